#pragma once


/*
    --------------------------------------------
    Stanza::Handler - Receiver of parse events
    --------------------------------------------
    The parser does not store anything itself. Every section header,
    `name = value` pair and continuation line is handed to a `Handler`
    as a `(section, name, value)` triple:

    - `name` empty:  a new section was declared
    - `value` empty: the key has no value (`key =` or, with
                     `allow_no_value`, a bare `key`)

    A handler accepts an event by returning `{}` and rejects it by
    returning `std::unexpected(reason)`. A rejection becomes a
    `ParseError` with code `handler_error` attributed to the current line.

    The views passed to `handle` are only valid for the duration of the
    call; copy what must be kept.
*/

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "stanza/config.hpp"

/// @defgroup StanzaHandler Event Handlers
/// @ingroup Stanza
/// @brief Consumers of the parser's event stream

namespace Stanza {

    /// @ingroup StanzaHandler
    /// @brief Result of handling one event: nothing, or a rejection reason
    using HandlerResult = std::expected<void, std::string>;

    /// @ingroup StanzaHandler
    /// @brief Abstract consumer of `(section, name, value)` events
    class STANZA_API Handler {
    public:
        virtual ~Handler() = default;

        /// @brief Receives one event
        ///
        /// @param section Current section, empty before the first header
        /// @param name    Key name, empty for a section notification
        /// @param value   Value, empty when the key has none
        /// @return `{}` to continue, `std::unexpected(reason)` to reject
        virtual HandlerResult handle(std::string_view section, std::string_view name, std::string_view value) = 0;
    };

    /// @ingroup StanzaHandler
    /// @brief `Handler` forwarding every event to a callable
    ///
    /// Example:
    /// @code
    /// Stanza::CallbackHandler h{ [&](std::string_view s, std::string_view n, std::string_view v)
    ///     -> Stanza::HandlerResult {
    ///     if (n == "forbidden") return std::unexpected(std::string{ "forbidden key" });
    ///     return {};
    /// } };
    /// auto r = Stanza::parse(text, h);
    /// @endcode
    class CallbackHandler final : public Handler {
    public:
        using callback_type = std::function<HandlerResult(std::string_view, std::string_view, std::string_view)>;

        explicit CallbackHandler(callback_type cb) : m_Callback{ std::move(cb) } {}

        HandlerResult handle(std::string_view section, std::string_view name, std::string_view value) override {
            return m_Callback(section, name, value);
        }

    private:
        callback_type m_Callback;
    };

} // namespace Stanza
