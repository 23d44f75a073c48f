#pragma once


/*
    ----------------------------------------------------
    Stanza - Modern C++ INI library (events + lookup)
    ----------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - Event handlers:               `Stanza::Handler`,
                                        `Stanza::CallbackHandler`
        - Parsing functions:            `Stanza::parse(...)`,
                                        `Stanza::parse_file(...)`,
                                        `Stanza::parse_lines(...)`
        - The in-memory reader:         `Stanza::Reader`
        - Error reporting types:        `Stanza::ParseError`
        - Configuration options:        `Stanza::ParseOptions`

    -------------------
    High-Level Overview
    -------------------
    - Streaming:
        * The parser walks the input line by line and hands every
          section header and `name = value` pair to a `Handler` as a
          `(section, name, value)` triple, without storing anything
    - Lookup:
        * `Stanza::Reader` is a handler that keeps every event in a
          case-insensitive index and offers typed getters with defaults
    - Errors:
        * All parse functions return `std::expected<void, ParseError>`
        * With `stop_on_first_error` the parse ends at the first fault;
          otherwise every line is processed (the handler sees every valid
          event) and the first fault is returned afterwards

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        int main() {
            Stanza::Reader ini{ "[user]\nname = Bob\nactive = yes\n" };
            if (ini.parse_error()) {
                std::println("{}", Stanza::to_string(*ini.parse_error()));
                return 1;
            }

            std::println("{} {}", ini.get_string("user", "name", "?"),
                                  ini.get_boolean("user", "active", false));
        }

    Include this header for the full Stanza API, or the individual headers
    `line.hpp`, `handler.hpp`, `reader.hpp`, `error.hpp`, `options.hpp`
    for finer-grained use
*/

/// @defgroup Stanza Stanza INI Library
/// @brief Core types and functions for Stanza

/// @defgroup StanzaAPI Top-level Parsing API
/// @ingroup Stanza
/// @brief Free functions feeding INI input to a handler

#include <expected>
#include <filesystem>
#include <iosfwd>
#include <span>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/handler.hpp"
#include "stanza/line.hpp"
#include "stanza/options.hpp"
#include "stanza/reader.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Alias for the result type returned by the parse functions
    ///
    /// @details
    /// Success carries no value: everything the input contained was
    /// delivered to the handler. Failure carries the first fault.
    using ParseResult = std::expected<void, ParseError>;

    /// @ingroup StanzaAPI
    /// @brief Splits text into physical lines
    ///
    /// @details
    /// Accepts `\n`, `\r\n` and lone `\r` terminators, which are removed;
    /// everything else, including trailing whitespace, is kept. A final
    /// terminator does not produce an extra empty line.
    ///
    /// @param text Input text
    /// @return Views into @p text, one per line
    [[nodiscard]] STANZA_API std::vector<std::string_view> split_lines(std::string_view text);

    /// @ingroup StanzaAPI
    /// @brief Runs the parser over already split lines
    ///
    /// @details
    /// Line numbers are 1-based positions in @p lines. Lines longer than
    /// `opts.max_line` are reported as "line too long" without being
    /// looked at. Events go to @p handler in input order; a continuation
    /// line is delivered under the name of the key it extends.
    ///
    /// @param lines   Physical lines without terminators
    /// @param handler Event consumer
    /// @param opts    Grammar and error policy
    /// @return Nothing on success, otherwise the first fault
    [[nodiscard]] STANZA_API ParseResult parse_lines(std::span<const std::string_view> lines, Handler& handler, const ParseOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Parses INI text held in memory
    ///
    /// Example:
    /// @code
    /// Stanza::CallbackHandler h{ [](auto section, auto name, auto value) -> Stanza::HandlerResult {
    ///     std::println("[{}] {} = {}", section, name, value);
    ///     return {};
    /// } };
    /// if (auto r = Stanza::parse("[a]\nx = 1\n", h); !r)
    ///     std::println("{}", Stanza::to_string(r.error()));
    /// @endcode
    [[nodiscard]] STANZA_API ParseResult parse(std::string_view text, Handler& handler, const ParseOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Parses the whole remaining content of an input stream
    ///
    /// @details
    /// A stream that is already failed, or fails while reading, is
    /// reported as `file_open`.
    [[nodiscard]] STANZA_API ParseResult parse(std::istream& is, Handler& handler, const ParseOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Opens and parses a file
    ///
    /// @details
    /// If the file cannot be opened the result is a `file_open` error whose
    /// message is "<path>: <reason>"; the handler is never called.
    [[nodiscard]] STANZA_API ParseResult parse_file(const std::filesystem::path& path, Handler& handler, const ParseOptions& opts = {});

} // namespace Stanza
