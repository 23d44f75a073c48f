#pragma once


/*
    ---------------------------------------------------
    Stanza::ParseError - Structured parse error reporting
    ---------------------------------------------------
    `Stanza::ParseError` describes a failure that occurred while reading
    INI text, either in the parser itself or in the handler consuming its
    events.

    ------
    Fields
    ------
    - `code errc`:
        * Enumerated error code describing failure category:
            - `file_open`
            - `syntax_error`
            - `out_of_memory`
            - `handler_error`
    - `size_t line`:
        * 1-based line number of the offending line
        * 0 when the failure is not tied to a line (e.g. `file_open`)
    - `std::string msg`:
        * Short description of the failure ("missing closing bracket",
          the handler's rejection reason, the file path and OS reason...)
        * Intended for diagnostics; not stable for programmatic use

    -----
    Usage
    -----
    - Parsing functions such as `Stanza::parse(...)` return
      `std::expected<void, ParseError>`
    - `Stanza::to_string(err)` renders the full human-readable message,
      e.g. "Parse error on line 4: missing closing bracket"
    - Only one `ParseError` is reported per parse call: the first fault,
      whether or not parsing stopped there (see `ParseOptions`)
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Parsing Errors
/// @ingroup Stanza
/// @brief Error codes and structures produced by the INI parser
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error information produced during INI parsing.
    ///
    /// @details
    /// A `ParseError` is returned whenever a parse call or the handler it
    /// feeds reports a fault. Each error contains:
    ///
    /// - **errc** - the category of the fault
    /// - **line** - 1-based line number (0 if not line related)
    /// - **msg** - short description
    struct ParseError {
        /// @ingroup StanzaError
        /// @brief Enumeration of possible error categories.
        ///
        /// Members:
        /// - `file_open`
        ///     The input source could not be opened or read. Reported
        ///     immediately and never retried.
        ///
        /// - `syntax_error`
        ///     A line violated the grammar: unterminated or empty section
        ///     header, line longer than `ParseOptions::max_line`, or an
        ///     unrecognised line while `stop_on_first_error` is set.
        ///
        /// - `out_of_memory`
        ///     Storage for a line or event could not be allocated.
        ///
        /// - `handler_error`
        ///     The attached `Handler` rejected an event; `msg` carries its
        ///     reason and `line` the line being processed.
        enum class code : uint8_t {
            file_open,      ///< Input could not be opened or read.
            syntax_error,   ///< Malformed line.
            out_of_memory,  ///< Allocation failure.
            handler_error,  ///< Event rejected by the handler.
        };

        code errc{};          ///< The classification of the fault.
        std::size_t line{};   ///< Line number where the fault occurred (1-based).
        std::string msg{};    ///< Short diagnostic message.

        /// @ingroup StanzaError
        /// @brief Constructs a fully-populated `ParseError` instance.
        ///
        /// @param c    The error code describing the category of failure.
        /// @param l    Line number (1-based, 0 when not line related).
        /// @param m    Short diagnostic message.
        /// @return A fully constructed `ParseError`.
        STANZA_API static ParseError make(code c, std::size_t l, std::string_view m);

        bool operator==(const ParseError&) const = default;
    };

    /// @ingroup StanzaError
    /// @brief Renders @p err as a single human-readable line.
    [[nodiscard]] STANZA_API std::string to_string(const ParseError& err);

    /// @ingroup StanzaError
    /// @brief Name of an error code, e.g. "syntax_error".
    [[nodiscard]] STANZA_API std::string_view to_string(ParseError::code c) noexcept;

} // namespace Stanza
