#pragma once


/*
    ----------------------
    Stanza parsing options
    ----------------------
    This header defines the configuration structure that controls the
    INI grammar accepted by `Stanza::parse(...)` and `Stanza::Reader`

    --------------------------------------
    Parsing Options - Stanza::ParseOptions
    --------------------------------------
    - `bool allow_multiline`:
        * When true, an indented line following a `name = value` line is
          a continuation of that value (Python ConfigParser style)
    - `bool allow_bom`:
        * When true, a UTF-8 byte order mark at the start of the first
          line is skipped
    - `bool allow_inline_comments`:
        * When true, a character of `inline_comment_prefixes` preceded by
          whitespace starts a comment in the middle of a line
    - `std::string inline_comment_prefixes`, `std::string start_comment_prefixes`:
        * Sets of characters starting inline and whole-line comments
    - `bool stop_on_first_error`:
        * When true, the first fault ends the parse; when false, every
          line is processed and the first fault is reported at the end.
          Unrecognised lines are an error only in this mode
    - `bool call_handler_on_new_section`:
        * Kept for compatibility with the classic inih option set. The
          handler is always told about a new section with an empty
          name and value, whatever this flag says
    - `bool allow_no_value`:
        * When true, a line holding only a name is reported with an
          empty value
    - `size_t max_line`:
        * Maximum length of a physical line in bytes; longer lines are
          a syntax error. 0 disables the limit

    The structure is a plain aggregate suitable for brace-initialization;
    the parser only ever reads it
*/


#include <cstddef>
#include <string>

/// @defgroup StanzaOptions Parsing Options
/// @ingroup Stanza
/// @brief Configuration objects controlling the accepted INI dialect

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Configuration controlling INI parsing behavior
    ///
    /// @details
    /// The defaults match the classic inih dialect: `;` and `#` start a
    /// comment line, `;` after whitespace starts an inline comment, a BOM
    /// is tolerated, and malformed lines are skipped.
    ///
    /// Example:
    /// @code
    /// Stanza::ParseOptions opts;
    /// opts.allow_multiline = true;
    /// opts.stop_on_first_error = true;
    /// auto result = Stanza::parse(text, handler, opts);
    /// @endcode
    struct ParseOptions {
        bool allow_multiline = false;                ///< Indented lines continue the previous value
        bool allow_bom = true;                       ///< Skip a UTF-8 BOM on the first line
        bool allow_inline_comments = true;           ///< Honor comments after whitespace mid-line
        std::string inline_comment_prefixes = ";";   ///< Characters starting an inline comment
        std::string start_comment_prefixes = ";#";   ///< Characters starting a comment line
        bool stop_on_first_error = false;            ///< Abort on the first fault
        bool call_handler_on_new_section = false;    ///< Compatibility flag; section events are always delivered
        bool allow_no_value = false;                 ///< Accept `name` lines without a separator
        std::size_t max_line = 200;                  ///< Maximum physical line length (0 = unlimited)
    };

} // namespace Stanza
