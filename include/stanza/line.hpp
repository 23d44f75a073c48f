#pragma once


/*
    ------------------------------------------------
    Stanza line classifier - one line, one decision
    ------------------------------------------------
    `Stanza::classify(...)` looks at a single physical line together with
    the running `ParseState` and decides what the line means:

        Ignore             blank line, comment, or (lenient mode) junk
        SectionEvent       `[name]`
        KeyValueEvent      `name = value`, `name: value`, bare `name`
        ContinuationEvent  indented line extending the previous value
        Invalid            grammar violation, with a short reason

    Precedence, first match wins:
        1. BOM strip (line 1 only, `allow_bom`)
        2. blank line
        3. start-of-line comment
        4. continuation (`allow_multiline`, previous key active, raw line
           starts with whitespace)
        5. section header
        6. `=` / `:` separator, whichever comes first
        7. bare name (`allow_no_value`)
        8. invalid under `stop_on_first_error`, ignored otherwise

    An inline comment prefix only counts when the character right before
    it is whitespace, so `4#5#6` and `test;3` survive intact.

    Section names are taken verbatim between the brackets:
    `[ section 2 ]` declares the section " section 2 ".

    The classifier updates `ParseState::section` and
    `ParseState::previous_name`; the driver owns the state and the
    line counter. The helpers in `Stanza::detail` are the line
    normalizer the classifier is built from.
*/

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"

/// @defgroup StanzaLine Line Classification
/// @ingroup Stanza
/// @brief Per-line grammar of the INI dialect

namespace Stanza {

    /// @ingroup StanzaLine
    /// @brief Running state of one parse call
    struct ParseState {
        std::string section{};                      ///< Current section, empty before the first header
        std::string previous_name{};                ///< Key a continuation line would extend, empty if none
        std::size_t line_number = 0;                ///< 1-based number of the line being classified
        std::optional<ParseError> first_error{};    ///< First fault seen in lenient mode
    };

    /// @ingroup StanzaLine
    /// @brief Line produces no event
    struct Ignore {
        bool malformed = false; ///< True when the line was unrecognised and skipped leniently
    };

    /// @ingroup StanzaLine
    /// @brief `[name]` header
    struct SectionEvent {
        std::string name;
    };

    /// @ingroup StanzaLine
    /// @brief `name = value` or bare `name`
    struct KeyValueEvent {
        std::string name;
        std::string value;
    };

    /// @ingroup StanzaLine
    /// @brief Additional line for `ParseState::previous_name`
    struct ContinuationEvent {
        std::string value;
    };

    /// @ingroup StanzaLine
    /// @brief Grammar violation
    struct Invalid {
        std::string reason;
    };

    using Outcome = std::variant<Ignore, SectionEvent, KeyValueEvent, ContinuationEvent, Invalid>;

    /// @ingroup StanzaLine
    /// @brief Classifies one physical line
    ///
    /// @details
    /// @p raw must be the untouched line without its terminator; leading
    /// whitespace decides continuations and line 1 may carry a BOM.
    /// `state.line_number` must already hold the number of @p raw.
    ///
    /// @param raw   The physical line
    /// @param state Running parse state, updated on section and key lines
    /// @param opts  Grammar options
    /// @return What the line means
    [[nodiscard]] STANZA_API Outcome classify(std::string_view raw, ParseState& state, const ParseOptions& opts);

    namespace detail {

        [[nodiscard]] constexpr bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
        }

        [[nodiscard]] STANZA_API std::string_view trim_left(std::string_view s) noexcept;
        [[nodiscard]] STANZA_API std::string_view trim_right(std::string_view s) noexcept;
        [[nodiscard]] STANZA_API std::string_view trim(std::string_view s) noexcept;

        /// Drops a leading UTF-8 byte order mark.
        [[nodiscard]] STANZA_API std::string_view strip_bom(std::string_view s) noexcept;

        /// Index of the first @p target, or of the first inline comment
        /// prefix preceded by whitespace when @p allow_inline is set,
        /// whichever comes first. `npos` when neither occurs.
        [[nodiscard]] STANZA_API std::size_t find_char_or_comment(std::string_view s, char target, std::string_view prefixes, bool allow_inline) noexcept;

        /// @p s with any inline comment removed, then trimmed.
        [[nodiscard]] STANZA_API std::string_view strip_inline_comment(std::string_view s, std::string_view prefixes) noexcept;

    } // namespace detail

} // namespace Stanza
