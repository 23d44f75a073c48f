#pragma once


/*
    ---------------------------------------------
    Stanza::Reader - Case-insensitive INI lookup
    ---------------------------------------------
    `Stanza::Reader` parses a complete input once and keeps every event
    in an index keyed by lowercased `(section, name)`.

    -----------
    Accumulation
    -----------
    - Section and key names are compared case-insensitively; the original
      spelling is not kept, `sections()` and `keys()` return lowercase
    - A key declared twice, and continuation lines in multi-line mode,
      append to the existing value with a `'\n'` separator:
          [s]
          a=1
          a=2          -> get("s", "a", "") == "1\n2"
    - Keys before the first section header live under section "", which
      is not listed by `sections()`

    ---------
    Accessors
    ---------
    - `get(...)` returns the stored text or exactly the default
    - `get_string(...)` also returns the default for an empty value
    - `get_integer(...)`/`get_integer64(...)`: `0x`/`0X` prefix means hex,
      otherwise signed decimal
    - `get_unsigned(...)`/`get_unsigned64(...)`: unsigned decimal
    - `get_real(...)`: decimal or scientific notation
    - `get_boolean(...)`: true/yes/on/1, false/no/off/0 (any case)
    - Anything that does not convert completely yields the default

    -------------
    Thread-Safety
    -------------
    - A `Reader` has no mutating member functions once constructed;
      concurrent reads from several threads are safe

    ------
    Errors
    ------
    - Construction never fails outright: `parse_error()` holds the fault
      the parse reported, if any. Everything the parser delivered is kept
      (with `stop_on_first_error`, only what preceded the fault)
    - `Reader::load(...)`/`Reader::load_file(...)` return the fault as a
      `std::expected` error instead
*/

#include <cstdint>
#include <expected>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"

/// @defgroup StanzaReader Indexed Reader
/// @ingroup Stanza
/// @brief In-memory, case-insensitive view of a parsed INI input

namespace Stanza {

    /// @ingroup StanzaReader
    /// @brief Immutable index of every value in an INI input
    class STANZA_API Reader {
    public:
        /// @brief Parses @p text and indexes its events
        explicit Reader(std::string_view text, const ParseOptions& opts = {});

        /// @brief Parses the remaining content of @p is and indexes its events
        explicit Reader(std::istream& is, const ParseOptions& opts = {});

        /// @brief Parses the file at @p path; a failed open is kept in `parse_error()`
        [[nodiscard]] static Reader from_file(const std::filesystem::path& path, const ParseOptions& opts = {});

        /// @brief Like the string constructor, but any fault is returned as the error
        [[nodiscard]] static std::expected<Reader, ParseError> load(std::string_view text, const ParseOptions& opts = {});

        /// @brief Like `from_file`, but any fault is returned as the error
        [[nodiscard]] static std::expected<Reader, ParseError> load_file(const std::filesystem::path& path, const ParseOptions& opts = {});

        /// @brief Fault reported while building this reader, if any
        [[nodiscard]] const std::optional<ParseError>& parse_error() const noexcept { return m_Error; }

        /// @brief Raw stored text of @p name in @p section, or @p default_value
        [[nodiscard]] std::string get(std::string_view section, std::string_view name, std::string_view default_value) const;

        /// @brief Stored text, or @p default_value when missing or empty
        [[nodiscard]] std::string get_string(std::string_view section, std::string_view name, std::string_view default_value) const;

        [[nodiscard]] long get_integer(std::string_view section, std::string_view name, long default_value) const;
        [[nodiscard]] int64_t get_integer64(std::string_view section, std::string_view name, int64_t default_value) const;
        [[nodiscard]] unsigned long get_unsigned(std::string_view section, std::string_view name, unsigned long default_value) const;
        [[nodiscard]] uint64_t get_unsigned64(std::string_view section, std::string_view name, uint64_t default_value) const;
        [[nodiscard]] double get_real(std::string_view section, std::string_view name, double default_value) const;
        [[nodiscard]] bool get_boolean(std::string_view section, std::string_view name, bool default_value) const;

        /// @brief All declared section names, lowercased and sorted
        [[nodiscard]] std::vector<std::string> sections() const;

        /// @brief Key names stored under @p section, lowercased and sorted
        [[nodiscard]] std::vector<std::string> keys(std::string_view section) const;

        [[nodiscard]] bool has_section(std::string_view section) const;
        [[nodiscard]] bool has_value(std::string_view section, std::string_view name) const;

    private:
        class Builder;

        Reader() = default;

        void record(const std::expected<void, ParseError>& result);
        [[nodiscard]] const std::string* find(std::string_view section, std::string_view name) const;

        using key_type = std::pair<std::string, std::string>;

        std::map<key_type, std::string> m_Values;
        std::set<std::string> m_Sections;
        std::optional<ParseError> m_Error;
    };

    /// @ingroup StanzaReader
    /// @brief Result of `Reader::load(...)`
    using ReaderResult = std::expected<Reader, ParseError>;

} // namespace Stanza
