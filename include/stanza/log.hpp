#pragma once


/*
    -------------------------------
    Stanza diagnostics - log output
    -------------------------------
    Level-gated diagnostic messages, written to stderr as
    `[domain] message`.

        1  errors      (file could not be opened)
        2  warnings    (faults recorded while parsing)
        3  info        (reader built: section/key counts)
        4  debug       (lines skipped in lenient mode)

    The maximum level defaults to 0, i.e. nothing is written until the
    application calls `Stanza::set_log_level(...)`. Formatting is only
    performed for enabled levels.
*/

#include <string_view>

#include <fmt/core.h>

#include "stanza/config.hpp"

namespace Stanza {

    namespace detail {
        STANZA_API void log_v(std::string_view domain, fmt::string_view format_str, fmt::format_args args);
    } // namespace detail

    /// @brief Sets the highest level that is still written
    STANZA_API void set_log_level(unsigned level) noexcept;

    /// @brief True when messages of @p level are written
    [[nodiscard]] STANZA_API bool check_log_level(unsigned level) noexcept;

    template<typename... Args>
    void log_fmt(unsigned level, std::string_view domain, fmt::format_string<Args...> format_str, Args&&... args) {
        if (!check_log_level(level)) return;
        detail::log_v(domain, format_str, fmt::make_format_args(args...));
    }

} // namespace Stanza
