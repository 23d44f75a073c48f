#include "stanza/line.hpp"

#include <algorithm>


namespace Stanza {

    namespace detail {

        std::string_view trim_left(std::string_view s) noexcept {
            size_t i = 0;
            while (i < s.size() && is_space(s[i])) i++;
            return s.substr(i);
        }

        std::string_view trim_right(std::string_view s) noexcept {
            size_t n = s.size();
            while (n > 0 && is_space(s[n - 1])) n--;
            return s.substr(0, n);
        }

        std::string_view trim(std::string_view s) noexcept {
            return trim_right(trim_left(s));
        }

        std::string_view strip_bom(std::string_view s) noexcept {
            if (s.starts_with("\xEF\xBB\xBF")) return s.substr(3);
            return s;
        }

        size_t find_char_or_comment(std::string_view s, char target, std::string_view prefixes, bool allow_inline) noexcept {
            bool was_space = false;
            for (size_t i = 0; i < s.size(); i++) {
                char c = s[i];
                if (c == target) return i;
                if (allow_inline && was_space && prefixes.find(c) != std::string_view::npos) return i;
                was_space = is_space(c);
            }
            return std::string_view::npos;
        }

        std::string_view strip_inline_comment(std::string_view s, std::string_view prefixes) noexcept {
            bool was_space = false;
            for (size_t i = 0; i < s.size(); i++) {
                char c = s[i];
                if (was_space && prefixes.find(c) != std::string_view::npos) return trim(s.substr(0, i));
                was_space = is_space(c);
            }
            return trim(s);
        }

        // Position of `sep` when the search reaches it before any comment.
        static size_t find_separator(std::string_view s, char sep, const ParseOptions& opts) noexcept {
            size_t pos = find_char_or_comment(s, sep, opts.inline_comment_prefixes, opts.allow_inline_comments);
            if (pos == std::string_view::npos || s[pos] != sep) return std::string_view::npos;
            return pos;
        }

    } // namespace detail

    Outcome classify(std::string_view raw, ParseState& state, const ParseOptions& opts) {
        std::string_view line = raw;
        if (state.line_number == 1 && opts.allow_bom) line = detail::strip_bom(line);

        std::string_view trimmed = detail::trim(line);
        if (trimmed.empty()) return Ignore{};

        if (opts.start_comment_prefixes.find(trimmed.front()) != std::string::npos) return Ignore{};

        if (opts.allow_multiline && !state.previous_name.empty() && detail::is_space(line.front())) {
            if (!opts.allow_inline_comments) return ContinuationEvent{ std::string{ line } };

            size_t indent = line.size() - detail::trim_left(line).size();
            std::string value{ line.substr(0, indent) };
            value.append(detail::strip_inline_comment(trimmed, opts.inline_comment_prefixes));
            return ContinuationEvent{ std::move(value) };
        }

        if (trimmed.front() == '[') {
            size_t end = detail::find_char_or_comment(trimmed, ']', opts.inline_comment_prefixes, opts.allow_inline_comments);
            if (end == std::string_view::npos || trimmed[end] != ']') return Invalid{ "missing closing bracket" };
            if (end == 1) return Invalid{ "empty section name" };

            state.section.assign(trimmed.substr(1, end - 1));
            state.previous_name.clear();
            return SectionEvent{ state.section };
        }

        size_t eq = detail::find_separator(trimmed, '=', opts);
        size_t colon = detail::find_separator(trimmed, ':', opts);
        size_t sep = std::min(eq, colon);

        if (sep != std::string_view::npos) {
            std::string_view name = detail::trim(trimmed.substr(0, sep));
            std::string_view rest = trimmed.substr(sep + 1);
            std::string_view value = opts.allow_inline_comments
                ? detail::strip_inline_comment(rest, opts.inline_comment_prefixes)
                : detail::trim(rest);

            state.previous_name.assign(name);
            return KeyValueEvent{ std::string{ name }, std::string{ value } };
        }

        if (opts.allow_no_value) {
            std::string_view name = opts.allow_inline_comments
                ? detail::strip_inline_comment(trimmed, opts.inline_comment_prefixes)
                : trimmed;

            state.previous_name.assign(name);
            return KeyValueEvent{ std::string{ name }, std::string{} };
        }

        if (opts.stop_on_first_error) return Invalid{ "invalid line format" };
        return Ignore{ .malformed = true };
    }

} // namespace Stanza
