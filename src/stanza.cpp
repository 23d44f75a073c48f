#include "stanza/stanza.hpp"
#include "stanza/log.hpp"

#include <cerrno>
#include <fstream>
#include <istream>
#include <new>
#include <sstream>
#include <system_error>


namespace Stanza {

    namespace detail {
        ParseResult parse_lines_impl(std::span<const std::string_view> lines, Handler& handler, const ParseOptions& opts);
    } // namespace detail

    std::vector<std::string_view> split_lines(std::string_view text) {
        std::vector<std::string_view> lines;
        size_t start = 0;
        size_t i = 0;
        while (i < text.size()) {
            char c = text[i];
            if (c == '\n' || c == '\r') {
                lines.push_back(text.substr(start, i - start));
                if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') i++;
                start = ++i;
                continue;
            }
            i++;
        }
        if (start < text.size()) lines.push_back(text.substr(start));
        return lines;
    }

    ParseResult parse_lines(std::span<const std::string_view> lines, Handler& handler, const ParseOptions& opts) {
        return detail::parse_lines_impl(lines, handler, opts);
    }

    ParseResult parse(std::string_view text, Handler& handler, const ParseOptions& opts) {
        auto lines = split_lines(text);
        return detail::parse_lines_impl(lines, handler, opts);
    }

    ParseResult parse(std::istream& is, Handler& handler, const ParseOptions& opts) {
        if (!is) return std::unexpected(ParseError::make(ParseError::code::file_open, 0, "input stream is not readable"));

        std::ostringstream oss;
        oss << is.rdbuf();
        if (is.bad()) return std::unexpected(ParseError::make(ParseError::code::file_open, 0, "error while reading input stream"));

        std::string text = oss.str();
        return parse(std::string_view{ text }, handler, opts);
    }

    ParseResult parse_file(const std::filesystem::path& path, Handler& handler, const ParseOptions& opts) {
        errno = 0;
        std::ifstream ifs(path, std::ios::in | std::ios::binary);
        if (!ifs) {
            int err = errno != 0 ? errno : ENOENT;
            auto msg = path.string() + ": " + std::generic_category().message(err);
            return std::unexpected(ParseError::make(ParseError::code::file_open, 0, msg));
        }
        return parse(ifs, handler, opts);
    }


#pragma region Driver
    // ================================
    // Internal driver implementation
    // ================================

    namespace detail {
        using expected_void = std::expected<void, ParseError>;

        constexpr std::string_view log_domain = "stanza";

        expected_void deliver(Handler& handler, std::string_view section, std::string_view name, std::string_view value, size_t line) {
            auto r = handler.handle(section, name, value);
            if (!r) return std::unexpected(ParseError::make(ParseError::code::handler_error, line, r.error()));
            return {};
        }

        expected_void parse_line(std::string_view raw, ParseState& state, Handler& handler, const ParseOptions& opts) {
            if (opts.max_line != 0 && raw.size() > opts.max_line)
                return std::unexpected(ParseError::make(ParseError::code::syntax_error, state.line_number, "line too long"));

            Outcome outcome = classify(raw, state, opts);

            if (auto* ignore = std::get_if<Ignore>(&outcome)) {
                if (ignore->malformed) log_fmt(4, log_domain, "line {}: skipping unrecognised line", state.line_number);
                return {};
            }
            if (auto* sec = std::get_if<SectionEvent>(&outcome))
                return deliver(handler, sec->name, {}, {}, state.line_number);
            if (auto* kv = std::get_if<KeyValueEvent>(&outcome))
                return deliver(handler, state.section, kv->name, kv->value, state.line_number);
            if (auto* cont = std::get_if<ContinuationEvent>(&outcome))
                return deliver(handler, state.section, state.previous_name, cont->value, state.line_number);

            const auto& invalid = std::get<Invalid>(outcome);
            return std::unexpected(ParseError::make(ParseError::code::syntax_error, state.line_number, invalid.reason));
        }

        ParseResult parse_lines_impl(std::span<const std::string_view> lines, Handler& handler, const ParseOptions& opts) {
            ParseState state;

            for (std::string_view raw : lines) {
                state.line_number++;

                expected_void r;
                try {
                    r = parse_line(raw, state, handler, opts);
                } catch (const std::bad_alloc&) {
                    r = std::unexpected(ParseError::make(ParseError::code::out_of_memory, state.line_number, "out of memory"));
                }
                if (r) continue;

                if (check_log_level(2)) log_fmt(2, log_domain, "{}", to_string(r.error()));
                if (opts.stop_on_first_error) return std::unexpected(std::move(r.error()));
                if (!state.first_error) state.first_error = std::move(r.error());
            }

            if (state.first_error) return std::unexpected(std::move(*state.first_error));
            return {};
        }

    } // namespace detail
#pragma endregion

} // namespace Stanza
