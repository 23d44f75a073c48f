#include "stanza/error.hpp"

#include <format>

namespace Stanza {

    ParseError ParseError::make(code c, size_t l, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.line = l;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string to_string(const ParseError& err) {
        switch (err.errc) {
        case ParseError::code::file_open: return std::format("Unable to open file: {}", err.msg);
        case ParseError::code::syntax_error: return std::format("Parse error on line {}: {}", err.line, err.msg);
        case ParseError::code::out_of_memory: return "Memory allocation error";
        case ParseError::code::handler_error: return std::format("Handler error on line {}: {}", err.line, err.msg);
        }
        return err.msg;
    }

    std::string_view to_string(ParseError::code c) noexcept {
        switch (c) {
        case ParseError::code::file_open: return "file_open";
        case ParseError::code::syntax_error: return "syntax_error";
        case ParseError::code::out_of_memory: return "out_of_memory";
        case ParseError::code::handler_error: return "handler_error";
        }
        return "unknown";
    }

} // namespace Stanza
