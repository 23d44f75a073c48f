#include "stanza/log.hpp"

#include <atomic>
#include <cstdio>
#include <iterator>

#include <fmt/format.h>

namespace Stanza {

    namespace {
        std::atomic<unsigned> max_level{ 0 };
    } // namespace

    void set_log_level(unsigned level) noexcept {
        max_level.store(level, std::memory_order_relaxed);
    }

    bool check_log_level(unsigned level) noexcept {
        return level <= max_level.load(std::memory_order_relaxed);
    }

    namespace detail {

        void log_v(std::string_view domain, fmt::string_view format_str, fmt::format_args args) {
            fmt::memory_buffer buf;
            if (!domain.empty()) fmt::format_to(std::back_inserter(buf), "[{}] ", domain);
            fmt::vformat_to(std::back_inserter(buf), format_str, args);
            buf.push_back('\n');
            std::fwrite(buf.data(), 1, buf.size(), stderr);
        }

    } // namespace detail

} // namespace Stanza
