#include <format>
#include <print>
#include <string>

#include "stanza/stanza.hpp"
#include "stanza/log.hpp"

constexpr std::string_view sample = R"(; Sample configuration

[protocol]             ; Protocol configuration
version=6              ; IPv6

[user]
name = Bob Smith       ; Spaces around '=' are stripped
email = bob@smith.com  ; And comments (like this) ignored
active = true          ; Test a boolean
pi = 3.14159           ; Test a floating point number
trillion = 1000000000000  ; Test 64-bit integers
)";

int main(int argc, char** argv) {
    Stanza::set_log_level(2);

    Stanza::Reader ini = argc > 1 ? Stanza::Reader::from_file(argv[1]) : Stanza::Reader{ sample };
    if (ini.parse_error()) {
        std::println("Can't load input: {}", Stanza::to_string(*ini.parse_error()));
        return 1;
    }

    for (const auto& section : ini.sections()) {
        std::println("[{}]", section);
        for (const auto& key : ini.keys(section))
            std::println("    {} = {}", key, ini.get(section, key, ""));
    }

    std::println("\nversion={}, trillion={}, name={}, email={}, pi={}, active={}",
        ini.get_integer("protocol", "version", -1),
        ini.get_integer64("user", "trillion", -1),
        ini.get_string("user", "name", "UNKNOWN"),
        ini.get_string("user", "email", "UNKNOWN"),
        ini.get_real("user", "pi", -1),
        ini.get_boolean("user", "active", true));

    // Streaming: reject anything the application does not know about.
    Stanza::CallbackHandler strict{ [](std::string_view section, std::string_view name, std::string_view)
        -> Stanza::HandlerResult {
        if (name.empty() || section != "user") return {};
        if (name == "name" || name == "email") return {};
        return std::unexpected(std::format("unknown key '{}'", name));
    } };

    auto r = Stanza::parse(sample, strict, { .stop_on_first_error = true });
    if (!r) std::println("{}", Stanza::to_string(r.error()));

    return 0;
}
