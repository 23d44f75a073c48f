#include "stanza/reader.hpp"
#include "stanza/stanza.hpp"
#include "stanza/log.hpp"

#include <charconv>
#include <istream>
#include <system_error>


namespace Stanza {

    namespace {

        constexpr std::string_view log_domain = "stanza.reader";

        std::string to_lower(std::string_view s) {
            std::string out{ s };
            for (char& c : out) {
                if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            }
            return out;
        }

        // from_chars rejects a leading '+', which is accepted here.
        std::string_view skip_plus(std::string_view s) noexcept {
            if (s.size() > 1 && s.front() == '+' && s[1] != '-' && s[1] != '+') return s.substr(1);
            return s;
        }

        template<typename T>
        std::optional<T> parse_number(std::string_view s, int base = 10) {
            if (s.empty()) return std::nullopt;
            T out{};
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, base);
            if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
            return out;
        }

        template<typename T>
        std::optional<T> parse_integer(std::string_view s) {
            if (s.starts_with("0x") || s.starts_with("0X")) {
                if (auto hex = parse_number<T>(s.substr(2), 16)) return hex;
            }
            return parse_number<T>(skip_plus(s));
        }

        std::optional<double> parse_real(std::string_view s) {
            s = skip_plus(s);
            if (s.empty()) return std::nullopt;
            double out = 0.0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
            return out;
        }

    } // namespace

    class Reader::Builder final : public Handler {
    public:
        explicit Builder(Reader& r) noexcept : m_Reader{ r } {}

        HandlerResult handle(std::string_view section, std::string_view name, std::string_view value) override {
            std::string lower_section = to_lower(section);
            if (!lower_section.empty()) m_Reader.m_Sections.insert(lower_section);

            // section notification only
            if (name.empty()) return {};

            key_type key{ std::move(lower_section), to_lower(name) };
            auto [it, inserted] = m_Reader.m_Values.try_emplace(std::move(key), value);
            if (!inserted) {
                it->second.push_back('\n');
                it->second.append(value);
            }
            return {};
        }

    private:
        Reader& m_Reader;
    };

    Reader::Reader(std::string_view text, const ParseOptions& opts) {
        Builder b{ *this };
        record(Stanza::parse(text, b, opts));
    }

    Reader::Reader(std::istream& is, const ParseOptions& opts) {
        Builder b{ *this };
        record(Stanza::parse(is, b, opts));
    }

    Reader Reader::from_file(const std::filesystem::path& path, const ParseOptions& opts) {
        Reader r;
        Builder b{ r };
        auto result = parse_file(path, b, opts);
        if (!result && result.error().errc == ParseError::code::file_open)
            log_fmt(1, log_domain, "{}", result.error().msg);
        r.record(result);
        return r;
    }

    ReaderResult Reader::load(std::string_view text, const ParseOptions& opts) {
        Reader r{ text, opts };
        if (r.m_Error) return std::unexpected(*r.m_Error);
        return r;
    }

    ReaderResult Reader::load_file(const std::filesystem::path& path, const ParseOptions& opts) {
        Reader r = from_file(path, opts);
        if (r.m_Error) return std::unexpected(*r.m_Error);
        return r;
    }

    void Reader::record(const std::expected<void, ParseError>& result) {
        if (!result) m_Error = result.error();
        log_fmt(3, log_domain, "indexed {} sections, {} values", m_Sections.size(), m_Values.size());
    }

    const std::string* Reader::find(std::string_view section, std::string_view name) const {
        auto it = m_Values.find(key_type{ to_lower(section), to_lower(name) });
        return it == m_Values.end() ? nullptr : &it->second;
    }

    std::string Reader::get(std::string_view section, std::string_view name, std::string_view default_value) const {
        if (const auto* v = find(section, name)) return *v;
        return std::string{ default_value };
    }

    std::string Reader::get_string(std::string_view section, std::string_view name, std::string_view default_value) const {
        std::string v = get(section, name, "");
        if (v.empty()) return std::string{ default_value };
        return v;
    }

    long Reader::get_integer(std::string_view section, std::string_view name, long default_value) const {
        return parse_integer<long>(get(section, name, "")).value_or(default_value);
    }

    int64_t Reader::get_integer64(std::string_view section, std::string_view name, int64_t default_value) const {
        return parse_integer<int64_t>(get(section, name, "")).value_or(default_value);
    }

    unsigned long Reader::get_unsigned(std::string_view section, std::string_view name, unsigned long default_value) const {
        return parse_number<unsigned long>(skip_plus(get(section, name, ""))).value_or(default_value);
    }

    uint64_t Reader::get_unsigned64(std::string_view section, std::string_view name, uint64_t default_value) const {
        return parse_number<uint64_t>(skip_plus(get(section, name, ""))).value_or(default_value);
    }

    double Reader::get_real(std::string_view section, std::string_view name, double default_value) const {
        return parse_real(get(section, name, "")).value_or(default_value);
    }

    bool Reader::get_boolean(std::string_view section, std::string_view name, bool default_value) const {
        std::string v = to_lower(get(section, name, ""));
        if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
        if (v == "false" || v == "no" || v == "off" || v == "0") return false;
        return default_value;
    }

    std::vector<std::string> Reader::sections() const {
        return std::vector<std::string>(m_Sections.begin(), m_Sections.end());
    }

    std::vector<std::string> Reader::keys(std::string_view section) const {
        std::vector<std::string> out;
        std::string lower = to_lower(section);
        for (auto it = m_Values.lower_bound(key_type{ lower, std::string{} }); it != m_Values.end() && it->first.first == lower; ++it)
            out.push_back(it->first.second);
        return out;
    }

    bool Reader::has_section(std::string_view section) const {
        return m_Sections.contains(to_lower(section));
    }

    bool Reader::has_value(std::string_view section, std::string_view name) const {
        return find(section, name) != nullptr;
    }

} // namespace Stanza
