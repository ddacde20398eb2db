#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace {

struct UnitSuffix {
    const char* suffix;
    std::uint64_t scale;
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Digits only; std::stoull would also accept a sign or leading spaces.
bool read_decimal(const std::string& digits, std::uint64_t& out) {
    if (digits.empty())
        return false;
    std::uint64_t v = 0;
    for (unsigned char c : digits) {
        if (!std::isdigit(c))
            return false;
        const std::uint64_t d = c - '0';
        if (v > (std::numeric_limits<std::uint64_t>::max() - d) / 10)
            return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

// Longer suffixes must precede their one-letter prefixes in @p units.
bool read_scaled(const std::string& text, const std::vector<UnitSuffix>& units,
                 std::uint64_t& out) {
    const std::string v = to_lower(text);
    std::uint64_t scale = 1;
    std::string digits = v;
    for (const auto& u : units) {
        const std::string suf = u.suffix;
        if (v.size() > suf.size() && v.compare(v.size() - suf.size(), suf.size(), suf) == 0) {
            digits = v.substr(0, v.size() - suf.size());
            scale = u.scale;
            break;
        }
    }
    std::uint64_t n = 0;
    if (!read_decimal(digits, n))
        return false;
    if (n > std::numeric_limits<std::uint64_t>::max() / scale)
        return false;
    out = n * scale;
    return true;
}

size_t within(std::uint64_t v, size_t min, size_t max, bool& ok) {
    ok = v >= min && v <= max;
    return ok ? static_cast<size_t>(v) : 0;
}

const std::vector<UnitSuffix>& byte_units() {
    static const std::vector<UnitSuffix> units{
        {"kb", 1ull << 10}, {"mb", 1ull << 20}, {"gb", 1ull << 30}, {"k", 1ull << 10},
        {"m", 1ull << 20},  {"g", 1ull << 30},  {"b", 1}};
    return units;
}

const std::vector<UnitSuffix>& time_units() {
    static const std::vector<UnitSuffix> units{{"ms", 1}, {"s", 1000}, {"m", 60 * 1000}};
    return units;
}

} // namespace

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    std::uint64_t v = 0;
    ok = false;
    if (!read_decimal(value, v))
        return 0;
    return within(v, min, max, ok);
}

size_t parse_size_t(const ArgParser& parser, const std::string& flag, size_t min, size_t max,
                    bool& ok) {
    ok = false;
    return parser.has_flag(flag) ? parse_size_t(parser.get_option(flag), min, max, ok) : 0;
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    std::uint64_t v = 0;
    ok = false;
    if (!read_scaled(value, byte_units(), v))
        return 0;
    return within(v, min, max, ok);
}

size_t parse_bytes(const ArgParser& parser, const std::string& flag, size_t min, size_t max,
                   bool& ok) {
    ok = false;
    return parser.has_flag(flag) ? parse_bytes(parser.get_option(flag), min, max, ok) : 0;
}

std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok) {
    std::uint64_t v = 0;
    ok = read_scaled(value, time_units(), v) &&
         v <= static_cast<std::uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max());
    return ok ? std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(v))
              : std::chrono::milliseconds(0);
}

std::chrono::milliseconds parse_time_ms(const ArgParser& parser, const std::string& flag,
                                        bool& ok) {
    ok = false;
    return parser.has_flag(flag) ? parse_time_ms(parser.get_option(flag), ok)
                                 : std::chrono::milliseconds(0);
}

bool parse_bool(const std::string& value, bool& ok) {
    static const std::vector<std::pair<const char*, bool>> words{
        {"true", true}, {"yes", true}, {"on", true},   {"1", true},
        {"false", false}, {"no", false}, {"off", false}, {"0", false}};
    const std::string v = to_lower(value);
    for (const auto& [word, result] : words) {
        if (v == word) {
            ok = true;
            return result;
        }
    }
    ok = false;
    return false;
}
