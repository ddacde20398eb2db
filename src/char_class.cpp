#include "char_class.hpp"
#include <algorithm>
#include <array>
#include <cstdio>

namespace scrub {

namespace {

struct Range {
    char32_t first;
    char32_t last;
};

// PropList.txt, Unicode 15.1.0, White_Space=Yes. The set has been stable
// since Unicode 6.3; bump the version string together with the table.
constexpr std::array<Range, 10> kWhiteSpace{{{0x0009, 0x000D},
                                             {0x0020, 0x0020},
                                             {0x0085, 0x0085},
                                             {0x00A0, 0x00A0},
                                             {0x1680, 0x1680},
                                             {0x2000, 0x200A},
                                             {0x2028, 0x2029},
                                             {0x202F, 0x202F},
                                             {0x205F, 0x205F},
                                             {0x3000, 0x3000}}};

constexpr const char* kWhiteSpaceVersion = "15.1.0";

Classification removable(CharClass cls, char32_t cp) { return {cls, true, code_point_label(cp)}; }

} // namespace

bool is_zero_width(char32_t cp) {
    return cp == 0x200B || cp == 0x200C || cp == 0x200D || cp == 0xFEFF;
}

bool is_ascii_control(char32_t cp) { return cp <= 0x1F || cp == 0x7F; }

bool is_unicode_white_space(char32_t cp) {
    auto it = std::lower_bound(kWhiteSpace.begin(), kWhiteSpace.end(), cp,
                               [](const Range& r, char32_t v) { return r.last < v; });
    return it != kWhiteSpace.end() && cp >= it->first;
}

const char* white_space_table_version() { return kWhiteSpaceVersion; }

std::string format_code_point(char32_t cp) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned int>(cp));
    return buf;
}

std::string code_point_label(char32_t cp) {
    switch (cp) {
    case 0x200B:
        return "ZWS";
    case 0x200C:
        return "ZWNJ";
    case 0x200D:
        return "ZWJ";
    case 0xFEFF:
        return "BOM";
    case 0x00A0:
        return "NBSP";
    case 0x0009:
        return "TAB";
    default:
        return format_code_point(cp);
    }
}

Classification classify(char32_t cp, const CharacterPolicy& policy) {
    if (cp == '\n')
        return {};
    if (is_zero_width(cp) && policy.strip_zero_width)
        return removable(CharClass::ZeroWidth, cp);
    if (cp == 0x00A0 && policy.strip_non_breaking_space)
        return removable(CharClass::NonBreakingSpace, cp);
    if (is_ascii_control(cp) && cp != '\t' && cp != '\r' && policy.strip_control_chars)
        return removable(CharClass::Control, cp);
    if (is_unicode_white_space(cp) && cp != ' ' && cp != '\t' && cp != '\r' && cp != 0x00A0 &&
        policy.strip_unicode_whitespace)
        return removable(CharClass::UnicodeWhitespace, cp);
    if (policy.custom_chars.count(cp))
        return removable(CharClass::Custom, cp);
    return {};
}

const char* char_class_name(CharClass cls) {
    switch (cls) {
    case CharClass::Content:
        return "content";
    case CharClass::ZeroWidth:
        return "zero-width";
    case CharClass::NonBreakingSpace:
        return "non-breaking-space";
    case CharClass::Control:
        return "control";
    case CharClass::UnicodeWhitespace:
        return "unicode-whitespace";
    case CharClass::Custom:
        return "custom";
    }
    return "content";
}

} // namespace scrub
