#include "utf8_utils.hpp"

namespace {

inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

} // namespace

namespace utf8 {

bool decode_next(std::string_view text, std::size_t& pos, char32_t& cp) {
    if (pos >= text.size())
        return false;
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t need = 0;
    char32_t value = 0;
    char32_t min_value = 0;
    if (lead < 0x80) {
        cp = lead;
        ++pos;
        return true;
    } else if ((lead & 0xE0) == 0xC0) {
        need = 1;
        value = lead & 0x1F;
        min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        need = 2;
        value = lead & 0x0F;
        min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        need = 3;
        value = lead & 0x07;
        min_value = 0x10000;
    } else {
        return false;
    }
    if (text.size() - pos - 1 < need)
        return false;
    for (std::size_t i = 1; i <= need; ++i) {
        const auto c = static_cast<unsigned char>(text[pos + i]);
        if (!is_continuation(c))
            return false;
        value = (value << 6) | (c & 0x3F);
    }
    if (value < min_value || value > 0x10FFFF)
        return false;
    if (value >= 0xD800 && value <= 0xDFFF)
        return false;
    cp = value;
    pos += need + 1;
    return true;
}

bool validate(std::string_view text, std::size_t& bad_offset) {
    std::size_t pos = 0;
    char32_t cp = 0;
    while (pos < text.size()) {
        if (!decode_next(text, pos, cp)) {
            bad_offset = pos;
            return false;
        }
    }
    return true;
}

void append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string encode(char32_t cp) {
    std::string out;
    append(out, cp);
    return out;
}

std::size_t length(std::string_view text) {
    std::size_t n = 0;
    for (char c : text) {
        if (!is_continuation(static_cast<unsigned char>(c)))
            ++n;
    }
    return n;
}

} // namespace utf8
