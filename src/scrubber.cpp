#include "scrubber.hpp"
#include <algorithm>
#include <cstdio>
#include "char_class.hpp"
#include "utf8_utils.hpp"

namespace scrub {

namespace {

// U+2983 / U+2984, the brackets around rendered markers.
constexpr const char* kOpen = "\xE2\xA6\x83";
constexpr const char* kClose = "\xE2\xA6\x84";

std::string marker(const std::string& body) { return std::string(kOpen) + body + kClose; }

struct DecodedChar {
    char32_t cp = 0;
    std::string_view bytes;
    bool valid = true;
};

// Tolerant decode for rendering: an invalid byte becomes its own entry.
std::vector<DecodedChar> decode_for_display(std::string_view text) {
    std::vector<DecodedChar> out;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t start = pos;
        char32_t cp = 0;
        if (utf8::decode_next(text, pos, cp)) {
            out.push_back({cp, text.substr(start, pos - start), true});
        } else {
            out.push_back({static_cast<unsigned char>(text[pos]), text.substr(pos, 1), false});
            ++pos;
        }
    }
    return out;
}

std::string space_name(const DecodedChar& c) {
    if (!c.valid) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned int>(c.cp));
        return buf;
    }
    switch (c.cp) {
    case ' ':
        return "SP";
    case '\t':
        return "TAB";
    case 0x00A0:
        return "NBSP";
    default:
        break;
    }
    if (is_unicode_white_space(c.cp))
        return "WS:" + format_code_point(c.cp);
    return format_code_point(c.cp);
}

std::string render_char(const DecodedChar& c) {
    if (!c.valid)
        return marker(space_name(c));
    if (c.cp == ' ')
        return " ";
    if (is_zero_width(c.cp) || c.cp == 0x00A0 || c.cp == '\t')
        return marker(code_point_label(c.cp));
    if (is_ascii_control(c.cp))
        return marker(format_code_point(c.cp));
    if (is_unicode_white_space(c.cp))
        return marker("WS:" + format_code_point(c.cp));
    return std::string(c.bytes);
}

bool is_blank(const DecodedChar& c) { return c.valid && is_unicode_white_space(c.cp); }

std::size_t line_of_offset(std::string_view bytes, std::size_t offset) {
    return 1 + static_cast<std::size_t>(
                   std::count(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                              '\n'));
}

// Collapses a whitespace-only line or trims its trailing SP/TAB run.
// kept_columns holds the original column of every code point in out.cleaned.
void trim_line_end(LineResult& out, std::vector<std::size_t>& kept_columns,
                   std::size_t line_index) {
    if (out.cleaned.empty())
        return;
    const std::size_t last = out.cleaned.find_last_not_of(" \t");
    if (last == std::string::npos) {
        Change ch;
        ch.line = line_index + 1;
        ch.column = kept_columns.front();
        ch.kind = ChangeKind::WhitespaceOnlyToEmpty;
        ch.label = whitespace_composition(out.cleaned);
        out.changes.push_back(std::move(ch));
        out.cleaned.clear();
        kept_columns.clear();
    } else if (last + 1 < out.cleaned.size()) {
        // The trimmed run is ASCII, so its length in bytes is its length in
        // code points.
        const std::size_t run = out.cleaned.size() - last - 1;
        Change ch;
        ch.line = line_index + 1;
        ch.column = kept_columns[kept_columns.size() - run];
        ch.kind = ChangeKind::TrailingWhitespaceTrimmed;
        ch.label = whitespace_composition(std::string_view(out.cleaned).substr(last + 1));
        out.changes.push_back(std::move(ch));
        out.cleaned.erase(last + 1);
        kept_columns.resize(kept_columns.size() - run);
    }
}

} // namespace

DecodeError::DecodeError(std::size_t offset, std::size_t line)
    : std::runtime_error("invalid UTF-8 sequence at byte " + std::to_string(offset) + " (line " +
                         std::to_string(line) + ")"),
      offset_(offset), line_(line) {}

std::vector<LineRecord> split_lines(std::string_view bytes) {
    std::vector<LineRecord> lines;
    std::size_t start = 0;
    while (start < bytes.size()) {
        std::size_t nl = bytes.find('\n', start);
        LineRecord rec;
        rec.index = lines.size();
        if (nl == std::string_view::npos) {
            rec.text = bytes.substr(start);
            lines.push_back(rec);
            break;
        }
        std::size_t end = nl;
        if (end > start && bytes[end - 1] == '\r')
            --end;
        rec.text = bytes.substr(start, end - start);
        rec.terminator = bytes.substr(end, nl + 1 - end);
        lines.push_back(rec);
        start = nl + 1;
    }
    return lines;
}

LineResult scrub_line(std::string_view text, const CharacterPolicy& policy,
                      std::size_t line_index, bool lf_terminated) {
    LineResult out;
    out.cleaned.reserve(text.size());
    // Original column of every code point kept in out.cleaned.
    std::vector<std::size_t> kept_columns;
    std::size_t pos = 0;
    std::size_t column = 0;
    while (pos < text.size()) {
        const std::size_t start = pos;
        char32_t cp = 0;
        if (!utf8::decode_next(text, pos, cp))
            throw DecodeError(start, line_index + 1);
        ++column;
        Classification c = classify(cp, policy);
        if (c.removable) {
            Change ch;
            ch.line = line_index + 1;
            ch.column = column;
            ch.kind = ChangeKind::RemovedChar;
            ch.code_point = cp;
            ch.label = std::move(c.label);
            out.changes.push_back(std::move(ch));
            continue;
        }
        kept_columns.push_back(column);
        out.cleaned.append(text.substr(start, pos - start));
    }

    if (policy.strip_trailing_whitespace) {
        trim_line_end(out, kept_columns, line_index);
        if (lf_terminated && !out.cleaned.empty() && out.cleaned.back() == '\r') {
            out.cleaned.pop_back();
            kept_columns.pop_back();
            trim_line_end(out, kept_columns, line_index);
            out.cleaned += '\r';
        }
    }

    if (!out.changes.empty()) {
        const std::string before = visualize_line(text);
        const std::string after = visualize_line(out.cleaned);
        for (auto& ch : out.changes) {
            ch.original_rendering = before;
            ch.cleaned_rendering = after;
        }
    }
    return out;
}

ScrubResult scrub_text(std::string_view bytes, const CharacterPolicy& policy) {
    std::size_t bad = 0;
    if (!utf8::validate(bytes, bad))
        throw DecodeError(bad, line_of_offset(bytes, bad));

    ScrubResult result;
    const std::vector<LineRecord> lines = split_lines(bytes);
    result.line_count = lines.size();
    result.cleaned.reserve(bytes.size());
    for (const auto& rec : lines) {
        LineResult lr = scrub_line(rec.text, policy, rec.index, rec.terminator == "\n");
        result.cleaned += lr.cleaned;
        result.cleaned.append(rec.terminator);
        std::move(lr.changes.begin(), lr.changes.end(), std::back_inserter(result.changes));
    }
    result.modified = !result.changes.empty();
    if (!result.modified)
        result.cleaned.assign(bytes.data(), bytes.size());
    return result;
}

std::string whitespace_composition(std::string_view run) {
    std::string out;
    for (const auto& c : decode_for_display(run)) {
        if (!out.empty())
            out += '+';
        out += space_name(c);
    }
    return out;
}

std::string visualize_line(std::string_view text) {
    if (text.empty())
        return marker("EMPTY");
    const std::vector<DecodedChar> chars = decode_for_display(text);
    auto last_visible = std::find_if(chars.rbegin(), chars.rend(),
                                     [](const DecodedChar& c) { return !is_blank(c); });
    if (last_visible == chars.rend())
        return marker("WHITESPACE-ONLY: " + whitespace_composition(text));

    const std::size_t keep = static_cast<std::size_t>(chars.rend() - last_visible);
    std::string out;
    for (std::size_t i = 0; i < keep; ++i)
        out += render_char(chars[i]);
    if (keep < chars.size()) {
        std::string trailing;
        for (std::size_t i = keep; i < chars.size(); ++i) {
            if (!trailing.empty())
                trailing += '+';
            trailing += space_name(chars[i]);
        }
        out += marker("TRAILING: " + trailing);
    }
    return out;
}

const char* change_kind_name(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::RemovedChar:
        return "removed-char";
    case ChangeKind::WhitespaceOnlyToEmpty:
        return "whitespace-only-to-empty";
    case ChangeKind::TrailingWhitespaceTrimmed:
        return "trailing-whitespace-trimmed";
    }
    return "removed-char";
}

} // namespace scrub
