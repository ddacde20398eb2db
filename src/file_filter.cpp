#include "file_filter.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#ifdef _WIN32
#include <regex>
#else
#include <fnmatch.h>
#endif

namespace fs = std::filesystem;

namespace {

void trim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

#ifdef _WIN32
std::string glob_to_regex(const std::string& pattern) {
    std::string rx;
    rx.reserve(pattern.size() * 2);
    rx.push_back('^');
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                rx += ".*";
                ++i;
            } else {
                rx += "[^/]*";
            }
        } else if (c == '?') {
            rx += "[^/]";
        } else if (std::string("\\.^$|()[]{}+").find(c) != std::string::npos) {
            rx.push_back('\\');
            rx.push_back(c);
        } else {
            rx.push_back(c);
        }
    }
    rx.push_back('$');
    return rx;
}
#endif

bool match_one(const std::string& pattern, const std::string& subject) {
#ifdef _WIN32
    std::regex re(glob_to_regex(pattern));
    return std::regex_match(subject, re);
#else
    return fnmatch(pattern.c_str(), subject.c_str(), 0) == 0;
#endif
}

std::vector<std::string> split_segments(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t slash = text.find('/', start);
        if (slash == std::string::npos)
            slash = text.size();
        std::string seg = text.substr(start, slash - start);
        if (!seg.empty() && seg != ".")
            out.push_back(std::move(seg));
        start = slash + 1;
    }
    return out;
}

bool match_segments(const std::vector<std::string>& pat, size_t pi,
                    const std::vector<std::string>& parts, size_t si) {
    if (pi == pat.size())
        return si == parts.size();
    if (pat[pi] == "**") {
        for (size_t k = si; k <= parts.size(); ++k) {
            if (match_segments(pat, pi + 1, parts, k))
                return true;
        }
        return false;
    }
    return si < parts.size() && match_one(pat[pi], parts[si]) &&
           match_segments(pat, pi + 1, parts, si + 1);
}

} // namespace

namespace filter {

bool glob_match(const std::string& pattern, const fs::path& rel) {
    if (pattern.empty())
        return false;
    const std::string full = rel.generic_string();
    if (pattern.find('/') == std::string::npos)
        return match_one(pattern, rel.filename().generic_string());
    if (match_one(pattern, full))
        return true;
    // "**/x" also matches "x" at the root.
    if (pattern.compare(0, 3, "**/") == 0)
        return match_one(pattern.substr(3), full);
    return false;
}

bool path_glob_match(const std::string& pattern, const fs::path& rel) {
    const std::vector<std::string> pat = split_segments(pattern);
    if (pat.empty())
        return false;
    return match_segments(pat, 0, split_segments(rel.generic_string()), 0);
}

bool matches_any(const std::vector<std::string>& patterns, const fs::path& rel) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&](const std::string& p) { return glob_match(p, rel); });
}

std::string extension_of(const fs::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

FileFilter::FileFilter(scrub::FilterRules rules) : rules_(std::move(rules)) {}

bool FileFilter::accepts(const fs::path& rel) const {
    const std::string ext = extension_of(rel);
    if (!ext.empty()) {
        const auto& exc = rules_.exclude_extensions;
        if (std::find(exc.begin(), exc.end(), ext) != exc.end())
            return false;
        const auto& inc = rules_.include_extensions;
        if (!inc.empty() && std::find(inc.begin(), inc.end(), ext) == inc.end())
            return false;
    }
    if (!rules_.include_patterns.empty() && !matches_any(rules_.include_patterns, rel))
        return false;
    return !matches_any(rules_.exclude_patterns, rel);
}

void FileFilter::add_exclude_patterns(const std::vector<std::string>& patterns) {
    rules_.exclude_patterns.insert(rules_.exclude_patterns.end(), patterns.begin(),
                                   patterns.end());
}

bool skip_directory(const std::string& name) {
    static const std::set<std::string> dirs{
        "target", "node_modules", ".git",  ".svn",  ".hg",  "__pycache__", ".pytest_cache",
        "venv",   ".venv",        "build", "dist",  ".idea", ".vscode"};
    return dirs.count(name) > 0;
}

bool is_editor_temporary(const fs::path& path) {
    const std::string name = path.filename().string();
    if (name.empty())
        return false;
    return name.front() == '.' || name.back() == '~' || ends_with(name, ".tmp") ||
           ends_with(name, ".swp") || name.find(".#") != std::string::npos;
}

std::vector<std::string> read_ignore_file(const fs::path& file) {
    std::vector<std::string> entries;
    std::ifstream ifs(file);
    if (!ifs)
        return entries;
    std::string line;
    while (std::getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        entries.push_back(line);
    }
    return entries;
}

} // namespace filter
