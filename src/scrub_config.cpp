#include "scrub_config.hpp"
#include <algorithm>
#include <cctype>
#include "parse_utils.hpp"
#include "utf8_utils.hpp"

namespace fs = std::filesystem;

namespace scrub {

namespace {

const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys{"zero_width_spaces",  "non_breaking_spaces",
                                            "control_characters", "unicode_whitespace",
                                            "trailing_whitespace", "custom_chars",
                                            "include_extensions", "exclude_extensions",
                                            "include_patterns",   "exclude_patterns",
                                            "verbosity"};
    return keys;
}

void read_flag(const ConfigValues& values, const std::string& key, bool& target) {
    if (values.lists.count(key))
        throw ConfigError("Option '" + key + "' expects true or false, got a list");
    auto it = values.scalars.find(key);
    if (it == values.scalars.end())
        return;
    bool ok = false;
    bool v = parse_bool(it->second, ok);
    if (!ok)
        throw ConfigError("Option '" + key + "' expects true or false, got '" + it->second + "'");
    target = v;
}

// A bare scalar is accepted as a one-element list; null clears the list.
bool read_list(const ConfigValues& values, const std::string& key,
               std::vector<std::string>& target) {
    auto lit = values.lists.find(key);
    if (lit != values.lists.end()) {
        target = lit->second;
        return true;
    }
    auto sit = values.scalars.find(key);
    if (sit == values.scalars.end())
        return false;
    target.clear();
    if (!sit->second.empty())
        target.push_back(sit->second);
    return true;
}

std::string normalize_extension(std::string ext) {
    if (!ext.empty() && ext.front() == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

std::vector<std::string> default_include_extensions() {
    return {"rs",   "py",  "js",   "ts",   "jsx",  "tsx", "go",   "java", "c",    "cpp", "h",
            "hpp",  "cs",  "php",  "rb",   "swift", "kt", "scala", "clj", "hs",   "ml",  "txt",
            "md",   "json", "xml", "yaml", "yml",  "toml", "ini", "cfg",  "conf"};
}

std::vector<std::string> default_include_patterns() { return {"**/*"}; }

std::vector<std::string> default_exclude_patterns() {
    return {// Version control
            "**/.git/**", "**/.svn/**", "**/.hg/**", "**/.bzr/**",
            // Build artifacts and dependencies
            "**/target/**", "**/node_modules/**", "**/build/**", "**/dist/**", "**/out/**",
            "**/bin/**", "**/obj/**",
            // Python
            "**/__pycache__/**", "**/.pytest_cache/**", "**/venv/**", "**/.venv/**",
            "**/*.egg-info/**",
            // IDEs and editors
            "**/.idea/**", "**/.vscode/**", "**/.vs/**", "**/*.swp", "**/*.swo", "**/*~",
            "**/.#*",
            // OS specific
            "**/.DS_Store", "**/Thumbs.db", "**/desktop.ini",
            // Temporary files
            "**/*.tmp", "**/*.temp", "**/*.bak", "**/*.orig",
            // Logs
            "**/*.log", "**/logs/**"};
}

ScrubConfig default_scrub_config() {
    ScrubConfig cfg;
    cfg.filter.include_extensions = default_include_extensions();
    cfg.filter.include_patterns = default_include_patterns();
    cfg.filter.exclude_patterns = default_exclude_patterns();
    return cfg;
}

CharacterPolicy passthrough_policy() {
    CharacterPolicy p;
    p.strip_zero_width = false;
    p.strip_non_breaking_space = false;
    p.strip_control_chars = false;
    p.strip_unicode_whitespace = false;
    p.strip_trailing_whitespace = false;
    return p;
}

bool parse_code_point(const std::string& text, char32_t& cp) {
    if (text.empty())
        return false;
    std::string hex;
    if (text.size() > 2 && (text.compare(0, 2, "U+") == 0 || text.compare(0, 2, "u+") == 0 ||
                            text.compare(0, 2, "0x") == 0 || text.compare(0, 2, "0X") == 0)) {
        hex = text.substr(2);
    } else {
        // A single literal character, e.g. " " written directly in YAML.
        std::size_t pos = 0;
        char32_t literal = 0;
        if (utf8::decode_next(text, pos, literal) && pos == text.size() &&
            !std::isxdigit(static_cast<unsigned char>(text[0]))) {
            cp = literal;
            return true;
        }
        hex = text;
    }
    if (hex.empty() || hex.size() > 6)
        return false;
    if (!std::all_of(hex.begin(), hex.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; }))
        return false;
    unsigned long v = std::stoul(hex, nullptr, 16);
    if (v > 0x10FFFF || (v >= 0xD800 && v <= 0xDFFF))
        return false;
    cp = static_cast<char32_t>(v);
    return true;
}

bool parse_verbosity(const std::string& text, Verbosity& out) {
    std::string v = text;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "silent")
        out = Verbosity::Silent;
    else if (v == "normal")
        out = Verbosity::Normal;
    else if (v == "verbose")
        out = Verbosity::Verbose;
    else
        return false;
    return true;
}

const char* verbosity_name(Verbosity v) {
    switch (v) {
    case Verbosity::Silent:
        return "silent";
    case Verbosity::Normal:
        return "normal";
    case Verbosity::Verbose:
        return "verbose";
    }
    return "normal";
}

ScrubConfig build_scrub_config(const ConfigValues& values) {
    for (const auto& kv : values.scalars) {
        if (!known_keys().count(kv.first))
            throw ConfigError("Unknown option in config: " + kv.first);
    }
    for (const auto& kv : values.lists) {
        if (!known_keys().count(kv.first))
            throw ConfigError("Unknown option in config: " + kv.first);
    }

    ScrubConfig cfg = default_scrub_config();
    read_flag(values, "zero_width_spaces", cfg.policy.strip_zero_width);
    read_flag(values, "non_breaking_spaces", cfg.policy.strip_non_breaking_space);
    read_flag(values, "control_characters", cfg.policy.strip_control_chars);
    read_flag(values, "unicode_whitespace", cfg.policy.strip_unicode_whitespace);
    read_flag(values, "trailing_whitespace", cfg.policy.strip_trailing_whitespace);

    std::vector<std::string> custom;
    if (read_list(values, "custom_chars", custom)) {
        for (const auto& entry : custom) {
            char32_t cp = 0;
            if (!parse_code_point(entry, cp))
                throw ConfigError("Invalid code point in custom_chars: '" + entry + "'");
            if (cp == '\n')
                throw ConfigError("custom_chars entry '" + entry +
                                  "' is U+000A; line feeds are never removed");
            cfg.policy.custom_chars.insert(cp);
        }
    }

    if (read_list(values, "include_extensions", cfg.filter.include_extensions)) {
        for (auto& e : cfg.filter.include_extensions)
            e = normalize_extension(e);
    }
    if (read_list(values, "exclude_extensions", cfg.filter.exclude_extensions)) {
        for (auto& e : cfg.filter.exclude_extensions)
            e = normalize_extension(e);
    }
    read_list(values, "include_patterns", cfg.filter.include_patterns);
    read_list(values, "exclude_patterns", cfg.filter.exclude_patterns);

    if (values.lists.count("verbosity"))
        throw ConfigError("Option 'verbosity' expects silent, normal or verbose");
    auto vit = values.scalars.find("verbosity");
    if (vit != values.scalars.end() && !parse_verbosity(vit->second, cfg.verbosity))
        throw ConfigError("Invalid verbosity: " + vit->second);
    return cfg;
}

ScrubConfig load_scrub_config(const fs::path& path) {
    ConfigValues values;
    std::string err;
    if (!load_config_file(path.string(), values, err))
        throw ConfigError("Failed to load config " + path.string() + ": " + err);
    return build_scrub_config(values);
}

fs::path find_default_config(const fs::path& dir) {
    for (const char* name :
         {".ghostscrub", ".ghostscrub.toml", ".ghostscrub.yaml", ".ghostscrub.json"}) {
        fs::path candidate = dir / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec))
            return candidate;
    }
    return {};
}

const std::string& config_template() {
    static const std::string text = R"(# ghostscrub configuration
#
# This file is YAML. TOML (.toml, or a .ghostscrub that parses as TOML) and
# JSON (.json) are read as well. Omitted keys use the defaults shown here.

target_characters:
  # U+200B, U+200C, U+200D and U+FEFF
  zero_width_spaces: true
  # U+00A0
  non_breaking_spaces: true
  # ASCII 0x00-0x1F and 0x7F; tabs and CRLF terminators are kept
  control_characters: true
  # Other Unicode White_Space (U+2000-U+200A, U+3000, ...)
  unicode_whitespace: true
  # Trailing spaces/tabs and whitespace-only lines
  trailing_whitespace: true
  # Extra code points to always remove, e.g. ["U+2028", "U+2029"].
  # Bare numbers are hex; a single non-hex character stands for itself.
  custom_chars: []

# Extensions without the leading dot. An empty include list allows any.
include_extensions: [rs, py, js, ts, jsx, tsx, go, java, c, cpp, h, hpp, cs, php, rb,
                     swift, kt, scala, clj, hs, ml, txt, md, json, xml, yaml, yml,
                     toml, ini, cfg, conf]
exclude_extensions: []

# Glob patterns matched against paths relative to each scanned root.
include_patterns: ["**/*"]
exclude_patterns:
  - "**/.git/**"
  - "**/.svn/**"
  - "**/.hg/**"
  - "**/target/**"
  - "**/node_modules/**"
  - "**/build/**"
  - "**/dist/**"
  - "**/__pycache__/**"
  - "**/.venv/**"
  - "**/.idea/**"
  - "**/.vscode/**"
  - "**/*.swp"
  - "**/*~"
  - "**/*.tmp"
  - "**/*.bak"
  - "**/*.log"

# silent, normal or verbose
verbosity: normal
)";
    return text;
}

} // namespace scrub
