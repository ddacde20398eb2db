#ifndef SCRUB_CONFIG_HPP
#define SCRUB_CONFIG_HPP
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "config_utils.hpp"

namespace scrub {

/**
 * @brief Character classes the engine is allowed to remove.
 *
 * Built once per run and passed by const reference into every engine call.
 * Default-constructed policies enable every class, matching the defaults of a
 * missing configuration file.
 */
struct CharacterPolicy {
    bool strip_zero_width = true;
    bool strip_non_breaking_space = true;
    bool strip_control_chars = true;
    bool strip_unicode_whitespace = true;
    bool strip_trailing_whitespace = true;
    std::set<char32_t> custom_chars;
};

enum class Verbosity { Silent, Normal, Verbose };

/** Include/exclude rules applied by the walker and the watcher. */
struct FilterRules {
    std::vector<std::string> include_extensions;
    std::vector<std::string> exclude_extensions;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
};

struct ScrubConfig {
    CharacterPolicy policy;
    FilterRules filter;
    Verbosity verbosity = Verbosity::Normal;
};

/** Raised for any configuration problem; always fatal at startup. */
class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

std::vector<std::string> default_include_extensions();
std::vector<std::string> default_include_patterns();
std::vector<std::string> default_exclude_patterns();

/** Configuration used when no file is present. */
ScrubConfig default_scrub_config();

/** Policy with every class disabled. The engine leaves any input unchanged. */
CharacterPolicy passthrough_policy();

/**
 * @brief Build a config from loaded values, starting from the defaults.
 *
 * Unknown keys, wrong value types and invalid code points raise
 * @ref ConfigError; a partially parsed policy is never returned.
 */
ScrubConfig build_scrub_config(const ConfigValues& values);

/**
 * @brief Load and validate a configuration file.
 *
 * @throws ConfigError when the file cannot be read or parsed.
 */
ScrubConfig load_scrub_config(const std::filesystem::path& path);

/**
 * @brief Locate the implicit configuration file in @p dir.
 *
 * Looks for `.ghostscrub`, `.ghostscrub.toml`, `.ghostscrub.yaml` and
 * `.ghostscrub.json` in that order. Returns an empty path when none exists.
 */
std::filesystem::path find_default_config(const std::filesystem::path& dir);

/**
 * @brief Parse a code point written as `U+XXXX`, `0xXXXX`, bare hex, or a
 *        single literal UTF-8 character.
 */
bool parse_code_point(const std::string& text, char32_t& cp);

bool parse_verbosity(const std::string& text, Verbosity& out);
const char* verbosity_name(Verbosity v);

/** Commented YAML written by `ghostscrub init`. */
const std::string& config_template();

} // namespace scrub

#endif // SCRUB_CONFIG_HPP
