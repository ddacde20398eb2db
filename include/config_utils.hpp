#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>

/**
 * @brief Flattened configuration values.
 *
 * Nested sections are flattened so that `target_characters.zero_width_spaces`
 * and a top level `zero_width_spaces` end up under the same key. Scalars are
 * stored as strings; sequences of scalars are kept as lists.
 */
struct ConfigValues {
    std::map<std::string, std::string> scalars;
    std::map<std::string, std::vector<std::string>> lists;

    bool has(const std::string& key) const { return scalars.count(key) || lists.count(key); }
    bool empty() const { return scalars.empty() && lists.empty(); }
};

/**
 * @brief Load configuration values from a YAML file.
 *
 * On success, @p values is populated with every key found in the file.
 *
 * @param path   Filesystem path to the YAML configuration file.
 * @param values Receives scalar and list values keyed by option name.
 * @param error  Output string capturing a human-readable error message on
 *               failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, ConfigValues& values, std::string& error);

/**
 * @brief Load configuration values from a JSON file.
 *
 * On success, @p values is populated with every key found in the file.
 *
 * @param path   Filesystem path to the JSON configuration file.
 * @param values Receives scalar and list values keyed by option name.
 * @param error  Output string capturing a human-readable error message on
 *               failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_json_config(const std::string& path, ConfigValues& values, std::string& error);

/**
 * @brief Load configuration values from a TOML file.
 *
 * Tables such as `[target_characters]` are flattened like YAML sections.
 */
bool load_toml_config(const std::string& path, ConfigValues& values, std::string& error);

/**
 * @brief Load a config file, choosing the parser from its extension.
 *
 * `.json`, `.toml` and `.yaml`/`.yml` pick their loader directly. Any other
 * name, including the extension-less `.ghostscrub`, is read as TOML when it
 * parses as TOML and as YAML otherwise.
 *
 * Integers in `custom_chars` from JSON or TOML are decimal code points. YAML
 * list items keep their literal spelling, so a bare `2028` there is hex.
 */
bool load_config_file(const std::string& path, ConfigValues& values, std::string& error);

#endif // CONFIG_UTILS_HPP
