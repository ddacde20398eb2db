#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include <toml++/toml.h>
#include "char_class.hpp"

// Typed integers (JSON, TOML) in this list are decimal code points.
static const char* const kCodePointList = "custom_chars";

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) {
        out = b ? "true" : "false";
        return true;
    }
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

// List items keep their literal spelling so `0x2028` is not turned into 8232.
static bool assign_yaml_node(const std::string& key, const YAML::Node& node, ConfigValues& values,
                             std::string& error) {
    if (node.IsSequence()) {
        auto& list = values.lists[key];
        list.clear();
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                error = "List '" + key + "' may only contain scalar values";
                return false;
            }
            list.push_back(item.Scalar());
        }
        values.scalars.erase(key);
        return true;
    }
    std::string s;
    if (!to_string_value(node, s)) {
        error = "Unsupported value for '" + key + "'";
        return false;
    }
    values.scalars[key] = s;
    values.lists.erase(key);
    return true;
}

static bool code_point_item(const std::string& key, long long v, std::string& out,
                            std::string& error) {
    if (key != kCodePointList) {
        error = "List '" + key + "' may only contain strings";
        return false;
    }
    if (v < 0 || v > 0x10FFFF) {
        error = "Code point out of range in '" + key + "': " + std::to_string(v);
        return false;
    }
    out = scrub::format_code_point(static_cast<char32_t>(v));
    return true;
}

static bool assign_json_value(const std::string& key, const nlohmann::json& val,
                              ConfigValues& values, std::string& error) {
    if (val.is_array()) {
        auto& list = values.lists[key];
        list.clear();
        for (const auto& item : val) {
            if (item.is_string()) {
                list.push_back(item.get<std::string>());
            } else if (item.is_number_integer()) {
                std::string cp;
                if (!code_point_item(key, item.get<long long>(), cp, error))
                    return false;
                list.push_back(cp);
            } else {
                error = "List '" + key + "' may only contain strings";
                return false;
            }
        }
        values.scalars.erase(key);
        return true;
    }
    std::string s;
    if (!to_string_value(val, s)) {
        error = "Unsupported value for '" + key + "'";
        return false;
    }
    values.scalars[key] = s;
    values.lists.erase(key);
    return true;
}

static bool to_string_value(const toml::node& node, std::string& out) {
    if (auto str = node.as_string()) {
        out = str->get();
        return true;
    }
    if (auto b = node.as_boolean()) {
        out = b->get() ? "true" : "false";
        return true;
    }
    if (auto i = node.as_integer()) {
        out = std::to_string(i->get());
        return true;
    }
    if (auto f = node.as_floating_point()) {
        std::ostringstream oss;
        oss << f->get();
        out = oss.str();
        return true;
    }
    return false;
}

static bool assign_toml_node(const std::string& key, const toml::node& node,
                             ConfigValues& values, std::string& error) {
    if (const toml::array* arr = node.as_array()) {
        auto& list = values.lists[key];
        list.clear();
        for (const auto& item : *arr) {
            if (auto str = item.as_string()) {
                list.push_back(str->get());
            } else if (auto i = item.as_integer()) {
                std::string cp;
                if (!code_point_item(key, static_cast<long long>(i->get()), cp, error))
                    return false;
                list.push_back(cp);
            } else {
                error = "List '" + key + "' may only contain strings";
                return false;
            }
        }
        values.scalars.erase(key);
        return true;
    }
    std::string s;
    if (!to_string_value(node, s)) {
        error = "Unsupported value for '" + key + "'";
        return false;
    }
    values.scalars[key] = s;
    values.lists.erase(key);
    return true;
}

static bool read_toml_table(const toml::table& root, ConfigValues& values, std::string& error) {
    for (auto&& [k, node] : root) {
        const std::string key_name(k.str());
        if (const toml::table* section = node.as_table()) {
            // `[target_characters]` only groups keys.
            for (auto&& [k2, sub] : *section) {
                if (sub.is_table()) {
                    error = "Section '" + key_name + "' nests too deeply";
                    return false;
                }
                if (!assign_toml_node(std::string(k2.str()), sub, values, error))
                    return false;
            }
        } else if (!assign_toml_node(key_name, node, values, error)) {
            return false;
        }
    }
    return true;
}

static std::string describe(const toml::parse_error& e) {
    std::ostringstream oss;
    oss << e.description() << " (line " << e.source().begin.line << ")";
    return oss.str();
}

bool load_toml_config(const std::string& path, ConfigValues& values, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    try {
        toml::table root = toml::parse(ifs, path);
        return read_toml_table(root, values, error);
    } catch (const toml::parse_error& e) {
        error = describe(e);
        return false;
    }
}

bool load_yaml_config(const std::string& path, ConfigValues& values, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (node.IsMap()) {
                // Sections such as `target_characters:` only group keys.
                for (auto it2 = node.begin(); it2 != node.end(); ++it2) {
                    if (!it2->first.IsScalar())
                        continue;
                    if (it2->second.IsMap()) {
                        error = "Section '" + key_name + "' nests too deeply";
                        return false;
                    }
                    if (!assign_yaml_node(it2->first.as<std::string>(), it2->second, values,
                                          error))
                        return false;
                }
            } else if (!assign_yaml_node(key_name, node, values, error)) {
                return false;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, ConfigValues& values, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            const std::string key_name = it.key();
            if (val.is_object()) {
                for (auto sub = val.begin(); sub != val.end(); ++sub) {
                    if (sub.value().is_object()) {
                        error = "Section '" + key_name + "' nests too deeply";
                        return false;
                    }
                    if (!assign_json_value(sub.key(), sub.value(), values, error))
                        return false;
                }
            } else if (!assign_json_value(key_name, val, values, error)) {
                return false;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_config_file(const std::string& path, ConfigValues& values, std::string& error) {
    std::string ext;
    auto slash = path.find_last_of("/\\");
    auto pos = path.find_last_of('.');
    if (pos != std::string::npos && (slash == std::string::npos || pos > slash + 1))
        ext = path.substr(pos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == "json")
        return load_json_config(path, values, error);
    if (ext == "toml")
        return load_toml_config(path, values, error);
    if (ext == "yaml" || ext == "yml")
        return load_yaml_config(path, values, error);

    // `.ghostscrub` and other names: TOML when it parses as TOML, else YAML.
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    std::string toml_error;
    try {
        toml::table root = toml::parse(ifs, path);
        return read_toml_table(root, values, error);
    } catch (const toml::parse_error& e) {
        toml_error = describe(e);
    }
    std::string yaml_error;
    if (load_yaml_config(path, values, yaml_error))
        return true;
    error = "not valid TOML (" + toml_error + ") or YAML (" + yaml_error + ")";
    return false;
}
