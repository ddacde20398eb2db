#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Simple command line argument parser.
 *
 * The parser recognizes long style options (`--flag`, `--opt value` and
 * `--opt=value`) and clusters of short options (`-nv`, `-t4`, `-t 4`).
 * Only the flags listed in @a value_flags consume a value, so a boolean flag
 * followed by a path leaves the path positional. A bare `--` ends option
 * parsing; everything after it is positional.
 *
 * Flags outside @a known_flags are collected in unknown_flags() and value
 * flags that appear last without a value in missing_values().
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::map<std::string, std::vector<std::string>>
        multi_options_;                       ///< Store all values for repeatable options
    std::vector<std::string> positional_;     ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;  ///< Flags not present in known_flags
    std::vector<std::string> missing_values_; ///< Value flags given without a value
    std::set<std::string> known_flags_;       ///< List of accepted flags
    std::map<char, std::string> short_map_;   ///< Mapping of short to long flags
    std::set<std::string> value_flags_;       ///< Flags that take a value

    bool known(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    void store(const std::string& key, const std::string& val) {
        flags_.insert(key);
        options_[key] = val;
        multi_options_[key].push_back(val);
    }

    void parse_short_cluster(const std::string& arg, int argc, char* argv[], int& i) {
        for (size_t j = 1; j < arg.size(); ++j) {
            char c = arg[j];
            auto it = short_map_.find(c);
            if (it == short_map_.end()) {
                unknown_flags_.push_back(std::string("-") + c);
                continue;
            }
            const std::string& key = it->second;
            if (!known(key)) {
                unknown_flags_.push_back(key);
                continue;
            }
            if (!value_flags_.count(key)) {
                flags_.insert(key);
                continue;
            }
            // The rest of the cluster (minus an optional '=') is the value.
            std::string rest = arg.substr(j + 1);
            if (!rest.empty() && rest[0] == '=')
                rest.erase(0, 1);
            if (!rest.empty()) {
                store(key, rest);
            } else if (i + 1 < argc) {
                store(key, argv[++i]);
            } else {
                flags_.insert(key);
                missing_values_.push_back(key);
            }
            return;
        }
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Optional set of flags that are considered valid. If
     *        empty, all flags are treated as known.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     * @param value_flags Long flags that take a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {})
        : known_flags_(known_flags), short_map_(short_map), value_flags_(value_flags) {
        bool options_done = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (options_done || arg == "-" || arg.empty() || arg[0] != '-') {
                positional_.push_back(arg);
            } else if (arg == "--") {
                options_done = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                std::string key = arg.substr(0, eq);
                if (!known(key)) {
                    unknown_flags_.push_back(key);
                } else if (eq != std::string::npos) {
                    store(key, arg.substr(eq + 1));
                } else if (!value_flags_.count(key)) {
                    flags_.insert(key);
                } else if (i + 1 < argc) {
                    store(key, argv[++i]);
                } else {
                    flags_.insert(key);
                    missing_values_.push_back(key);
                }
            } else {
                parse_short_cluster(arg, argc, argv, i);
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     * @return `true` if the flag was present, otherwise `false`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * If the option was given more than once the last value wins. If it was
     * not provided, an empty string is returned.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return Every value given for @p opt, in command line order. */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        if (it != multi_options_.end())
            return it->second;
        return {};
    }

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value flags that ended the command line without a value. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
