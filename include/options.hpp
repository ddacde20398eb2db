#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "logger.hpp"
#include "scrub_config.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file; ///< Empty disables file logging
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
};

struct Options {
    std::vector<std::filesystem::path> paths;
    bool dry_run = false;
    bool watch = false;
    bool verbose = false;
    bool silent = false;
    bool no_colors = false;
    bool show_help = false;
    bool print_version = false;
    bool init = false;  ///< `init` subcommand
    bool force = false; ///< Overwrite an existing config on `init`
    std::filesystem::path config_file;
    size_t concurrency = 0; ///< 0 picks the hardware concurrency
    std::chrono::milliseconds debounce{300};
    LoggingOptions logging;
    std::vector<std::string> original_args;
};

/**
 * Parse command-line arguments into an Options instance.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Fully populated Options structure. Paths default to `.`.
 * @throws std::runtime_error on unknown flags, missing or invalid values, and
 *         conflicting flags.
 */
Options parse_options(int argc, char* argv[]);

/**
 * Build the scrub configuration for a run.
 *
 * Loads `--config` when given, otherwise the first of `.ghostscrub`,
 * `.ghostscrub.toml`, `.ghostscrub.yaml` and `.ghostscrub.json` found in
 * @p search_dir, otherwise
 * the built-in defaults. `--verbose` and `--silent` then override the
 * configured verbosity.
 *
 * @throws scrub::ConfigError when a config file is missing or invalid.
 */
scrub::ScrubConfig resolve_scrub_config(const Options& opts,
                                        const std::filesystem::path& search_dir = ".");

#endif // OPTIONS_HPP
