#include <filesystem>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace {

const std::set<std::string>& known_flags() {
    static const std::set<std::string> known{
        "--dry-run",   "--watch",     "--config",       "--verbose",   "--silent",
        "--threads",   "--debounce",  "--no-colors",    "--log-file",  "--log-level",
        "--json-log",  "--max-log-size", "--max-log-files", "--compress-logs", "--help",
        "--version",   "--force"};
    return known;
}

const std::set<std::string>& value_flags() {
    static const std::set<std::string> values{"--config",   "--threads",      "--debounce",
                                              "--log-file", "--log-level",    "--max-log-size",
                                              "--max-log-files"};
    return values;
}

const std::map<char, std::string>& short_flags() {
    static const std::map<char, std::string> shorts{
        {'n', "--dry-run"}, {'w', "--watch"},    {'c', "--config"},   {'v', "--verbose"},
        {'s', "--silent"},  {'t', "--threads"},  {'C', "--no-colors"}, {'l', "--log-file"},
        {'L', "--log-level"}, {'h', "--help"},   {'V', "--version"},  {'f', "--force"}};
    return shorts;
}

} // namespace

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, known_flags(), short_flags(), value_flags());
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error("Option " + parser.missing_values().front() +
                                 " requires a value");

    Options opts;
    for (int i = 1; i < argc; ++i)
        opts.original_args.emplace_back(argv[i]);

    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.dry_run = parser.has_flag("--dry-run");
    opts.watch = parser.has_flag("--watch");
    opts.verbose = parser.has_flag("--verbose");
    opts.silent = parser.has_flag("--silent");
    opts.no_colors = parser.has_flag("--no-colors");
    opts.force = parser.has_flag("--force");
    if (opts.verbose && opts.silent)
        throw std::runtime_error("--verbose and --silent cannot be combined");

    std::vector<std::string> positional = parser.positional();
    if (!positional.empty() && positional.front() == "init") {
        opts.init = true;
        positional.erase(positional.begin());
        if (!positional.empty())
            throw std::runtime_error("init does not take paths");
        if (opts.watch || opts.dry_run)
            throw std::runtime_error("init cannot be combined with --watch or --dry-run");
    } else if (opts.force) {
        throw std::runtime_error("--force is only valid with init");
    }
    for (const auto& p : positional)
        opts.paths.emplace_back(p);
    if (opts.paths.empty() && !opts.init)
        opts.paths.emplace_back(".");

    if (parser.has_flag("--config")) {
        opts.config_file = parser.get_option("--config");
        if (opts.config_file.empty())
            throw std::runtime_error("--config requires a file name");
    }

    bool ok = false;
    if (parser.has_flag("--threads")) {
        opts.concurrency = parse_size_t(parser, "--threads", 1, 1024, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --threads (expected 1-1024)");
    }
    if (parser.has_flag("--debounce")) {
        opts.debounce = parse_time_ms(parser, "--debounce", ok);
        if (!ok || opts.debounce > std::chrono::minutes(10))
            throw std::runtime_error("Invalid value for --debounce");
    }

    opts.logging.log_file = parser.get_option("--log-file");
    if (parser.has_flag("--log-level")) {
        if (!parse_log_level(parser.get_option("--log-level"), opts.logging.log_level))
            throw std::runtime_error("Invalid log level: " + parser.get_option("--log-level"));
    }
    if (parser.has_flag("--max-log-size")) {
        opts.logging.max_log_size =
            parse_bytes(parser, "--max-log-size", 1024, std::numeric_limits<size_t>::max(), ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (parser.has_flag("--max-log-files")) {
        opts.logging.max_log_files = parse_size_t(parser, "--max-log-files", 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files (expected 1-100)");
    }
    opts.logging.json_log = parser.has_flag("--json-log");
    opts.logging.compress_logs = parser.has_flag("--compress-logs");
    return opts;
}

scrub::ScrubConfig resolve_scrub_config(const Options& opts, const fs::path& search_dir) {
    scrub::ScrubConfig cfg;
    if (!opts.config_file.empty()) {
        std::error_code ec;
        if (!fs::exists(opts.config_file, ec))
            throw scrub::ConfigError("Config file not found: " + opts.config_file.string());
        cfg = scrub::load_scrub_config(opts.config_file);
    } else {
        fs::path found = scrub::find_default_config(search_dir);
        cfg = found.empty() ? scrub::default_scrub_config() : scrub::load_scrub_config(found);
    }
    if (opts.verbose)
        cfg.verbosity = scrub::Verbosity::Verbose;
    else if (opts.silent)
        cfg.verbosity = scrub::Verbosity::Silent;
    return cfg;
}
