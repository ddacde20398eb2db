#include "test_common.hpp"
#include <stdexcept>

TEST_CASE("parse_options defaults") {
    Argv args(std::vector<std::string>{});
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.paths == std::vector<fs::path>{"."});
    REQUIRE_FALSE(opts.dry_run);
    REQUIRE_FALSE(opts.watch);
    REQUIRE(opts.concurrency == 0);
    REQUIRE(opts.debounce == std::chrono::milliseconds(300));
    REQUIRE(opts.logging.log_file.empty());
    REQUIRE(opts.logging.log_level == LogLevel::INFO);
    REQUIRE(opts.logging.max_log_files == 3);
}

TEST_CASE("parse_options flags and values") {
    Argv args({"-nv", "--threads", "4", "--debounce=2s", "--config", "my.yaml", "--log-file",
               "run.log", "--log-level", "debug", "--json-log", "--compress-logs",
               "--max-log-size", "2MB", "--max-log-files", "5", "-C", "src", "docs/a.md"});
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.dry_run);
    REQUIRE(opts.verbose);
    REQUIRE(opts.no_colors);
    REQUIRE(opts.concurrency == 4);
    REQUIRE(opts.debounce == std::chrono::seconds(2));
    REQUIRE(opts.config_file == "my.yaml");
    REQUIRE(opts.logging.log_file == "run.log");
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.logging.json_log);
    REQUIRE(opts.logging.compress_logs);
    REQUIRE(opts.logging.max_log_size == 2 * 1024 * 1024);
    REQUIRE(opts.logging.max_log_files == 5);
    REQUIRE(opts.paths == std::vector<fs::path>{"src", "docs/a.md"});
    REQUIRE(opts.original_args.size() == 19);
}

TEST_CASE("parse_options init subcommand") {
    Argv args({"init", "--force"});
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.init);
    REQUIRE(opts.force);
    REQUIRE(opts.paths.empty());
}

TEST_CASE("parse_options rejects bad input") {
    const std::vector<std::vector<std::string>> bad{
        {"--bogus"},
        {"-z"},
        {"--config"},
        {"--verbose", "--silent"},
        {"--threads", "0"},
        {"--threads", "many"},
        {"--debounce", "11m"},
        {"--log-level", "chatty"},
        {"--max-log-size", "10"},
        {"--max-log-files", "0"},
        {"--force"},
        {"init", "src"},
        {"init", "--watch"},
        {"init", "--dry-run"},
    };
    for (const auto& argv : bad) {
        Argv args(argv);
        INFO(argv.front());
        REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), std::runtime_error);
    }
}

TEST_CASE("resolve_scrub_config search and overrides") {
    fs::path dir = make_temp_dir("resolve_cfg");
    Options opts;
    auto cfg = resolve_scrub_config(opts, dir);
    REQUIRE(cfg.policy.strip_zero_width);

    write_bytes(dir / ".ghostscrub", "zero_width_spaces: false\nverbosity: verbose\n");
    cfg = resolve_scrub_config(opts, dir);
    REQUIRE_FALSE(cfg.policy.strip_zero_width);
    REQUIRE(cfg.verbosity == scrub::Verbosity::Verbose);

    opts.silent = true;
    cfg = resolve_scrub_config(opts, dir);
    REQUIRE(cfg.verbosity == scrub::Verbosity::Silent);

    opts.silent = false;
    write_bytes(dir / "explicit.json", "{\"trailing_whitespace\": false}");
    opts.config_file = dir / "explicit.json";
    cfg = resolve_scrub_config(opts, dir);
    REQUIRE(cfg.policy.strip_zero_width);
    REQUIRE_FALSE(cfg.policy.strip_trailing_whitespace);

    opts.config_file = dir / "nope.yaml";
    REQUIRE_THROWS_AS(resolve_scrub_config(opts, dir), scrub::ConfigError);
    FS_REMOVE_ALL(dir);
}
