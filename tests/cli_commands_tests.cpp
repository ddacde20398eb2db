#include "test_common.hpp"
#include "cli_commands.hpp"

using namespace std::chrono_literals;

namespace {
Options options_for(const std::vector<fs::path>& paths) {
    Options opts;
    opts.paths = paths;
    opts.no_colors = true;
    opts.concurrency = 2;
    return opts;
}
} // namespace

TEST_CASE("init writes the template and honours --force") {
    fs::path dir = make_temp_dir("cli_init");
    Options opts;
    opts.init = true;
    std::ostringstream out, err;
    REQUIRE(cli::handle_init(opts, dir, out, err) == 0);
    REQUIRE(read_bytes(dir / ".ghostscrub") == scrub::config_template());
    REQUIRE(out.str().find("Created configuration file") != std::string::npos);

    write_bytes(dir / ".ghostscrub", "verbosity: silent\n");
    REQUIRE(cli::handle_init(opts, dir, out, err) == 1);
    REQUIRE(err.str().find("already exists") != std::string::npos);
    REQUIRE(read_bytes(dir / ".ghostscrub") == "verbosity: silent\n");

    opts.force = true;
    REQUIRE(cli::handle_init(opts, dir, out, err) == 0);
    REQUIRE(read_bytes(dir / ".ghostscrub") == scrub::config_template());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Single pass cleans files and prints a summary") {
    fs::path dir = make_temp_dir("cli_single");
    write_bytes(dir / "a.rs", "fn a()\xE2\x80\x8B {}\n");
    write_bytes(dir / "b.md", "clean\n");
    write_bytes(dir / "c.txt", "  \n");

    Options opts = options_for({dir});
    auto cfg = scrub::default_scrub_config();
    std::ostringstream out, err;
    std::atomic<bool> running{true};
    REQUIRE(cli::handle_single_pass(opts, cfg, out, err, running) == 0);
    REQUIRE(read_bytes(dir / "a.rs") == "fn a() {}\n");
    REQUIRE(read_bytes(dir / "c.txt") == "\n");
    const std::string text = out.str();
    REQUIRE(text.find("Cleaned 1 invisible characters from: ") != std::string::npos);
    REQUIRE(text.find("Processing summary:") != std::string::npos);
    REQUIRE(text.find("  Files processed: 3\n") != std::string::npos);
    REQUIRE(text.find("  Files modified: 2\n") != std::string::npos);
    REQUIRE(text.find("  Invisible characters removed: 2\n") != std::string::npos);
    REQUIRE(err.str().empty());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Dry run reports without writing") {
    fs::path dir = make_temp_dir("cli_dry");
    const std::string original = "x\xC2\xA0y\n";
    write_bytes(dir / "a.txt", original);
    Options opts = options_for({dir});
    opts.dry_run = true;
    std::ostringstream out, err;
    std::atomic<bool> running{true};
    REQUIRE(cli::handle_single_pass(opts, scrub::default_scrub_config(), out, err, running) ==
            0);
    REQUIRE(read_bytes(dir / "a.txt") == original);
    REQUIRE(out.str().find("Would clean 1 invisible characters from: ") != std::string::npos);
    REQUIRE(out.str().find("Dry run summary:") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Failures give exit status 2 and keep going") {
    fs::path dir = make_temp_dir("cli_errors");
    write_bytes(dir / "bad.txt", std::string("\xFF\xFE\n", 3));
    write_bytes(dir / "good.txt", "g\xE2\x80\x8B\n");
    Options opts = options_for({dir, dir / "missing.rs"});
    std::ostringstream out, err;
    std::atomic<bool> running{true};
    REQUIRE(cli::handle_single_pass(opts, scrub::default_scrub_config(), out, err, running) ==
            cli::kExitFileErrors);
    REQUIRE(read_bytes(dir / "good.txt") == "g\n");
    REQUIRE(err.str().find("Error processing ") != std::string::npos);
    REQUIRE(err.str().find("No such file or directory") != std::string::npos);
    REQUIRE(out.str().find("  Errors encountered: 2\n") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("An interrupted run reports the files it never started") {
    fs::path dir = make_temp_dir("cli_interrupted");
    write_bytes(dir / "a.txt", "a\xE2\x80\x8B\n");
    write_bytes(dir / "b.txt", "b\xE2\x80\x8B\n");
    Options opts = options_for({dir});
    std::ostringstream out, err;
    std::atomic<bool> running{false};
    REQUIRE(cli::handle_single_pass(opts, scrub::default_scrub_config(), out, err, running) ==
            cli::kExitFileErrors);
    REQUIRE(read_bytes(dir / "a.txt") == "a\xE2\x80\x8B\n");
    REQUIRE(err.str().find("Interrupted: 2 file(s) were not processed") != std::string::npos);
    REQUIRE(out.str().find("  Files not processed (interrupted): 2\n") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Silent mode prints nothing on success") {
    fs::path dir = make_temp_dir("cli_silent");
    write_bytes(dir / "a.txt", "a \n");
    Options opts = options_for({dir});
    auto cfg = scrub::default_scrub_config();
    cfg.verbosity = scrub::Verbosity::Silent;
    std::ostringstream out, err;
    std::atomic<bool> running{true};
    REQUIRE(cli::handle_single_pass(opts, cfg, out, err, running) == 0);
    REQUIRE(out.str().empty());
    REQUIRE(read_bytes(dir / "a.txt") == "a\n");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("watch_relative_path maps to the containing root") {
    fs::path dir = make_temp_dir("cli_relpath");
    fs::create_directories(dir / "src");
    std::vector<fs::path> roots{dir / "src", dir / "single.rs"};
    REQUIRE(cli::watch_relative_path(dir / "src" / "deep" / "m.rs", roots) ==
            fs::path("deep/m.rs"));
    REQUIRE(cli::watch_relative_path(dir / "single.rs", roots) == fs::path("single.rs"));
    REQUIRE(cli::watch_relative_path(dir / "elsewhere" / "x.rs", roots) == fs::path("x.rs"));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Watch mode cleans files as they change") {
    fs::path dir = make_temp_dir("cli_watch");
    Options opts = options_for({dir});
    opts.debounce = 50ms;
    auto cfg = scrub::default_scrub_config();
    std::ostringstream out, err;
    std::atomic<bool> running{true};
    std::atomic<int> rc{-1};
    std::thread watcher([&] { rc = cli::handle_watch(opts, cfg, out, err, running); });

    // Give the watcher time to install its watches before writing.
    std::this_thread::sleep_for(300ms);
    write_bytes(dir / "live.rs", "let v = 1;\xE2\x80\x8B\n");
    const bool cleaned = eventually([&] { return read_bytes(dir / "live.rs") == "let v = 1;\n"; });
    running = false;
    watcher.join();
    REQUIRE(cleaned);
    REQUIRE(rc.load() == 0);
    REQUIRE(out.str().find("Watching: ") != std::string::npos);
    REQUIRE(out.str().find("Auto-cleaned 1 invisible characters from: ") != std::string::npos);
    REQUIRE(out.str().find("Stopped watching after") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Watch mode refuses missing paths") {
    fs::path dir = make_temp_dir("cli_watch_missing");
    Options opts = options_for({dir / "nope"});
    std::ostringstream out, err;
    std::atomic<bool> running{true};
    REQUIRE(cli::handle_watch(opts, scrub::default_scrub_config(), out, err, running) == 1);
    REQUIRE(err.str().find("Cannot watch missing path") != std::string::npos);
    FS_REMOVE_ALL(dir);
}
