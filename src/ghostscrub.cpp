/**
 * @file ghostscrub.cpp
 * @brief CLI entry point for scrubbing invisible characters from files.
 *
 * Parses options, resolves the configuration and dispatches to the init,
 * single-pass or watch handlers.
 */

#include <atomic>
#include <csignal>
#include <iostream>

#include "char_class.hpp"
#include "cli_commands.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "reporter.hpp"
#include "version.hpp"

namespace {

std::atomic<bool> g_running{true};

extern "C" void handle_stop_signal(int) { g_running.store(false); }

void setup_logging(const LoggingOptions& logging) {
    if (logging.log_file.empty())
        return;
    init_logger(logging.log_file, logging.log_level, logging.max_log_size,
                logging.max_log_files);
    set_json_logging(logging.json_log);
    set_log_compression(logging.compress_logs);
}

} // namespace

/**
 * @brief Application entry point.
 *
 * @return 0 on success or when printing help/version, 1 on fatal errors
 *         (bad arguments, unreadable or invalid configuration) and 2 when
 *         one or more files could not be processed.
 */
#ifndef GHOSTSCRUB_NO_MAIN
int main(int argc, char* argv[]) {
    int rc = 1;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << "ghostscrub " << GHOSTSCRUB_VERSION << " (Unicode White_Space "
                      << scrub::white_space_table_version() << ")\n";
            return 0;
        }
        enable_win_ansi();
        setup_logging(opts.logging);
        log_info("ghostscrub started", {{"version", GHOSTSCRUB_VERSION}});

        if (opts.init) {
            rc = cli::handle_init(opts, ".", std::cout, std::cerr);
        } else {
            scrub::ScrubConfig cfg = resolve_scrub_config(opts);
            std::signal(SIGINT, handle_stop_signal);
            std::signal(SIGTERM, handle_stop_signal);
            rc = opts.watch ? cli::handle_watch(opts, cfg, std::cout, std::cerr, g_running)
                            : cli::handle_single_pass(opts, cfg, std::cout, std::cerr, g_running);
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        log_error(e.what());
        rc = 1;
    }
    shutdown_logger();
    return rc;
}
#endif // GHOSTSCRUB_NO_MAIN
