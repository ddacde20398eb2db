#include "cli_commands.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>

#include "debounce.hpp"
#include "file_filter.hpp"
#include "file_processor.hpp"
#include "file_watch.hpp"
#include "logger.hpp"
#include "reporter.hpp"
#include "scanner.hpp"
#include "thread_utils.hpp"
#include "time_utils.hpp"
#include "walker.hpp"

namespace fs = std::filesystem;

namespace cli {

namespace {

ReportStyle make_style(const Options& opts, const scrub::ScrubConfig& cfg, bool watch) {
    ReportStyle style;
    style.verbosity = cfg.verbosity;
    style.dry_run = opts.dry_run;
    style.watch = watch;
    style.colors = make_term_colors(opts.no_colors || !stdout_is_terminal());
    return style;
}

} // namespace

int handle_init(const Options& opts, const fs::path& dir, std::ostream& out, std::ostream& err) {
    const fs::path target = dir / ".ghostscrub";
    std::error_code ec;
    if (fs::exists(target, ec) && !opts.force) {
        err << "Configuration file already exists: " << target.string()
            << " (use --force to overwrite)\n";
        return 1;
    }
    std::string error;
    if (!atomic_write_file(target, scrub::config_template(), error)) {
        err << error << "\n";
        log_error(error);
        return 1;
    }
    log_info("Wrote configuration template", {{"path", target.string()}});
    out << "Created configuration file: " << target.string() << "\n";
    return 0;
}

int handle_single_pass(const Options& opts, const scrub::ScrubConfig& cfg, std::ostream& out,
                       std::ostream& err, const std::atomic<bool>& running) {
    const auto start = std::chrono::steady_clock::now();
    const ReportStyle style = make_style(opts, cfg, false);

    WalkResult walk = collect_files(opts.paths, filter::FileFilter(cfg.filter));
    RunSummary summary;
    summary.files_skipped = walk.skipped;
    for (const auto& e : walk.errors) {
        err << style.colors.red << e << style.colors.reset << "\n";
        summary.add_error(e);
    }

    const std::vector<FileReport> reports = scrub_files(
        walk.files, cfg.policy, opts.dry_run, opts.concurrency,
        [&](const FileReport& rep) {
            print_report(rep, style, out, err);
            summary.add(rep);
        },
        &running);
    // Files never handed to a worker keep an empty path.
    summary.files_interrupted = static_cast<size_t>(
        std::count_if(reports.begin(), reports.end(),
                      [](const FileReport& rep) { return rep.path.empty(); }));
    if (summary.files_interrupted > 0) {
        err << style.colors.yellow << "Interrupted: " << summary.files_interrupted
            << " file(s) were not processed" << style.colors.reset << "\n";
        log_warning("Run interrupted",
                    {{"unprocessed", std::to_string(summary.files_interrupted)}});
    }

    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    log_info("Run finished", {{"processed", std::to_string(summary.files_processed)},
                              {"modified", std::to_string(summary.files_modified)},
                              {"changes", std::to_string(summary.total_changes)},
                              {"errors", std::to_string(summary.errors)}});
    if (cfg.verbosity != scrub::Verbosity::Silent)
        out << render_summary(summary, opts.dry_run, style.colors);
    return summary.errors > 0 || summary.files_interrupted > 0 ? kExitFileErrors : 0;
}

fs::path watch_relative_path(const fs::path& changed, const std::vector<fs::path>& roots) {
    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec))
            continue;
        fs::path rel = changed.lexically_relative(root);
        if (!rel.empty() && *rel.begin() != "..")
            return rel;
    }
    return changed.filename();
}

int handle_watch(const Options& opts, const scrub::ScrubConfig& cfg, std::ostream& out,
                 std::ostream& err, const std::atomic<bool>& running) {
    const auto start = std::chrono::steady_clock::now();
    const ReportStyle style = make_style(opts, cfg, true);
    const filter::FileFilter file_filter(cfg.filter);
    std::mutex out_mtx;

    std::vector<fs::path> roots;
    for (const auto& p : opts.paths) {
        std::error_code ec;
        if (!fs::exists(p, ec)) {
            err << style.colors.red << "Cannot watch missing path: " << p.string()
                << style.colors.reset << "\n";
            log_error("Cannot watch missing path", {{"path", p.string()}});
            return 1;
        }
        roots.push_back(p);
        if (cfg.verbosity != scrub::Verbosity::Silent)
            out << "Watching: " << p.string() << "\n";
    }

    WatchDispatcher dispatcher(
        opts.debounce,
        [&](const fs::path& path) {
            std::error_code ec;
            if (!fs::is_regular_file(path, ec))
                return;
            FileReport rep = process_file(path, cfg.policy, opts.dry_run);
            std::lock_guard<std::mutex> lk(out_mtx);
            print_report(rep, style, out, err);
            out.flush();
        },
        resolve_concurrency(opts.concurrency, 0));

    FileWatcher watcher(roots, [&](const fs::path& path) {
        if (filter::is_editor_temporary(path))
            return;
        if (!file_filter.accepts(watch_relative_path(path, roots)))
            return;
        log_debug("Change detected", {{"path", path.string()}});
        dispatcher.submit(path);
    });
    log_info("Watch started", {{"roots", std::to_string(roots.size())},
                               {"backend", watcher.native() ? "inotify" : "polling"}});
    if (cfg.verbosity != scrub::Verbosity::Silent)
        out << "File watcher started. Press Ctrl+C to stop.\n" << std::flush;

    while (running.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

    watcher.stop();
    dispatcher.stop();
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start);
    log_info("Watch stopped", {{"uptime", format_duration_short(uptime)}});
    if (cfg.verbosity != scrub::Verbosity::Silent)
        out << "\nStopped watching after " << format_duration_short(uptime) << "\n";
    return 0;
}

} // namespace cli
