#ifndef REPORTER_HPP
#define REPORTER_HPP

#include <chrono>
#include <filesystem>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "file_processor.hpp"
#include "scrub_config.hpp"

/**
 * @brief Enable ANSI color sequences on Windows consoles.
 *
 * Has no effect on other platforms.
 */
void enable_win_ansi();

/** @return `true` when standard output is attached to a terminal. */
bool stdout_is_terminal();

/**
 * @brief Theme definition for terminal colors.
 *
 * Contains raw ANSI sequences for each color used in the output.
 */
struct TermTheme {
    std::string reset = "\033[0m";
    std::string green = "\033[32m";
    std::string yellow = "\033[33m";
    std::string red = "\033[31m";
    std::string cyan = "\033[36m";
    std::string gray = "\033[90m";
    std::string bold = "\033[1m";
};

/** Resolved color codes; all empty when colors are off. */
struct TermColors {
    std::string reset;
    std::string green;
    std::string yellow;
    std::string red;
    std::string cyan;
    std::string gray;
    std::string bold;
};

TermColors make_term_colors(bool no_colors, const TermTheme& theme = TermTheme{});

/** How per-file results are printed. */
struct ReportStyle {
    scrub::Verbosity verbosity = scrub::Verbosity::Normal;
    bool dry_run = false;
    bool watch = false; ///< Watch mode wording ("Auto-cleaned ...")
    TermColors colors;
};

/**
 * @brief Render the per-line diff of a modified file.
 *
 * One `-N:` / `+N:` pair per changed line, using the engine's renderings so
 * invisible characters show up as markers.
 */
std::string render_diff(const FileReport& report, const TermColors& colors);

/**
 * @brief Render the status line for one file.
 *
 * Returns an empty string when nothing should be printed at the given
 * verbosity. Failures always produce a line.
 */
std::string render_report_line(const FileReport& report, const ReportStyle& style);

/**
 * @brief Print one report: diff (verbose only) and status line to @p out,
 * failures to @p err.
 */
void print_report(const FileReport& report, const ReportStyle& style, std::ostream& out,
                  std::ostream& err);

/** Totals for a single pass. */
struct RunSummary {
    size_t files_processed = 0; ///< Files read and scrubbed, modified or not
    size_t files_modified = 0;
    size_t files_skipped = 0;
    size_t total_changes = 0;
    size_t errors = 0;
    size_t files_interrupted = 0; ///< Files never started because the run was stopped
    std::vector<std::pair<std::filesystem::path, std::string>> failures;
    std::chrono::milliseconds elapsed{0};

    void add(const FileReport& report);
    /** Walk-level problems such as a missing input path. */
    void add_error(const std::string& message);
};

std::string render_summary(const RunSummary& summary, bool dry_run, const TermColors& colors);

#endif // REPORTER_HPP
