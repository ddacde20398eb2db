#include "reporter.hpp"
#include <cstdio>
#include <sstream>
#include "time_utils.hpp"

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>

void enable_win_ansi() {
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE)
        return;
    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode))
        return;
    dwMode |= 0x0004; // ENABLE_VIRTUAL_TERMINAL_PROCESSING
    SetConsoleMode(hOut, dwMode);
}

bool stdout_is_terminal() { return _isatty(_fileno(stdout)) != 0; }
#else
#include <unistd.h>

void enable_win_ansi() {}

bool stdout_is_terminal() { return isatty(STDOUT_FILENO) != 0; }
#endif

TermColors make_term_colors(bool no_colors, const TermTheme& theme) {
    if (no_colors)
        return {};
    return {theme.reset, theme.green, theme.yellow, theme.red,
            theme.cyan,  theme.gray,  theme.bold};
}

std::string render_diff(const FileReport& report, const TermColors& colors) {
    std::ostringstream out;
    out << colors.bold << "--- Original: " << report.path.string() << colors.reset << '\n';
    out << colors.bold << "+++ Cleaned:  " << report.path.string() << colors.reset << '\n';
    size_t last_line = 0;
    for (const auto& ch : report.result.changes) {
        // Changes are ordered by line; print each changed line once.
        if (ch.line == last_line)
            continue;
        last_line = ch.line;
        out << colors.red << '-' << ch.line << ": " << ch.original_rendering << colors.reset
            << '\n';
        out << colors.green << '+' << ch.line << ": " << ch.cleaned_rendering << colors.reset
            << '\n';
    }
    return out.str();
}

std::string render_report_line(const FileReport& report, const ReportStyle& style) {
    const auto& c = style.colors;
    const std::string path = report.path.string();
    if (report.failed())
        return c.red + "Error processing " + path + ": " + report.error + c.reset;
    if (style.verbosity == scrub::Verbosity::Silent)
        return "";
    const std::string count = std::to_string(report.change_count());
    switch (report.status) {
    case FileStatus::Cleaned:
        return c.green + (style.watch ? "Auto-cleaned " : "Cleaned ") + count +
               " invisible characters from: " + c.reset + path;
    case FileStatus::WouldClean:
        return c.yellow + "Would clean " + count + " invisible characters from: " + c.reset +
               path;
    case FileStatus::Unchanged:
        if (style.verbosity == scrub::Verbosity::Verbose && !style.watch)
            return c.gray + "No changes needed: " + path + c.reset;
        return "";
    default:
        return "";
    }
}

void print_report(const FileReport& report, const ReportStyle& style, std::ostream& out,
                  std::ostream& err) {
    if (report.failed()) {
        err << render_report_line(report, style) << '\n';
        return;
    }
    if (style.verbosity == scrub::Verbosity::Verbose && report.result.modified)
        out << render_diff(report, style.colors);
    const std::string line = render_report_line(report, style);
    if (!line.empty())
        out << line << '\n';
}

void RunSummary::add(const FileReport& report) {
    if (report.failed()) {
        ++errors;
        failures.emplace_back(report.path, report.error);
        return;
    }
    ++files_processed;
    if (report.result.modified) {
        ++files_modified;
        total_changes += report.change_count();
    }
}

void RunSummary::add_error(const std::string& message) {
    ++errors;
    failures.emplace_back(std::filesystem::path(), message);
}

std::string render_summary(const RunSummary& summary, bool dry_run, const TermColors& colors) {
    std::ostringstream out;
    out << '\n' << colors.bold << (dry_run ? "Dry run summary:" : "Processing summary:")
        << colors.reset << '\n';
    if (dry_run) {
        out << "  Files that would be processed: " << summary.files_processed << '\n';
        out << "  Files that would be modified: " << summary.files_modified << '\n';
        out << "  Invisible characters that would be removed: " << summary.total_changes << '\n';
    } else {
        out << "  Files processed: " << summary.files_processed << '\n';
        out << "  Files modified: " << summary.files_modified << '\n';
        out << "  Invisible characters removed: " << summary.total_changes << '\n';
    }
    if (summary.files_skipped > 0)
        out << "  Files skipped: " << summary.files_skipped << '\n';
    if (summary.files_interrupted > 0)
        out << colors.yellow << "  Files not processed (interrupted): "
            << summary.files_interrupted << colors.reset << '\n';
    if (summary.errors > 0) {
        out << colors.red << "  Errors encountered: " << summary.errors << colors.reset << '\n';
        for (const auto& [path, msg] : summary.failures) {
            out << "    ";
            if (!path.empty() && msg.find(path.string()) == std::string::npos)
                out << path.string() << ": ";
            out << msg << '\n';
        }
    }
    out << colors.gray << "  Completed in " << format_elapsed(summary.elapsed) << colors.reset
        << '\n';
    return out.str();
}
