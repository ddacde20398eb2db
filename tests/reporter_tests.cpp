#include "test_common.hpp"
#include "reporter.hpp"

namespace {
FileReport make_report(const std::string& path, const std::string& text, bool dry_run) {
    FileReport rep;
    rep.path = path;
    rep.result = scrub::scrub_text(text, scrub::CharacterPolicy{});
    if (!rep.result.modified)
        rep.status = FileStatus::Unchanged;
    else
        rep.status = dry_run ? FileStatus::WouldClean : FileStatus::Cleaned;
    return rep;
}
} // namespace

TEST_CASE("Status lines without colors") {
    ReportStyle style;
    FileReport cleaned = make_report("a.rs", "x\xE2\x80\x8B\xE2\x80\x8B\n", false);
    REQUIRE(render_report_line(cleaned, style) == "Cleaned 2 invisible characters from: a.rs");
    style.watch = true;
    REQUIRE(render_report_line(cleaned, style) ==
            "Auto-cleaned 2 invisible characters from: a.rs");

    style.watch = false;
    FileReport dry = make_report("b.md", "y \n", true);
    REQUIRE(render_report_line(dry, style) == "Would clean 1 invisible characters from: b.md");

    FileReport same = make_report("c.txt", "z\n", false);
    REQUIRE(render_report_line(same, style).empty());
    style.verbosity = scrub::Verbosity::Verbose;
    REQUIRE(render_report_line(same, style) == "No changes needed: c.txt");

    style.verbosity = scrub::Verbosity::Silent;
    REQUIRE(render_report_line(cleaned, style).empty());
    FileReport failed;
    failed.path = "d.rs";
    failed.status = FileStatus::DecodeError;
    failed.error = "bad bytes";
    REQUIRE(render_report_line(failed, style) == "Error processing d.rs: bad bytes");
}

TEST_CASE("Diff shows one pair per changed line") {
    FileReport rep = make_report("f.py", "ok\na\xE2\x80\x8B \nok\n", false);
    const std::string diff = render_diff(rep, TermColors{});
    const std::string open = "\xE2\xA6\x83";
    const std::string close = "\xE2\xA6\x84";
    const std::string expected = "--- Original: f.py\n"
                                 "+++ Cleaned:  f.py\n"
                                 "-2: a" +
                                 open + "ZWS" + close + open + "TRAILING: SP" + close +
                                 "\n"
                                 "+2: a\n";
    REQUIRE(diff == expected);
}

TEST_CASE("print_report routes output by verbosity") {
    std::ostringstream out, err;
    ReportStyle style;
    style.verbosity = scrub::Verbosity::Verbose;
    FileReport rep = make_report("g.rs", "g\xC2\xA0\n", false);
    print_report(rep, style, out, err);
    REQUIRE(out.str().find("--- Original: g.rs") != std::string::npos);
    REQUIRE(out.str().find("Cleaned 1 invisible characters from: g.rs") != std::string::npos);
    REQUIRE(err.str().empty());

    FileReport failed;
    failed.path = "h.rs";
    failed.status = FileStatus::ReadError;
    failed.error = "denied";
    print_report(failed, style, out, err);
    REQUIRE(err.str() == "Error processing h.rs: denied\n");
}

TEST_CASE("Summary totals and rendering") {
    RunSummary summary;
    summary.add(make_report("a", "a\xE2\x80\x8B\n", false));
    summary.add(make_report("b", "b\n", false));
    FileReport failed;
    failed.path = "c";
    failed.status = FileStatus::WriteError;
    failed.error = "disk full";
    summary.add(failed);
    summary.add_error("No such file or directory: d");
    summary.files_skipped = 3;
    summary.elapsed = std::chrono::milliseconds(250);

    REQUIRE(summary.files_processed == 2);
    REQUIRE(summary.files_modified == 1);
    REQUIRE(summary.total_changes == 1);
    REQUIRE(summary.errors == 2);

    const std::string text = render_summary(summary, false, TermColors{});
    REQUIRE(text.find("Processing summary:") != std::string::npos);
    REQUIRE(text.find("  Files processed: 2\n") != std::string::npos);
    REQUIRE(text.find("  Files modified: 1\n") != std::string::npos);
    REQUIRE(text.find("  Invisible characters removed: 1\n") != std::string::npos);
    REQUIRE(text.find("  Files skipped: 3\n") != std::string::npos);
    REQUIRE(text.find("  Errors encountered: 2\n") != std::string::npos);
    REQUIRE(text.find("    c: disk full\n") != std::string::npos);
    REQUIRE(text.find("    No such file or directory: d\n") != std::string::npos);
    REQUIRE(text.find("  Completed in 250ms\n") != std::string::npos);

    REQUIRE(text.find("interrupted") == std::string::npos);

    const std::string dry = render_summary(summary, true, TermColors{});
    REQUIRE(dry.find("Dry run summary:") != std::string::npos);

    summary.files_interrupted = 4;
    REQUIRE(render_summary(summary, false, TermColors{})
                .find("  Files not processed (interrupted): 4\n") != std::string::npos);
    REQUIRE(dry.find("Invisible characters that would be removed: 1") != std::string::npos);
}

TEST_CASE("Colors can be disabled") {
    TermColors off = make_term_colors(true);
    REQUIRE(off.red.empty());
    REQUIRE(off.reset.empty());
    TermColors on = make_term_colors(false);
    REQUIRE(on.red == "\033[31m");
}
