#include "test_common.hpp"

using filter::FileFilter;
using filter::glob_match;

TEST_CASE("glob_match directory patterns") {
    REQUIRE(glob_match("**/build/**", "a/build/out.c"));
    REQUIRE(glob_match("**/build/**", "build/out.c"));
    REQUIRE_FALSE(glob_match("**/build/**", "rebuild.c"));
    REQUIRE(glob_match("**/*", "top.rs"));
    REQUIRE(glob_match("src/*.rs", "src/main.rs"));
    REQUIRE_FALSE(glob_match("src/*.rs", "lib/main.rs"));
    REQUIRE_FALSE(glob_match("", "x"));
}

TEST_CASE("path_glob_match keeps wildcards within one segment") {
    using filter::path_glob_match;
    REQUIRE(path_glob_match("src/**/*.rs", "src/top.rs"));
    REQUIRE(path_glob_match("src/**/*.rs", "src/a/b/deep.rs"));
    REQUIRE_FALSE(path_glob_match("src/*.rs", "src/a/mid.rs"));
    REQUIRE(path_glob_match("*.md", "a.md"));
    REQUIRE_FALSE(path_glob_match("*.md", "docs/a.md"));
    REQUIRE(path_glob_match("**", "any/depth/file.txt"));
    REQUIRE_FALSE(path_glob_match("", "x"));
}

TEST_CASE("glob_match name-only patterns") {
    REQUIRE(glob_match("*.swp", "deep/dir/.file.swp"));
    REQUIRE(glob_match("Thumbs.db", "pics/Thumbs.db"));
    REQUIRE_FALSE(glob_match("*.md", "docs/readme.txt"));
}

TEST_CASE("extension_of lowercases") {
    REQUIRE(filter::extension_of("A/B.RS") == "rs");
    REQUIRE(filter::extension_of("Makefile").empty());
    REQUIRE(filter::extension_of("archive.tar.GZ") == "gz");
}

TEST_CASE("FileFilter applies extension rules first") {
    scrub::FilterRules rules;
    rules.include_extensions = {"rs", "md"};
    rules.exclude_extensions = {"md"};
    FileFilter f(rules);
    REQUIRE(f.accepts("src/lib.rs"));
    REQUIRE(f.accepts("SRC/LIB.RS"));
    REQUIRE_FALSE(f.accepts("README.md"));
    REQUIRE_FALSE(f.accepts("main.py"));
    // Files without an extension pass the extension checks.
    REQUIRE(f.accepts("LICENSE"));
}

TEST_CASE("FileFilter include and exclude patterns") {
    auto cfg = scrub::default_scrub_config();
    FileFilter f(cfg.filter);
    REQUIRE(f.accepts("main.rs"));
    REQUIRE(f.accepts("src/deep/mod.py"));
    REQUIRE_FALSE(f.accepts("node_modules/pkg/index.js"));
    REQUIRE_FALSE(f.accepts("web/node_modules/pkg/index.js"));
    REQUIRE_FALSE(f.accepts(".git/config"));
    REQUIRE_FALSE(f.accepts("notes.log"));
    REQUIRE_FALSE(f.accepts("image.png"));

    scrub::FilterRules rules;
    rules.include_patterns = {"docs/**"};
    FileFilter docs(rules);
    REQUIRE(docs.accepts("docs/guide/intro.md"));
    REQUIRE_FALSE(docs.accepts("src/intro.md"));
    docs.add_exclude_patterns({"docs/drafts/**"});
    REQUIRE_FALSE(docs.accepts("docs/drafts/wip.md"));
    REQUIRE(docs.rules().exclude_patterns.size() == 1);
}

TEST_CASE("Skipped directories and editor temporaries") {
    REQUIRE(filter::skip_directory("node_modules"));
    REQUIRE(filter::skip_directory(".git"));
    REQUIRE_FALSE(filter::skip_directory("src"));

    REQUIRE(filter::is_editor_temporary("dir/.main.rs.swp"));
    REQUIRE(filter::is_editor_temporary("dir/main.rs~"));
    REQUIRE(filter::is_editor_temporary("dir/.#main.rs"));
    REQUIRE(filter::is_editor_temporary("dir/4913.tmp"));
    REQUIRE(filter::is_editor_temporary("dir/.main.rs.ghostscrub-tmp-1f-0"));
    REQUIRE_FALSE(filter::is_editor_temporary("dir/main.rs"));
}

TEST_CASE("read_ignore_file parses entries") {
    fs::path dir = make_temp_dir("ignore_file");
    fs::path file = dir / ".ghostscrubignore";
    write_bytes(file, "# generated code\r\n"
                      "gen/**\r\n"
                      "\n"
                      "   *.min.js   \n");
    auto entries = filter::read_ignore_file(file);
    REQUIRE(entries == std::vector<std::string>{"gen/**", "*.min.js"});
    REQUIRE(filter::read_ignore_file(dir / "missing").empty());
    FS_REMOVE_ALL(dir);
}
