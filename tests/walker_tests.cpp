#include "test_common.hpp"

namespace {
std::set<std::string> names_of(const WalkResult& r, const fs::path& root) {
    std::set<std::string> out;
    for (const auto& p : r.files)
        out.insert(p.lexically_relative(root).generic_string());
    return out;
}
} // namespace

TEST_CASE("collect_files walks directories with the default filter") {
    fs::path root = make_temp_dir("walk_default");
    write_bytes(root / "main.rs", "fn main() {}\n");
    write_bytes(root / "src" / "lib.py", "x = 1\n");
    write_bytes(root / "image.png", "PNG");
    write_bytes(root / "node_modules" / "dep" / "index.js", "x\n");
    write_bytes(root / "target" / "debug" / "out.rs", "x\n");
    write_bytes(root / "logs" / "run.txt", "x\n");

    filter::FileFilter f(scrub::default_scrub_config().filter);
    WalkResult r = collect_files({root}, f);
    REQUIRE(r.errors.empty());
    REQUIRE(names_of(r, root) == std::set<std::string>{"main.rs", "src/lib.py"});
    REQUIRE(r.skipped >= 2);
    FS_REMOVE_ALL(root);
}

TEST_CASE("collect_files honours .ghostscrubignore") {
    fs::path root = make_temp_dir("walk_ignore");
    write_bytes(root / ".ghostscrubignore", "gen/**\n*.min.js\n");
    write_bytes(root / "gen" / "api.rs", "x\n");
    write_bytes(root / "app.min.js", "x\n");
    write_bytes(root / "app.js", "x\n");

    scrub::FilterRules rules;
    rules.include_extensions = {"rs", "js"};
    rules.include_patterns = {"**/*.rs", "**/*.js"};
    WalkResult r = collect_files({root}, filter::FileFilter(rules));
    REQUIRE(names_of(r, root) == std::set<std::string>{"app.js"});
    FS_REMOVE_ALL(root);
}

TEST_CASE("Explicit files are filtered by name only and deduplicated") {
    fs::path root = make_temp_dir("walk_explicit");
    fs::path build_file = root / "build" / "keep.rs";
    write_bytes(build_file, "x\n");
    write_bytes(root / "other.rs", "x\n");

    filter::FileFilter f(scrub::default_scrub_config().filter);
    WalkResult r = collect_files({build_file, build_file, root / "other.rs"}, f);
    REQUIRE(r.errors.empty());
    REQUIRE(r.files.size() == 2);
    REQUIRE(r.files[0] == build_file);

    WalkResult both = collect_files({root / "other.rs", root}, f);
    REQUIRE(both.files.size() == 1);
    FS_REMOVE_ALL(root);
}

TEST_CASE("Missing paths and glob expansion") {
    fs::path root = make_temp_dir("walk_glob");
    write_bytes(root / "a.md", "x\n");
    write_bytes(root / "b.md", "x\n");
    write_bytes(root / "c.txt", "x\n");

    filter::FileFilter f(scrub::default_scrub_config().filter);
    WalkResult missing = collect_files({root / "nope.rs"}, f);
    REQUIRE(missing.files.empty());
    REQUIRE(missing.errors.size() == 1);

    WalkResult globbed = collect_files({root / "*.md"}, f);
    REQUIRE(globbed.errors.empty());
    REQUIRE(names_of(globbed, root) == std::set<std::string>{"a.md", "b.md"});

    WalkResult none = collect_files({root / "*.zig"}, f);
    REQUIRE(none.files.empty());
    REQUIRE(none.errors.empty());
    REQUIRE(has_glob_chars("src/*.rs"));
    REQUIRE_FALSE(has_glob_chars("src/main.rs"));
    FS_REMOVE_ALL(root);
}

TEST_CASE("Recursive globs expand across every depth") {
    fs::path root = make_temp_dir("walk_globstar");
    write_bytes(root / "src" / "top.rs", "x\n");
    write_bytes(root / "src" / "a" / "mid.rs", "x\n");
    write_bytes(root / "src" / "a" / "b" / "deep.rs", "x\n");
    write_bytes(root / "src" / "a" / "b" / "notes.md", "x\n");
    write_bytes(root / "src" / "node_modules" / "dep.rs", "x\n");

    filter::FileFilter f(scrub::default_scrub_config().filter);
    WalkResult deep = collect_files({root / "src" / "**" / "*.rs"}, f);
    REQUIRE(deep.errors.empty());
    REQUIRE(names_of(deep, root) ==
            std::set<std::string>{"src/top.rs", "src/a/mid.rs", "src/a/b/deep.rs"});

    // A single star stays within one directory level.
    WalkResult shallow = collect_files({root / "src" / "*" / "*.rs"}, f);
    REQUIRE(names_of(shallow, root) == std::set<std::string>{"src/a/mid.rs"});
    FS_REMOVE_ALL(root);
}

#ifndef _WIN32
TEST_CASE("Symlinks are not followed during walks") {
    fs::path root = make_temp_dir("walk_symlink");
    fs::path outside = make_temp_dir("walk_symlink_target");
    write_bytes(outside / "secret.rs", "x\n");
    write_bytes(root / "real.rs", "x\n");
    std::error_code ec;
    fs::create_directory_symlink(outside, root / "linked", ec);
    REQUIRE_FALSE(ec);
    fs::create_symlink(root / "real.rs", root / "alias.rs", ec);
    REQUIRE_FALSE(ec);

    WalkResult r = collect_files({root}, filter::FileFilter(scrub::default_scrub_config().filter));
    REQUIRE(names_of(r, root) == std::set<std::string>{"real.rs"});
    FS_REMOVE_ALL(root);
    FS_REMOVE_ALL(outside);
}
#endif
