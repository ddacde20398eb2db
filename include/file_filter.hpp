#ifndef FILE_FILTER_HPP
#define FILE_FILTER_HPP
#include <filesystem>
#include <string>
#include <vector>
#include "scrub_config.hpp"

namespace filter {

/**
 * @brief Match a single glob pattern against a relative path.
 *
 * `*` and `?` follow fnmatch(3) rules without `FNM_PATHNAME`, so `**` spans
 * directories. A leading `**` followed by `/` may also match zero directories.
 * Patterns without a `/` are matched against the file name only.
 */
bool glob_match(const std::string& pattern, const std::filesystem::path& rel);

/**
 * @brief Match a path glob segment by segment, the way a shell expands it.
 *
 * `*`, `?` and `[...]` never cross a `/`. A `**` segment matches any number
 * of directories, including none.
 */
bool path_glob_match(const std::string& pattern, const std::filesystem::path& rel);

/** True if any pattern in @p patterns matches @p rel. */
bool matches_any(const std::vector<std::string>& patterns, const std::filesystem::path& rel);

/**
 * @brief Lower-case extension without the leading dot; empty when the file has
 * none.
 */
std::string extension_of(const std::filesystem::path& path);

/**
 * @brief Decides which files are eligible for scrubbing.
 *
 * Extension rules are checked first. A file without an extension passes them.
 * Then the path, relative to the scanned root, must match an include pattern
 * (when any are set) and no exclude pattern.
 */
class FileFilter {
  public:
    FileFilter() = default;
    explicit FileFilter(scrub::FilterRules rules);

    bool accepts(const std::filesystem::path& rel) const;

    /** Extra exclude globs, e.g. from a `.ghostscrubignore` file. */
    void add_exclude_patterns(const std::vector<std::string>& patterns);

    const scrub::FilterRules& rules() const { return rules_; }

  private:
    scrub::FilterRules rules_;
};

/** Dependency and build directories that are never descended into. */
bool skip_directory(const std::string& name);

/**
 * @brief Names editors use for swap, backup and lock files.
 *
 * Hidden files, names ending in `~`, `.tmp` or `.swp`, and names containing
 * `.#`. Watch mode ignores events for these.
 */
bool is_editor_temporary(const std::filesystem::path& path);

/**
 * Read a list of ignore entries from a file.
 *
 * Each non-empty, non-comment line in the file is trimmed of leading and
 * trailing whitespace and kept as one glob. Lines beginning with '#' are
 * comments. A trailing carriage return is stripped. Missing or unreadable
 * files result in an empty list.
 */
std::vector<std::string> read_ignore_file(const std::filesystem::path& file);

} // namespace filter

#endif // FILE_FILTER_HPP
