#ifndef WALKER_HPP
#define WALKER_HPP
#include <filesystem>
#include <string>
#include <vector>
#include "file_filter.hpp"

/** Outcome of expanding the command line paths into files. */
struct WalkResult {
    std::vector<std::filesystem::path> files; ///< Accepted files, in discovery order
    size_t skipped = 0;                       ///< Files rejected by the filter
    std::vector<std::string> errors;          ///< Unreadable or missing inputs
};

/**
 * @brief Expand @p inputs into the list of files to scrub.
 *
 * Regular files named directly or matched by a glob are checked against the
 * filter by file name only, so patterns with directory parts only apply to
 * walked trees. Directories are walked recursively, skipping dependency/build
 * directories and symlinks; a `.ghostscrubignore` at the top of a walked
 * directory adds exclude patterns for that walk. Inputs that do not exist are expanded as glob patterns.
 *
 * A file reached through more than one input is listed once.
 */
WalkResult collect_files(const std::vector<std::filesystem::path>& inputs,
                         const filter::FileFilter& filter);

/** True if @p text contains `*`, `?` or `[`. */
bool has_glob_chars(const std::string& text);

#endif // WALKER_HPP
