#pragma once

#include <atomic>
#include <filesystem>
#include <ostream>
#include <vector>

#include "options.hpp"
#include "scrub_config.hpp"

namespace cli {

/** Exit status when the run finished but at least one file failed. */
constexpr int kExitFileErrors = 2;

/**
 * @brief Write the commented default configuration to `.ghostscrub`.
 *
 * Refuses to replace an existing file unless `--force` was given. Returns the
 * process exit code.
 */
int handle_init(const Options& opts, const std::filesystem::path& dir, std::ostream& out,
                std::ostream& err);

/**
 * @brief Collect, scrub and report every file once.
 *
 * Prints per-file lines as files finish and a summary at the end (unless
 * silent). Returns `0`, or kExitFileErrors when any input or file failed or
 * @p running was cleared before every file was processed.
 */
int handle_single_pass(const Options& opts, const scrub::ScrubConfig& cfg, std::ostream& out,
                       std::ostream& err, const std::atomic<bool>& running);

/**
 * @brief Watch the paths and scrub files as they change until @p running is
 * cleared.
 */
int handle_watch(const Options& opts, const scrub::ScrubConfig& cfg, std::ostream& out,
                 std::ostream& err, const std::atomic<bool>& running);

/**
 * @brief Map a changed path to the path the filter expects: relative to the
 * watched directory that contains it, or the bare file name for file roots.
 */
std::filesystem::path watch_relative_path(const std::filesystem::path& changed,
                                          const std::vector<std::filesystem::path>& roots);

} // namespace cli
