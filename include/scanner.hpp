#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <atomic>
#include <filesystem>
#include <functional>
#include <vector>

#include "file_processor.hpp"

/** Called once per finished file. Calls are serialized. */
using ReportCallback = std::function<void(const FileReport&)>;

/**
 * @brief Scrub @p files on a pool of worker threads.
 *
 * Each file is one unit of work and files are picked in list order, but
 * completion order is not defined. @p on_report (if set) runs under a lock so
 * output from different files never interleaves.
 *
 * @param files       Files to process.
 * @param policy      Shared read-only character policy.
 * @param dry_run     Report without writing.
 * @param concurrency Worker count; 0 picks the hardware concurrency.
 * @param on_report   Progress callback.
 * @param running     Optional stop flag checked between files.
 * @return One report per file, in the order of @p files. Files not reached
 *         before @p running was cleared keep an empty path.
 */
std::vector<FileReport> scrub_files(const std::vector<std::filesystem::path>& files,
                                    const scrub::CharacterPolicy& policy, bool dry_run,
                                    size_t concurrency, const ReportCallback& on_report = {},
                                    const std::atomic<bool>* running = nullptr);

#endif // SCANNER_HPP
