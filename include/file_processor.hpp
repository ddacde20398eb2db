#ifndef FILE_PROCESSOR_HPP
#define FILE_PROCESSOR_HPP
#include <filesystem>
#include <string>
#include "scrubber.hpp"

enum class FileStatus { Cleaned, WouldClean, Unchanged, ReadError, DecodeError, WriteError };

/** Per-file outcome. Failures are carried here instead of being thrown. */
struct FileReport {
    std::filesystem::path path;
    FileStatus status = FileStatus::Unchanged;
    scrub::ScrubResult result;
    std::string error; ///< Set for the three error statuses

    bool failed() const {
        return status == FileStatus::ReadError || status == FileStatus::DecodeError ||
               status == FileStatus::WriteError;
    }
    size_t change_count() const { return result.changes.size(); }
};

const char* file_status_name(FileStatus status);

/**
 * @brief Read a whole file in binary mode.
 *
 * @param path  File to read.
 * @param out   Receives the file contents.
 * @param error Human-readable reason on failure.
 * @return `true` on success.
 */
bool read_file_bytes(const std::filesystem::path& path, std::string& out, std::string& error);

/**
 * @brief Replace @p path with @p bytes atomically.
 *
 * Writes a temporary file next to the target, copies the target's
 * permissions, flushes it and renames it over the target. On any failure the
 * temporary file is removed and the original is left untouched.
 */
bool atomic_write_file(const std::filesystem::path& path, const std::string& bytes,
                       std::string& error);

/**
 * @brief Read, scrub and (unless @p dry_run) rewrite one file.
 *
 * Never throws for I/O or decoding problems; those end up in the report's
 * status and error message and are logged.
 */
FileReport process_file(const std::filesystem::path& path, const scrub::CharacterPolicy& policy,
                        bool dry_run);

#endif // FILE_PROCESSOR_HPP
