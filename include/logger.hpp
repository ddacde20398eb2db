#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for append and starts the background writer.
 * Calling it again switches to the new file; if that file cannot be opened
 * the previous one stays active.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * When enabled every entry is written as a single-line JSON object with
 * `timestamp`, `level`, `msg` and any structured fields.
 */
void set_json_logging(bool enable);

/** @brief Gzip rotated log files (`ghostscrub.log.1.gz`, ...). */
void set_log_compression(bool enable);

/** @brief Configure how many rotated log files are retained. */
void set_log_rotation(size_t max_files);

/** @return `true` once a log file is open. */
bool logger_initialized();

/**
 * @brief Parse a level name (debug, info, warning/warn, error/err).
 *
 * @return `false` if @p name is not a known level.
 */
bool parse_log_level(const std::string& name, LogLevel& out);

const char* log_level_name(LogLevel level);

/**
 * @brief Log a message with the specified severity.
 *
 * Messages are queued and written by a background thread; call
 * flush_logger() to wait for them.
 */
void log_event(LogLevel level, const std::string& message);

/**
 * @brief Log a message with structured key/value fields.
 *
 * In plain text mode the fields are appended as `key=value` pairs.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/** @brief Block until every queued entry has been written. */
void flush_logger();

/** @brief Drain the queue, stop the writer thread and close the file. */
void shutdown_logger();

#endif // LOGGER_HPP
