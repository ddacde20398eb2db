#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <string>

/** Local wall-clock time as `YYYY-MM-DD HH:MM:SS`, used as the log line prefix. */
std::string timestamp();

/**
 * @brief Compact duration such as `45s`, `2m5s` or `1d0h3m0s`.
 *
 * Leading zero units are omitted; the seconds are always printed.
 */
std::string format_duration_short(std::chrono::seconds dur);

/**
 * @brief Run time for the summary line: `250ms` below one second, `1.24s`
 * below one minute and format_duration_short() above.
 */
std::string format_elapsed(std::chrono::milliseconds dur);

#endif // TIME_UTILS_HPP
