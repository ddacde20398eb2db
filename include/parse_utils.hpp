#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include "arg_parser.hpp"

/**
 * @brief Parse a plain decimal count within [@p min, @p max].
 *
 * Signs, spaces and trailing text are rejected. On failure @p ok is false and
 * 0 is returned.
 */
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

/** Same as above, reading the value of @p flag; a flag that is absent fails. */
size_t parse_size_t(const ArgParser& parser, const std::string& flag, size_t min, size_t max,
                    bool& ok);

/**
 * @brief Parse a size such as `512`, `64K`, `4KB` or `2mb` into bytes.
 *
 * Suffixes B, K/KB, M/MB and G/GB are case-insensitive and binary (1K is
 * 1024). The result must fall within [@p min, @p max].
 */
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

size_t parse_bytes(const ArgParser& parser, const std::string& flag, size_t min, size_t max,
                   bool& ok);

/**
 * @brief Parse a duration such as `300`, `250ms`, `2s` or `1m`.
 *
 * A bare number is milliseconds.
 */
std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok);

std::chrono::milliseconds parse_time_ms(const ArgParser& parser, const std::string& flag,
                                        bool& ok);

// true/false, yes/no, on/off or 1/0 in any case. Anything else clears ok.
bool parse_bool(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
