#ifndef UTF8_UTILS_HPP
#define UTF8_UTILS_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace utf8 {

/**
 * @brief Decode one code point starting at @p pos.
 *
 * Rejects truncated sequences, overlong encodings, UTF-16 surrogates and
 * values above U+10FFFF. On success @p pos is advanced past the sequence.
 * On failure @p pos is left untouched.
 *
 * @return `true` if a valid code point was decoded.
 */
bool decode_next(std::string_view text, std::size_t& pos, char32_t& cp);

/**
 * @brief Strictly validate a UTF-8 buffer.
 *
 * @param text       Bytes to validate.
 * @param bad_offset Receives the offset of the first invalid sequence.
 * @return `true` if the whole buffer is well-formed UTF-8.
 */
bool validate(std::string_view text, std::size_t& bad_offset);

/** Append the UTF-8 encoding of @p cp to @p out. */
void append(std::string& out, char32_t cp);

/** Encode a single code point. */
std::string encode(char32_t cp);

/** Number of code points in an already validated buffer. */
std::size_t length(std::string_view text);

} // namespace utf8

#endif // UTF8_UTILS_HPP
