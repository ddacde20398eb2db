#ifndef SCRUBBER_HPP
#define SCRUBBER_HPP
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "scrub_config.hpp"

namespace scrub {

enum class ChangeKind { RemovedChar, WhitespaceOnlyToEmpty, TrailingWhitespaceTrimmed };

/**
 * @brief One reportable modification on a single line.
 *
 * For `RemovedChar` the label is the character label (ZWS, NBSP, U+0007...).
 * For the two whitespace kinds it is the composition of the affected run, for
 * example `SP+SP+TAB`.
 */
struct Change {
    std::size_t line = 0;   ///< 1-based line number
    std::size_t column = 0; ///< 1-based code point column in the original line
    ChangeKind kind = ChangeKind::RemovedChar;
    char32_t code_point = 0; ///< Only meaningful for RemovedChar
    std::string label;
    std::string original_rendering;
    std::string cleaned_rendering;
};

/** A line as split from the input buffer. Views into the caller's bytes. */
struct LineRecord {
    std::size_t index = 0; ///< 0-based
    std::string_view text;
    std::string_view terminator; ///< "", "\n" or "\r\n"
};

struct LineResult {
    std::string cleaned;
    std::vector<Change> changes;
};

/**
 * @brief Outcome of scrubbing one buffer.
 *
 * When @ref modified is false, @ref cleaned is a byte-for-byte copy of the
 * input.
 */
struct ScrubResult {
    std::string cleaned;
    std::vector<Change> changes;
    bool modified = false;
    std::size_t line_count = 0;
};

/** Input is not valid UTF-8. Nothing was produced. */
class DecodeError : public std::runtime_error {
  public:
    DecodeError(std::size_t offset, std::size_t line);
    std::size_t offset() const { return offset_; }
    std::size_t line() const { return line_; }

  private:
    std::size_t offset_;
    std::size_t line_;
};

/**
 * @brief Split @p bytes into lines, keeping each line's own terminator.
 *
 * A trailing terminator does not start an extra empty line. An empty buffer
 * yields no lines.
 */
std::vector<LineRecord> split_lines(std::string_view bytes);

/**
 * @brief Clean a single line (terminator excluded).
 *
 * Removes classified characters first, then collapses a whitespace-only line
 * to empty or trims trailing spaces and tabs when
 * `strip_trailing_whitespace` is set.
 *
 * When @p lf_terminated is set and the cleaned text ends in `\r`, that CR
 * forms a CRLF terminator once the line is written back, so trimming applies
 * to the text before it as well.
 *
 * @param text          UTF-8 line content without its terminator.
 * @param policy        Active character policy.
 * @param line_index    0-based index used to number the emitted changes.
 * @param lf_terminated The line ends in a bare `\n`.
 * @throws DecodeError if @p text is not valid UTF-8.
 */
LineResult scrub_line(std::string_view text, const CharacterPolicy& policy,
                      std::size_t line_index = 0, bool lf_terminated = false);

/**
 * @brief Scrub a whole buffer.
 *
 * The buffer is validated as UTF-8 up front so an invalid file is never
 * partially processed. Pure function: safe to call concurrently.
 *
 * @throws DecodeError on the first invalid byte sequence.
 */
ScrubResult scrub_text(std::string_view bytes, const CharacterPolicy& policy);

/**
 * @brief Render a line with its invisible characters spelled out.
 *
 * Produces markers such as `⦃ZWS⦄`, `⦃TAB⦄`, `⦃WS:U+2003⦄`,
 * `⦃TRAILING: SP+SP⦄`, `⦃WHITESPACE-ONLY: SP+TAB⦄` and `⦃EMPTY⦄`.
 */
std::string visualize_line(std::string_view text);

/** Join the names of the characters in @p run with '+', e.g. `SP+TAB`. */
std::string whitespace_composition(std::string_view run);

const char* change_kind_name(ChangeKind kind);

} // namespace scrub

#endif // SCRUBBER_HPP
