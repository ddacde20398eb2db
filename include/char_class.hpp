#ifndef CHAR_CLASS_HPP
#define CHAR_CLASS_HPP
#include <string>
#include "scrub_config.hpp"

namespace scrub {

/**
 * @brief Fixed character classes, in priority order.
 *
 * `Content` means the code point is preserved verbatim.
 */
enum class CharClass { Content, ZeroWidth, NonBreakingSpace, Control, UnicodeWhitespace, Custom };

/** Result of classifying a single code point under a policy. */
struct Classification {
    CharClass cls = CharClass::Content;
    bool removable = false;
    std::string label; ///< Empty for content.
};

/**
 * @brief Classify @p cp under @p policy.
 *
 * Classes are tried in the order of @ref CharClass; a class whose policy gate
 * is off is skipped so a later class (usually `Custom`) may still claim the
 * code point. Line feed is structural and always content. Tab and carriage
 * return are never removed by the control class; only `custom_chars` can
 * remove them.
 */
Classification classify(char32_t cp, const CharacterPolicy& policy);

/**
 * @brief Reporting label for a code point.
 *
 * Returns ZWS, ZWNJ, ZWJ, BOM, NBSP or TAB for the characters that have a
 * dedicated name and `U+XXXX` otherwise.
 */
std::string code_point_label(char32_t cp);

/** Format as `U+XXXX`: uppercase hex, at least four digits. */
std::string format_code_point(char32_t cp);

bool is_zero_width(char32_t cp);
bool is_ascii_control(char32_t cp);

/** Unicode `White_Space` property from the pinned table. */
bool is_unicode_white_space(char32_t cp);

/** Unicode version of the pinned `White_Space` table. */
const char* white_space_table_version();

const char* char_class_name(CharClass cls);

} // namespace scrub

#endif // CHAR_CLASS_HPP
