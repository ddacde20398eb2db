#include "test_common.hpp"

using scrub::CharClass;
using scrub::CharacterPolicy;
using scrub::classify;

TEST_CASE("Zero-width characters are removable with labels") {
    CharacterPolicy p;
    auto zws = classify(0x200B, p);
    REQUIRE(zws.cls == CharClass::ZeroWidth);
    REQUIRE(zws.removable);
    REQUIRE(zws.label == "ZWS");
    REQUIRE(classify(0x200C, p).label == "ZWNJ");
    REQUIRE(classify(0x200D, p).label == "ZWJ");
    REQUIRE(classify(0xFEFF, p).label == "BOM");
}

TEST_CASE("Classes are ordered by priority") {
    CharacterPolicy p;
    REQUIRE(classify(0x00A0, p).cls == CharClass::NonBreakingSpace);
    REQUIRE(classify(0x0007, p).cls == CharClass::Control);
    REQUIRE(classify(0x007F, p).cls == CharClass::Control);
    REQUIRE(classify(0x2003, p).cls == CharClass::UnicodeWhitespace);
    REQUIRE(classify(0x3000, p).cls == CharClass::UnicodeWhitespace);
    REQUIRE(classify(0x0085, p).cls == CharClass::UnicodeWhitespace);
}

TEST_CASE("Content is preserved") {
    CharacterPolicy p;
    for (char32_t cp : {U'a', U' ', U'\n', U'é', U'中', U'\U0001F600'}) {
        auto c = classify(cp, p);
        REQUIRE(c.cls == CharClass::Content);
        REQUIRE_FALSE(c.removable);
        REQUIRE(c.label.empty());
    }
}

TEST_CASE("Tab and carriage return survive the control class") {
    CharacterPolicy p;
    REQUIRE_FALSE(classify('\t', p).removable);
    REQUIRE_FALSE(classify('\r', p).removable);
    p.custom_chars = {'\t'};
    auto tab = classify('\t', p);
    REQUIRE(tab.removable);
    REQUIRE(tab.cls == CharClass::Custom);
    REQUIRE(tab.label == "TAB");
}

TEST_CASE("Disabled gates let later classes claim the code point") {
    CharacterPolicy p = scrub::passthrough_policy();
    REQUIRE_FALSE(classify(0x200B, p).removable);
    REQUIRE_FALSE(classify(0x00A0, p).removable);
    REQUIRE_FALSE(classify(0x0001, p).removable);
    REQUIRE_FALSE(classify(0x2028, p).removable);

    p.custom_chars = {0x2028, 0x200B};
    auto ls = classify(0x2028, p);
    REQUIRE(ls.removable);
    REQUIRE(ls.cls == CharClass::Custom);
    REQUIRE(ls.label == "U+2028");
    REQUIRE(classify(0x200B, p).cls == CharClass::Custom);
}

TEST_CASE("NBSP and controls gate independently") {
    CharacterPolicy p;
    p.strip_control_chars = false;
    REQUIRE(classify(0x00A0, p).removable);
    REQUIRE_FALSE(classify(0x0007, p).removable);
    p.strip_non_breaking_space = false;
    // NBSP is excluded from the generic whitespace class.
    REQUIRE_FALSE(classify(0x00A0, p).removable);
}

TEST_CASE("Code point labels are zero padded uppercase hex") {
    REQUIRE(scrub::format_code_point(0x7) == "U+0007");
    REQUIRE(scrub::format_code_point(0x2028) == "U+2028");
    REQUIRE(scrub::format_code_point(0x1F600) == "U+1F600");
    REQUIRE(scrub::format_code_point(0x10FFFF) == "U+10FFFF");
    REQUIRE(scrub::code_point_label(0x00A0) == "NBSP");
    REQUIRE(scrub::code_point_label(0x0009) == "TAB");
}

TEST_CASE("White_Space table matches the pinned Unicode version") {
    REQUIRE(std::string(scrub::white_space_table_version()) == "15.1.0");
    const std::vector<char32_t> members{0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x20,   0x85,
                                        0xA0, 0x1680, 0x2000, 0x200A, 0x2028, 0x2029,
                                        0x202F, 0x205F, 0x3000};
    for (char32_t cp : members)
        REQUIRE(scrub::is_unicode_white_space(cp));
    for (char32_t cp : {char32_t(0x200B), char32_t(0x180E), char32_t(0xFEFF), char32_t('a'),
                        char32_t(0x2060), char32_t(0x1F)})
        REQUIRE_FALSE(scrub::is_unicode_white_space(cp));
}
