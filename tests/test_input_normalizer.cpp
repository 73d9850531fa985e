// ---------------------------------------------------------------------------
// test_input_normalizer.cpp
//
// normalize_string 및 개별 단계 단위 테스트
// ---------------------------------------------------------------------------

#include "normalizer/input_normalizer.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Test: 모든 옵션 비활성 → 항등
// ---------------------------------------------------------------------------
TEST(InputNormalizer, NoOptionsIsIdentity) {
    const std::vector<std::string> inputs{
        "",
        "  padded  ",
        "<b>bold</b>",
        "tab\there",
        std::string("nul\0byte", 8),
        "e\xCC\x81",  // e + U+0301
        "Mixed CASE",
    };
    for (const auto& in : inputs) {
        EXPECT_EQ(normalize_string(in, NormalizeOptions::none()), in);
    }
}

// ---------------------------------------------------------------------------
// Test: 개별 단계
// ---------------------------------------------------------------------------
TEST(InputNormalizer, StripHtmlRemovesTagsKeepsText) {
    EXPECT_EQ(strip_html_tags("<p>Hello <b>world</b></p>"), "Hello world");
    // 닫히지 않은 '<' 는 텍스트로 남는다
    EXPECT_EQ(strip_html_tags("a < b"), "a < b");
}

TEST(InputNormalizer, RemovesControlAndInvisibleCharacters) {
    // U+200B zero width space, U+202E right-to-left override, U+FEFF BOM
    const std::string in = "DR\xE2\x80\x8BOP\x01 TA\xE2\x80\xAE" "BLE\xEF\xBB\xBF\x7F";
    EXPECT_EQ(remove_control_characters(in), "DROP TABLE");
}

TEST(InputNormalizer, KeepsTabNewlineCarriageReturn) {
    EXPECT_EQ(remove_control_characters("a\tb\nc\rd"), "a\tb\nc\rd");
}

TEST(InputNormalizer, CollapseWhitespaceRuns) {
    EXPECT_EQ(collapse_whitespace("a  \t\n b"), "a b");
    EXPECT_EQ(collapse_whitespace("  lead"), " lead");
}

TEST(InputNormalizer, TruncatesByCodePointNotByte) {
    // "한글" = 2 코드포인트, 6 바이트
    EXPECT_EQ(truncate_code_points("\xED\x95\x9C\xEA\xB8\x80!", 2), "\xED\x95\x9C\xEA\xB8\x80");
    EXPECT_EQ(truncate_code_points("abc", 10), "abc");
    EXPECT_EQ(truncate_code_points("abc", 0), "");
}

// ---------------------------------------------------------------------------
// Test: 조합
// ---------------------------------------------------------------------------
TEST(InputNormalizer, DefaultsComposeNfcAndCleanWhitespace) {
    const std::string in = "  caf" "e\xCC\x81" "\x07  menu  ";
    EXPECT_EQ(normalize_string(in, NormalizeOptions::defaults()), "caf\xC3\xA9 menu");
}

TEST(InputNormalizer, CaseFoldLowercases) {
    NormalizeOptions o{};
    o.case_fold = true;
    EXPECT_EQ(normalize_string("SELECT Name", o), "select name");
}

TEST(InputNormalizer, MaxLengthThenTrimLeavesNoTrailingSpace) {
    NormalizeOptions o{};
    o.trim       = true;
    o.max_length = 6;
    EXPECT_EQ(normalize_string("hello world", o), "hello");
}

TEST(InputNormalizer, HtmlStrippedBeforeWhitespaceCollapse) {
    NormalizeOptions o = NormalizeOptions::defaults();
    o.strip_html       = true;
    EXPECT_EQ(normalize_string("<p> one </p>\n\n<p>two</p>", o), "one two");
}

// ---------------------------------------------------------------------------
// Test: 멱등성
// ---------------------------------------------------------------------------
TEST(InputNormalizer, NormalizationIsIdempotent) {
    NormalizeOptions all = NormalizeOptions::defaults();
    all.strip_html       = true;
    all.case_fold        = true;
    all.max_length       = 12;

    const std::vector<std::string> inputs{
        "  <i>Hello</i>\t\tWORLD  ",
        "A\xE2\x80\x8B" "B\xCC\x81 C",
        "<<script>>x",
        "tail     spaces     cut here",
        "\xED\x95\x9C\xEA\xB8\x80 \xED\x85\x8C\xEC\x8A\xA4\xED\x8A\xB8",
    };
    for (const auto& in : inputs) {
        const auto once  = normalize_string(in, all);
        const auto twice = normalize_string(once, all);
        EXPECT_EQ(once, twice) << "input: " << in;
    }
}
