/**
 * @file compare_test.cpp
 * @brief 输出比对测试
 */

#include <gtest/gtest.h>
#include "core/compare.h"

using namespace sjudge;

TEST(CompareTest, ExactMatch) {
    EXPECT_TRUE(compare("42", "42", ComparisonMode::EXACT).matches);
    EXPECT_FALSE(compare("42", "42 ", ComparisonMode::EXACT).matches);
}

TEST(CompareTest, ExactMismatchMessageQuotesBothSides) {
    auto r = compare("41", "42", "exact");
    ASSERT_FALSE(r.matches);
    ASSERT_TRUE(r.message.has_value());
    EXPECT_EQ(*r.message, "Expected '42', got '41'");
}

TEST(CompareTest, ExactMismatchEscapesNewlines) {
    auto r = compare("a\nb", "a b", "exact");
    ASSERT_FALSE(r.matches);
    EXPECT_EQ(*r.message, "Expected 'a b', got 'a\\nb'");
}

TEST(CompareTest, NormalizedCollapsesWhitespace) {
    EXPECT_TRUE(compare("a   b", "a b", "normalized").matches);
    EXPECT_TRUE(compare("  1\t2\n3  ", "1 2 3", "normalized").matches);
    EXPECT_FALSE(compare("1 2", "12", "normalized").matches);
}

TEST(CompareTest, NormalizationIsIdempotent) {
    std::string once = normalize_whitespace(" x \n\n y\t\tz ");
    EXPECT_EQ(once, "x y z");
    EXPECT_EQ(normalize_whitespace(once), once);
}

TEST(CompareTest, RegexRequiresFullMatch) {
    EXPECT_TRUE(compare("abc123", "[a-z]+\\d+", "regex").matches);
    EXPECT_FALSE(compare("abc123!", "[a-z]+\\d+", "regex").matches);
    EXPECT_FALSE(compare("xabc123", "abc\\d+", "regex").matches);
}

TEST(CompareTest, InvalidRegexDoesNotThrow) {
    CompareResult r;
    ASSERT_NO_THROW(r = compare("abc", "([a-z", "regex"));
    EXPECT_FALSE(r.matches);
    ASSERT_TRUE(r.message.has_value());
    EXPECT_NE(r.message->find("Invalid regex pattern"), std::string::npos);
}

TEST(CompareTest, RegexOnOutputCeilingSizedInput) {
    // 默认 max_output_kb = 64
    std::string big(64 * 1024, 'a');
    EXPECT_TRUE(compare(big, "[a-z]+", "regex").matches);
    EXPECT_TRUE(compare(big, "a.*a", "regex").matches);
    EXPECT_FALSE(compare(big + "1", "[a-z]+", "regex").matches);

    std::string lines;
    for (int i = 0; i < 2000; i++) lines += "line " + std::to_string(i) + "\n";
    EXPECT_TRUE(compare(lines, "(line \\d+\\n)+", "regex").matches);
}

TEST(CompareTest, PathologicalRegexFailsInsteadOfThrowing) {
    CompareResult r;
    ASSERT_NO_THROW(r = compare(std::string(40, 'a'), "(a*)*b", "regex"));
    EXPECT_FALSE(r.matches);
    ASSERT_TRUE(r.message.has_value());
}

TEST(CompareTest, Contains) {
    EXPECT_TRUE(compare("result: 42 done", "42", "contains").matches);
    EXPECT_FALSE(compare("result: 41", "42", "contains").matches);
    EXPECT_TRUE(compare("anything", "", "contains").matches);
}

TEST(CompareTest, Reflexive) {
    const std::string samples[] = {"", "hello", "a  b\tc", "1 2 3", "x"};
    for (const auto &s : samples) {
        EXPECT_TRUE(compare(s, s, "exact").matches) << s;
        EXPECT_TRUE(compare(s, s, "normalized").matches) << s;
        EXPECT_TRUE(compare(s, s, "contains").matches) << s;
    }
    // 不含元字符的字符串作为正则时匹配自身
    EXPECT_TRUE(compare("hello", "hello", "regex").matches);
}

TEST(CompareTest, UnknownModeFails) {
    auto r = compare("a", "a", "fuzzy");
    EXPECT_FALSE(r.matches);
    EXPECT_EQ(*r.message, "Unknown comparison mode: fuzzy");
}
