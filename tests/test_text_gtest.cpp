// ==============================================================================
// test_text_gtest.cpp - Тесты строковых утилит (GoogleTest)
// ==============================================================================
//
// TST-TEXT-001..TST-TEXT-005
//
// ==============================================================================

#include "terse/text.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace terse::text::test {

// ==============================================================================
// TST-TEXT-001: Регистр и пробелы
// ==============================================================================

TEST(TextTest, Iequals_IgnoresAsciiCase) {
    EXPECT_TRUE(iequals("Bash", "bash"));
    EXPECT_TRUE(iequals("", ""));
    EXPECT_FALSE(iequals("bash", "bash "));
}

TEST(TextTest, Icontains_FindsMixedCase) {
    EXPECT_TRUE(icontains("I Cannot do that", "cannot"));
    EXPECT_TRUE(icontains("anything", ""));
    EXPECT_FALSE(icontains("short", "shorter"));
}

TEST(TextTest, Trim_RemovesBothEnds) {
    EXPECT_EQ(trim("  \t hello \r\n"), "hello");
    EXPECT_EQ(trim_start("  x "), "x ");
    EXPECT_EQ(trim_end("  x "), "  x");
    EXPECT_EQ(trim("   "), "");
}

// ==============================================================================
// TST-TEXT-002: Строки
// ==============================================================================

TEST(TextTest, SplitLines_DropsCarriageReturnAndFinalNewline) {
    auto lines = split_lines("a\r\nb\n\nc\n");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "c");
}

TEST(TextTest, SplitLines_EmptyText_NoLines) {
    EXPECT_TRUE(split_lines("").empty());
}

TEST(TextTest, JoinLines_UsesNewlineSeparator) {
    EXPECT_EQ(join_lines({"a", "b", "c"}), "a\nb\nc");
    EXPECT_EQ(join_lines({}), "");
}

TEST(TextTest, SplitWhitespace_CollapsesRuns) {
    auto words = split_whitespace("  git   log\t--oneline ");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], "git");
    EXPECT_EQ(words[2], "--oneline");
    EXPECT_EQ(first_word("  cargo build"), "cargo");
}

TEST(TextTest, ReplaceFirst_OnlyFirstOccurrence) {
    std::string s = "git status && git status";
    EXPECT_TRUE(replace_first(s, "git status", "git status --porcelain"));
    EXPECT_EQ(s, "git status --porcelain && git status");
    EXPECT_FALSE(replace_first(s, "svn", "hg"));
    EXPECT_FALSE(replace_first(s, "", "x"));
}

TEST(TextTest, TruncateChars_AppendsEllipsis) {
    EXPECT_EQ(truncate_chars("abcdef", 10), "abcdef");
    EXPECT_EQ(truncate_chars("abcdefghij", 6), "abc...");
}

TEST(TextTest, TruncateChars_KeepsUtf8Boundary) {
    // "жжжж" - по 2 байта на символ
    std::string s = "\xd0\xb6\xd0\xb6\xd0\xb6\xd0\xb6";
    std::string out = truncate_chars(s, 6);
    // Срез на 3-м байте попадает внутрь символа и сдвигается к 2
    EXPECT_EQ(out, "\xd0\xb6...");
}

// ==============================================================================
// TST-TEXT-003: Оценка токенов
// ==============================================================================

TEST(TextTest, EstimateTokens_CeilOfQuarter) {
    EXPECT_EQ(estimate_tokens(""), 0u);
    EXPECT_EQ(estimate_tokens("a"), 1u);
    EXPECT_EQ(estimate_tokens("abcd"), 1u);
    EXPECT_EQ(estimate_tokens("abcde"), 2u);
    EXPECT_EQ(estimate_tokens(std::string(4000, 'x')), 1000u);
}

TEST(TextTest, SavingsPct_Bounds) {
    EXPECT_DOUBLE_EQ(savings_pct(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(savings_pct(100, 25), 75.0);
    EXPECT_DOUBLE_EQ(savings_pct(100, 150), 0.0);
}

// ==============================================================================
// TST-TEXT-004: Сигналы ошибки
// ==============================================================================

TEST(TextTest, FailureSignal_KeywordsAndGlyphs) {
    EXPECT_TRUE(has_failure_signal("src/main.rs:3: ERROR: expected ;"));
    EXPECT_TRUE(has_failure_signal("test foo ... FAILED"));
    EXPECT_TRUE(has_failure_signal("Traceback (most recent call last):"));
    EXPECT_TRUE(has_failure_signal("\xe2\x9c\x95 renders header"));
    EXPECT_FALSE(has_failure_signal("Compiling terse v0.4.0"));
}

}  // namespace terse::text::test
