#include <gtest/gtest.h>
#include "utils/StringUtils.hpp"

using namespace FeedLine;

TEST(StringUtilsTest, SanitizeKeepsValidUtf8) {
    std::string text = "Caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x93\xB0\tline\n";
    EXPECT_EQ(StringUtils::sanitizeUtf8(text), text);
}

TEST(StringUtilsTest, SanitizeDropsInvalidBytes) {
    EXPECT_EQ(StringUtils::sanitizeUtf8("abc\xFF" "def"), "abcdef");
    // Lone continuation byte and truncated sequence at the end
    EXPECT_EQ(StringUtils::sanitizeUtf8("a\x80" "b\xE2\x82"), "ab");
}

TEST(StringUtilsTest, SanitizeDropsControlCharacters) {
    EXPECT_EQ(StringUtils::sanitizeUtf8(std::string("a\x01" "b\x1B" "c\x7F" "d")), "abcd");
    // U+0085 is a C1 control
    EXPECT_EQ(StringUtils::sanitizeUtf8("x\xC2\x85y"), "xy");
}

TEST(StringUtilsTest, SanitizeRejectsOverlongAndSurrogates) {
    EXPECT_EQ(StringUtils::sanitizeUtf8("a\xC0\xAF" "b"), "ab");
    EXPECT_EQ(StringUtils::sanitizeUtf8("a\xED\xA0\x80" "b"), "ab");
}

TEST(StringUtilsTest, ContainsIgnoreCase) {
    EXPECT_TRUE(StringUtils::containsIgnoreCase("Breaking NEWS today", "news"));
    EXPECT_FALSE(StringUtils::containsIgnoreCase("Weather", "sport"));
    EXPECT_TRUE(StringUtils::containsIgnoreCase("anything", ""));
}

TEST(StringUtilsTest, ReplaceAllAndSplit) {
    EXPECT_EQ(StringUtils::replaceAll("a&amp;b&amp;c", "&amp;", "&"), "a&b&c");
    auto parts = StringUtils::split("a,,b", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
}

TEST(StringUtilsTest, TrimAndTruncate) {
    EXPECT_EQ(StringUtils::trim("  \thello\r\n"), "hello");
    EXPECT_EQ(StringUtils::trim(" \n "), "");
    EXPECT_EQ(StringUtils::truncateForLog("abcdef", 3), "abc...");
    EXPECT_EQ(StringUtils::truncateForLog("abc", 3), "abc");
}
