#include <gtest/gtest.h>
#include "WildcardMatcher.hpp"

TEST(WildcardMatcherTest, StarMatchesExtensionCaseInsensitive) {
    EXPECT_TRUE(WildcardMatches("*.JPG", "photo.jpg"));
    EXPECT_TRUE(WildcardMatches("*.jpg", "PHOTO.JPG"));
}

// '/' is an ordinary character to the matcher; callers only ever pass single components
TEST(WildcardMatcherTest, SlashIsAnOrdinaryCharacter) {
    EXPECT_TRUE(WildcardMatches("a/*", "a/b"));
    EXPECT_FALSE(WildcardMatches("a/*", "b"));
    EXPECT_FALSE(WildcardMatches("*/b", "b"));
}

TEST(WildcardMatcherTest, StarMatchesEmpty) {
    EXPECT_TRUE(WildcardMatches("*", ""));
    EXPECT_TRUE(WildcardMatches("abc*", "abc"));
    EXPECT_TRUE(WildcardMatches("*abc", "abc"));
}

TEST(WildcardMatcherTest, QuestionMarkConsumesExactlyOne) {
    EXPECT_TRUE(WildcardMatches("file?.txt", "file1.txt"));
    EXPECT_FALSE(WildcardMatches("file?.txt", "file.txt"));
    EXPECT_FALSE(WildcardMatches("file?.txt", "file12.txt"));
    EXPECT_FALSE(WildcardMatches("?", ""));
}

TEST(WildcardMatcherTest, WholeNameMustMatch) {
    EXPECT_FALSE(WildcardMatches("*.tmp", "a.tmp.bak"));
    EXPECT_FALSE(WildcardMatches("cache", "cache2"));
    EXPECT_TRUE(WildcardMatches("Cache", "cACHE"));
}

TEST(WildcardMatcherTest, BacktracksAcrossMultipleStars) {
    EXPECT_TRUE(WildcardMatches("*a*b*c", "xxaYYbZZc"));
    EXPECT_FALSE(WildcardMatches("*a*b*c", "xxaYYcZZb"));
    EXPECT_TRUE(WildcardMatches("**", "anything"));
}
