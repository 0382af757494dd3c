#include <gtest/gtest.h>
#include "ExclusionRules.hpp"

TEST(ExclusionRulesTest, ParsesFourCategories) {
    ExclusionRules Rules({ "/cache", "notes.txt", "~/build*", "~*.tmp" });

    EXPECT_TRUE(Rules.MatchesExactDirectory("cache"));
    EXPECT_FALSE(Rules.MatchesExactFile("cache"));

    EXPECT_TRUE(Rules.MatchesExactFile("notes.txt"));
    EXPECT_FALSE(Rules.MatchesExactDirectory("notes.txt"));

    EXPECT_TRUE(Rules.MatchesWildcardDirectory("build-debug"));
    EXPECT_FALSE(Rules.MatchesWildcardFile("build-debug"));

    EXPECT_TRUE(Rules.MatchesWildcardFile("b.TMP"));
    EXPECT_FALSE(Rules.MatchesWildcardDirectory("b.tmp"));
}

TEST(ExclusionRulesTest, ExactRulesAreCaseSensitive) {
    ExclusionRules Rules({ "/Cache", "Notes.txt" });
    EXPECT_TRUE(Rules.IsExcludedDirectory("Cache"));
    EXPECT_FALSE(Rules.IsExcludedDirectory("cache"));
    EXPECT_FALSE(Rules.IsExcludedFile("notes.txt"));
}

TEST(ExclusionRulesTest, LeadingSlashesStrippedFromDirectoryRule) {
    ExclusionRules Rules({ "//node_modules" });
    EXPECT_TRUE(Rules.IsExcludedDirectory("node_modules"));
}

TEST(ExclusionRulesTest, EmptyAndBareRulesIgnored) {
    ExclusionRules Rules({ "", "/" });
    EXPECT_TRUE(Rules.Empty());
}

TEST(ExclusionRulesTest, ParseReplacesPreviousRules) {
    ExclusionRules Rules({ "a.txt" });
    Rules.Parse({ "b.txt" });
    EXPECT_FALSE(Rules.IsExcludedFile("a.txt"));
    EXPECT_TRUE(Rules.IsExcludedFile("b.txt"));
}
