#include "mirror_for_plex/core/title_matcher.hpp"

#include <gtest/gtest.h>

using mirror_for_plex::core::TitleMatcher;

TEST(TitleMatcherTest, NormalizeTitleDropsTagsPunctuationAndArticle) {
    EXPECT_EQ(TitleMatcher::normalize_title("The Melancholy of Haruhi Suzumiya (2006) [BD 1080p]"),
              "melancholy of haruhi suzumiya");
    EXPECT_EQ(TitleMatcher::normalize_title("Frieren's   Journey!"), "frierens journey");
    EXPECT_EQ(TitleMatcher::normalize_title("Re:ZERO -Starting Life in Another World-"),
              "re zero starting life in another world");
}

TEST(TitleMatcherTest, NormalizeTitleKeepsLoneArticleAndNonAscii) {
    EXPECT_EQ(TitleMatcher::normalize_title("The"), "the");
    EXPECT_EQ(TitleMatcher::normalize_title("進撃の巨人 The Final Season"), "進撃の巨人 the final season");
}

TEST(TitleMatcherTest, NormalizeFolderNameStripsTrailingMarkers) {
    EXPECT_EQ(TitleMatcher::normalize_folder_name("Attack on Titan S4"), "attack on titan");
    EXPECT_EQ(TitleMatcher::normalize_folder_name("Mushoku Tensei Season 2 [1080p]"), "mushoku tensei");
    EXPECT_EQ(TitleMatcher::normalize_folder_name("Vinland Saga 2nd Season"), "vinland saga");
    EXPECT_EQ(TitleMatcher::normalize_folder_name("Cowboy Bebop 1998 BluRay 1080p x265"), "cowboy bebop");
    EXPECT_EQ(TitleMatcher::normalize_folder_name("Spy x Family Part 2 WEB-DL"), "spy x family");
}

TEST(TitleMatcherTest, NormalizeFolderNameAlwaysKeepsOneToken) {
    EXPECT_EQ(TitleMatcher::normalize_folder_name("1080p"), "1080p");
    EXPECT_EQ(TitleMatcher::normalize_folder_name("86 S01"), "86");
}

TEST(TitleMatcherTest, ScoreIsOneForEquivalentTitles) {
    EXPECT_DOUBLE_EQ(TitleMatcher::score("Frieren", "frieren!"), 1.0);
    EXPECT_DOUBLE_EQ(TitleMatcher::score("The Promised Neverland", "Promised Neverland"), 1.0);
}

TEST(TitleMatcherTest, ScoreRewardsContainment) {
    // {attack on titan} inside {attack on titan final season}: dice 0.75
    EXPECT_DOUBLE_EQ(TitleMatcher::score("Attack on Titan", "Attack on Titan: Final Season"), 0.875);
    EXPECT_DOUBLE_EQ(TitleMatcher::score("Steins Gate", "Steins;Gate 0"), 0.9);
}

TEST(TitleMatcherTest, ScoreUsesDiceWithoutContainment) {
    EXPECT_DOUBLE_EQ(TitleMatcher::score("Spy x Family", "Family Guy"), 0.4);
    EXPECT_DOUBLE_EQ(TitleMatcher::score("Naruto", "Bleach"), 0.0);
    EXPECT_DOUBLE_EQ(TitleMatcher::score("", "Bleach"), 0.0);
}

TEST(TitleMatcherTest, NonIdenticalTitlesNeverScoreOne) {
    EXPECT_DOUBLE_EQ(TitleMatcher::score("Love Love Live", "Love Live"), 0.99);
}

TEST(TitleMatcherTest, ScoreIsDeterministic) {
    const double first = TitleMatcher::score("Kaguya-sama: Love is War", "Kaguya sama Love Is War Ultra Romantic");
    for (int i = 0; i < 5; ++i) {
        EXPECT_DOUBLE_EQ(TitleMatcher::score("Kaguya-sama: Love is War", "Kaguya sama Love Is War Ultra Romantic"),
                         first);
    }
}

TEST(TitleMatcherTest, MatchPicksBestCandidate) {
    TitleMatcher matcher;
    auto result = matcher.match("Frieren", {"Naruto", "Sousou no Frieren", "Frieren"});

    ASSERT_TRUE(result.matched());
    EXPECT_EQ(*result.index, 2u);
    EXPECT_DOUBLE_EQ(result.score, 1.0);
}

TEST(TitleMatcherTest, MatchTieGoesToEarliestCandidate) {
    TitleMatcher matcher;
    auto result = matcher.match("Frieren", {"FRIEREN", "frieren"});

    ASSERT_TRUE(result.matched());
    EXPECT_EQ(*result.index, 0u);
}

TEST(TitleMatcherTest, MatchBelowThresholdReportsScoreWithoutIndex) {
    TitleMatcher matcher(0.6);
    auto result = matcher.match("Spy x Family", {"Family Guy"});

    EXPECT_FALSE(result.matched());
    EXPECT_DOUBLE_EQ(result.score, 0.4);

    EXPECT_FALSE(matcher.match("Anything", {}).matched());
}

TEST(TitleMatcherTest, MatchSetsFindsSynonymOfLocalizedShow) {
    TitleMatcher matcher;
    const std::vector<std::string> queries = {
        TitleMatcher::normalize_folder_name("Attack on Titan S4"),
        "進撃の巨人 The Final Season"
    };
    const std::vector<std::vector<std::string>> candidates = {
        {"Shingeki no Kyojin Season 3", "Attack on Titan Season 3"},
        {"Shingeki no Kyojin: The Final Season", "Attack on Titan Final Season", "進撃の巨人 The Final Season",
         "Attack on Titan: Final Season"},
    };

    auto result = matcher.match_sets(queries, candidates);

    ASSERT_TRUE(result.matched());
    // Exact hit on the native title beats the earlier season
    EXPECT_EQ(*result.index, 1u);
    EXPECT_DOUBLE_EQ(result.score, 1.0);
}
