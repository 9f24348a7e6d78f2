//! # Ignore Rule Tests

#include "discovery/gitignore.hpp"

#include <gtest/gtest.h>

using devkit::discovery::IgnoreMatcher;

TEST(IgnoreMatcherTest, EmptyMatcherIgnoresNothing) {
    IgnoreMatcher matcher;
    EXPECT_TRUE(matcher.empty());
    EXPECT_FALSE(matcher.is_ignored("scripts/deploy.sh", false));
}

TEST(IgnoreMatcherTest, CommentsAndBlankLinesSkipped) {
    auto matcher = IgnoreMatcher::parse("# comment\n\n   \n");
    EXPECT_TRUE(matcher.empty());
}

TEST(IgnoreMatcherTest, UnanchoredMatchesBasenameAnywhere) {
    auto matcher = IgnoreMatcher::parse("*.log\nsecret.sh\n");

    EXPECT_TRUE(matcher.is_ignored("build.log", false));
    EXPECT_TRUE(matcher.is_ignored("scripts/secret.sh", false));
    EXPECT_TRUE(matcher.is_ignored("a/b/c/debug.log", false));
    EXPECT_FALSE(matcher.is_ignored("scripts/deploy.sh", false));
}

TEST(IgnoreMatcherTest, AnchoredPatterns) {
    auto matcher = IgnoreMatcher::parse("/local.sh\nscripts/tmp-*\n");

    EXPECT_TRUE(matcher.is_ignored("local.sh", false));
    EXPECT_FALSE(matcher.is_ignored("scripts/local.sh", false));
    EXPECT_TRUE(matcher.is_ignored("scripts/tmp-1", false));
    EXPECT_FALSE(matcher.is_ignored("tools/scripts/tmp-1", false));
}

TEST(IgnoreMatcherTest, DirectoryOnlyRule) {
    auto matcher = IgnoreMatcher::parse("tools/\n");

    EXPECT_TRUE(matcher.is_ignored("tools", true));
    EXPECT_FALSE(matcher.is_ignored("tools", false));
    // Everything below an ignored directory is ignored
    EXPECT_TRUE(matcher.is_ignored("tools/run.sh", false));
}

TEST(IgnoreMatcherTest, NegationLastRuleWins) {
    auto matcher = IgnoreMatcher::parse("*.sh\n!keep.sh\n");

    EXPECT_TRUE(matcher.is_ignored("bin/drop.sh", false));
    EXPECT_FALSE(matcher.is_ignored("bin/keep.sh", false));
}

TEST(IgnoreMatcherTest, NegationCannotReincludeBelowIgnoredDirectory) {
    auto matcher = IgnoreMatcher::parse("bin/\n!bin/keep.sh\n");
    EXPECT_TRUE(matcher.is_ignored("bin/keep.sh", false));
}

TEST(IgnoreMatcherTest, DoubleStarSpansDirectories) {
    auto matcher = IgnoreMatcher::parse("**/generated\nlogs/**\n");

    EXPECT_TRUE(matcher.is_ignored("generated", true));
    EXPECT_TRUE(matcher.is_ignored("a/b/generated", true));
    EXPECT_TRUE(matcher.is_ignored("logs/today/x.txt", false));
    EXPECT_FALSE(matcher.is_ignored("logs", true));
}

TEST(IgnoreMatcherTest, EscapedHash) {
    auto matcher = IgnoreMatcher::parse("\\#notes\n");
    EXPECT_TRUE(matcher.is_ignored("#notes", false));
}
