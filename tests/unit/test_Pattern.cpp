#include <gtest/gtest.h>
#include "filter/Pattern.hpp"

using namespace ferry::filter;

TEST(PatternTest, ClassifiesKinds) {
    EXPECT_EQ(Pattern("wp-config.php").kind(), PatternKind::Exact);
    EXPECT_EQ(Pattern("wp-content/cache/").kind(), PatternKind::Prefix);
    EXPECT_EQ(Pattern("*.log").kind(), PatternKind::Glob);
    EXPECT_EQ(Pattern("wp-content/**/*.tmp").kind(), PatternKind::Glob);
    EXPECT_EQ(Pattern("wp-content/uploads/***").kind(), PatternKind::Glob);
    EXPECT_EQ(to_string(PatternKind::Prefix), "prefix");
}

TEST(PatternTest, ExactMatchesFullRelativePath) {
    const Pattern p("wp-content/plugins/myplugin/plugin.php");
    EXPECT_TRUE(p.matches("wp-content/plugins/myplugin/plugin.php"));
    EXPECT_FALSE(p.matches("wp-content/plugins/myplugin/plugin.php.bak"));
    EXPECT_FALSE(p.matches("wp-content/plugins/myplugin"));
    EXPECT_FALSE(p.matches("other/wp-content/plugins/myplugin/plugin.php"));
}

TEST(PatternTest, BareNameMatchesAtAnyDepth) {
    const Pattern p(".DS_Store");
    EXPECT_TRUE(p.matches(".DS_Store"));
    EXPECT_TRUE(p.matches("wp-content/uploads/.DS_Store"));
    EXPECT_FALSE(p.matches("wp-content/uploads/.DS_Store2"));
}

TEST(PatternTest, LeadingSlashAnchorsToRoot) {
    const Pattern p("/wp-config.php");
    EXPECT_TRUE(p.anchored());
    EXPECT_TRUE(p.matches("wp-config.php"));
    EXPECT_FALSE(p.matches("backup/wp-config.php"));
}

TEST(PatternTest, DirectoryPrefixMatchesDirectoryAndDescendants) {
    const Pattern p("wp-content/cache/");
    EXPECT_TRUE(p.matches("wp-content/cache"));
    EXPECT_TRUE(p.matches("wp-content/cache/page.html"));
    EXPECT_TRUE(p.matches("wp-content/cache/deep/nested/file.css"));
    EXPECT_FALSE(p.matches("wp-content/cache-old/page.html"));
    EXPECT_FALSE(p.matches("wp-content"));
}

TEST(PatternTest, UnanchoredDirectoryPrefixMatchesAnyComponent) {
    const Pattern p(".git/");
    EXPECT_TRUE(p.matches(".git"));
    EXPECT_TRUE(p.matches(".git/HEAD"));
    EXPECT_TRUE(p.matches("wp-content/plugins/vendored/.git/config"));
    EXPECT_FALSE(p.matches(".github/workflows/ci.yml"));
}

TEST(PatternTest, SingleStarStaysWithinOneComponent) {
    const Pattern p("wp-content/*.log");
    EXPECT_TRUE(p.matches("wp-content/debug.log"));
    EXPECT_FALSE(p.matches("wp-content/logs/debug.log"));

    EXPECT_FALSE(Pattern("a/*").matches("a/b/c"));
    EXPECT_TRUE(Pattern("a/*").matches("a/b"));
}

TEST(PatternTest, UnanchoredGlobMatchesBasename) {
    const Pattern p("*.log");
    EXPECT_TRUE(p.matches("debug.log"));
    EXPECT_TRUE(p.matches("wp-content/debug.log"));
    EXPECT_FALSE(p.matches("wp-content/debug.log.gz"));
}

TEST(PatternTest, DoubleStarCrossesSeparators) {
    const Pattern p("wp-content/**/*.tmp");
    EXPECT_TRUE(p.matches("wp-content/a/b/c/file.tmp"));
    EXPECT_TRUE(p.matches("wp-content/file.tmp"));
    EXPECT_FALSE(p.matches("other/a/file.tmp"));

    EXPECT_TRUE(Pattern("a/**").matches("a/b/c"));
}

TEST(PatternTest, QuestionMarkMatchesOneCharacter) {
    const Pattern p("file?.txt");
    EXPECT_TRUE(p.matches("file1.txt"));
    EXPECT_FALSE(p.matches("file12.txt"));
    EXPECT_FALSE(p.matches("file.txt"));
}

TEST(PatternTest, SubtreeRuleCoversDirectoryAndContent) {
    const Pattern p("/wp-content/uploads/***");
    EXPECT_TRUE(p.matches("wp-content/uploads"));
    EXPECT_TRUE(p.matches("wp-content/uploads/2024/01/image.jpg"));
    EXPECT_FALSE(p.matches("wp-content/plugins/a.php"));
}

TEST(PatternTest, DirectoryRuleSelectsOnlyTheDirectoryItself) {
    const Pattern p("/wp-content/");
    EXPECT_TRUE(p.selects("wp-content"));
    EXPECT_FALSE(p.selects("wp-content/index.php"));
    EXPECT_TRUE(p.matches("wp-content/index.php"));
}

TEST(PatternTest, MayMatchBelowFollowsAnchoredPrefix) {
    const Pattern p("/wp-content/themes/mytheme/style.css");
    EXPECT_TRUE(p.mayMatchBelow("wp-content"));
    EXPECT_TRUE(p.mayMatchBelow("wp-content/themes"));
    EXPECT_FALSE(p.mayMatchBelow("wp-content/plugins"));
    EXPECT_FALSE(p.mayMatchBelow("wp-admin"));

    EXPECT_TRUE(Pattern("*.css").mayMatchBelow("anything"));
}

TEST(PatternTest, MatchingIsPureAndRepeatable) {
    for (const auto* rel : {"wp-content/cache/a.html", "index.php", "wp-content/uploads/x.jpg"}) {
        for (const auto* pat : {"wp-content/cache/", "*.php", "index.php", "wp-content/**"}) {
            const bool first = matches(rel, pat);
            EXPECT_EQ(first, matches(rel, pat)) << rel << " vs " << pat;
        }
    }
}

TEST(GlobMatchTest, Basics) {
    EXPECT_TRUE(globMatch("abc", "abc"));
    EXPECT_TRUE(globMatch("abc", "a*"));
    EXPECT_TRUE(globMatch("", "*"));
    EXPECT_FALSE(globMatch("a/b", "*"));
    EXPECT_TRUE(globMatch("a/b", "**"));
    EXPECT_TRUE(globMatch("a/b/c.txt", "a/**/c.txt"));
    EXPECT_TRUE(globMatch("a/c.txt", "a/**/c.txt"));
    EXPECT_FALSE(globMatch("abc", "abd"));
    EXPECT_FALSE(globMatch("a/b", "a?b"));
}
