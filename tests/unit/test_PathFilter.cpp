#include <gtest/gtest.h>
#include "filter/PathFilter.hpp"

using namespace ferry::filter;

TEST(PathFilterTest, DirectoryPrefixExcludesEveryDescendant) {
    const PathFilter f({"wp-content/cache/"});
    EXPECT_TRUE(f.isExcluded("wp-content/cache"));
    EXPECT_TRUE(f.isExcluded("wp-content/cache/a/b/c.html"));
    EXPECT_FALSE(f.isExcluded("wp-content/uploads/a.jpg"));
}

TEST(PathFilterTest, ExcludedParentPrunesChildren) {
    const PathFilter f({"wp-content/uploads"});
    EXPECT_TRUE(f.isExcluded("wp-content/uploads"));
    EXPECT_TRUE(f.isExcluded("wp-content/uploads/2024/photo.jpg"));
    EXPECT_FALSE(f.isExcluded("wp-content/uploads-old/photo.jpg"));
}

TEST(PathFilterTest, ExcludesAreUnionedRegardlessOfOrder) {
    const PathFilter a({"*.log", "node_modules/"});
    const PathFilter b({"node_modules/", "*.log"});
    for (const auto* rel : {"x.log", "a/node_modules/pkg/index.js", "index.php"})
        EXPECT_EQ(a.isExcluded(rel), b.isExcluded(rel)) << rel;
}

TEST(PathFilterTest, EmptyPatternsAreIgnored) {
    const PathFilter f({"", "*.bak"});
    EXPECT_EQ(f.excludes().size(), 1u);
    EXPECT_FALSE(f.isExcluded("index.php"));
}

TEST(PathFilterTest, NoRestrictionWithoutIncludes) {
    const PathFilter f({}, {}, true);
    EXPECT_FALSE(f.restricts());
    EXPECT_TRUE(f.isIncluded("anything/at/all.txt", false));
}

TEST(PathFilterTest, RestrictionKeepsSelectedSubtreeAndAncestors) {
    const PathFilter f({}, {"/wp-content/", "/wp-content/uploads/", "/wp-content/uploads/***"}, true);
    ASSERT_TRUE(f.restricts());

    EXPECT_TRUE(f.isIncluded("wp-content", true));
    EXPECT_TRUE(f.isIncluded("wp-content/uploads", true));
    EXPECT_TRUE(f.isIncluded("wp-content/uploads/2024/01/a.jpg", false));

    EXPECT_FALSE(f.isIncluded("wp-content/plugins", true));
    EXPECT_FALSE(f.isIncluded("wp-content/index.php", false));
    EXPECT_FALSE(f.isIncluded("index.php", false));
}

TEST(PathFilterTest, AncestorOfIncludedFileStaysVisible) {
    const PathFilter f({}, {"/wp-content/themes/mytheme/style.css"}, true);
    EXPECT_TRUE(f.isIncluded("wp-content", true));
    EXPECT_TRUE(f.isIncluded("wp-content/themes/mytheme", true));
    EXPECT_TRUE(f.isIncluded("wp-content/themes/mytheme/style.css", false));
    EXPECT_FALSE(f.isIncluded("wp-content/themes/mytheme/functions.php", false));
    EXPECT_FALSE(f.isIncluded("wp-content/plugins", true));
}

TEST(PathFilterTest, ExcludeWinsOverInclude) {
    const PathFilter f({"*.log"}, {"/logs/", "/logs/***"}, true);
    EXPECT_TRUE(f.accepts("logs/readme.txt", false));
    EXPECT_FALSE(f.accepts("logs/error.log", false));
}
