#include <gtest/gtest.h>
#include "sync/SearchReplace.hpp"
#include "types/errors.hpp"
#include "TempTree.hpp"

using namespace ferry::sync;
using ferry::test::TempTree;

class SearchReplaceTest : public ::testing::Test {
protected:
    std::unique_ptr<TempTree> tree;
    void SetUp() override { tree = std::make_unique<TempTree>("replace"); }
    void TearDown() override { tree.reset(); }
};

TEST_F(SearchReplaceTest, RewritesTextFilesOnly) {
    tree->write("themes/site/header.php", "<a href=\"https://example.test/\">https://example.test</a>");
    tree->write("themes/site/style.css", "body { background: url(https://example.test/bg.png); }");
    tree->write("themes/site/notes.txt", "nothing to see");
    tree->write("uploads/photo.jpg", "https://example.test");
    tree->write("uploads/packed.js", std::string("https://example.test\0binary", 27));

    const auto result = replaceInTree(tree->root(), "https://example.test", "https://example.com");

    EXPECT_EQ(result.files_checked, 3u);
    EXPECT_EQ(result.files_modified, 2u);
    EXPECT_EQ(tree->read("themes/site/header.php"), "<a href=\"https://example.com/\">https://example.com</a>");
    EXPECT_EQ(tree->read("themes/site/style.css"), "body { background: url(https://example.com/bg.png); }");
    EXPECT_EQ(tree->read("uploads/photo.jpg"), "https://example.test");
}

TEST_F(SearchReplaceTest, ReplacementContainingSearchDoesNotLoop) {
    tree->write("a.php", "site.test site.test");
    const auto result = replaceInTree(tree->root(), "site.test", "www.site.test");
    EXPECT_EQ(result.files_modified, 1u);
    EXPECT_EQ(tree->read("a.php"), "www.site.test www.site.test");
}

TEST_F(SearchReplaceTest, IdenticalOrEmptySearchIsNoOp) {
    tree->write("a.php", "x");
    EXPECT_EQ(replaceInTree(tree->root(), "x", "x").files_checked, 0u);
    EXPECT_EQ(replaceInTree(tree->root(), "", "y").files_checked, 0u);
    EXPECT_EQ(tree->read("a.php"), "x");
}

TEST_F(SearchReplaceTest, MissingRootThrows) {
    EXPECT_THROW(replaceInTree(tree->root() / "nope", "a", "b"), ferry::types::StagingError);
}

TEST_F(SearchReplaceTest, ExtensionAndBinaryDetection) {
    EXPECT_TRUE(hasTextExtension("x/INDEX.PHP"));
    EXPECT_TRUE(hasTextExtension("config.yml"));
    EXPECT_FALSE(hasTextExtension("image.jpg"));
    EXPECT_FALSE(hasTextExtension("Makefile"));

    const auto text = tree->write("t.txt", "plain");
    const auto bin = tree->write("b.txt", std::string("a\0b", 3));
    EXPECT_FALSE(looksBinary(text));
    EXPECT_TRUE(looksBinary(bin));
}
