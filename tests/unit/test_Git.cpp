#include <gtest/gtest.h>
#include "vcs/Git.hpp"
#include "types/errors.hpp"
#include "FakeExecutor.hpp"

using namespace ferry::vcs;
using namespace ferry::cmd;
using ferry::test::FakeExecutor;

TEST(GitTest, SplitNulDropsEmptyItems) {
    const std::string out("index.php\0wp-content/themes/a.css\0\0readme.txt\0", 46);
    EXPECT_EQ(git::splitNul(out), (std::vector<std::string>{"index.php", "wp-content/themes/a.css", "readme.txt"}));
    EXPECT_TRUE(git::splitNul("").empty());
}

TEST(GitTest, LsFilesCommandQuotesRoot) {
    EXPECT_EQ(git::buildLsFilesCommand("/srv/my site", Toolchain::defaults()), "git -C '/srv/my site' ls-files -z");
}

TEST(GitTest, TrackedFilesRunsGitThroughExecutor) {
    FakeExecutor exec;
    exec.when("ls-files", {0, std::string("a.php\0b/c.php\0", 14), ""});

    const auto files = git::trackedFiles(exec, Toolchain::defaults(), "/srv/site");
    EXPECT_EQ(files, (std::vector<std::string>{"a.php", "b/c.php"}));
    ASSERT_EQ(exec.commands.size(), 1u);
    EXPECT_EQ(exec.commands[0], "git -C '/srv/site' ls-files -z");
}

TEST(GitTest, TrackedFilesFailsOutsideARepository) {
    FakeExecutor exec;
    exec.when("ls-files", {128, "", "fatal: not a git repository"});
    EXPECT_THROW((void)git::trackedFiles(exec, Toolchain::defaults(), "/srv/site"), ferry::types::TransferError);
}
