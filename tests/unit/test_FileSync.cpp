#include <gtest/gtest.h>
#include "sync/FileSync.hpp"
#include "sync/Staging.hpp"
#include "types/errors.hpp"
#include "FakeExecutor.hpp"
#include "TempTree.hpp"

#include <filesystem>
#include <stdexcept>

using namespace ferry::sync;
using namespace ferry::types;
using ferry::cmd::Toolchain;
using ferry::test::FakeExecutor;
using ferry::test::TempTree;
namespace fs = std::filesystem;

namespace {

constexpr auto STATS_OUTPUT = "Number of files: 3\n"
                              "Number of regular files transferred: 1\n"
                              "Total file size: 3,072 bytes\n"
                              "Total transferred file size: 1,024 bytes\n";

// The staging directory named in an rsync command line
fs::path stagedPathIn(const std::string& command) {
    const auto at = command.find(STAGING_PREFIX);
    if (at == std::string::npos) return {};
    const auto open = command.rfind('\'', at);
    const auto end = command.find('/', at);
    return command.substr(open + 1, end - open - 1);
}

}

class FileSyncTest : public ::testing::Test {
protected:
    std::unique_ptr<TempTree> src;
    Toolchain tools = Toolchain::defaults();
    FakeExecutor exec;
    Environment local, remote;

    void SetUp() override {
        src = std::make_unique<TempTree>("filesync");
        src->write("index.php", "<?php header('Location: http://site.test/');");
        src->write("wp-content/themes/site/style.css", "a { background: url(http://site.test/bg.png); }");
        src->write("wp-content/uploads/photo.jpg", "JPEG http://site.test");
        src->write("wp-content/debug.log", "noise");
        src->write(".git/HEAD", "ref: refs/heads/main");

        local.name = "local";
        local.wordpress_path = src->root();
        local.url = "http://site.test";
        local.database = {"wp", "root", "", "localhost"};

        remote.name = "production";
        remote.wordpress_path = "/var/www/html";
        remote.url = "https://example.com";
        remote.database = {"wp", "wp", "", "localhost"};
        remote.ssh = RemoteAccess{"example.com", "deploy"};
    }

    void TearDown() override { src.reset(); }
};

TEST_F(FileSyncTest, RemoteToRemoteIsRejected) {
    auto other = remote;
    other.name = "staging";
    FileSyncController controller(exec, tools);
    EXPECT_THROW(controller.sync(remote, other, {}), std::invalid_argument);
    EXPECT_TRUE(exec.commands.empty());
}

TEST_F(FileSyncTest, VcsDirectoriesAreAlwaysExcluded) {
    EXPECT_EQ(withVcsExcludes({"*.log"}), (std::vector<std::string>{"*.log", ".git", ".git/"}));
    EXPECT_EQ(withVcsExcludes({".git/"}), (std::vector<std::string>{".git/", ".git"}));
}

TEST_F(FileSyncTest, DryRunPreviewsLocalSourceAndSummarisesItemizedOutput) {
    exec.when("--dry-run", {0, std::string(">f+++++++++:1024:index.php\n"
                                           "cd+++++++++:4096:wp-content/\n") + STATS_OUTPUT, ""});

    FileSyncOptions options;
    options.dry_run = true;
    options.excludes = {"*.log"};

    FileSyncController controller(exec, tools);
    const auto report = controller.sync(local, remote, options);

    ASSERT_EQ(exec.commands.size(), 1u);
    EXPECT_NE(exec.commands[0].find("--dry-run"), std::string::npos);
    EXPECT_EQ(exec.commands[0].find(STAGING_PREFIX), std::string::npos);
    EXPECT_NE(exec.commands[0].find("'" + src->root().string() + "/'"), std::string::npos);

    EXPECT_FALSE(report.preview.empty());
    for (const auto& e : report.preview) {
        EXPECT_FALSE(e.path.starts_with(".git")) << e.path;
        EXPECT_NE(e.path, "wp-content/debug.log");
    }

    ASSERT_TRUE(report.summary.has_value());
    EXPECT_EQ(report.summary->files, 1u);
    EXPECT_EQ(report.notes, (std::vector<std::string>{"Would transfer 1 file (1.0 KB).", "Examined 3 files (3.0 KB total)."}));
}

TEST_F(FileSyncTest, DryRunFromRemoteSourceHasNoPreview) {
    FileSyncOptions options;
    options.dry_run = true;

    FileSyncController controller(exec, tools);
    const auto report = controller.sync(remote, local, options);
    EXPECT_TRUE(report.preview.empty());
    EXPECT_TRUE(exec.ran("'deploy@example.com:/var/www/html/'"));
}

TEST_F(FileSyncTest, PushStagesRewritesUrlsAndCleansUp) {
    fs::path staged;
    exec.onRun = [&](const std::string& command) {
        staged = stagedPathIn(command);
        ASSERT_FALSE(staged.empty());
        EXPECT_TRUE(fs::exists(staged / "index.php"));
        EXPECT_FALSE(fs::exists(staged / "wp-content/debug.log"));
        EXPECT_FALSE(fs::exists(staged / ".git"));
        EXPECT_EQ(TempTree::slurp(staged / "index.php"), "<?php header('Location: https://example.com/');");
        EXPECT_EQ(TempTree::slurp(staged / "wp-content/uploads/photo.jpg"), "JPEG http://site.test");
    };
    exec.when("rsync", {0, STATS_OUTPUT, ""});

    FileSyncOptions options;
    options.excludes = {"*.log"};

    FileSyncController controller(exec, tools);
    const auto report = controller.sync(local, remote, options);

    ASSERT_EQ(exec.commands.size(), 1u);
    EXPECT_NE(exec.commands[0].find("'deploy@example.com:/var/www/html'"), std::string::npos);
    EXPECT_FALSE(staged.empty());
    EXPECT_FALSE(fs::exists(staged));

    EXPECT_EQ(src->read("index.php"), "<?php header('Location: http://site.test/');");
    EXPECT_EQ(report.notes, (std::vector<std::string>{"Transferred 1 file (1.0 KB).", "Examined 3 files (3.0 KB total)."}));
}

TEST_F(FileSyncTest, StagingIsRemovedWhenTransferFails) {
    fs::path staged;
    exec.onRun = [&](const std::string& command) { staged = stagedPathIn(command); };
    exec.when("rsync", {12, "", "rsync: connection unexpectedly closed"});

    FileSyncController controller(exec, tools);
    try {
        (void)controller.sync(local, remote, {});
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.exitCode(), 12);
        EXPECT_EQ(e.stderrText(), "rsync: connection unexpectedly closed");
    }
    ASSERT_FALSE(staged.empty());
    EXPECT_FALSE(fs::exists(staged));
}

TEST_F(FileSyncTest, TrackedOnlyStagesGitFilesThatPassTheFilter) {
    exec.when("ls-files", {0, std::string("index.php\0wp-content/debug.log\0", 31), ""});

    std::vector<std::string> stagedFiles;
    exec.onRun = [&](const std::string& command) {
        const auto staged = stagedPathIn(command);
        if (staged.empty()) return;
        for (const auto& e : fs::recursive_directory_iterator(staged))
            if (e.is_regular_file()) stagedFiles.push_back(e.path().lexically_relative(staged).generic_string());
    };

    FileSyncOptions options;
    options.tracked_only = true;
    options.excludes = {"*.log"};

    FileSyncController controller(exec, tools);
    (void)controller.sync(local, remote, options);

    ASSERT_EQ(exec.commands.size(), 2u);
    EXPECT_NE(exec.commands[0].find("ls-files -z"), std::string::npos);
    EXPECT_EQ(stagedFiles, (std::vector<std::string>{"index.php"}));
}

TEST_F(FileSyncTest, LocalDestinationIsRewrittenAfterTransfer) {
    const TempTree dest("filesync_dest");
    dest.write("wp-content/themes/site/style.css", "a { background: url(https://example.com/bg.png); }");

    auto target = local;
    target.name = "copy";
    target.wordpress_path = dest.root();
    target.url = "http://copy.test";

    FileSyncController controller(exec, tools);
    const auto report = controller.sync(remote, target, {});

    EXPECT_TRUE(exec.ran("'deploy@example.com:/var/www/html/' '" + dest.root().string() + "'"));
    EXPECT_EQ(dest.read("wp-content/themes/site/style.css"), "a { background: url(http://copy.test/bg.png); }");
    EXPECT_FALSE(report.stats.has_value());
    EXPECT_TRUE(report.notes.empty());
}

TEST_F(FileSyncTest, SelectionRestrictsTransfer) {
    FileSyncOptions options;
    options.dry_run = true;
    options.selection = ferry::filter::buildSelectionRules({{"wp-content/themes", true}});

    FileSyncController controller(exec, tools);
    const auto report = controller.sync(local, remote, options);

    ASSERT_EQ(exec.commands.size(), 1u);
    EXPECT_NE(exec.commands[0].find("'--include=/wp-content/themes/***' '--exclude=*'"), std::string::npos);
    ASSERT_EQ(report.preview.size(), 2u);
    EXPECT_EQ(report.preview[0].path, "wp-content");
    EXPECT_EQ(report.preview[1].path, "wp-content/themes");
}
