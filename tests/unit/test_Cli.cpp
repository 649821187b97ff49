#include <gtest/gtest.h>
#include "cli/Console.hpp"
#include "cli/Parser.hpp"
#include "cli/commands.hpp"
#include "cli/helpers.hpp"
#include "config/Config.hpp"
#include "FakeExecutor.hpp"
#include "TempTree.hpp"

#include <sstream>
#include <nlohmann/json.hpp>

using namespace ferry::cli;
using ferry::cmd::Toolchain;
using ferry::sync::model::PlanEntry;
using ferry::test::FakeExecutor;
using ferry::test::TempTree;

TEST(CliParserTest, EmptyArgumentsMeanHelp) {
    EXPECT_EQ(parseArgs(std::vector<std::string>{}).name, "help");
    EXPECT_EQ(parseArgs({"--help"}).name, "help");
    EXPECT_EQ(parseArgs({"-h"}).name, "help");
}

TEST(CliParserTest, NormalizeSplitsValuesAndBundles) {
    EXPECT_EQ(normalizeArgs({"--config=site.yml", "-c./ferry.yml", "-vy", "plain"}),
              (std::vector<std::string>{"--config", "site.yml", "-c", "./ferry.yml", "-v", "-y", "plain"}));
}

TEST(CliParserTest, ParsesPositionalsSwitchesAndValues) {
    const auto call = parseArgs({"push", "local", "production", "--dry-run", "-y", "--only", "wp-content/themes/",
                                 "--only=wp-content/plugins/", "-c", "other.yml"});
    EXPECT_EQ(call.name, "push");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"local", "production"}));
    EXPECT_TRUE(hasFlag(call, "dry-run"));
    EXPECT_TRUE(hasFlag(call, "yes"));
    EXPECT_FALSE(hasFlag(call, "delete"));
    EXPECT_EQ(optVals(call, "only"), (std::vector<std::string>{"wp-content/themes/", "wp-content/plugins/"}));
    EXPECT_EQ(optVal(call, "config"), "other.yml");
    EXPECT_EQ(optVal(call, "dry-run"), "");
    EXPECT_FALSE(optVal(call, "files").has_value());
}

TEST(CliParserTest, DoubleDashStopsFlagParsing) {
    const auto call = parseArgs({"preview", "--", "--weird-env"});
    EXPECT_TRUE(call.options.empty());
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"--weird-env"}));
}

TEST(CliParserTest, UnknownOptionIsReported) {
    const auto call = parseArgs({"push", "a", "b", "--force"});
    EXPECT_EQ(unknownOption(call, {"dry-run"}), "force");
    EXPECT_FALSE(unknownOption(parseArgs({"push", "--dry-run"}), {"dry-run"}).has_value());

    const auto res = invalid("bad");
    EXPECT_EQ(res.exit_code, 2);
    EXPECT_EQ(res.stderr_text, "bad\n");
}

TEST(ConsoleTest, PlanPreviewTruncatesLongLists) {
    std::ostringstream out;
    std::istringstream in;
    Console console(out, in);

    std::vector<PlanEntry> entries;
    entries.push_back({"wp-content", PlanEntry::Type::Directory, std::nullopt});
    entries.push_back({"wp-content/uploads", PlanEntry::Type::Directory, 1200});
    for (int i = 0; i < 5; ++i) entries.push_back({"file" + std::to_string(i) + ".php", PlanEntry::Type::File, 1});

    console.planPreview(entries, 3);
    const auto text = out.str();
    EXPECT_NE(text.find("Total files to sync: 1,205"), std::string::npos);
    EXPECT_NE(text.find("wp-content/ (partial)"), std::string::npos);
    EXPECT_NE(text.find("wp-content/uploads/ (1,200 files)"), std::string::npos);
    EXPECT_NE(text.find("file0.php"), std::string::npos);
    EXPECT_EQ(text.find("file1.php"), std::string::npos);
    EXPECT_NE(text.find("... and 4 more"), std::string::npos);
}

TEST(ConsoleTest, ConfirmDefaultsToNo) {
    std::ostringstream out;
    std::istringstream in("yes\n\nn\n");
    Console console(out, in);
    EXPECT_TRUE(console.confirm("Proceed?"));
    EXPECT_FALSE(console.confirm("Proceed?"));
    EXPECT_FALSE(console.confirm("Proceed?"));
    EXPECT_FALSE(console.confirm("Proceed?"));  // EOF
    EXPECT_NE(out.str().find("Proceed? [y/N]"), std::string::npos);
}

class CommandTest : public ::testing::Test {
protected:
    std::unique_ptr<TempTree> site, locks;
    std::unique_ptr<ferry::config::Config> config;
    Toolchain tools = Toolchain::defaults();
    FakeExecutor exec;
    std::ostringstream out;
    std::istringstream in;
    std::unique_ptr<Console> console;

    void SetUp() override {
        site = std::make_unique<TempTree>("cli_site");
        locks = std::make_unique<TempTree>("cli_locks");
        site->write("index.php");
        site->write("wp-content/uploads/a.jpg");
        site->write("wp-content/uploads/b.jpg");
        site->write("wp-content/cache/page.html");

        config = std::make_unique<ferry::config::Config>(ferry::config::loadConfigFromString(
            "global:\n"
            "  exclude: [\"wp-content/cache/\"]\n"
            "local:\n"
            "  wordpress_path: " + site->root().string() + "\n"
            "  url: http://site.test\n"
            "  database: {name: wp, user: root, host: localhost}\n"
            "production:\n"
            "  wordpress_path: /var/www/html\n"
            "  url: https://example.com\n"
            "  database: {name: wp, user: wp, host: localhost}\n"
            "  ssh: {host: example.com, user: deploy}\n"));

        console = std::make_unique<Console>(out, in);
    }

    CommandResult run(const std::vector<std::string>& args, const std::string& input = "") {
        in.str(input);
        in.clear();
        Context ctx{*config, tools, exec, *console, locks->root()};
        return dispatch(parseArgs(args), ctx);
    }
};

TEST_F(CommandTest, UnknownCommandShowsUsage) {
    const auto res = run({"deploy"});
    EXPECT_EQ(res.exit_code, 2);
    EXPECT_NE(res.stderr_text.find("Usage: ferry"), std::string::npos);
    EXPECT_TRUE(isStandalone("help"));
    EXPECT_FALSE(isStandalone("push"));
}

TEST_F(CommandTest, PreviewJsonListsCollapsedPlan) {
    const auto res = run({"preview", "local", "--json"});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;

    const auto j = nlohmann::json::parse(res.stdout_text);
    EXPECT_EQ(j["environment"], "local");
    EXPECT_EQ(j["total_files"], 3);
    ASSERT_EQ(j["entries"].size(), 3u);
    EXPECT_EQ(j["entries"][2]["path"], "wp-content/uploads");
    EXPECT_EQ(j["entries"][2]["count"], 2);
}

TEST_F(CommandTest, PreviewRejectsRemoteEnvironment) {
    EXPECT_EQ(run({"preview", "production"}).exit_code, 2);
}

TEST_F(CommandTest, PullNeedsRemoteSource) {
    const auto res = run({"pull", "local", "production"});
    EXPECT_EQ(res.exit_code, 2);
    EXPECT_TRUE(exec.commands.empty());
}

TEST_F(CommandTest, SameSourceAndDestinationIsRejected) {
    EXPECT_EQ(run({"push", "local", "local"}).exit_code, 2);
}

TEST_F(CommandTest, DryRunPushRunsOnlyRsyncDryRun) {
    const auto res = run({"push", "local", "production", "--dry-run"});
    ASSERT_EQ(res.exit_code, 0) << out.str();

    ASSERT_EQ(exec.commands.size(), 1u);
    EXPECT_NE(exec.commands[0].find("--dry-run"), std::string::npos);
    EXPECT_NE(exec.commands[0].find("--exclude=wp-content/cache/"), std::string::npos);

    const auto text = out.str();
    EXPECT_NE(text.find("Would export source database"), std::string::npos);
    EXPECT_NE(text.find("DRY RUN MODE"), std::string::npos);
    EXPECT_NE(text.find("Total files to sync: 3"), std::string::npos);
    EXPECT_NE(text.find("Dry run complete."), std::string::npos);
}

TEST_F(CommandTest, DecliningConfirmationCancelsFileSync) {
    const auto res = run({"push", "local", "production", "--files"}, "n\n");
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_TRUE(exec.commands.empty());
    EXPECT_NE(out.str().find("File sync cancelled."), std::string::npos);
}

TEST_F(CommandTest, MissingToolsAbortBeforeRunning) {
    tools = Toolchain::discover([](const std::string&) -> std::optional<std::filesystem::path> { return std::nullopt; });
    const auto res = run({"push", "local", "production", "--files", "--yes"});
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_TRUE(exec.commands.empty());
    EXPECT_NE(out.str().find("rsync is not installed"), std::string::npos);
}

TEST_F(CommandTest, ValidateReportsMissingWpConfig) {
    const auto res = run({"validate"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_NE(out.str().find("wp-config.php not found"), std::string::npos);
    EXPECT_NE(out.str().find("Configuration is valid."), std::string::npos);
}

TEST_F(CommandTest, StatusNeverPrintsPasswords) {
    auto cfg = *config;
    cfg.environments.at("production").database.password = "hunter2";
    config = std::make_unique<ferry::config::Config>(std::move(cfg));

    const auto res = run({"status"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(out.str().find("hunter2"), std::string::npos);
    EXPECT_NE(out.str().find("production"), std::string::npos);
}

TEST_F(CommandTest, BackupWritesIntoOutputDirectory) {
    const auto dir = locks->root() / "backups";
    const auto res = run({"backup", "local", "-o", dir.string(), "--yes"});
    ASSERT_EQ(res.exit_code, 0) << out.str();

    ASSERT_EQ(exec.commands.size(), 1u);
    EXPECT_TRUE(exec.commands[0].starts_with("mysqldump --user='root'"));
    EXPECT_NE(exec.commands[0].find(dir.string() + "/backup_wp_"), std::string::npos);
    EXPECT_TRUE(std::filesystem::is_directory(dir));
    EXPECT_NE(out.str().find("Backup created successfully!"), std::string::npos);
}

TEST_F(CommandTest, BackupCanBeDeclined) {
    const auto res = run({"backup", "local"}, "n\n");
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_TRUE(exec.commands.empty());
    EXPECT_NE(out.str().find("Backup cancelled."), std::string::npos);
}

TEST_F(CommandTest, RemoteBackupStopsWhenSshFails) {
    exec.when("'exit 0'", {255, "", "ssh: connect to host example.com port 22: Connection refused"});
    const auto res = run({"backup", "production", "--yes"});
    EXPECT_EQ(res.exit_code, 1);
    ASSERT_EQ(exec.commands.size(), 1u);
    EXPECT_NE(exec.commands[0].find("BatchMode=yes"), std::string::npos);
    EXPECT_NE(out.str().find("Failed to connect to deploy@example.com"), std::string::npos);
}

TEST_F(CommandTest, SshTestsTheConnection) {
    const auto res = run({"ssh", "production"});
    ASSERT_EQ(res.exit_code, 0) << out.str();
    ASSERT_EQ(exec.commands.size(), 1u);
    EXPECT_EQ(exec.commands[0],
              "ssh -o StrictHostKeyChecking=no -o BatchMode=yes -o ConnectTimeout=10 deploy@example.com 'exit 0'");
    EXPECT_NE(out.str().find("Port: 22"), std::string::npos);
    EXPECT_NE(out.str().find("None (password auth)"), std::string::npos);
    EXPECT_NE(out.str().find("Successfully connected to production"), std::string::npos);
}

TEST_F(CommandTest, SshReportsFailureWithHints) {
    exec.when("'exit 0'", {255, "", "Permission denied (publickey).\n"});
    const auto res = run({"ssh", "production"});
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_NE(out.str().find("Failed to connect to production"), std::string::npos);
    EXPECT_NE(out.str().find("ssh said: Permission denied (publickey)."), std::string::npos);
    EXPECT_NE(out.str().find("Possible issues:"), std::string::npos);
}

TEST_F(CommandTest, SshRejectsLocalEnvironment) {
    EXPECT_EQ(run({"ssh", "local"}).exit_code, 1);
    EXPECT_TRUE(exec.commands.empty());
    EXPECT_NE(out.str().find("not configured for SSH"), std::string::npos);
}
