#include "cli/commands.hpp"
#include "cli/helpers.hpp"
#include "cmd/Remote.hpp"
#include "config/util.hpp"
#include "logging/LogRegistry.hpp"
#include "stats/Formatter.hpp"
#include "sync/DatabaseSync.hpp"

#include <filesystem>
#include <fmt/format.h>

using namespace ferry::cli;
using namespace ferry::cmd;
using namespace ferry::logging;
using namespace ferry::sync;
using namespace ferry::types;
namespace fs = std::filesystem;

CommandResult ferry::cli::runBackup(const CommandCall& call, Context& ctx) {
    if (const auto bad = unknownOption(call, {"output", "yes", "verbose", "config"}))
        return invalid("Unknown option for backup: --" + *bad);
    if (call.positionals.size() != 1) return invalid("Usage: ferry backup <environment> [--output <dir>]");

    const auto& env = ctx.config.environment(call.positionals[0]);
    validate(env.database, "Environment '" + env.name + "' database configuration");

    const auto output = optVal(call, "output");
    const fs::path dir = output && !output->empty()
        ? config::expandHome(*output)
        : env.backup_path.value_or(fs::temp_directory_path());

    const std::vector<Tool> required = env.isRemote()
        ? std::vector<Tool>{Tool::Ssh, Tool::Scp}
        : std::vector<Tool>{Tool::Mysqldump, Tool::Gzip};
    if (const auto missing = ctx.tools.missing(required); !missing.empty()) {
        std::vector<std::string> lines;
        for (const auto t : missing) lines.push_back(to_string(t) + " is not installed or not available in PATH");
        ctx.console.error(lines);
        return {1, "", ""};
    }

    auto& console = ctx.console;
    console.title("ferry backup: " + env.name);

    if (env.isRemote()) {
        console.text("Testing SSH connection...");
        if (!ctx.executor.run(buildConnectionTestCommand(*env.ssh, ctx.tools)).ok()) {
            console.error({"Failed to connect to " + env.ssh->connectionString()});
            return {1, "", ""};
        }
        console.text("SSH connection successful");
    }

    console.section("Backup Configuration");
    console.listing({
        "Environment: " + env.name,
        "Database: " + env.database.name,
        std::string("Type: ") + (env.isRemote() ? "Remote (via SSH)" : "Local"),
        "Output Directory: " + dir.string(),
    });

    if (!hasFlag(call, "yes") && !console.confirm("Create backup?", true)) {
        console.text("Backup cancelled.");
        return {0, "", ""};
    }

    DatabaseSyncController controller(ctx.executor, ctx.tools);
    const auto file = controller.backup(env, dir);
    LogRegistry::ferry()->info("[backup] {} -> {}", env.name, file.string());

    std::vector<std::string> lines{"Backup created successfully!", "File: " + file.string()};
    std::error_code ec;
    if (const auto size = fs::file_size(file, ec); !ec) lines.push_back("Size: " + stats::formatBytes(size));
    console.success(lines);
    return {0, "", ""};
}
