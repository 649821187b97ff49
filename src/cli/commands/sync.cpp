#include "cli/commands.hpp"
#include "cli/helpers.hpp"
#include "filter/PathFilter.hpp"
#include "filter/SelectionRules.hpp"
#include "sync/DatabaseSync.hpp"
#include "sync/FileSync.hpp"
#include "sync/Previewer.hpp"
#include "sync/SyncLock.hpp"
#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace ferry::cli;
using namespace ferry::cmd;
using namespace ferry::filter;
using namespace ferry::logging;
using namespace ferry::sync;
using namespace ferry::types;
namespace fs = std::filesystem;

namespace {

const std::vector<std::string> SYNC_OPTIONS = {
    "db", "files", "delete", "dry-run", "no-backup", "tracked-only", "only", "yes", "verbose", "config"
};

struct SyncFlags {
    bool db{false};
    bool files{false};
    bool delete_extraneous{false};
    bool dry_run{false};
    bool backup{true};
    bool tracked_only{false};
    bool yes{false};
    std::vector<std::string> only;
};

SyncFlags parseFlags(const CommandCall& call) {
    SyncFlags f;
    f.db = hasFlag(call, "db");
    f.files = hasFlag(call, "files");
    if (!f.db && !f.files) f.db = f.files = true;
    f.delete_extraneous = hasFlag(call, "delete");
    f.dry_run = hasFlag(call, "dry-run");
    f.backup = !hasFlag(call, "no-backup");
    f.tracked_only = hasFlag(call, "tracked-only");
    f.yes = hasFlag(call, "yes");
    f.only = optVals(call, "only");
    return f;
}

const char* mark(const bool b) { return b ? "✓" : "✗"; }

// Trailing '/' or an existing local directory marks a directory selection
std::vector<Selection> toSelections(const std::vector<std::string>& only, const Environment& source) {
    std::vector<Selection> out;
    for (const auto& raw : only) {
        bool dir = raw.ends_with('/');
        if (!dir && !source.isRemote()) {
            std::error_code ec;
            dir = fs::is_directory(source.wordpress_path / raw, ec);
        }
        out.push_back({raw, dir});
    }
    return out;
}

std::vector<Tool> requiredTools(const Environment& source, const Environment& destination, const SyncFlags& f) {
    std::vector<Tool> tools;
    const bool anyRemote = source.isRemote() || destination.isRemote();
    const bool anyLocal = !source.isRemote() || !destination.isRemote();

    if (f.files) {
        tools.push_back(Tool::Rsync);
        if (anyRemote) tools.push_back(Tool::Ssh);
        if (f.tracked_only) tools.push_back(Tool::Git);
    }
    if (f.db && !f.dry_run) {
        if (anyRemote) {
            tools.push_back(Tool::Ssh);
            tools.push_back(Tool::Scp);
        }
        if (anyLocal) {
            tools.push_back(Tool::Mysqldump);
            tools.push_back(Tool::Mysql);
            tools.push_back(Tool::Gzip);
            tools.push_back(Tool::Gunzip);
            if (!destination.isRemote()) tools.push_back(Tool::Wp);
        }
    }
    return tools;
}

void showConfiguration(Console& console, const Environment& source, const Environment& destination, const SyncFlags& f) {
    console.section("Configuration");
    console.listing({
        "Source: " + source.name + (source.isRemote() ? " (" + source.ssh->host + ")" : ""),
        "Destination: " + destination.name + (destination.isRemote() ? " (" + destination.ssh->host + ")" : ""),
        fmt::format("Database: {}", mark(f.db)),
        fmt::format("Files: {}", mark(f.files)),
        fmt::format("Dry Run: {}", f.dry_run ? "Yes" : "No"),
        fmt::format("Delete Missing Files: {}", f.files && f.delete_extraneous ? "Yes" : "No"),
        fmt::format("Create DB Backup: {}", f.db ? (f.backup ? "Yes" : "No") : "N/A"),
    });

    if (f.dry_run) console.warning({"DRY RUN MODE - No changes will be made"});
}

bool syncFiles(Context& ctx, const Environment& source, const Environment& destination, const SyncFlags& f) {
    auto& console = ctx.console;
    console.section("Files");

    FileSyncOptions options;
    options.dry_run = f.dry_run;
    options.delete_extraneous = f.delete_extraneous;
    options.tracked_only = f.tracked_only;
    options.excludes = ctx.config.excludesFor(source.name);
    options.selection = buildSelectionRules(toSelections(f.only, source));

    if (options.selection.restrict) console.text("Selected paths: " + fmt::format("{}", fmt::join(f.only, ", ")));
    else console.text("All paths selected.");

    if (f.delete_extraneous)
        console.warning({"You have enabled --delete. Files missing from the source will be removed from the destination.",
                         "Ensure you have backups before continuing."});

    if (!f.dry_run && !f.yes && !source.isRemote()) {
        const PathFilter filter(withVcsExcludes(options.excludes), options.selection.includes, options.selection.restrict);
        console.planPreview(Previewer(filter).scan(source.wordpress_path));
        if (!console.confirm("Proceed with file sync?")) {
            console.text("File sync cancelled.");
            return false;
        }
    }

    FileSyncController controller(ctx.executor, ctx.tools);
    const auto report = controller.sync(source, destination, options);

    if (f.dry_run && !source.isRemote()) console.planPreview(report.preview);
    if (!report.notes.empty()) console.note(report.notes);
    else console.text("Transfer statistics unavailable.");

    return true;
}

bool syncDatabase(Context& ctx, const Environment& source, const Environment& destination, const SyncFlags& f) {
    auto& console = ctx.console;
    console.section("Database");

    if (!f.dry_run) {
        if (!f.backup) console.warning({"Destination database will be overwritten without creating a backup."});
        if (!f.yes && !console.confirm(fmt::format("Overwrite database '{}' on {}?", destination.database.name, destination.name))) {
            console.text("Database sync cancelled.");
            return false;
        }
    }

    DatabaseSyncController controller(ctx.executor, ctx.tools);
    const auto report = controller.sync(source, destination, {f.dry_run, f.backup});

    for (const auto& step : report.steps) console.text(step);
    if (report.backup_file) console.note({"Destination backup stored at: " + report.backup_file->string()});
    return true;
}

}

CommandResult ferry::cli::runSync(const CommandCall& call, Context& ctx, const Direction direction) {
    const auto verb = to_string(direction);

    if (const auto bad = unknownOption(call, SYNC_OPTIONS)) return invalid("Unknown option for " + verb + ": --" + *bad);
    if (call.positionals.size() != 2) return invalid("Usage: ferry " + verb + " <source> <destination> [options]");

    const auto& source = ctx.config.environment(call.positionals[0]);
    const auto& destination = ctx.config.environment(call.positionals[1]);
    const auto flags = parseFlags(call);

    if (source.name == destination.name) return invalid("Source and destination must be different environments");
    if (direction == Direction::Pull && !source.isRemote())
        return invalid("pull expects a remote source; use push for '" + source.name + "'");
    if (flags.files && source.isRemote() && destination.isRemote())
        return invalid("Remote-to-remote file syncs are not supported. Sync via a local environment.");
    if (flags.tracked_only && source.isRemote())
        return invalid("--tracked-only needs a local source");

    if (const auto missing = ctx.tools.missing(requiredTools(source, destination, flags)); !missing.empty()) {
        std::vector<std::string> names;
        for (const auto t : missing) names.push_back(to_string(t) + " is not installed or not available in PATH");
        ctx.console.error(names);
        return {1, "", ""};
    }

    const SyncLock lock(source.name, destination.name, ctx.lockDir);

    ctx.console.title(fmt::format("ferry {}: {} → {}", verb, source.name, destination.name));
    showConfiguration(ctx.console, source, destination, flags);

    LogRegistry::ferry()->info("[{}] {} -> {} (db: {}, files: {}, dry run: {})",
                               verb, source.name, destination.name, flags.db, flags.files, flags.dry_run);

    bool completed = true;
    if (flags.db) completed = syncDatabase(ctx, source, destination, flags) && completed;
    if (flags.files) completed = syncFiles(ctx, source, destination, flags) && completed;

    if (!completed) return {1, "", ""};

    ctx.console.success({flags.dry_run ? "Dry run complete." : "Sync complete."});
    return {0, "", ""};
}
