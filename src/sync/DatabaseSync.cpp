#include "sync/DatabaseSync.hpp"
#include "cmd/Database.hpp"
#include "cmd/Remote.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

using namespace ferry::sync;
using namespace ferry::cmd;
using namespace ferry::logging;
using namespace ferry::types;
namespace fs = std::filesystem;

namespace {

constexpr auto REMOTE_TMP = "/tmp";

// Removes a local temp file when the enclosing scope ends
class TempFileGuard {
public:
    explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            if (const auto log = spdlog::get("db")) log->warn("[DatabaseSync] Failed to remove {}: {}", path_.string(), ec.message());
        }
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

private:
    fs::path path_;
};

// Runs the remote "rm -f" for a temp dump when the enclosing scope ends, failed transfers included
class RemoteFileGuard {
public:
    RemoteFileGuard(ferry::process::Executor& executor, std::string removeCommand, fs::path path)
        : executor_(executor), removeCommand_(std::move(removeCommand)), path_(std::move(path)) {}

    ~RemoteFileGuard() {
        bool removed = false;
        std::string failure;
        try {
            const auto result = executor_.run(removeCommand_);
            removed = result.ok();
            failure = result.stderr_text;
        } catch (const std::exception& e) {
            failure = e.what();
        }
        if (removed) return;
        if (const auto log = spdlog::get("db")) log->warn("[DatabaseSync] Failed to remove remote file {}: {}", path_.string(), failure);
    }

    RemoteFileGuard(const RemoteFileGuard&) = delete;
    RemoteFileGuard& operator=(const RemoteFileGuard&) = delete;

private:
    ferry::process::Executor& executor_;
    std::string removeCommand_;
    fs::path path_;
};

}

DatabaseSyncController::DatabaseSyncController(process::Executor& executor, const Toolchain& localTools, fs::path workDir)
    : executor_(executor), local_(localTools), workDir_(std::move(workDir)) {}

void DatabaseSyncController::runOn(const Environment& env, const std::string& command, const std::string& what) {
    if (!env.isRemote()) {
        executor_.check(command, what);
        return;
    }
    executor_.check(buildRemoteShellCommand({*env.ssh, command}, local_), what + " on " + env.ssh->host);
}

void DatabaseSyncController::maskPassword(const Environment& env) {
    if (env.database.hasPassword()) executor_.addSecret(env.database.password);
}

void DatabaseSyncController::exportTo(const Environment& env, const fs::path& localFile) {
    LogRegistry::db()->info("[DatabaseSync] Exporting database '{}' of {}", env.database.name, env.name);
    maskPassword(env);

    if (!env.isRemote()) {
        executor_.check(buildExportCommand({env.database, localFile, true}, local_), "Database export");
        return;
    }

    const fs::path remoteFile = fs::path(REMOTE_TMP) / ("ferry_export_" + util::getUniqueSuffix() + ".sql.gz");
    const RemoteFileGuard guard(executor_, buildRemoteShellCommand({*env.ssh, buildRemoveCommand(remoteFile)}, local_), remoteFile);

    runOn(env, buildExportCommand({env.database, remoteFile, true}, remote_), "Database export");
    executor_.check(buildRemoteCopyCommand({*env.ssh, localFile, remoteFile, CopyDirection::Download}, local_),
                    "Downloading database export");
}

void DatabaseSyncController::importFrom(const Environment& env, const fs::path& localFile) {
    LogRegistry::db()->info("[DatabaseSync] Importing into database '{}' of {}", env.database.name, env.name);
    maskPassword(env);

    if (!env.isRemote()) {
        executor_.check(buildImportCommand({env.database, localFile}, local_), "Database import");
        return;
    }

    const fs::path remoteFile = fs::path(REMOTE_TMP) / ("ferry_import_" + util::getUniqueSuffix() + ".sql.gz");
    const RemoteFileGuard guard(executor_, buildRemoteShellCommand({*env.ssh, buildRemoveCommand(remoteFile)}, local_), remoteFile);

    executor_.check(buildRemoteCopyCommand({*env.ssh, localFile, remoteFile, CopyDirection::Upload}, local_),
                    "Uploading database export");
    runOn(env, buildImportCommand({env.database, remoteFile}, remote_), "Database import");
}

void DatabaseSyncController::searchReplace(const Environment& env, const std::string& oldUrl, const std::string& newUrl) {
    LogRegistry::db()->info("[DatabaseSync] Search-replace {} -> {} on {}", oldUrl, newUrl, env.name);
    const auto& tools = env.isRemote() ? remote_ : local_;
    runOn(env, buildSearchReplaceCommand({env.wordpress_path, oldUrl, newUrl}, tools), "Search-replace");
}

fs::path DatabaseSyncController::backup(const Environment& env, const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw std::runtime_error("Failed to create backup directory " + dir.string() + ": " + ec.message());

    const auto file = dir / ("backup_" + env.database.name + "_" + util::getBackupTimestamp() + ".sql.gz");
    exportTo(env, file);
    LogRegistry::db()->info("[DatabaseSync] Backup of {} stored at {}", env.name, file.string());
    return file;
}

DatabaseSyncReport DatabaseSyncController::sync(const Environment& source, const Environment& destination,
                                                const DatabaseSyncOptions& options) {
    validate(source.database, "Environment '" + source.name + "' database configuration");
    validate(destination.database, "Environment '" + destination.name + "' database configuration");

    DatabaseSyncReport report;

    if (options.dry_run) {
        report.steps.emplace_back("Would export source database");
        if (options.backup) report.steps.emplace_back("Would create backup of destination database");
        report.steps.emplace_back("Would import to destination database");
        report.steps.push_back("Would perform search-replace: " + source.url + " → " + destination.url);
        return report;
    }

    const auto exportFile = workDir_ / ("ferry_export_" + util::getUniqueSuffix() + ".sql.gz");
    const TempFileGuard guard(exportFile);

    exportTo(source, exportFile);
    report.steps.emplace_back("Exported source database");

    if (options.backup) {
        report.backup_file = backup(destination, destination.backup_path.value_or(workDir_));
        report.steps.push_back("Backed up destination database to " + report.backup_file->string());
    }

    importFrom(destination, exportFile);
    report.steps.emplace_back("Imported into destination database");

    if (source.url != destination.url) {
        searchReplace(destination, source.url, destination.url);
        report.steps.push_back("Search-replace: " + source.url + " → " + destination.url);
    }

    return report;
}
