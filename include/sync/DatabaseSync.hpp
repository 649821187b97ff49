#pragma once

#include "cmd/Toolchain.hpp"
#include "process/Executor.hpp"
#include "types/Environment.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::sync {

struct DatabaseSyncOptions {
    bool dry_run{false};
    bool backup{true};
};

struct DatabaseSyncReport {
    std::vector<std::string> steps;                  // "Would ..." lines for dry runs, completed steps otherwise
    std::optional<std::filesystem::path> backup_file;
};

// Export, optional backup, import and search-replace, strictly in that order.
// Remote environments run their side through ssh with files moved by scp.
class DatabaseSyncController {
public:
    DatabaseSyncController(process::Executor& executor, const cmd::Toolchain& localTools,
                           std::filesystem::path workDir = std::filesystem::temp_directory_path());

    DatabaseSyncReport sync(const types::Environment& source, const types::Environment& destination,
                            const DatabaseSyncOptions& options);

    // Dumps env's database to <dir>/backup_<db>_<timestamp>.sql.gz on this host and returns the path.
    std::filesystem::path backup(const types::Environment& env, const std::filesystem::path& dir);

    // Exports env's database, compressed, to a local file.
    void exportTo(const types::Environment& env, const std::filesystem::path& localFile);

    void importFrom(const types::Environment& env, const std::filesystem::path& localFile);

    void searchReplace(const types::Environment& env, const std::string& oldUrl, const std::string& newUrl);

private:
    process::Executor& executor_;
    const cmd::Toolchain& local_;
    const cmd::Toolchain remote_ = cmd::Toolchain::defaults();
    std::filesystem::path workDir_;

    // Runs command locally, or through ssh for remote environments
    void runOn(const types::Environment& env, const std::string& command, const std::string& what);

    void maskPassword(const types::Environment& env);
};

}
