#pragma once

#include "cmd/Rsync.hpp"
#include "cmd/Toolchain.hpp"
#include "filter/SelectionRules.hpp"
#include "process/Executor.hpp"
#include "stats/TransferStats.hpp"
#include "sync/model/PlanEntry.hpp"
#include "types/Environment.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ferry::sync {

struct FileSyncOptions {
    bool dry_run{false};
    bool delete_extraneous{false};
    bool tracked_only{false};
    std::vector<std::string> excludes;      // merged global + environment excludes
    filter::SelectionRules selection;
};

struct FileSyncReport {
    std::vector<model::PlanEntry> preview;  // dry runs from a local source only
    std::optional<stats::TransferStats> stats;
    std::optional<stats::DryRunSummary> summary;
    std::vector<std::string> notes;
};

// Patterns always excluded from a file transfer
std::vector<std::string> withVcsExcludes(const std::vector<std::string>& excludes);

class FileSyncController {
public:
    FileSyncController(process::Executor& executor, const cmd::Toolchain& tools);

    // Throws std::invalid_argument for remote -> remote, TransferError when rsync fails.
    FileSyncReport sync(const types::Environment& source, const types::Environment& destination,
                        const FileSyncOptions& options);

private:
    process::Executor& executor_;
    const cmd::Toolchain& tools_;

    FileSyncReport dryRun(const types::Environment& source, const types::Environment& destination,
                          const FileSyncOptions& options, const std::vector<std::string>& excludes);

    FileSyncReport pushStaged(const types::Environment& source, const types::Environment& destination,
                              const FileSyncOptions& options, const std::vector<std::string>& excludes);

    FileSyncReport syncDirect(const types::Environment& source, const types::Environment& destination,
                              const FileSyncOptions& options, const std::vector<std::string>& excludes);

    std::vector<std::string> filesToStage(const types::Environment& source, const FileSyncOptions& options,
                                          const std::vector<std::string>& excludes);

    void run(const cmd::RsyncRequest& request, FileSyncReport& report);
};

}
