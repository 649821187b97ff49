#include "sync/FileSync.hpp"
#include "sync/Previewer.hpp"
#include "sync/SearchReplace.hpp"
#include "sync/Staging.hpp"
#include "filter/PathFilter.hpp"
#include "stats/Formatter.hpp"
#include "stats/Parser.hpp"
#include "vcs/Git.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <utility>

using namespace ferry::sync;
using namespace ferry::cmd;
using namespace ferry::filter;
using namespace ferry::logging;
using namespace ferry::types;
namespace fs = std::filesystem;

namespace {

constexpr auto CONTENT_DIR = "wp-content";

PathFilter makeFilter(const FileSyncOptions& options, const std::vector<std::string>& excludes) {
    return PathFilter(excludes, options.selection.includes, options.selection.restrict);
}

RsyncRequest makeRequest(Endpoint source, Endpoint destination, const FileSyncOptions& options,
                         const std::vector<std::string>& excludes) {
    RsyncRequest req;
    req.source = std::move(source);
    req.destination = std::move(destination);
    req.excludes = excludes;
    req.includes = options.selection.includes;
    req.restrict_to_includes = options.selection.restrict;
    req.delete_extraneous = options.delete_extraneous;
    req.dry_run = options.dry_run;
    return req;
}

}

std::vector<std::string> ferry::sync::withVcsExcludes(const std::vector<std::string>& excludes) {
    auto merged = excludes;
    for (const auto* vcs : {".git", ".git/"})
        if (std::ranges::find(merged, vcs) == merged.end()) merged.emplace_back(vcs);
    return merged;
}

FileSyncController::FileSyncController(process::Executor& executor, const Toolchain& tools)
    : executor_(executor), tools_(tools) {}

FileSyncReport FileSyncController::sync(const Environment& source, const Environment& destination,
                                        const FileSyncOptions& options) {
    if (source.isRemote() && destination.isRemote())
        throw std::invalid_argument("Cannot sync files between two remote environments ("
                                    + source.name + " -> " + destination.name + ")");

    const auto excludes = withVcsExcludes(options.excludes);

    LogRegistry::sync()->info("[FileSync] {} -> {}{}{}", source.name, destination.name,
                              options.dry_run ? " (dry run)" : "",
                              options.delete_extraneous ? " with --delete" : "");

    if (options.dry_run) return dryRun(source, destination, options, excludes);
    if (destination.isRemote()) return pushStaged(source, destination, options, excludes);
    return syncDirect(source, destination, options, excludes);
}

FileSyncReport FileSyncController::dryRun(const Environment& source, const Environment& destination,
                                          const FileSyncOptions& options, const std::vector<std::string>& excludes) {
    FileSyncReport report;
    if (!source.isRemote())
        report.preview = Previewer(makeFilter(options, excludes)).scan(source.wordpress_path);

    run(makeRequest(Endpoint::of(source), Endpoint::of(destination), options, excludes), report);
    return report;
}

FileSyncReport FileSyncController::pushStaged(const Environment& source, const Environment& destination,
                                              const FileSyncOptions& options, const std::vector<std::string>& excludes) {
    const auto files = filesToStage(source, options, excludes);
    const ScopedStaging staged(source.wordpress_path, files);

    if (source.url != destination.url) {
        const auto replaced = replaceInTree(staged.path(), source.url, destination.url);
        LogRegistry::sync()->debug("[FileSync] Rewrote {} of {} staged text files", replaced.files_modified, replaced.files_checked);
    }

    FileSyncReport report;
    run(makeRequest(Endpoint::local(staged.path()), Endpoint::of(destination), options, excludes), report);
    return report;
}

FileSyncReport FileSyncController::syncDirect(const Environment& source, const Environment& destination,
                                              const FileSyncOptions& options, const std::vector<std::string>& excludes) {
    FileSyncReport report;
    run(makeRequest(Endpoint::of(source), Endpoint::of(destination), options, excludes), report);

    if (source.url != destination.url) {
        const auto content = destination.wordpress_path / CONTENT_DIR;
        const auto root = fs::is_directory(content) ? content : destination.wordpress_path;
        const auto replaced = replaceInTree(root, source.url, destination.url);
        LogRegistry::sync()->debug("[FileSync] Rewrote {} of {} text files under {}",
                                   replaced.files_modified, replaced.files_checked, root.string());
    }

    return report;
}

std::vector<std::string> FileSyncController::filesToStage(const Environment& source, const FileSyncOptions& options,
                                                          const std::vector<std::string>& excludes) {
    const auto filter = makeFilter(options, excludes);
    if (!options.tracked_only) return collectFiles(source.wordpress_path, filter);

    auto tracked = vcs::git::trackedFiles(executor_, tools_, source.wordpress_path);
    std::erase_if(tracked, [&](const std::string& rel) { return !filter.accepts(rel, false); });
    std::ranges::sort(tracked);
    return tracked;
}

void FileSyncController::run(const RsyncRequest& request, FileSyncReport& report) {
    const auto result = executor_.check(buildRsyncCommand(request, tools_), "rsync");

    report.stats = stats::parseStats(result.stdout_text);
    if (request.dry_run) report.summary = stats::parseDryRunSummary(result.stdout_text);

    if (!report.stats) {
        LogRegistry::sync()->debug("[FileSync] Transfer statistics unavailable");
        return;
    }

    report.notes = stats::formatNoteLines(*report.stats, report.summary, request.dry_run);
}
