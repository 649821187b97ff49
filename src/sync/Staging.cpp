#include "sync/Staging.hpp"
#include "logging/LogRegistry.hpp"
#include "types/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unordered_set>

#include <stdlib.h>

using namespace ferry::sync;
using namespace ferry::logging;
using namespace ferry::types;
namespace fs = std::filesystem;

namespace {

fs::path makeTempDir() {
    auto tmpl = (fs::temp_directory_path() / (std::string(STAGING_PREFIX) + "XXXXXX")).string();
    if (!::mkdtemp(tmpl.data()))
        throw StagingError("Failed to create temporary staging directory: " + std::string(std::strerror(errno)));
    return tmpl;
}

// Rejects absolute paths and ".." components so nothing is read from outside the source root
fs::path checkedRelative(const std::string& entry) {
    const fs::path rel = fs::path(entry).lexically_normal();
    if (entry.empty() || rel.is_absolute() || rel.empty() || *rel.begin() == "..")
        throw StagingError("Invalid path in staging list: '" + entry + "'");
    return rel;
}

void copyEntry(const fs::path& from, const fs::path& to, const std::string& entry) {
    std::error_code ec;
    const auto st = fs::symlink_status(from, ec);
    if (ec || !fs::exists(st)) throw StagingError("File listed for staging does not exist: " + entry);

    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path(), ec);
        if (ec) throw StagingError("Failed to create directory for " + entry + ": " + ec.message());
    }

    if (fs::is_symlink(st)) fs::copy_symlink(from, to, ec);
    else if (fs::is_regular_file(st)) fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    else throw StagingError("Not a regular file: " + entry);

    if (ec) throw StagingError("Failed to stage " + entry + ": " + ec.message());
}

}

fs::path Staging::stage(const fs::path& sourceRoot, const std::vector<std::string>& fileList, const bool preserveStructure) {
    if (!fs::is_directory(sourceRoot)) throw StagingError("Staging source is not a directory: " + sourceRoot.string());

    const auto dir = makeTempDir();
    LogRegistry::sync()->debug("[Staging] Staging {} files from {} into {}", fileList.size(), sourceRoot.string(), dir.string());

    try {
        std::unordered_set<std::string> flatNames;
        for (const auto& entry : fileList) {
            const auto rel = checkedRelative(entry);

            fs::path target = dir / rel;
            if (!preserveStructure) {
                const auto name = rel.filename().string();
                if (!flatNames.insert(name).second)
                    throw StagingError("Duplicate file name when flattening staging tree: " + name);
                target = dir / name;
            }

            copyEntry(sourceRoot / rel, target, entry);
        }
    } catch (const std::exception& e) {
        LogRegistry::sync()->error("[Staging] {}", e.what());
        cleanup(dir);
        throw;
    }

    return dir;
}

void Staging::cleanup(const fs::path& stagingPath) noexcept {
    if (stagingPath.empty()) return;

    std::error_code ec;
    const auto removed = fs::remove_all(stagingPath, ec);

    // spdlog::get() never throws, LogRegistry::get() does
    if (const auto log = spdlog::get("sync")) {
        if (ec) log->warn("[Staging] Failed to remove {}: {}", stagingPath.string(), ec.message());
        else if (removed > 0) log->debug("[Staging] Removed {} ({} entries)", stagingPath.string(), removed);
    }
}

ScopedStaging::ScopedStaging(const fs::path& sourceRoot, const std::vector<std::string>& fileList, const bool preserveStructure)
    : path_(Staging::stage(sourceRoot, fileList, preserveStructure)) {}

ScopedStaging::~ScopedStaging() {
    Staging::cleanup(path_);
}

std::vector<std::string> ferry::sync::collectFiles(const fs::path& root, const filter::PathFilter& filter) {
    std::vector<std::string> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) throw StagingError("Cannot read " + root.string() + ": " + ec.message());

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) throw StagingError("Cannot read " + root.string() + ": " + ec.message());

        const auto rel = it->path().lexically_relative(root).generic_string();
        const bool isDir = it->is_directory(ec) && !it->is_symlink(ec);

        if (isDir) {
            if (!filter.accepts(rel, true)) it.disable_recursion_pending();
            continue;
        }
        if (filter.accepts(rel, false)) files.push_back(rel);
    }

    std::ranges::sort(files);
    return files;
}
