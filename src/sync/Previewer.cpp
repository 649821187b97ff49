#include "sync/Previewer.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

using namespace ferry::sync;
using namespace ferry::sync::model;
using namespace ferry::logging;
namespace fs = std::filesystem;

Previewer::Previewer(filter::PathFilter filter) : filter_(std::move(filter)) {}

std::vector<PlanEntry> Previewer::scan(const fs::path& currentPath, const fs::path& basePath) const {
    std::error_code ec;
    if (!fs::is_directory(currentPath, ec)) {
        LogRegistry::fs()->debug("[Previewer] Not a directory, nothing to preview: {}", currentPath.string());
        return {};
    }

    std::string rel = currentPath.lexically_normal().lexically_relative(basePath.lexically_normal()).generic_string();
    if (rel == ".") rel.clear();
    while (!rel.empty() && rel.back() == '/') rel.pop_back();

    auto tree = walk(currentPath, rel);
    LogRegistry::fs()->debug("[Previewer] {} files under {} ({} entries)", tree.files, currentPath.string(), tree.entries.size());
    return std::move(tree.entries);
}

Previewer::Subtree Previewer::walk(const fs::path& dir, const std::string& rel) const {
    Subtree out;

    std::vector<fs::directory_entry> children;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        children.push_back(*it);

    if (ec) {
        LogRegistry::fs()->warn("[Previewer] Unable to read {}: {}", dir.string(), ec.message());
        out.complete = false;
        return out;
    }

    std::ranges::sort(children, [](const fs::directory_entry& a, const fs::directory_entry& b) {
        return a.path().filename().string() < b.path().filename().string();
    });

    for (const auto& child : children) {
        const auto name = child.path().filename().string();
        const auto childRel = rel.empty() ? name : rel + '/' + name;

        // symlinks are counted as files and never followed
        std::error_code statEc;
        const bool isDir = child.is_directory(statEc) && !child.is_symlink(statEc);

        if (filter_.isExcluded(childRel) || !filter_.isIncluded(childRel, isDir)) {
            out.complete = false;
            continue;
        }

        if (!isDir) {
            ++out.files;
            out.entries.push_back({childRel, PlanEntry::Type::File, 1});
            continue;
        }

        auto sub = walk(child.path(), childRel);
        if (sub.files == 0) {
            if (!sub.complete) out.complete = false;
            continue;
        }

        out.files += sub.files;

        if (sub.complete) {
            out.entries.push_back({childRel, PlanEntry::Type::Directory, sub.files});
            continue;
        }

        out.complete = false;
        out.entries.push_back({childRel, PlanEntry::Type::Directory, std::nullopt});
        out.entries.insert(out.entries.end(),
                           std::make_move_iterator(sub.entries.begin()),
                           std::make_move_iterator(sub.entries.end()));
    }

    return out;
}
