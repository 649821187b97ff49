#pragma once

#include "filter/PathFilter.hpp"
#include "sync/model/PlanEntry.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ferry::sync {

// Walks a source tree and reports what a transfer would move, collapsing every directory whose
// whole content passes the filter into a single counted row.
class Previewer {
public:
    explicit Previewer(filter::PathFilter filter);

    // Paths in the result are relative to basePath; currentPath must be basePath or beneath it.
    [[nodiscard]] std::vector<model::PlanEntry> scan(const std::filesystem::path& currentPath,
                                                     const std::filesystem::path& basePath) const;

    [[nodiscard]] std::vector<model::PlanEntry> scan(const std::filesystem::path& root) const { return scan(root, root); }

private:
    struct Subtree {
        uint64_t files{0};
        bool complete{true};
        std::vector<model::PlanEntry> entries;
    };

    filter::PathFilter filter_;

    Subtree walk(const std::filesystem::path& dir, const std::string& rel) const;
};

}
