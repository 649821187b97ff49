#pragma once

#include "filter/PathFilter.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ferry::sync {

constexpr auto STAGING_PREFIX = "ferry_stage_";

// Builds throw-away copies of a source tree restricted to an explicit file list.
struct Staging {
    // Copies every listed file from sourceRoot into a fresh temp directory and returns it.
    // A missing or escaping path is a StagingError naming it; nothing is left on disk on failure.
    // Without preserveStructure files land flat in the staging root and basenames must be unique.
    static std::filesystem::path stage(const std::filesystem::path& sourceRoot,
                                       const std::vector<std::string>& fileList,
                                       bool preserveStructure = true);

    // Recursive removal; missing paths are fine.
    static void cleanup(const std::filesystem::path& stagingPath) noexcept;
};

// Owns a staging directory for the enclosing scope.
class ScopedStaging {
public:
    ScopedStaging(const std::filesystem::path& sourceRoot,
                  const std::vector<std::string>& fileList,
                  bool preserveStructure = true);
    ~ScopedStaging();

    ScopedStaging(const ScopedStaging&) = delete;
    ScopedStaging& operator=(const ScopedStaging&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Sorted relative paths of every file (symlinks included) under root that passes the filter.
std::vector<std::string> collectFiles(const std::filesystem::path& root, const filter::PathFilter& filter);

}
