#pragma once

#include <filesystem>
#include <string>

namespace ferry::sync {

// Exclusive advisory lock per (source, destination) pair, held for the lifetime of the object.
class SyncLock {
public:
    SyncLock(const std::string& source, const std::string& destination,
             const std::filesystem::path& lockDir = std::filesystem::temp_directory_path());
    ~SyncLock();

    SyncLock(const SyncLock&) = delete;
    SyncLock& operator=(const SyncLock&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_{-1};
};

}
