#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace ferry::sync {

struct ReplaceResult {
    uint64_t files_checked{0};
    uint64_t files_modified{0};
};

// Rewrites every occurrence of search with replace in the text files below root.
// Only known text extensions are considered; files with a NUL byte in their first
// 2048 bytes are treated as binary and skipped. Symlinks are not followed.
ReplaceResult replaceInTree(const std::filesystem::path& root, const std::string& search, const std::string& replace);

[[nodiscard]] bool hasTextExtension(const std::filesystem::path& file);

[[nodiscard]] bool looksBinary(const std::filesystem::path& file);

}
