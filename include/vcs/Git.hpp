#pragma once

#include "cmd/Toolchain.hpp"
#include "process/Executor.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ferry::vcs::git {

// git -C '<root>' ls-files -z
std::string buildLsFilesCommand(const std::filesystem::path& root, const cmd::Toolchain& tools);

// Paths tracked by the repository at root, relative to root. Throws TransferError when git fails.
std::vector<std::string> trackedFiles(process::Executor& executor, const cmd::Toolchain& tools,
                                      const std::filesystem::path& root);

// Splits NUL separated output, dropping empty items
std::vector<std::string> splitNul(const std::string& output);

}
