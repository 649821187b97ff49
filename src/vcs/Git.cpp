#include "vcs/Git.hpp"
#include "cmd/quote.hpp"
#include "logging/LogRegistry.hpp"
#include "types/errors.hpp"

using namespace ferry::vcs;
using namespace ferry::cmd;
using namespace ferry::logging;

std::string git::buildLsFilesCommand(const std::filesystem::path& root, const Toolchain& tools) {
    if (root.empty()) throw types::MissingFieldError("Git tracked files", "root");
    return shellWord(tools.binary(Tool::Git)) + " -C " + shellQuote(root.string()) + " ls-files -z";
}

std::vector<std::string> git::splitNul(const std::string& output) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\0', start);
        if (end == std::string::npos) end = output.size();
        if (end > start) items.emplace_back(output, start, end - start);
        start = end + 1;
    }
    return items;
}

std::vector<std::string> git::trackedFiles(process::Executor& executor, const Toolchain& tools,
                                           const std::filesystem::path& root) {
    const auto result = executor.check(buildLsFilesCommand(root, tools), "git ls-files in " + root.string());
    auto files = splitNul(result.stdout_text);
    LogRegistry::sync()->debug("[Git] {} tracked files under {}", files.size(), root.string());
    return files;
}
