#include "cmd/Toolchain.hpp"
#include "logging/LogRegistry.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include <unistd.h>

using namespace ferry::cmd;
using namespace ferry::logging;

namespace {

size_t indexOf(const Tool tool) { return static_cast<size_t>(tool); }

}

std::string ferry::cmd::to_string(const Tool tool) {
    switch (tool) {
    case Tool::Rsync: return "rsync";
    case Tool::Ssh: return "ssh";
    case Tool::Scp: return "scp";
    case Tool::Mysqldump: return "mysqldump";
    case Tool::Mysql: return "mysql";
    case Tool::Gzip: return "gzip";
    case Tool::Gunzip: return "gunzip";
    case Tool::Wp: return "wp";
    case Tool::Git: return "git";
    default: throw std::invalid_argument("Unknown tool");
    }
}

Toolchain Toolchain::discover(const Lookup& lookup) {
    Toolchain tc;
    for (const auto tool : ALL_TOOLS) {
        const auto name = to_string(tool);
        const auto i = indexOf(tool);
        if (const auto resolved = lookup(name)) {
            tc.binaries_[i] = resolved->string();
            tc.found_[i] = true;
        } else {
            tc.binaries_[i] = name;
            LogRegistry::cmd()->debug("[Toolchain] {} not found", name);
        }
    }
    return tc;
}

Toolchain Toolchain::discover() {
    return discover([](const std::string& name) { return findInPath(name); });
}

Toolchain Toolchain::defaults() {
    Toolchain tc;
    for (const auto tool : ALL_TOOLS) {
        tc.binaries_[indexOf(tool)] = to_string(tool);
        tc.found_[indexOf(tool)] = true;
    }
    return tc;
}

const std::string& Toolchain::binary(const Tool tool) const {
    return binaries_[indexOf(tool)];
}

bool Toolchain::available(const Tool tool) const {
    return found_[indexOf(tool)];
}

std::vector<Tool> Toolchain::missing(const std::vector<Tool>& required) const {
    std::vector<Tool> out;
    for (const auto tool : required)
        if (!available(tool)) out.push_back(tool);
    return out;
}

std::optional<std::filesystem::path> Toolchain::findInPath(const std::string& name) {
    const char* path = std::getenv("PATH");
    if (!path) return std::nullopt;

    std::string_view dirs(path);
    while (true) {
        const auto sep = dirs.find(':');
        const auto dir = dirs.substr(0, sep);
        if (!dir.empty()) {
            auto candidate = std::filesystem::path(dir) / name;
            std::error_code ec;
            if (::access(candidate.c_str(), X_OK) == 0 && !std::filesystem::is_directory(candidate, ec))
                return candidate;
        }
        if (sep == std::string_view::npos) break;
        dirs.remove_prefix(sep + 1);
    }
    return std::nullopt;
}
