#pragma once

#include <array>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ferry::cmd {

enum class Tool { Rsync, Ssh, Scp, Mysqldump, Mysql, Gzip, Gunzip, Wp, Git };

constexpr std::array ALL_TOOLS = {
    Tool::Rsync, Tool::Ssh, Tool::Scp, Tool::Mysqldump, Tool::Mysql, Tool::Gzip, Tool::Gunzip, Tool::Wp, Tool::Git
};

std::string to_string(Tool tool);

// Resolved once at start-up and passed by reference to every builder and controller.
class Toolchain {
public:
    using Lookup = std::function<std::optional<std::filesystem::path>(const std::string&)>;

    // Resolves every tool through lookup; unresolved tools keep their bare name.
    static Toolchain discover(const Lookup& lookup);

    // Searches $PATH
    static Toolchain discover();

    // Bare names, all reported available. Used for commands executed on a remote host.
    static Toolchain defaults();

    [[nodiscard]] const std::string& binary(Tool tool) const;
    [[nodiscard]] bool available(Tool tool) const;
    [[nodiscard]] std::vector<Tool> missing(const std::vector<Tool>& required) const;

    static std::optional<std::filesystem::path> findInPath(const std::string& name);

private:
    std::array<std::string, ALL_TOOLS.size()> binaries_;
    std::array<bool, ALL_TOOLS.size()> found_{};
};

}
