#include "cli/commands.hpp"
#include "cli/helpers.hpp"
#include "cmd/Remote.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

using namespace ferry::cli;
using namespace ferry::cmd;
using namespace ferry::logging;

CommandResult ferry::cli::runSsh(const CommandCall& call, Context& ctx) {
    if (const auto bad = unknownOption(call, {"verbose", "config"})) return invalid("Unknown option for ssh: --" + *bad);
    if (call.positionals.size() != 1) return invalid("Usage: ferry ssh <environment>");

    const auto& env = ctx.config.environment(call.positionals[0]);
    auto& console = ctx.console;

    if (!env.isRemote()) {
        console.error({"Environment '" + env.name + "' is not configured for SSH (local environment)"});
        return {1, "", ""};
    }
    if (!ctx.tools.available(Tool::Ssh)) {
        console.error({"ssh is not installed or not available in PATH"});
        return {1, "", ""};
    }

    const auto& remote = *env.ssh;
    console.title("ferry ssh: " + env.name);

    console.section("SSH Configuration");
    console.listing({
        "Host: " + remote.host,
        "User: " + remote.user,
        fmt::format("Port: {}", remote.port),
        "Key: " + (remote.key ? remote.key->string() : std::string("None (password auth)")),
    });

    console.section("Connection Test");
    const auto result = ctx.executor.run(buildConnectionTestCommand(remote, ctx.tools));
    if (result.ok()) {
        console.success({"Successfully connected to " + env.name});
        return {0, "", ""};
    }

    LogRegistry::ferry()->warn("[ssh] Connection to {} failed with exit code {}: {}",
                               remote.connectionString(), result.exit_code, result.stderr_text);
    console.error({"Failed to connect to " + env.name});
    std::vector<std::string> hints{"Possible issues:",
                                   "- SSH host is unreachable",
                                   "- SSH credentials are incorrect",
                                   "- SSH key file is incorrect or not readable",
                                   "- Firewall is blocking the connection",
                                   "- SSH service is not running on the remote host"};
    if (const auto end = result.stderr_text.find_last_not_of('\n'); end != std::string::npos)
        hints.insert(hints.begin(), "ssh said: " + result.stderr_text.substr(0, end + 1));
    console.note(hints);
    return {1, "", ""};
}
