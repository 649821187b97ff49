#include "cli/commands.hpp"
#include "cli/helpers.hpp"

#include <fmt/format.h>

using namespace ferry::cli;
using namespace ferry::cmd;
using namespace ferry::types;

namespace {

std::vector<std::string> describe(const Environment& env) {
    std::vector<std::string> lines;
    lines.push_back("Path: " + env.wordpress_path.string());
    lines.push_back("URL: " + env.url);
    lines.push_back(fmt::format("Database: {}@{} ({})", env.database.user, env.database.host, env.database.name));
    if (env.isRemote()) {
        lines.push_back(fmt::format("SSH: {}{}", env.ssh->connectionString(),
                                    env.ssh->hasCustomPort() ? fmt::format(" port {}", env.ssh->port) : ""));
        if (env.ssh->key) lines.push_back("SSH key: " + env.ssh->key->string());
    } else {
        lines.emplace_back("SSH: local");
    }
    if (env.backup_path) lines.push_back("Backups: " + env.backup_path->string());
    if (!env.exclude.empty()) lines.push_back(fmt::format("Excludes: {}", env.exclude.size()));
    return lines;
}

}

CommandResult ferry::cli::runStatus(const CommandCall& call, Context& ctx) {
    if (const auto bad = unknownOption(call, {"verbose", "config"})) return invalid("Unknown option for status: --" + *bad);
    if (call.positionals.size() > 1) return invalid("Usage: ferry status [environment]");

    auto& console = ctx.console;
    console.title("ferry status");

    console.section("Tools");
    std::vector<std::string> tools;
    for (const auto tool : ALL_TOOLS)
        tools.push_back(fmt::format("{:<10} {}", to_string(tool),
                                    ctx.tools.available(tool) ? ctx.tools.binary(tool) : "not found"));
    console.listing(tools);

    const auto names = call.positionals.empty() ? ctx.config.environmentNames() : call.positionals;
    for (const auto& name : names) {
        const auto& env = ctx.config.environment(name);
        console.section("Environment: " + env.name + (env.isRemote() ? " (remote)" : " (local)"));
        console.listing(describe(env));
    }

    if (!ctx.config.global.exclude.empty())
        console.note({fmt::format("{} global exclude patterns", ctx.config.global.exclude.size())});

    return {0, "", ""};
}
