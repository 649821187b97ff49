#include "cli/commands.hpp"
#include "cli/helpers.hpp"
#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <set>
#include <fmt/format.h>

using namespace ferry::cli;
using namespace ferry::cmd;
using namespace ferry::logging;
using namespace ferry::types;
namespace fs = std::filesystem;

namespace {

struct Findings {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

void checkEnvironment(const Environment& env, Findings& f) {
    if (env.isRemote()) {
        if (env.ssh->key && !fs::exists(*env.ssh->key))
            f.errors.push_back(fmt::format("{}: SSH key not found: {}", env.name, env.ssh->key->string()));
        return;
    }

    if (!fs::is_directory(env.wordpress_path)) {
        f.errors.push_back(fmt::format("{}: WordPress path does not exist: {}", env.name, env.wordpress_path.string()));
        return;
    }
    if (!fs::exists(env.wordpress_path / "wp-config.php"))
        f.warnings.push_back(fmt::format("{}: wp-config.php not found in {}", env.name, env.wordpress_path.string()));
    if (env.core_path && !fs::is_directory(*env.core_path))
        f.warnings.push_back(fmt::format("{}: core path does not exist: {}", env.name, env.core_path->string()));
    if (env.backup_path && fs::exists(*env.backup_path) && !fs::is_directory(*env.backup_path))
        f.errors.push_back(fmt::format("{}: backup path is not a directory: {}", env.name, env.backup_path->string()));
}

}

CommandResult ferry::cli::runValidate(const CommandCall& call, Context& ctx) {
    if (const auto bad = unknownOption(call, {"verbose", "config"})) return invalid("Unknown option for validate: --" + *bad);

    auto& console = ctx.console;
    console.title("ferry validate");

    const auto names = ctx.config.environmentNames();
    if (names.empty()) {
        console.error({"No environments configured"});
        return {1, "", ""};
    }

    Findings findings;
    std::set<Tool> needed{Tool::Rsync};
    for (const auto& name : names) {
        const auto& env = ctx.config.environment(name);
        checkEnvironment(env, findings);

        if (env.isRemote()) {
            needed.insert(Tool::Ssh);
            needed.insert(Tool::Scp);
        } else {
            needed.insert({Tool::Mysqldump, Tool::Mysql, Tool::Gzip, Tool::Gunzip, Tool::Wp, Tool::Git});
        }
    }

    for (const auto tool : ctx.tools.missing({needed.begin(), needed.end()}))
        findings.warnings.push_back(to_string(tool) + " is not installed or not available in PATH");

    console.section("Environments");
    console.listing(names);

    if (!findings.warnings.empty()) console.warning(findings.warnings);
    if (!findings.errors.empty()) {
        console.error(findings.errors);
        LogRegistry::config()->error("[validate] {} problems in {}", findings.errors.size(), ctx.config.source.string());
        return {1, "", ""};
    }

    console.success({"Configuration is valid."});
    return {0, "", ""};
}
