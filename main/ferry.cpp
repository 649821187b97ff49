// CLI
#include "cli/Console.hpp"
#include "cli/Parser.hpp"
#include "cli/commands.hpp"
#include "cli/helpers.hpp"

// Core
#include "cmd/Toolchain.hpp"
#include "config/Config.hpp"
#include "process/Executor.hpp"
#include "logging/LogRegistry.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <fmt/core.h>

#include <unistd.h>

using namespace ferry::cli;
using namespace ferry::config;
using namespace ferry::logging;

namespace {

void initLogging(const LoggingConfig& cnf, const bool verbose) {
    try {
        LogRegistry::init(cnf.dir, cnf);
    } catch (const std::filesystem::filesystem_error& e) {
        fmt::print(stderr, "ferry: cannot use log directory {} ({}), logging to the temp directory\n",
                   cnf.dir.string(), e.what());
        LogRegistry::init(std::filesystem::temp_directory_path() / "ferry", cnf);
    }
    if (verbose) LogRegistry::setConsoleLevel(spdlog::level::debug);
}

int emit(const CommandResult& result) {
    if (!result.stdout_text.empty()) fmt::print("{}", result.stdout_text);
    if (!result.stderr_text.empty()) fmt::print(stderr, "{}", result.stderr_text);
    return result.exit_code;
}

}

int main(const int argc, char** argv) {
    const bool color = ::isatty(STDOUT_FILENO) == 1;
    Console console(std::cout, std::cin, color);
    Console errConsole(std::cerr, std::cin, ::isatty(STDERR_FILENO) == 1);

    try {
        const auto call = parseArgs(argc, argv);

        if (isStandalone(call.name) || hasFlag(call, "help")) {
            if (call.name == "help" || hasFlag(call, "help")) return emit(ok(usage()));
            return emit(invalid("Unknown command: " + call.name + "\n\n" + usage()));
        }

        const auto configPath = optVal(call, "config").value_or(DEFAULT_CONFIG_FILE);
        const auto config = loadConfig(configPath);

        initLogging(config.global.logging, hasFlag(call, "verbose"));
        LogRegistry::config()->debug("[main] Loaded {} environments from {}", config.environments.size(), configPath);

        const auto tools = ferry::cmd::Toolchain::discover();
        ferry::process::ShellExecutor executor;

        Context ctx{config, tools, executor, console};
        return emit(dispatch(call, ctx));
    } catch (const std::exception& e) {
        errConsole.error({e.what()});
        if (LogRegistry::isInitialized()) LogRegistry::ferry()->error("[main] {}", e.what());
        return 1;
    }
}
