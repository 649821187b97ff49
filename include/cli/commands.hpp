#pragma once

#include "cli/Console.hpp"
#include "cli/types.hpp"
#include "cmd/Toolchain.hpp"
#include "config/Config.hpp"
#include "process/Executor.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace ferry::cli {

// Everything a command handler may touch, created once by main.
struct Context {
    const config::Config& config;
    const cmd::Toolchain& tools;
    process::Executor& executor;
    Console& console;
    std::filesystem::path lockDir = std::filesystem::temp_directory_path();
};

enum class Direction { Push, Pull };

std::string to_string(Direction direction);

CommandResult runSync(const CommandCall& call, Context& ctx, Direction direction);
CommandResult runPreview(const CommandCall& call, Context& ctx);
CommandResult runStatus(const CommandCall& call, Context& ctx);
CommandResult runValidate(const CommandCall& call, Context& ctx);
CommandResult runBackup(const CommandCall& call, Context& ctx);
CommandResult runSsh(const CommandCall& call, Context& ctx);

std::string usage();

// True for commands that work without a configuration file
bool isStandalone(const std::string& name);

// Routes call.name to its handler; unknown names produce usage and exit code 2.
CommandResult dispatch(const CommandCall& call, Context& ctx);

}
