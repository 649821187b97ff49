#include "cli/commands.hpp"
#include "cli/helpers.hpp"

#include <stdexcept>
#include <unordered_map>

using namespace ferry::cli;

namespace {

using Handler = std::function<CommandResult(const CommandCall&, Context&)>;

const std::unordered_map<std::string, Handler>& handlers() {
    static const std::unordered_map<std::string, Handler> table = {
        {"push", [](const CommandCall& c, Context& ctx) { return runSync(c, ctx, Direction::Push); }},
        {"pull", [](const CommandCall& c, Context& ctx) { return runSync(c, ctx, Direction::Pull); }},
        {"preview", runPreview},
        {"status", runStatus},
        {"validate", runValidate},
        {"backup", runBackup},
        {"ssh", runSsh},
        {"help", [](const CommandCall&, Context&) { return ok(usage()); }},
    };
    return table;
}

}

std::string ferry::cli::to_string(const Direction direction) {
    switch (direction) {
    case Direction::Push: return "push";
    case Direction::Pull: return "pull";
    default: throw std::invalid_argument("Unknown direction");
    }
}

bool ferry::cli::isStandalone(const std::string& name) {
    return name == "help" || !handlers().contains(name);
}

CommandResult ferry::cli::dispatch(const CommandCall& call, Context& ctx) {
    if (hasFlag(call, "help")) return ok(usage());

    const auto it = handlers().find(call.name);
    if (it == handlers().end()) return invalid("Unknown command: " + call.name + "\n\n" + usage());
    return it->second(call, ctx);
}

std::string ferry::cli::usage() {
    return R"(Usage: ferry <command> [args] [options]

Commands:
  push <source> <destination>   Push database and/or files from source to destination
  pull <source> <destination>   Pull database and/or files from a remote source
  preview <environment>         Show what a file sync from a local environment would send
  status [environment]          Show tool availability and configured environments
  validate                      Check the configuration and prerequisites
  backup <environment>          Back up an environment's database to this machine
  ssh <environment>             Test the SSH connection to a remote environment
  help                          Show this help

Sync options:
  --db                 Sync the database (default: database and files)
  --files              Sync files (default: database and files)
  --delete             Delete destination files missing from the source
  --dry-run, -n        Show what would change without changing anything
  --no-backup          Skip the destination database backup
  --tracked-only       Push only files tracked by git
  --only <path>        Restrict the file sync to a path (repeatable, trailing / for directories)
  --yes, -y            Do not ask for confirmation

Backup options:
  --output, -o <dir>   Backup directory (default: backup_path, else the temp dir)
  --yes, -y            Do not ask for confirmation

Preview options:
  --only <path>        Restrict the preview to a path (repeatable)
  --json               Print the plan as JSON

Global options:
  --config, -c <file>  Configuration file (default: ferry.yml)
  --verbose, -v        Debug logging on the console
)";
}
