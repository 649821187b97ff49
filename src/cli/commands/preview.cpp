#include "cli/commands.hpp"
#include "cli/helpers.hpp"
#include "filter/PathFilter.hpp"
#include "filter/SelectionRules.hpp"
#include "sync/FileSync.hpp"
#include "sync/Previewer.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

using namespace ferry::cli;
using namespace ferry::filter;
using namespace ferry::sync;

CommandResult ferry::cli::runPreview(const CommandCall& call, Context& ctx) {
    if (const auto bad = unknownOption(call, {"only", "json", "verbose", "config"}))
        return invalid("Unknown option for preview: --" + *bad);
    if (call.positionals.size() != 1) return invalid("Usage: ferry preview <environment> [--only <path>] [--json]");

    const auto& env = ctx.config.environment(call.positionals[0]);
    if (env.isRemote()) return invalid("preview needs a local environment, '" + env.name + "' is remote");
    if (!std::filesystem::is_directory(env.wordpress_path))
        return invalid("WordPress path does not exist: " + env.wordpress_path.string());

    std::vector<Selection> selected;
    for (const auto& raw : optVals(call, "only")) {
        std::error_code ec;
        selected.push_back({raw, raw.ends_with('/') || std::filesystem::is_directory(env.wordpress_path / raw, ec)});
    }
    const auto rules = buildSelectionRules(selected);

    const PathFilter filter(withVcsExcludes(ctx.config.excludesFor(env.name)), rules.includes, rules.restrict);
    const auto entries = Previewer(filter).scan(env.wordpress_path);

    if (hasFlag(call, "json")) {
        const nlohmann::json j = {
            {"environment", env.name},
            {"root", env.wordpress_path.string()},
            {"total_files", model::totalFiles(entries)},
            {"entries", entries}
        };
        return ok(j.dump(2) + "\n");
    }

    ctx.console.title("ferry preview: " + env.name);
    ctx.console.planPreview(entries);
    return {0, "", ""};
}
