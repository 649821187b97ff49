#include "cli/helpers.hpp"

#include <algorithm>
#include <utility>

using namespace ferry::cli;

CommandResult ferry::cli::invalid(std::string msg) {
    if (msg.empty() || msg.back() != '\n') msg += '\n';
    return {2, "", std::move(msg)};
}

CommandResult ferry::cli::ok(std::string out) {
    return {0, std::move(out), ""};
}

std::optional<std::string> ferry::cli::optVal(const CommandCall& c, const std::string& key) {
    std::optional<std::string> found;
    for (const auto& [k, v] : c.options) if (k == key) found = v.value_or(std::string{});
    return found;
}

std::vector<std::string> ferry::cli::optVals(const CommandCall& c, const std::string& key) {
    std::vector<std::string> out;
    for (const auto& [k, v] : c.options) if (k == key && v && !v->empty()) out.push_back(*v);
    return out;
}

bool ferry::cli::hasFlag(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

std::optional<std::string> ferry::cli::unknownOption(const CommandCall& c, const std::vector<std::string>& allowed) {
    for (const auto& [k, v] : c.options)
        if (std::ranges::find(allowed, k) == allowed.end()) return k;
    return std::nullopt;
}
