#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/util.hpp"
#include "types/errors.hpp"

#include <algorithm>
#include <unordered_set>

using namespace ferry::config;
using namespace ferry::types;

namespace {

constexpr auto GLOBAL_SECTION = "global";

void interpolateScalars(YAML::Node node, const VariableLookup& lookup) {
    switch (node.Type()) {
    case YAML::NodeType::Scalar:
        node = interpolate(node.Scalar(), lookup);
        break;
    case YAML::NodeType::Sequence:
        for (auto child : node) interpolateScalars(child, lookup);
        break;
    case YAML::NodeType::Map:
        for (auto it = node.begin(); it != node.end(); ++it) interpolateScalars(it->second, lookup);
        break;
    default:
        break;
    }
}

Config fromNode(YAML::Node root) {
    if (!root.IsMap()) throw ConfigError("Configuration must be a mapping of environments");

    interpolateScalars(root, processEnvironment());

    Config cfg;
    for (auto it = root.begin(); it != root.end(); ++it) {
        const auto name = it->first.as<std::string>();

        try {
            if (name == GLOBAL_SECTION) {
                if (!it->second.IsNull() && !YAML::convert<GlobalConfig>::decode(it->second, cfg.global))
                    throw ConfigError("Section 'global' must be a mapping");
                continue;
            }

            Environment env;
            if (!YAML::convert<Environment>::decode(it->second, env))
                throw ConfigError("Environment '" + name + "' must be a mapping");
            env.name = name;
            validate(env);
            cfg.environments.emplace(name, std::move(env));
        } catch (const YAML::Exception& e) {
            throw ConfigError("Malformed section '" + name + "': " + e.what());
        }
    }

    return cfg;
}

}

Config ferry::config::loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) throw ConfigError("Configuration file not found: " + path.string());

    applyDotEnv(parseDotEnv(path.parent_path() / ".env"));

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse " + path.string() + ": " + e.what());
    }

    auto cfg = fromNode(root);
    cfg.source = path;
    return cfg;
}

Config ferry::config::loadConfigFromString(const std::string& yaml) {
    try {
        return fromNode(YAML::Load(yaml));
    } catch (const YAML::ParserException& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
}

const Environment& Config::environment(const std::string& name) const {
    const auto it = environments.find(name);
    if (it == environments.end()) throw ConfigError("Environment '" + name + "' not found in configuration");
    return it->second;
}

bool Config::hasEnvironment(const std::string& name) const {
    return environments.contains(name);
}

std::vector<std::string> Config::environmentNames() const {
    std::vector<std::string> names;
    names.reserve(environments.size());
    for (const auto& [name, _] : environments) names.push_back(name);
    return names;
}

std::vector<std::string> Config::excludesFor(const std::string& name) const {
    const auto& env = environment(name);

    std::vector<std::string> merged;
    std::unordered_set<std::string> seen;
    const auto add = [&](const std::vector<std::string>& patterns) {
        for (const auto& p : patterns)
            if (seen.insert(p).second) merged.push_back(p);
    };

    add(global.exclude);
    add(env.exclude);
    return merged;
}
