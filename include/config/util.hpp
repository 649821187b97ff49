#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::config {

using VariableLookup = std::function<std::optional<std::string>(const std::string&)>;

// getenv-backed lookup
VariableLookup processEnvironment();

// Replaces every ${NAME} (NAME = [A-Z_][A-Z0-9_]*) in value. Throws ConfigError for unset names.
std::string interpolate(std::string_view value, const VariableLookup& lookup);

// KEY=VALUE lines, '#' comments, optional matching quotes around VALUE. Missing file yields an empty map.
std::map<std::string, std::string> parseDotEnv(const std::filesystem::path& path);

// setenv() for every pair not already present in the process environment
void applyDotEnv(const std::map<std::string, std::string>& vars);

// "~" and "~/..." against $HOME, anything else untouched
std::filesystem::path expandHome(const std::filesystem::path& path);

}
