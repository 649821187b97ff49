#pragma once

#include "types/Environment.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace ferry::config {

constexpr auto DEFAULT_CONFIG_FILE = "ferry.yml";
constexpr auto DEFAULT_LOG_DIR = "~/.local/state/ferry";

struct LoggingConfig {
    std::filesystem::path dir = DEFAULT_LOG_DIR;
    spdlog::level::level_enum console_level = spdlog::level::warn;
    spdlog::level::level_enum file_level = spdlog::level::info;
};

struct GlobalConfig {
    std::vector<std::string> exclude;
    LoggingConfig logging;
};

struct Config {
    std::filesystem::path source;   // file the config was read from, empty for in-memory configs
    GlobalConfig global;
    std::map<std::string, types::Environment> environments;

    [[nodiscard]] const types::Environment& environment(const std::string& name) const;
    [[nodiscard]] bool hasEnvironment(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> environmentNames() const;

    // global excludes followed by the environment's own, first occurrence wins
    [[nodiscard]] std::vector<std::string> excludesFor(const std::string& name) const;
};

// Loads <dir>/.env (if present) into the process environment, then parses and validates the file.
Config loadConfig(const std::filesystem::path& path);

// Parses and validates YAML text. ${VAR} references resolve against the process environment.
Config loadConfigFromString(const std::string& yaml);

}
