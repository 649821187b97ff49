#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"
#include "types/Environment.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ferry::config;
using namespace ferry::types;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["dir"] = rhs.dir.string();
        node["console_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_level));
        node["file_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_level));
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.dir = expandHome(node["dir"].as<std::string>(DEFAULT_LOG_DIR));
        rhs.console_level = spdlog::level::from_str(node["console_level"].as<std::string>("warn"));
        rhs.file_level = spdlog::level::from_str(node["file_level"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<GlobalConfig> {
    static Node encode(const GlobalConfig& rhs) {
        Node node;
        node["exclude"] = rhs.exclude;
        node["logging"] = rhs.logging;
        return node;
    }

    static bool decode(const Node& node, GlobalConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.exclude = node["exclude"].as<std::vector<std::string>>(std::vector<std::string>{});
        if (node["logging"]) rhs.logging = node["logging"].as<LoggingConfig>();
        return true;
    }
};

template<>
struct convert<RemoteAccess> {
    static Node encode(const RemoteAccess& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["user"] = rhs.user;
        node["port"] = rhs.port;
        if (rhs.key) node["key"] = rhs.key->string();
        return node;
    }

    static bool decode(const Node& node, RemoteAccess& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("");
        rhs.user = node["user"].as<std::string>("");
        rhs.port = node["port"].as<uint16_t>(DEFAULT_SSH_PORT);
        if (const auto key = node["key"].as<std::string>(""); !key.empty()) rhs.key = expandHome(key);
        return true;
    }
};

template<>
struct convert<DatabaseCredentials> {
    static Node encode(const DatabaseCredentials& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password"] = rhs.password;
        node["host"] = rhs.host;
        return node;
    }

    static bool decode(const Node& node, DatabaseCredentials& rhs) {
        if (!node.IsMap()) return false;
        rhs.name = node["name"].as<std::string>("");
        rhs.user = node["user"].as<std::string>("");
        rhs.password = node["password"].as<std::string>("");
        rhs.host = node["host"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<Environment> {
    static Node encode(const Environment& rhs) {
        Node node;
        node["wordpress_path"] = rhs.wordpress_path.string();
        if (rhs.core_path) node["core_path"] = rhs.core_path->string();
        node["url"] = rhs.url;
        if (rhs.backup_path) node["backup_path"] = rhs.backup_path->string();
        node["database"] = rhs.database;
        if (rhs.ssh) node["ssh"] = *rhs.ssh;
        if (!rhs.exclude.empty()) node["exclude"] = rhs.exclude;
        return node;
    }

    static bool decode(const Node& node, Environment& rhs) {
        if (!node.IsMap()) return false;
        rhs.wordpress_path = node["wordpress_path"].as<std::string>("");
        if (const auto core = node["core_path"].as<std::string>(""); !core.empty()) rhs.core_path = core;
        rhs.url = node["url"].as<std::string>("");
        if (const auto backup = node["backup_path"].as<std::string>(""); !backup.empty()) rhs.backup_path = expandHome(backup);
        if (node["database"]) rhs.database = node["database"].as<DatabaseCredentials>();
        if (node["ssh"]) rhs.ssh = node["ssh"].as<RemoteAccess>();
        rhs.exclude = node["exclude"].as<std::vector<std::string>>(std::vector<std::string>{});
        return true;
    }
};

}
