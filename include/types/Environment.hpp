#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::types {

constexpr uint16_t DEFAULT_SSH_PORT = 22;

struct RemoteAccess {
    std::string host;
    std::string user;
    uint16_t port{DEFAULT_SSH_PORT};
    std::optional<std::filesystem::path> key;

    // user@host
    [[nodiscard]] std::string connectionString() const;
    [[nodiscard]] bool hasCustomPort() const { return port != DEFAULT_SSH_PORT; }
};

struct DatabaseCredentials {
    std::string name;
    std::string user;
    std::string password;
    std::string host{"localhost"};

    [[nodiscard]] bool hasPassword() const { return !password.empty(); }
};

struct Environment {
    std::string name;
    std::filesystem::path wordpress_path;
    std::optional<std::filesystem::path> core_path;
    std::string url;
    std::optional<std::filesystem::path> backup_path;
    DatabaseCredentials database;
    std::optional<RemoteAccess> ssh;
    std::vector<std::string> exclude;

    [[nodiscard]] bool isRemote() const { return ssh.has_value(); }

    // "user@host:/path" for remote environments, the plain path otherwise
    [[nodiscard]] std::string transferPath() const;
};

void validate(const RemoteAccess& remote, const std::string& context);
void validate(const DatabaseCredentials& db, const std::string& context);
void validate(const Environment& env);

}
