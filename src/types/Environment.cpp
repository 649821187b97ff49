#include "types/Environment.hpp"
#include "types/errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace ferry::types;

namespace {

// Anything that could be read as an ssh option or split by the shell is rejected.
bool unsafeShellToken(const std::string& s) {
    if (s.empty() || s.front() == '-') return true;
    return std::ranges::any_of(s, [](const char c) {
        return std::isspace(static_cast<unsigned char>(c)) || c == '\'' || c == '"' || c == '`' || c == '$' || c == ';';
    });
}

}

std::string RemoteAccess::connectionString() const {
    return user + "@" + host;
}

std::string Environment::transferPath() const {
    if (!ssh) return wordpress_path.string();
    return ssh->connectionString() + ":" + wordpress_path.string();
}

void ferry::types::validate(const RemoteAccess& remote, const std::string& context) {
    if (remote.host.empty()) throw MissingFieldError(context, "ssh.host");
    if (remote.user.empty()) throw MissingFieldError(context, "ssh.user");
    if (unsafeShellToken(remote.host)) throw std::invalid_argument(context + " has an invalid ssh.host: " + remote.host);
    if (unsafeShellToken(remote.user)) throw std::invalid_argument(context + " has an invalid ssh.user: " + remote.user);
    if (remote.port == 0) throw std::invalid_argument(context + " has an invalid ssh.port: 0");
    if (remote.key && remote.key->empty()) throw MissingFieldError(context, "ssh.key");
}

void ferry::types::validate(const DatabaseCredentials& db, const std::string& context) {
    if (db.name.empty()) throw MissingFieldError(context, "name");
    if (db.user.empty()) throw MissingFieldError(context, "user");
    if (db.host.empty()) throw MissingFieldError(context, "host");
}

void ferry::types::validate(const Environment& env) {
    const auto context = "Environment '" + env.name + "'";
    if (env.wordpress_path.empty()) throw MissingFieldError(context, "wordpress_path");
    if (env.url.empty()) throw MissingFieldError(context, "url");
    validate(env.database, context + " database configuration");
    if (env.ssh) validate(*env.ssh, context);
}
