#include "config/util.hpp"
#include "types/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

using namespace ferry::config;
using namespace ferry::types;

namespace {

bool isNameStart(const char c) { return c == '_' || (c >= 'A' && c <= 'Z'); }
bool isNameChar(const char c) { return isNameStart(c) || (c >= '0' && c <= '9'); }

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

}

VariableLookup ferry::config::processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* v = std::getenv(name.c_str())) return std::string(v);
        return std::nullopt;
    };
}

std::string ferry::config::interpolate(const std::string_view value, const VariableLookup& lookup) {
    std::string out;
    out.reserve(value.size());

    size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '$' && i + 1 < value.size() && value[i + 1] == '{') {
            const auto close = value.find('}', i + 2);
            const auto name = close == std::string_view::npos ? std::string_view{} : value.substr(i + 2, close - i - 2);
            const bool validName = !name.empty() && isNameStart(name.front())
                && std::all_of(name.begin(), name.end(), isNameChar);

            if (validName) {
                const auto resolved = lookup(std::string(name));
                if (!resolved) throw ConfigError("Environment variable '" + std::string(name) + "' is not set");
                out += *resolved;
                i = close + 1;
                continue;
            }
        }
        out += value[i++];
    }
    return out;
}

std::map<std::string, std::string> ferry::config::parseDotEnv(const std::filesystem::path& path) {
    std::map<std::string, std::string> vars;
    std::ifstream in(path);
    if (!in.is_open()) return vars;

    std::string line;
    while (std::getline(in, line)) {
        const auto l = trim(line);
        if (l.empty() || l.front() == '#') continue;

        const auto eq = l.find('=');
        if (eq == std::string_view::npos) continue;

        auto key = trim(l.substr(0, eq));
        if (key.starts_with("export ")) key = trim(key.substr(7));
        if (key.empty()) continue;

        auto val = trim(l.substr(eq + 1));
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front())
            val = val.substr(1, val.size() - 2);

        vars[std::string(key)] = std::string(val);
    }
    return vars;
}

void ferry::config::applyDotEnv(const std::map<std::string, std::string>& vars) {
    for (const auto& [key, value] : vars)
        if (::setenv(key.c_str(), value.c_str(), 0) != 0)
            throw ConfigError("Failed to export .env variable '" + key + "'");
}

std::filesystem::path ferry::config::expandHome(const std::filesystem::path& path) {
    const auto s = path.string();
    if (s.empty() || s.front() != '~') return path;
    if (s.size() > 1 && s[1] != '/') return path;  // ~user is not supported

    const char* home = std::getenv("HOME");
    if (!home || !*home) throw ConfigError("Cannot expand '" + s + "': HOME is not set");
    if (s.size() <= 2) return home;
    return std::filesystem::path(home) / s.substr(2);
}
