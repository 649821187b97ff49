#include "cmd/Remote.hpp"
#include "cmd/quote.hpp"
#include "types/errors.hpp"

#include <stdexcept>

using namespace ferry::cmd;
using namespace ferry::types;

namespace {

constexpr auto HOST_KEY_POLICY = "StrictHostKeyChecking=no";
constexpr int CONNECT_TIMEOUT_SECONDS = 10;

std::vector<std::string> transportOptions(const RemoteAccess& remote, const char* portFlag) {
    std::vector<std::string> opts;
    if (remote.hasCustomPort()) {
        opts.emplace_back(portFlag);
        opts.push_back(std::to_string(remote.port));
    }
    if (remote.key) {
        opts.emplace_back("-i");
        opts.push_back(remote.key->string());
    }
    opts.emplace_back("-o");
    opts.emplace_back(HOST_KEY_POLICY);
    return opts;
}

}

std::vector<std::string> ferry::cmd::sshOptions(const RemoteAccess& remote) {
    return transportOptions(remote, "-p");
}

std::vector<std::string> ferry::cmd::scpOptions(const RemoteAccess& remote) {
    return transportOptions(remote, "-P");
}

std::string ferry::cmd::sshTransport(const RemoteAccess& remote, const Toolchain& tools) {
    validate(remote, "Remote transport");
    auto words = sshOptions(remote);
    words.insert(words.begin(), tools.binary(Tool::Ssh));
    return join(words);
}

std::string ferry::cmd::to_string(const CopyDirection direction) {
    switch (direction) {
    case CopyDirection::Upload: return "upload";
    case CopyDirection::Download: return "download";
    default: throw std::invalid_argument("Unknown copy direction");
    }
}

std::string ferry::cmd::buildRemoteShellCommand(const RemoteShellRequest& req, const Toolchain& tools) {
    validate(req.remote, "Remote shell request");
    if (req.command.empty()) throw MissingFieldError("Remote shell request", "command");

    auto words = sshOptions(req.remote);
    words.insert(words.begin(), tools.binary(Tool::Ssh));
    words.push_back(req.remote.connectionString());

    return join(words) + ' ' + shellQuote(req.command);
}

std::string ferry::cmd::buildConnectionTestCommand(const RemoteAccess& remote, const Toolchain& tools) {
    validate(remote, "Connection test");

    auto words = sshOptions(remote);
    words.insert(words.begin(), tools.binary(Tool::Ssh));
    words.insert(words.end(), {"-o", "BatchMode=yes", "-o", "ConnectTimeout=" + std::to_string(CONNECT_TIMEOUT_SECONDS)});
    words.push_back(remote.connectionString());

    return join(words) + " 'exit 0'";
}

std::string ferry::cmd::buildRemoteCopyCommand(const RemoteCopyRequest& req, const Toolchain& tools) {
    validate(req.remote, "Remote copy request");
    if (req.local_path.empty()) throw MissingFieldError("Remote copy request", "local_path");
    if (req.remote_path.empty()) throw MissingFieldError("Remote copy request", "remote_path");

    const auto remoteSide = req.remote.connectionString() + ":" + req.remote_path.string();
    const auto localSide = req.local_path.string();

    auto words = scpOptions(req.remote);
    words.insert(words.begin(), tools.binary(Tool::Scp));

    auto cmd = join(words);
    if (req.direction == CopyDirection::Upload) cmd += ' ' + shellQuote(localSide) + ' ' + shellQuote(remoteSide);
    else cmd += ' ' + shellQuote(remoteSide) + ' ' + shellQuote(localSide);
    return cmd;
}
