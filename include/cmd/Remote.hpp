#pragma once

#include "cmd/Toolchain.hpp"
#include "types/Environment.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ferry::cmd {

// -p PORT (omitted for 22), -i KEY, -o StrictHostKeyChecking=no
std::vector<std::string> sshOptions(const types::RemoteAccess& remote);

// Same as sshOptions() but with scp's -P port flag
std::vector<std::string> scpOptions(const types::RemoteAccess& remote);

// "ssh -p 2222 ..." as a single unquoted line, suitable for rsync -e
std::string sshTransport(const types::RemoteAccess& remote, const Toolchain& tools);

struct RemoteShellRequest {
    types::RemoteAccess remote;
    std::string command;    // already built and quoted, passed to the remote shell as one argument
};

enum class CopyDirection { Upload, Download };

std::string to_string(CopyDirection direction);

struct RemoteCopyRequest {
    types::RemoteAccess remote;
    std::filesystem::path local_path;
    std::filesystem::path remote_path;
    CopyDirection direction = CopyDirection::Download;
};

std::string buildRemoteShellCommand(const RemoteShellRequest& req, const Toolchain& tools);

// ssh [opts] -o BatchMode=yes -o ConnectTimeout=10 user@host 'exit 0'
std::string buildConnectionTestCommand(const types::RemoteAccess& remote, const Toolchain& tools);
std::string buildRemoteCopyCommand(const RemoteCopyRequest& req, const Toolchain& tools);

}
