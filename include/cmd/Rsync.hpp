#pragma once

#include "cmd/Toolchain.hpp"
#include "types/Environment.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::cmd {

// One side of a transfer: a path, optionally on a remote host.
struct Endpoint {
    std::filesystem::path path;
    std::optional<types::RemoteAccess> remote;

    [[nodiscard]] bool isRemote() const { return remote.has_value(); }

    // "user@host:/path" or "/path"
    [[nodiscard]] std::string argument() const;

    static Endpoint local(std::filesystem::path path);
    static Endpoint of(const types::Environment& env);
};

// Out-format giving one "CODE:SIZE:PATH" line per itemized change
constexpr auto DRY_RUN_OUT_FORMAT = "%i:%l:%n%L";

struct RsyncRequest {
    Endpoint source;
    Endpoint destination;
    std::vector<std::string> excludes;
    std::vector<std::string> includes;
    bool restrict_to_includes = false;
    bool delete_extraneous = false;
    bool dry_run = false;
    bool stats = true;
};

// rsync -avz [--stats] --omit-dir-times [--delete] [dry-run flags] [-e ssh...]
//       --exclude=... --include=... [--exclude=*] 'source/' 'destination'
// Throws std::invalid_argument when both endpoints are remote.
std::string buildRsyncCommand(const RsyncRequest& req, const Toolchain& tools);

}
