#include "cmd/Rsync.hpp"
#include "cmd/Remote.hpp"
#include "cmd/quote.hpp"
#include "types/errors.hpp"

#include <stdexcept>
#include <utility>

using namespace ferry::cmd;
using namespace ferry::types;

namespace {

void validateEndpoint(const Endpoint& ep, const std::string& side) {
    const auto context = "Rsync " + side;
    if (ep.path.empty()) throw MissingFieldError(context, "path");
    if (ep.remote) validate(*ep.remote, context);
}

std::string withTrailingSlash(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    if (s != "/") s += '/';
    return s;
}

}

std::string Endpoint::argument() const {
    if (!remote) return path.string();
    return remote->connectionString() + ":" + path.string();
}

Endpoint Endpoint::local(std::filesystem::path path) {
    return Endpoint{std::move(path), std::nullopt};
}

Endpoint Endpoint::of(const Environment& env) {
    return Endpoint{env.wordpress_path, env.ssh};
}

std::string ferry::cmd::buildRsyncCommand(const RsyncRequest& req, const Toolchain& tools) {
    validateEndpoint(req.source, "source");
    validateEndpoint(req.destination, "destination");
    if (req.source.isRemote() && req.destination.isRemote())
        throw std::invalid_argument("Cannot sync between two remote endpoints");

    std::vector<std::string> words{tools.binary(Tool::Rsync), "-avz"};
    if (req.stats) words.emplace_back("--stats");
    words.emplace_back("--omit-dir-times");
    if (req.delete_extraneous) words.emplace_back("--delete");
    if (req.dry_run) {
        words.emplace_back("--dry-run");
        words.emplace_back("--itemize-changes");
        words.emplace_back(std::string("--out-format=") + DRY_RUN_OUT_FORMAT);
    }

    const auto& remote = req.source.isRemote() ? req.source.remote : req.destination.remote;
    if (remote) {
        words.emplace_back("-e");
        words.push_back(sshTransport(*remote, tools));
    }

    // rsync applies the first matching rule, so excludes win over includes
    for (const auto& p : req.excludes)
        if (!p.empty()) words.push_back("--exclude=" + p);
    for (const auto& p : req.includes)
        if (!p.empty()) words.push_back("--include=" + p);
    if (req.restrict_to_includes && !req.includes.empty()) words.emplace_back("--exclude=*");

    Endpoint source = req.source;
    source.path = withTrailingSlash(req.source.path.string());

    return join(words) + ' ' + shellQuote(source.argument()) + ' ' + shellQuote(req.destination.argument());
}
