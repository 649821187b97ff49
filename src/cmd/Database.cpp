#include "cmd/Database.hpp"
#include "cmd/quote.hpp"
#include "types/errors.hpp"

using namespace ferry::cmd;
using namespace ferry::types;

namespace {

constexpr auto GUID_COLUMN = "guid";
constexpr auto PARTIAL_SUFFIX = ".part";

std::string credentialFlags(const DatabaseCredentials& db) {
    std::string flags = "--user=" + shellQuote(db.user) + " --host=" + shellQuote(db.host);
    if (db.hasPassword()) flags += " --password=" + shellQuote(db.password);
    return flags;
}

}

std::string ferry::cmd::buildExportCommand(const ExportRequest& req, const Toolchain& tools) {
    validate(req.database, "Database export");
    if (req.output_path.empty()) throw MissingFieldError("Database export", "output_path");

    const auto dump = shellWord(tools.binary(Tool::Mysqldump)) + ' ' + credentialFlags(req.database)
        + " --single-transaction --quick --lock-tables=false " + shellQuote(req.database.name);
    const auto output = shellQuote(req.output_path.string());

    if (!req.compress) return dump + " > " + output;

    // A pipe would report gzip's status only, so the dump lands in a plain file first
    const auto partial = shellQuote(req.output_path.string() + PARTIAL_SUFFIX);
    return dump + " > " + partial + " && " + shellWord(tools.binary(Tool::Gzip)) + " -c " + partial + " > " + output
        + "; rc=$?; rm -f " + partial + "; exit $rc";
}

std::string ferry::cmd::buildImportCommand(const ImportRequest& req, const Toolchain& tools) {
    validate(req.database, "Database import");
    if (req.input_path.empty()) throw MissingFieldError("Database import", "input_path");

    const auto mysql = shellWord(tools.binary(Tool::Mysql)) + ' ' + credentialFlags(req.database)
        + ' ' + shellQuote(req.database.name);
    const auto input = shellQuote(req.input_path.string());

    // gunzip -t fails on a missing or corrupt archive before mysql sees any input
    if (req.input_path.extension() == ".gz") {
        const auto gunzip = shellWord(tools.binary(Tool::Gunzip));
        return gunzip + " -t " + input + " && " + gunzip + " < " + input + " | " + mysql;
    }
    return mysql + " < " + input;
}

std::string ferry::cmd::buildSearchReplaceCommand(const SearchReplaceRequest& req, const Toolchain& tools) {
    if (req.wordpress_path.empty()) throw MissingFieldError("Search-replace", "wordpress_path");
    if (req.old_url.empty()) throw MissingFieldError("Search-replace", "old_url");
    if (req.new_url.empty()) throw MissingFieldError("Search-replace", "new_url");

    return shellWord(tools.binary(Tool::Wp)) + " search-replace " + shellQuote(req.old_url) + ' '
        + shellQuote(req.new_url) + " --path=" + shellQuote(req.wordpress_path.string())
        + " --skip-columns=" + GUID_COLUMN + " --quiet";
}

std::string ferry::cmd::buildRemoveCommand(const std::filesystem::path& path) {
    if (path.empty()) throw MissingFieldError("Remove command", "path");
    return "rm -f " + shellQuote(path.string());
}
