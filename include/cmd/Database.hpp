#pragma once

#include "cmd/Toolchain.hpp"
#include "types/Environment.hpp"

#include <filesystem>
#include <string>

namespace ferry::cmd {

struct ExportRequest {
    types::DatabaseCredentials database;
    std::filesystem::path output_path;
    bool compress = true;
};

struct ImportRequest {
    types::DatabaseCredentials database;
    std::filesystem::path input_path;   // a .gz suffix selects gunzip
};

struct SearchReplaceRequest {
    std::filesystem::path wordpress_path;
    std::string old_url;
    std::string new_url;
};

// mysqldump --user= --host= [--password=] --single-transaction --quick --lock-tables=false 'db' > 'out'
// Compressed exports dump to 'out.part', gzip it into 'out' and remove it, exiting with the first failure.
std::string buildExportCommand(const ExportRequest& req, const Toolchain& tools);

// [gunzip -t 'in' && gunzip < 'in' |] mysql --user= --host= [--password=] 'db' [< 'in']
std::string buildImportCommand(const ImportRequest& req, const Toolchain& tools);

// wp search-replace 'old' 'new' --path='p' --skip-columns=guid --quiet
std::string buildSearchReplaceCommand(const SearchReplaceRequest& req, const Toolchain& tools);

// rm -f 'path'
std::string buildRemoveCommand(const std::filesystem::path& path);

}
