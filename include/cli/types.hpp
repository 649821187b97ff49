#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ferry::cli {

struct FlagKV {
    std::string key;                    // long name without dashes
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;           // printed after the command returns
    std::string stderr_text;
};

}
