#pragma once

#include "cli/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ferry::cli {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);

// Last value given for key ("" for a bare switch), nullopt when absent
std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

// Every value given for a repeatable option, in order
std::vector<std::string> optVals(const CommandCall& c, const std::string& key);

bool hasFlag(const CommandCall& c, const std::string& key);

// Rejects options that are not in allowed
std::optional<std::string> unknownOption(const CommandCall& c, const std::vector<std::string>& allowed);

}
