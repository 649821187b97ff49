#pragma once

#include "cli/types.hpp"

#include <string>
#include <vector>

namespace ferry::cli {

// Split --key=value and -Xvalue (heuristic), keep -abc bundles as-is
std::vector<std::string> normalizeArgs(const std::vector<std::string>& args);

// args[0] is the command name, an empty list means "help".
// Options listed in valueOptions() take the next argument as their value, everything else is a switch.
// Repeated options are kept in order.
CommandCall parseArgs(const std::vector<std::string>& args);

CommandCall parseArgs(int argc, char** argv);

const std::vector<std::string>& valueOptions();

}
