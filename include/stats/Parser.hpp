#pragma once

#include "stats/TransferStats.hpp"

#include <optional>
#include <string_view>

namespace ferry::stats {

// Reads "Number of files", "Number of (regular) files transferred", "Total file size" and
// "Total transferred file size" out of rsync --stats output. Thousands separators are accepted.
// Returns nullopt when none of them is present or when transferred exceeds examined.
std::optional<TransferStats> parseStats(std::string_view output);

// Interprets "CODE:SIZE:PATH" lines (rsync --out-format=%i:%l:%n%L). Only lines whose code
// starts with '<' or '>' followed by 'f' carry file content and count toward files/bytes.
DryRunSummary parseDryRunSummary(std::string_view output);

// True for "<f..." and ">f...", false for directory, link, attribute-only and deletion codes
bool isContentTransfer(std::string_view code);

}
