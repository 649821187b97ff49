#pragma once

#include "stats/TransferStats.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ferry::stats {

// "Would transfer N files (SIZE)." / "Transferred N files (SIZE)." followed by
// "Examined N files (SIZE total)." or, without a file count, "Total dataset size: SIZE.".
// In dry-run mode the first line uses the summary counts when a summary is given.
std::vector<std::string> formatNoteLines(const TransferStats& stats,
                                         const std::optional<DryRunSummary>& dryRunSummary,
                                         bool isDryRun);

// 1024-based, one decimal at the largest unit >= 1: "0 B", "512.0 B", "20.0 KB"
std::string formatBytes(uint64_t bytes);
std::string formatBytes(const std::optional<uint64_t>& bytes);

// 1234567 -> "1,234,567"
std::string formatCount(uint64_t n);

}
