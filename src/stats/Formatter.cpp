#include "stats/Formatter.hpp"

#include <array>
#include <cstddef>
#include <utility>
#include <fmt/format.h>

using namespace ferry::stats;

namespace {

constexpr std::array<const char*, 6> UNITS = {"B", "KB", "MB", "GB", "TB", "PB"};

const char* plural(const uint64_t n) { return n == 1 ? "file" : "files"; }

}

std::string ferry::stats::formatCount(const uint64_t n) {
    auto digits = std::to_string(n);
    for (auto i = static_cast<std::ptrdiff_t>(digits.size()) - 3; i > 0; i -= 3)
        digits.insert(static_cast<size_t>(i), 1, ',');
    return digits;
}

std::string ferry::stats::formatBytes(const uint64_t bytes) {
    if (bytes == 0) return "0 B";

    size_t power = 0;
    long double scale = 1;
    while (power + 1 < UNITS.size() && static_cast<long double>(bytes) >= scale * 1024) {
        scale *= 1024;
        ++power;
    }

    return fmt::format("{:.1f} {}", static_cast<double>(static_cast<long double>(bytes) / scale), UNITS[power]);
}

std::string ferry::stats::formatBytes(const std::optional<uint64_t>& bytes) {
    if (!bytes) return "unknown size";
    return formatBytes(*bytes);
}

std::vector<std::string> ferry::stats::formatNoteLines(const TransferStats& stats,
                                                       const std::optional<DryRunSummary>& dryRunSummary,
                                                       const bool isDryRun) {
    uint64_t filesMoved = stats.files_transferred.value_or(0);
    std::optional<uint64_t> bytesMoved = stats.bytes_transferred;

    if (isDryRun && dryRunSummary) {
        filesMoved = dryRunSummary->files;
        bytesMoved = dryRunSummary->bytes;
    }

    std::vector<std::string> lines;
    lines.push_back(fmt::format("{} {} {} ({}).",
                                isDryRun ? "Would transfer" : "Transferred",
                                formatCount(filesMoved), plural(filesMoved), formatBytes(bytesMoved)));

    if (stats.files_examined) {
        auto total = fmt::format("Examined {} {}", formatCount(*stats.files_examined), plural(*stats.files_examined));
        if (stats.bytes_examined) total += fmt::format(" ({} total)", formatBytes(*stats.bytes_examined));
        total += '.';
        lines.push_back(std::move(total));
    } else if (stats.bytes_examined) {
        lines.push_back(fmt::format("Total dataset size: {}.", formatBytes(*stats.bytes_examined)));
    }

    return lines;
}
