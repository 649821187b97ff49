#pragma once

#include <cstdint>
#include <optional>
#include <nlohmann/json_fwd.hpp>

namespace ferry::stats {

// Counters read from a transfer tool's --stats block. Each one is optional since
// older tool versions and partial output omit some of them.
struct TransferStats {
    std::optional<uint64_t> files_examined;
    std::optional<uint64_t> files_transferred;
    std::optional<uint64_t> bytes_examined;
    std::optional<uint64_t> bytes_transferred;

    [[nodiscard]] bool hasAnyValues() const;

    // transferred <= examined wherever both sides are known
    [[nodiscard]] bool consistent() const;
};

// Files whose content would be sent, derived from an itemized change list.
struct DryRunSummary {
    uint64_t files = 0;
    uint64_t bytes = 0;
    uint64_t items_listed = 0;  // every itemized line, including directories and attribute-only changes
};

void to_json(nlohmann::json& j, const TransferStats& s);
void to_json(nlohmann::json& j, const DryRunSummary& s);

}
