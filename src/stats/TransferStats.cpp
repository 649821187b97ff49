#include "stats/TransferStats.hpp"

#include <nlohmann/json.hpp>

using namespace ferry::stats;

namespace {

bool notAbove(const std::optional<uint64_t>& part, const std::optional<uint64_t>& whole) {
    return !part || !whole || *part <= *whole;
}

nlohmann::json optionalToJson(const std::optional<uint64_t>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

}

bool TransferStats::hasAnyValues() const {
    return files_examined || files_transferred || bytes_examined || bytes_transferred;
}

bool TransferStats::consistent() const {
    return notAbove(files_transferred, files_examined) && notAbove(bytes_transferred, bytes_examined);
}

void ferry::stats::to_json(nlohmann::json& j, const TransferStats& s) {
    j = {
        {"files_examined", optionalToJson(s.files_examined)},
        {"files_transferred", optionalToJson(s.files_transferred)},
        {"bytes_examined", optionalToJson(s.bytes_examined)},
        {"bytes_transferred", optionalToJson(s.bytes_transferred)}
    };
}

void ferry::stats::to_json(nlohmann::json& j, const DryRunSummary& s) {
    j = {
        {"files", s.files},
        {"bytes", s.bytes},
        {"items_listed", s.items_listed}
    };
}
