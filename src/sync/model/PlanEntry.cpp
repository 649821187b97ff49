#include "sync/model/PlanEntry.hpp"

#include <numeric>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace ferry::sync::model;

std::string ferry::sync::model::to_string(const PlanEntry::Type type) {
    switch (type) {
    case PlanEntry::Type::File: return "file";
    case PlanEntry::Type::Directory: return "dir";
    default: throw std::invalid_argument("Unknown plan entry type");
    }
}

uint64_t ferry::sync::model::totalFiles(const std::vector<PlanEntry>& entries) {
    return std::accumulate(entries.begin(), entries.end(), uint64_t{0},
                           [](const uint64_t sum, const PlanEntry& e) { return sum + e.file_count.value_or(0); });
}

void ferry::sync::model::to_json(nlohmann::json& j, const PlanEntry& e) {
    j = {
        {"path", e.path},
        {"type", to_string(e.type)},
    };
    if (e.file_count) j["count"] = *e.file_count;
    else j["count"] = nullptr;
}

void ferry::sync::model::to_json(nlohmann::json& j, const std::vector<PlanEntry>& entries) {
    j = nlohmann::json::array();
    for (const auto& e : entries) j.push_back(e);
}
