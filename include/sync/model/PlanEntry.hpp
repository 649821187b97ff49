#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ferry::sync::model {

// One row of a dry-run preview.
struct PlanEntry {
    enum class Type { File, Directory };

    std::string path;
    Type type{Type::File};

    // Set for files (1) and collapsed directories; unset for a directory that is only
    // listed because some of its content is filtered out.
    std::optional<uint64_t> file_count;

    [[nodiscard]] bool collapsed() const { return type == Type::Directory && file_count.has_value(); }
};

std::string to_string(PlanEntry::Type type);

// Sum of all counted entries, i.e. the number of files the plan covers.
uint64_t totalFiles(const std::vector<PlanEntry>& entries);

void to_json(nlohmann::json& j, const PlanEntry& e);
void to_json(nlohmann::json& j, const std::vector<PlanEntry>& entries);

}
