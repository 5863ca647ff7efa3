#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace cloudlink::model {

struct RelocationRequest {
    std::filesystem::path source;
    std::filesystem::path target;
};

// Write-ahead snapshot of one relocation attempt.
struct RollbackRecord {
    std::filesystem::path source;
    std::filesystem::path target;
    bool sourceExistedBefore = false;
    bool targetExistedBefore = false;
    bool sourceWasJunctionBefore = false;
    std::optional<std::filesystem::path> originalJunctionTarget;
    bool backupCreated = false;
    bool junctionCreated = false;
    std::string timestamp;
};

struct JunctionInfo {
    std::filesystem::path source;
    std::filesystem::path target;
    std::string created;
    bool targetExists = false;
};

void to_json(nlohmann::json &out, const RollbackRecord &record);
// Throws nlohmann::json::exception on missing or mistyped keys.
void from_json(const nlohmann::json &in, RollbackRecord &record);

// target/basename(source) when target is an existing directory, otherwise target itself.
std::filesystem::path effectiveTarget(
    const std::filesystem::path &source,
    const std::filesystem::path &target,
    bool targetIsExistingDirectory
);

} // namespace cloudlink::model
