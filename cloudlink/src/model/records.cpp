#include "model/records.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace cloudlink::model
{

    void to_json(json &out, const RollbackRecord &record)
    {
        out = json{
            {"source", record.source.string()},
            {"target", record.target.string()},
            {"source_existed", record.sourceExistedBefore},
            {"target_existed", record.targetExistedBefore},
            {"source_is_junction", record.sourceWasJunctionBefore},
            {"backup_created", record.backupCreated},
            {"junction_created", record.junctionCreated},
            {"timestamp", record.timestamp},
        };
        if (record.originalJunctionTarget.has_value())
        {
            out["original_junction_target"] = record.originalJunctionTarget->string();
        }
    }

    void from_json(const json &in, RollbackRecord &record)
    {
        record.source = fs::path(in.at("source").get<std::string>());
        record.target = fs::path(in.at("target").get<std::string>());
        record.sourceExistedBefore = in.at("source_existed").get<bool>();
        record.targetExistedBefore = in.at("target_existed").get<bool>();
        record.sourceWasJunctionBefore = in.at("source_is_junction").get<bool>();
        record.backupCreated = in.value("backup_created", false);
        record.junctionCreated = in.value("junction_created", false);
        record.timestamp = in.value("timestamp", std::string());

        record.originalJunctionTarget.reset();
        if (in.contains("original_junction_target") && in["original_junction_target"].is_string())
        {
            record.originalJunctionTarget = fs::path(in["original_junction_target"].get<std::string>());
        }
    }

    fs::path effectiveTarget(const fs::path &source, const fs::path &target, bool targetIsExistingDirectory)
    {
        if (!targetIsExistingDirectory)
        {
            return target;
        }

        fs::path name = source.filename();
        if (name.empty())
        {
            name = source.parent_path().filename();
        }
        return target / name;
    }

} // namespace cloudlink::model
