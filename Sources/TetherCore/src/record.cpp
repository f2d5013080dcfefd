#include "tether/record.hpp"
#include "tether/log.hpp"
#include <nlohmann/json.hpp>

namespace tether {

using json = nlohmann::json;

std::string record::to_json() const {
    json j;
    j["id"] = id;
    j["name"] = name;
    j["owner_id"] = owner_id;
    j["created_at"] = format_timestamp(created_at);
    j["updated_at"] = format_timestamp(updated_at);
    j["deleted"] = deleted;
    return j.dump();
}

std::optional<record> record::from_json(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::exception& e) {
        LOG_WARN("record", "Malformed record JSON: %s", e.what());
        return std::nullopt;
    }
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
        return std::nullopt;
    }

    record r;
    r.id = j["id"].get<std::string>();
    if (r.id.empty()) return std::nullopt;

    if (j.contains("name") && j["name"].is_string()) {
        r.name = j["name"].get<std::string>();
    }
    if (j.contains("owner_id") && j["owner_id"].is_string()) {
        r.owner_id = j["owner_id"].get<std::string>();
    } else if (j.contains("user_id") && j["user_id"].is_string()) {
        r.owner_id = j["user_id"].get<std::string>();
    }
    if (j.contains("created_at") && j["created_at"].is_string()) {
        if (auto ts = parse_timestamp(j["created_at"].get<std::string>())) r.created_at = *ts;
    }
    if (j.contains("updated_at") && j["updated_at"].is_string()) {
        if (auto ts = parse_timestamp(j["updated_at"].get<std::string>())) r.updated_at = *ts;
    } else {
        r.updated_at = r.created_at;
    }
    if (j.contains("deleted") && j["deleted"].is_boolean()) {
        r.deleted = j["deleted"].get<bool>();
    }
    return r;
}

} // namespace tether
