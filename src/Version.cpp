#include "Version.hpp"

namespace Chronicle {

const char* eventName(VersionEvent event){
    switch(event){
        case VersionEvent::Insert: return "insert";
        case VersionEvent::Update: return "update";
        case VersionEvent::Delete: return "delete";
        case VersionEvent::SoftDelete: return "soft_delete";
    }
    return "insert";
}

bool parseEvent(const std::string &name, VersionEvent &out){
    if(name == "insert"){ out = VersionEvent::Insert; return true; }
    if(name == "update"){ out = VersionEvent::Update; return true; }
    if(name == "delete"){ out = VersionEvent::Delete; return true; }
    if(name == "soft_delete"){ out = VersionEvent::SoftDelete; return true; }
    return false;
}

nlohmann::json Version::toJSON() const {
    return nlohmann::json{
        {"id", id},
        {"event", eventName(event)},
        {"item_type", itemType},
        {"item_id", itemId},
        {"item_changes", itemChanges},
        {"originator_id", originatorId ? nlohmann::json(*originatorId) : nlohmann::json()},
        {"origin", origin ? nlohmann::json(*origin) : nlohmann::json()},
        {"meta", meta},
        {"inserted_at", insertedAt}
    };
}

Version Version::fromJSON(const nlohmann::json &j){
    Version v;
    v.id = j.value("id", int64_t(0));
    VersionEvent ev;
    if(parseEvent(j.value("event", std::string()), ev)) v.event = ev;
    v.itemType = j.value("item_type", std::string());
    if(j.contains("item_id") && j["item_id"].is_number_integer()) v.itemId = j["item_id"].get<int64_t>();
    if(j.contains("item_changes") && j["item_changes"].is_object()) v.itemChanges = j["item_changes"];
    if(j.contains("originator_id") && j["originator_id"].is_number_integer()) v.originatorId = j["originator_id"].get<int64_t>();
    if(j.contains("origin") && j["origin"].is_string()) v.origin = j["origin"].get<std::string>();
    if(j.contains("meta")) v.meta = j["meta"];
    v.insertedAt = j.value("inserted_at", std::string());
    return v;
}

bool Version::operator==(const Version &other) const {
    return id == other.id && event == other.event && itemType == other.itemType
        && itemId == other.itemId && itemChanges == other.itemChanges
        && originatorId == other.originatorId && origin == other.origin
        && meta == other.meta && insertedAt == other.insertedAt;
}

EntitySchema versionsSchema(const std::string &table){
    EntitySchema s;
    s.itemType = "Version";
    s.table = table;
    s.timestamps = false;
    s.columns = {
        {"event", ColumnType::Text, false, {}},
        {"item_type", ColumnType::Text, false, {}},
        {"item_id", ColumnType::Integer, true, {}},
        {"item_changes", ColumnType::Json, false, {}},
        {"originator_id", ColumnType::Integer, true, {}},
        {"origin", ColumnType::Text, true, {}},
        {"meta", ColumnType::Json, true, {}},
        {"inserted_at", ColumnType::Timestamp, false, {}}
    };
    return s;
}

} // namespace Chronicle
