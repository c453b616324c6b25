#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include "EntitySchema.hpp"

namespace Chronicle {

enum class VersionEvent { Insert, Update, Delete, SoftDelete };

const char* eventName(VersionEvent event);
bool parseEvent(const std::string &name, VersionEvent &out);

// One immutable entry of the ledger. Field set and names match the persisted row.
struct Version {
    int64_t id = 0;
    VersionEvent event = VersionEvent::Insert;
    std::string itemType;
    int64_t itemId = 0;
    Record itemChanges = Record::object();
    std::optional<int64_t> originatorId;
    std::optional<std::string> origin;
    nlohmann::json meta; // null when absent
    std::string insertedAt;

    nlohmann::json toJSON() const;
    static Version fromJSON(const nlohmann::json &j);

    bool operator==(const Version &other) const;
    bool operator!=(const Version &other) const { return !(*this == other); }
};

// Schema of the ledger table; `table` is the configured versions table name.
EntitySchema versionsSchema(const std::string &table);

} // namespace Chronicle
