#include "ChangeCapture.hpp"
#include <sstream>

namespace Chronicle {
namespace ChangeCapture {

Record serialize(const EntitySchema &schema, const Record &row){
    Record out = Record::object();
    for(const auto &c : schema.allColumns()){
        auto it = row.find(c.name);
        out[c.name] = it != row.end() ? *it : nlohmann::json();
    }
    return out;
}

Record serializeChanges(const EntitySchema &schema, const Record &changes){
    Record out = Record::object();
    if(!changes.is_object()) return out;
    for(auto it = changes.begin(); it != changes.end(); ++it){
        if(schema.hasColumn(it.key())) out[it.key()] = it.value();
    }
    return out;
}

std::string itemType(const EntitySchema &schema){ return schema.itemType; }

int64_t itemId(const EntitySchema &schema, const Record &row){ return schema.idOf(row); }

static Version baseVersion(VersionEvent event, const EntitySchema &schema, const Options &options){
    Version v;
    v.event = event;
    v.itemType = itemType(schema);
    v.originatorId = options.originatorId;
    v.origin = options.origin;
    v.meta = options.meta;
    return v;
}

Version capture(VersionEvent event, const EntitySchema &schema, const Record &entity, const Options &options){
    Version v = baseVersion(event, schema, options);
    v.itemId = itemId(schema, entity);
    switch(event){
        case VersionEvent::Update:
            v.itemChanges = serializeChanges(schema, entity);
            break;
        case VersionEvent::Insert:
        case VersionEvent::Delete:
        case VersionEvent::SoftDelete:
            v.itemChanges = serialize(schema, entity);
            break;
    }
    return v;
}

Version capture(VersionEvent event, const Changeset &changeset, const Options &options){
    const EntitySchema &schema = changeset.schema();
    Version v = baseVersion(event, schema, options);
    switch(event){
        case VersionEvent::Insert: {
            Record after = changeset.applyChanges();
            v.itemId = itemId(schema, after);
            v.itemChanges = serialize(schema, after);
            break;
        }
        case VersionEvent::Update:
            v.itemId = itemId(schema, changeset.data());
            v.itemChanges = serializeChanges(schema, changeset.changes());
            break;
        case VersionEvent::Delete:
        case VersionEvent::SoftDelete:
            v.itemId = itemId(schema, changeset.data());
            v.itemChanges = serialize(schema, changeset.data());
            break;
    }
    return v;
}

bool makeVersionProjection(VersionEvent event, const Query &query, const Record &changes,
                           const Options &options, VersionProjection &out, std::string *outError){
    const EntitySchema &schema = query.schema();
    std::string itemChangesSQL;
    switch(event){
        case VersionEvent::Update:
            itemChangesSQL = "json(?)";
            break;
        case VersionEvent::SoftDelete:
            itemChangesSQL = "json_patch(" + schema.jsonObjectSQL() + ", ?)";
            break;
        default:
            if(outError) *outError = std::string("no bulk projection for ") + eventName(event) + " events";
            return false;
    }
    std::string where;
    std::vector<BoundValue> whereParams;
    if(!query.compile(where, whereParams, outError)) return false;

    const Record serialized = serializeChanges(schema, changes);
    std::ostringstream ss;
    ss << "SELECT ?, ?, " << quoteIdent(schema.table) << "." << quoteIdent(schema.primaryKey) << ", "
       << itemChangesSQL << ", ?, ?, ?, ? FROM " << quoteIdent(schema.table) << where
       << " ORDER BY " << quoteIdent(schema.table) << "." << quoteIdent(schema.primaryKey);

    out.selectSQL = ss.str();
    out.params.clear();
    out.params.push_back(BoundValue{Column{"event", ColumnType::Text, false, {}}, eventName(event)});
    out.params.push_back(BoundValue{Column{"item_type", ColumnType::Text, false, {}}, itemType(schema)});
    out.params.push_back(BoundValue{Column{"item_changes", ColumnType::Json, false, {}}, serialized});
    out.params.push_back(BoundValue{Column{"originator_id", ColumnType::Integer, true, {}},
                                    options.originatorId ? nlohmann::json(*options.originatorId) : nlohmann::json()});
    out.params.push_back(BoundValue{Column{"origin", ColumnType::Text, true, {}},
                                    options.origin ? nlohmann::json(*options.origin) : nlohmann::json()});
    out.params.push_back(BoundValue{Column{"meta", ColumnType::Json, true, {}}, options.meta});
    out.params.push_back(BoundValue{Column{"inserted_at", ColumnType::Timestamp, false, {}}, utcTimestamp()});
    for(auto &p : whereParams) out.params.push_back(std::move(p));
    return true;
}

} // namespace ChangeCapture
} // namespace Chronicle
