#include "VersionQueries.hpp"
#include <plog/Log.h>

namespace Chronicle {
namespace VersionQueries {

namespace {

bool itemVersions(Repo &repo, const EntitySchema &schema, int64_t itemId, const char *order,
                  std::vector<Version> &out, std::string *outError){
    std::vector<BoundValue> params;
    params.push_back(BoundValue{Column{"item_type", ColumnType::Text, false, {}}, schema.itemType});
    params.push_back(BoundValue{Column{"item_id", ColumnType::Integer, false, {}}, itemId});
    return repo.selectVersions(" WHERE item_type = ? AND item_id = ?", params, std::string("id ") + order, out, outError);
}

int64_t linkValue(const Record &row, const char *column){
    auto it = row.find(column);
    if(it == row.end() || !it->is_number_integer()) return -1;
    return it->get<int64_t>();
}

} // namespace

bool getVersions(Repo &repo, const EntitySchema &schema, int64_t itemId, std::vector<Version> &out, std::string *outError){
    return itemVersions(repo, schema, itemId, "DESC", out, outError);
}

bool getVersion(Repo &repo, const EntitySchema &schema, int64_t itemId, std::optional<Version> &out, std::string *outError){
    std::vector<Version> all;
    if(!getVersions(repo, schema, itemId, all, outError)) return false;
    out.reset();
    if(!all.empty()) out = all.front();
    return true;
}

bool getVersionById(Repo &repo, int64_t versionId, std::optional<Version> &out, std::string *outError){
    std::vector<BoundValue> params;
    params.push_back(BoundValue{Column{"id", ColumnType::Integer, false, {}}, versionId});
    std::vector<Version> rows;
    if(!repo.selectVersions(" WHERE id = ?", params, std::string(), rows, outError)) return false;
    out.reset();
    if(!rows.empty()) out = rows.front();
    return true;
}

bool chain(Repo &repo, const EntitySchema &schema, int64_t itemId, std::vector<Version> &out, std::string *outError){
    return itemVersions(repo, schema, itemId, "ASC", out, outError);
}

bool verifyChain(Repo &repo, const EntitySchema &schema, int64_t itemId, std::string *outError){
    if(!schema.versionLinks){
        if(outError) *outError = schema.itemType + " has no version link columns";
        return false;
    }
    Record entity;
    if(!repo.get(schema, itemId, entity, outError)) return false;
    std::vector<Version> versions;
    if(!chain(repo, schema, itemId, versions, outError)) return false;
    if(versions.empty()){
        if(outError) *outError = schema.itemType + " " + std::to_string(itemId) + " has no versions";
        return false;
    }
    const int64_t first = linkValue(entity, kFirstVersionColumn);
    const int64_t current = linkValue(entity, kCurrentVersionColumn);
    if(first != versions.front().id){
        if(outError) *outError = "first_version_id " + std::to_string(first) + " is not the oldest version " + std::to_string(versions.front().id);
        return false;
    }
    if(current != versions.back().id){
        if(outError) *outError = "current_version_id " + std::to_string(current) + " is not the newest version " + std::to_string(versions.back().id);
        return false;
    }
    PLOGD << "VersionQueries: chain of " << schema.itemType << " " << itemId << " verified (" << versions.size() << " versions)";
    return true;
}

} // namespace VersionQueries
} // namespace Chronicle
