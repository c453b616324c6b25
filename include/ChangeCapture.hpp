#pragma once
#include <string>
#include <vector>
#include "Changeset.hpp"
#include "Config.hpp"
#include "Query.hpp"
#include "Version.hpp"

namespace Chronicle {

// SELECT producing one versions row per matching entity row, column order
// (event, item_type, item_id, item_changes, originator_id, origin, meta, inserted_at).
struct VersionProjection {
    std::string selectSQL;
    std::vector<BoundValue> params;
};

// Computes the payload of a Version for a mutation. Pure: no I/O.
//  - insert: full snapshot of the entity as persisted
//  - update: exactly the changeset's change map
//  - delete / soft_delete: full snapshot of the entity before removal
namespace ChangeCapture {

    // Normalizes a row to its persisted attributes (unknown keys dropped,
    // missing attributes set to null).
    Record serialize(const EntitySchema &schema, const Record &row);

    // Serializes only the given attributes (used for update diffs).
    Record serializeChanges(const EntitySchema &schema, const Record &changes);

    std::string itemType(const EntitySchema &schema);
    int64_t itemId(const EntitySchema &schema, const Record &row);

    // Version for a persisted (insert) or about-to-be-removed (delete,
    // soft_delete) entity row.
    Version capture(VersionEvent event, const EntitySchema &schema, const Record &entity, const Options &options);

    // Version for a changeset; update uses the change map, insert uses the
    // changeset with its changes applied, delete/soft_delete use its data.
    Version capture(VersionEvent event, const Changeset &changeset, const Options &options);

    // Projection turning every row matched by `query` into a version row.
    // update: item_changes = changes; soft_delete: current row patched with changes.
    bool makeVersionProjection(VersionEvent event, const Query &query, const Record &changes,
                               const Options &options, VersionProjection &out, std::string *outError = nullptr);

} // namespace ChangeCapture

} // namespace Chronicle
