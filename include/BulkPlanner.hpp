#pragma once
#include <vector>
#include "Multi.hpp"

namespace Chronicle {

// Plans for operations that touch many rows at once. Non-strict only; Multi
// refuses them in strict mode before they get here.
namespace BulkPlanner {

    // Model step inserts every entry in one statement (EntityBatch with rows).
    // A merge step then records one insert version per returned row under
    // StepKey(versionKey, id). Rows without an id get no version.
    void planInsertAll(Multi &multi, const EntitySchema &schema, const std::vector<Record> &entries, const Options &options);

    // The version step projects every matching row into the ledger first,
    // then the model step applies `set` (EntityBatch with the row count).
    void planUpdateAll(Multi &multi, const Query &query, const Record &set, const Options &options);

    // updateAll with deleted_at = now; versions carry the full row as it is
    // being deleted. Throws std::invalid_argument without soft deletion.
    void planSoftDeleteAll(Multi &multi, const Query &query, const Options &options);

} // namespace BulkPlanner

} // namespace Chronicle
