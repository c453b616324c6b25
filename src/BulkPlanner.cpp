#include "BulkPlanner.hpp"
#include "Repo.hpp"
#include "ChangeCapture.hpp"
#include <plog/Log.h>

namespace Chronicle {
namespace BulkPlanner {

namespace {

bool returnsVersions(const Options &options){
    return options.returning && options.returnOperation && *options.returnOperation == options.versionKey;
}

// Version step: INSERT ... SELECT over the rows the model step is about to change.
void addProjectedVersions(Multi &multi, VersionEvent event, const Query &query, const Record &changes, const Options &options){
    multi.run(StepKey(options.versionKey), [event, query, changes, options](Repo &repo, const MultiResult&){
        std::string err;
        VersionProjection projection;
        if(!ChangeCapture::makeVersionProjection(event, query, changes, options, projection, &err))
            return StepOutcome::failure(PersistenceError{err});
        const bool returning = returnsVersions(options);
        VersionBatch batch;
        std::vector<Version> rows;
        if(!repo.insertVersionsFrom(projection, returning, batch.count, returning ? &rows : nullptr, &err))
            return StepOutcome::failure(PersistenceError{err});
        if(returning) batch.versions = std::move(rows);
        PLOGD << "BulkPlanner: " << batch.count << " " << eventName(event) << " versions for " << query.schema().itemType;
        return StepOutcome::success(batch);
    });
}

void addBulkUpdate(Multi &multi, const Query &query, const Record &set, const Options &options){
    multi.run(StepKey(options.modelKey), [query, set](Repo &repo, const MultiResult&){
        std::string err;
        EntityBatch batch;
        if(!repo.updateAll(query, set, batch.count, &err)) return StepOutcome::failure(PersistenceError{err});
        return StepOutcome::success(batch);
    });
}

} // namespace

void planInsertAll(Multi &multi, const EntitySchema &schema, const std::vector<Record> &entries, const Options &options){
    const StepKey modelKey(options.modelKey);
    const EntitySchema *s = &schema;

    multi.run(modelKey, [s, entries](Repo &repo, const MultiResult&){
        std::string err;
        std::vector<Record> rows;
        if(!repo.insertAll(*s, entries, rows, &err)) return StepOutcome::failure(PersistenceError{err});
        EntityBatch batch;
        batch.count = static_cast<int64_t>(rows.size());
        batch.rows = std::move(rows);
        return StepOutcome::success(batch);
    });

    multi.merge([s, options, modelKey](const MultiResult &results){
        Multi versions;
        const EntityBatch &batch = results.get<EntityBatch>(modelKey);
        if(!batch.rows) return versions;
        for(const auto &row : *batch.rows){
            const int64_t id = s->idOf(row);
            if(id < 0) continue;
            Version v = ChangeCapture::capture(VersionEvent::Insert, *s, row, options);
            versions.run(StepKey(options.versionKey, id), [v](Repo &repo, const MultiResult&) mutable {
                std::string err;
                if(!repo.insertVersion(v, false, &err)) return StepOutcome::failure(PersistenceError{err});
                return StepOutcome::success(v);
            });
        }
        return versions;
    });
}

void planUpdateAll(Multi &multi, const Query &query, const Record &set, const Options &options){
    addProjectedVersions(multi, VersionEvent::Update, query, set, options);
    addBulkUpdate(multi, query, set, options);
}

void planSoftDeleteAll(Multi &multi, const Query &query, const Options &options){
    const EntitySchema &schema = query.schema();
    if(!schema.softDelete)
        throw std::invalid_argument(schema.itemType + " does not support soft deletion");
    const Record marks = {{kDeletedAtColumn, utcTimestamp()}};
    addProjectedVersions(multi, VersionEvent::SoftDelete, query, marks, options);
    addBulkUpdate(multi, query, marks, options);
}

} // namespace BulkPlanner
} // namespace Chronicle
