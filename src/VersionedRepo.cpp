#include "VersionedRepo.hpp"
#include <plog/Log.h>

namespace Chronicle {

ChronicleError::ChronicleError(StepKey step, StepError error)
    : std::runtime_error("step " + step.toString() + " failed: " + describeStepError(error)),
      failedStep(std::move(step)), stepError(std::move(error)) {}

CommitResult VersionedRepo::insert(const Changeset &changeset, const Options &options){
    return multi().insert(changeset, options).commit(repo, options);
}

CommitResult VersionedRepo::update(const Changeset &changeset, const Options &options){
    return multi().update(changeset, options).commit(repo, options);
}

CommitResult VersionedRepo::remove(const Changeset &changeset, const Options &options){
    return multi().remove(changeset, options).commit(repo, options);
}

CommitResult VersionedRepo::remove(const EntitySchema &schema, const Record &entity, const Options &options){
    return multi().remove(schema, entity, options).commit(repo, options);
}

CommitResult VersionedRepo::softDelete(const EntitySchema &schema, const Record &entity, const Options &options){
    return multi().softDelete(schema, entity, options).commit(repo, options);
}

CommitResult VersionedRepo::insertAll(const EntitySchema &schema, const std::vector<Record> &entries, const Options &options){
    return multi().insertAll(schema, entries, options).commit(repo, options);
}

CommitResult VersionedRepo::updateAll(const Query &query, const Record &set, const Options &options){
    return multi().updateAll(query, set, options).commit(repo, options);
}

CommitResult VersionedRepo::softDeleteAll(const Query &query, const Options &options){
    return multi().softDeleteAll(query, options).commit(repo, options);
}

Record VersionedRepo::entityOrThrow(const CommitResult &result, const Options &options) const {
    if(!result){
        PLOGW << "VersionedRepo: " << result.failedStep().toString() << " failed";
        throw ChronicleError(result.failedStep(), result.error());
    }
    return result.changes().entity(StepKey(options.modelKey));
}

Record VersionedRepo::insertOrThrow(const Changeset &changeset, const Options &options){
    return entityOrThrow(insert(changeset, options), options);
}

Record VersionedRepo::updateOrThrow(const Changeset &changeset, const Options &options){
    return entityOrThrow(update(changeset, options), options);
}

Record VersionedRepo::removeOrThrow(const EntitySchema &schema, const Record &entity, const Options &options){
    return entityOrThrow(remove(schema, entity, options), options);
}

} // namespace Chronicle
