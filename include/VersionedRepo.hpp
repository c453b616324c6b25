#pragma once
#include <string>
#include <vector>
#include <stdexcept>
#include "Multi.hpp"
#include "Repo.hpp"

namespace Chronicle {

// Thrown by the *OrThrow helpers when a commit fails.
class ChronicleError : public std::runtime_error {
public:
    ChronicleError(StepKey step, StepError error);

    const StepKey& step() const { return failedStep; }
    const StepError& error() const { return stepError; }

private:
    StepKey failedStep;
    StepError stepError;
};

// One-shot versioned operations: each call builds a Multi for a single
// operation and commits it against the repo.
class VersionedRepo {
public:
    VersionedRepo(Repo &repo, ChronicleConfig cfg) : repo(repo), cfg(std::move(cfg)) {}

    Repo& store() const { return repo; }
    const ChronicleConfig& config() const { return cfg; }
    bool strict() const { return cfg.strictMode; }

    // Empty plan in the configured mode, for composing several operations.
    Multi multi() const { return Multi(cfg); }

    CommitResult insert(const Changeset &changeset, const Options &options = {});
    CommitResult update(const Changeset &changeset, const Options &options = {});
    CommitResult remove(const Changeset &changeset, const Options &options = {});
    CommitResult remove(const EntitySchema &schema, const Record &entity, const Options &options = {});
    CommitResult softDelete(const EntitySchema &schema, const Record &entity, const Options &options = {});
    CommitResult insertAll(const EntitySchema &schema, const std::vector<Record> &entries, const Options &options = {});
    CommitResult updateAll(const Query &query, const Record &set, const Options &options = {});
    CommitResult softDeleteAll(const Query &query, const Options &options = {});

    // Return the persisted (or removed) entity, throw ChronicleError on failure.
    Record insertOrThrow(const Changeset &changeset, const Options &options = {});
    Record updateOrThrow(const Changeset &changeset, const Options &options = {});
    Record removeOrThrow(const EntitySchema &schema, const Record &entity, const Options &options = {});

private:
    Record entityOrThrow(const CommitResult &result, const Options &options) const;

    Repo &repo;
    ChronicleConfig cfg;
};

} // namespace Chronicle
