#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <stdexcept>
#include "Changeset.hpp"
#include "Config.hpp"
#include "Query.hpp"
#include "MultiResult.hpp"

namespace Chronicle {

class Repo;

// Raised while composing an operation that has no implementation in the
// selected mode (strict mode bulk operations).
class NotImplementedError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// What one step hands back to the transaction runner.
struct StepOutcome {
    bool ok = true;
    StepValue value;
    std::optional<StepError> error;

    static StepOutcome success(StepValue v){ StepOutcome o; o.value = std::move(v); return o; }
    static StepOutcome failure(StepError e){ StepOutcome o; o.ok = false; o.error = std::move(e); return o; }
};

class Multi;

// A step sees the repo and every result produced before it.
using StepFn = std::function<StepOutcome(Repo&, const MultiResult&)>;
// Computes more steps from earlier results; they run in the same transaction.
using MergeFn = std::function<Multi(const MultiResult&)>;

struct Step {
    StepKey key;
    StepFn run;
    MergeFn merge;                     // set for merge steps, run is empty then
    std::optional<Changeset> precheck; // validated before the transaction begins
    bool internal = false;             // bookkeeping, stripped from commit() results
};

// Ordered plan of named steps executed atomically. Built with the operation
// helpers (insert, update, ...) or raw run/merge/error steps, then executed
// with transaction() or commit().
class Multi {
public:
    explicit Multi(bool strictMode = false);
    explicit Multi(const ChronicleConfig &cfg);

    bool strict() const { return strictMode; }

    // Single-entity operations. Each adds a model step (Options::modelKey) and
    // a version step (Options::versionKey); strict mode adds the internal
    // "initial_version" step in front of inserts and updates.
    Multi& insert(const Changeset &changeset, const Options &options = {});
    Multi& update(const Changeset &changeset, const Options &options = {});
    Multi& remove(const Changeset &changeset, const Options &options = {});
    Multi& remove(const EntitySchema &schema, const Record &entity, const Options &options = {});
    // Requires a schema with softDelete; throws std::invalid_argument otherwise.
    Multi& softDelete(const Changeset &changeset, const Options &options = {});
    Multi& softDelete(const EntitySchema &schema, const Record &entity, const Options &options = {});

    // Bulk operations. Throw NotImplementedError in strict mode.
    Multi& insertAll(const EntitySchema &schema, const std::vector<Record> &entries, const Options &options = {});
    Multi& updateAll(const Query &query, const Record &set, const Options &options = {});
    Multi& softDeleteAll(const Query &query, const Options &options = {});

    Multi& run(const StepKey &key, StepFn fn);
    Multi& merge(MergeFn fn);
    Multi& error(const StepKey &key, StepError value);
    Multi& append(const Multi &other);
    Multi& prepend(const Multi &other);

    // Adds a prebuilt step. Throws std::invalid_argument on a duplicate key.
    Multi& addStep(Step step);

    std::vector<StepKey> toList() const;
    const std::vector<Step>& steps() const { return stepList; }
    std::vector<StepKey> internalKeys() const;

    // Runs every step inside one transaction (BEGIN IMMEDIATE in strict mode).
    // Invalid prechecks fail before the transaction starts.
    TransactionOutcome transaction(Repo &repo) const;
    // transaction() followed by result shaping.
    CommitResult commit(Repo &repo, const Options &options = {}) const;

private:
    bool hasKey(const StepKey &key) const;

    bool strictMode = false;
    std::vector<Step> stepList;
    int mergeCount = 0;
};

} // namespace Chronicle
