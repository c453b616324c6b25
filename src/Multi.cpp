#include "Multi.hpp"
#include "Repo.hpp"
#include "ChangeCapture.hpp"
#include "SequenceLinker.hpp"
#include "BulkPlanner.hpp"
#include "ResultShaper.hpp"
#include <plog/Log.h>

namespace Chronicle {

namespace {

StepOutcome persistenceFailure(const std::string &err){
    return StepOutcome::failure(PersistenceError{err});
}

StepOutcome storeVersion(Repo &repo, Version v){
    std::string err;
    if(!repo.insertVersion(v, false, &err)) return persistenceFailure(err);
    return StepOutcome::success(v);
}

void requireVersionLinks(const EntitySchema &schema){
    if(!schema.versionLinks)
        throw std::invalid_argument("strict mode needs version link columns on " + schema.table);
}

// Runs steps in order against the repo, recursing into merge steps.
class StepRunner {
public:
    StepRunner(Repo &repo, TransactionOutcome &outcome) : repo(repo), outcome(outcome) {}

    bool checkPrechecks(const std::vector<Step> &steps){
        for(const auto &s : steps){
            if(s.precheck && !s.precheck->isValid()){
                PLOGW << "Multi: step " << s.key.toString() << " rejected: " << describeStepError(*s.precheck);
                outcome.failedStep = s.key;
                outcome.error = StepError(*s.precheck);
                return false;
            }
        }
        return true;
    }

    bool runSteps(const std::vector<Step> &steps){
        for(const auto &s : steps){
            if(s.merge){
                Multi more = s.merge(outcome.changes);
                if(!checkPrechecks(more.steps())) return false;
                if(!runSteps(more.steps())) return false;
                continue;
            }
            if(outcome.changes.contains(s.key)){
                outcome.failedStep = s.key;
                outcome.error = StepError(PersistenceError{"duplicate step key " + s.key.toString()});
                return false;
            }
            PLOGD << "Multi: running step " << s.key.toString();
            StepOutcome r;
            try {
                r = s.run(repo, outcome.changes);
            } catch(const nlohmann::json::type_error &e){
                // values that cannot be encoded (invalid UTF-8) fail the step
                r = persistenceFailure(e.what());
            }
            if(!r.ok){
                outcome.failedStep = s.key;
                outcome.error = r.error ? std::move(*r.error) : StepError(PersistenceError{"step failed"});
                PLOGW << "Multi: step " << s.key.toString() << " failed: " << describeStepError(*outcome.error);
                return false;
            }
            outcome.changes.put(s.key, std::move(r.value));
        }
        return true;
    }

private:
    Repo &repo;
    TransactionOutcome &outcome;
};

} // namespace

Multi::Multi(bool strictMode) : strictMode(strictMode) {}

Multi::Multi(const ChronicleConfig &cfg) : strictMode(cfg.strictMode) {}

bool Multi::hasKey(const StepKey &key) const {
    for(const auto &s : stepList) if(s.key == key) return true;
    return false;
}

Multi& Multi::addStep(Step step){
    if(step.merge){
        step.key = StepKey("__merge", ++mergeCount);
    } else if(hasKey(step.key)){
        throw std::invalid_argument("duplicate step key " + step.key.toString());
    }
    stepList.push_back(std::move(step));
    return *this;
}

Multi& Multi::run(const StepKey &key, StepFn fn){
    Step s;
    s.key = key;
    s.run = std::move(fn);
    return addStep(std::move(s));
}

Multi& Multi::merge(MergeFn fn){
    Step s;
    s.merge = std::move(fn);
    return addStep(std::move(s));
}

Multi& Multi::error(const StepKey &key, StepError value){
    return run(key, [value](Repo&, const MultiResult&){ return StepOutcome::failure(value); });
}

Multi& Multi::append(const Multi &other){
    for(const auto &s : other.stepList) addStep(s);
    return *this;
}

Multi& Multi::prepend(const Multi &other){
    std::vector<Step> mine = std::move(stepList);
    stepList.clear();
    mergeCount = 0;
    for(const auto &s : other.stepList) addStep(s);
    for(auto &s : mine) addStep(std::move(s));
    return *this;
}

std::vector<StepKey> Multi::toList() const {
    std::vector<StepKey> out;
    out.reserve(stepList.size());
    for(const auto &s : stepList) out.push_back(s.key);
    return out;
}

std::vector<StepKey> Multi::internalKeys() const {
    std::vector<StepKey> out;
    for(const auto &s : stepList) if(s.internal) out.push_back(s.key);
    return out;
}

Multi& Multi::insert(const Changeset &changeset, const Options &options){
    const StepKey modelKey(options.modelKey);
    const StepKey versionKey(options.versionKey);

    if(strictMode){
        requireVersionLinks(changeset.schema());
        const StepKey initialKey(SequenceLinker::kInitialVersionKey);

        Step placeholder;
        placeholder.key = initialKey;
        placeholder.internal = true;
        placeholder.run = [changeset, options](Repo &repo, const MultiResult&){
            std::string err;
            Version v;
            if(!SequenceLinker(repo, options).insertPlaceholder(VersionEvent::Insert, changeset, v, &err)) return persistenceFailure(err);
            return StepOutcome::success(v);
        };
        addStep(std::move(placeholder));

        Step model;
        model.key = modelKey;
        model.precheck = changeset;
        model.run = [changeset, options, initialKey](Repo &repo, const MultiResult &results){
            std::string err;
            Record row;
            const Version &v = results.get<Version>(initialKey);
            if(!SequenceLinker(repo, options).linkEntity(VersionEvent::Insert, changeset, v, row, &err)) return persistenceFailure(err);
            return StepOutcome::success(row);
        };
        addStep(std::move(model));

        return run(versionKey, [changeset, options, initialKey, modelKey](Repo &repo, const MultiResult &results){
            std::string err;
            Version v;
            if(!SequenceLinker(repo, options).finalize(VersionEvent::Insert, changeset, results.get<Version>(initialKey),
                                                      results.entity(modelKey), v, &err)) return persistenceFailure(err);
            return StepOutcome::success(v);
        });
    }

    Step model;
    model.key = modelKey;
    model.precheck = changeset;
    model.run = [changeset](Repo &repo, const MultiResult&){
        std::string err;
        Record row;
        if(!repo.insert(changeset.schema(), changeset.applyChanges(), row, &err)) return persistenceFailure(err);
        return StepOutcome::success(row);
    };
    addStep(std::move(model));

    const EntitySchema *schema = &changeset.schema();
    return run(versionKey, [schema, options, modelKey](Repo &repo, const MultiResult &results){
        return storeVersion(repo, ChangeCapture::capture(VersionEvent::Insert, *schema, results.entity(modelKey), options));
    });
}

Multi& Multi::update(const Changeset &changeset, const Options &options){
    const StepKey modelKey(options.modelKey);
    const StepKey versionKey(options.versionKey);

    if(strictMode && changeset.hasChanges()){
        requireVersionLinks(changeset.schema());
        const StepKey initialKey(SequenceLinker::kInitialVersionKey);

        Step placeholder;
        placeholder.key = initialKey;
        placeholder.internal = true;
        placeholder.run = [changeset, options](Repo &repo, const MultiResult&){
            std::string err;
            Version v;
            if(!SequenceLinker(repo, options).insertPlaceholder(VersionEvent::Update, changeset, v, &err)) return persistenceFailure(err);
            return StepOutcome::success(v);
        };
        addStep(std::move(placeholder));

        Step model;
        model.key = modelKey;
        model.precheck = changeset;
        model.run = [changeset, options, initialKey](Repo &repo, const MultiResult &results){
            std::string err;
            Record row;
            const Version &v = results.get<Version>(initialKey);
            if(!SequenceLinker(repo, options).linkEntity(VersionEvent::Update, changeset, v, row, &err)) return persistenceFailure(err);
            return StepOutcome::success(row);
        };
        addStep(std::move(model));

        return run(versionKey, [changeset, options, initialKey, modelKey](Repo &repo, const MultiResult &results){
            std::string err;
            Version v;
            if(!SequenceLinker(repo, options).finalize(VersionEvent::Update, changeset, results.get<Version>(initialKey),
                                                      results.entity(modelKey), v, &err)) return persistenceFailure(err);
            return StepOutcome::success(v);
        });
    }

    Step model;
    model.key = modelKey;
    model.precheck = changeset;
    model.run = [changeset](Repo &repo, const MultiResult&){
        if(!changeset.hasChanges()) return StepOutcome::success(changeset.data());
        std::string err;
        Record row;
        const EntitySchema &schema = changeset.schema();
        if(!repo.update(schema, schema.idOf(changeset.data()), changeset.changes(), row, &err)) return persistenceFailure(err);
        return StepOutcome::success(row);
    };
    addStep(std::move(model));

    // no diff, no version
    return run(versionKey, [changeset, options](Repo &repo, const MultiResult&){
        if(!changeset.hasChanges()) return StepOutcome::success(std::monostate{});
        return storeVersion(repo, ChangeCapture::capture(VersionEvent::Update, changeset, options));
    });
}

Multi& Multi::remove(const Changeset &changeset, const Options &options){
    Step model;
    model.key = StepKey(options.modelKey);
    model.precheck = changeset;
    model.run = [changeset](Repo &repo, const MultiResult&){
        std::string err;
        const EntitySchema &schema = changeset.schema();
        if(!repo.remove(schema, schema.idOf(changeset.data()), &err)) return persistenceFailure(err);
        return StepOutcome::success(changeset.data());
    };
    addStep(std::move(model));

    return run(StepKey(options.versionKey), [changeset, options](Repo &repo, const MultiResult&){
        return storeVersion(repo, ChangeCapture::capture(VersionEvent::Delete, changeset, options));
    });
}

Multi& Multi::remove(const EntitySchema &schema, const Record &entity, const Options &options){
    return remove(Changeset::forEntity(schema, entity), options);
}

Multi& Multi::softDelete(const Changeset &changeset, const Options &options){
    const EntitySchema &schema = changeset.schema();
    if(!schema.softDelete)
        throw std::invalid_argument(schema.itemType + " does not support soft deletion");

    if(strictMode && schema.versionLinks){
        const StepKey modelKey(options.modelKey);
        const StepKey initialKey(SequenceLinker::kInitialVersionKey);

        Step placeholder;
        placeholder.key = initialKey;
        placeholder.internal = true;
        placeholder.run = [changeset, options](Repo &repo, const MultiResult&){
            std::string err;
            Version v;
            if(!SequenceLinker(repo, options).insertPlaceholder(VersionEvent::SoftDelete, changeset, v, &err)) return persistenceFailure(err);
            return StepOutcome::success(v);
        };
        addStep(std::move(placeholder));

        Step model;
        model.key = modelKey;
        model.precheck = changeset;
        model.run = [changeset, options, initialKey](Repo &repo, const MultiResult &results){
            std::string err;
            Record row;
            const Version &v = results.get<Version>(initialKey);
            if(!SequenceLinker(repo, options).linkEntity(VersionEvent::SoftDelete, changeset, v, row, &err)) return persistenceFailure(err);
            return StepOutcome::success(row);
        };
        addStep(std::move(model));

        return run(StepKey(options.versionKey), [changeset, options, initialKey, modelKey](Repo &repo, const MultiResult &results){
            std::string err;
            Version v;
            if(!SequenceLinker(repo, options).finalize(VersionEvent::SoftDelete, changeset, results.get<Version>(initialKey),
                                                      results.entity(modelKey), v, &err)) return persistenceFailure(err);
            return StepOutcome::success(v);
        });
    }

    Step model;
    model.key = StepKey(options.modelKey);
    model.precheck = changeset;
    model.run = [changeset](Repo &repo, const MultiResult&){
        std::string err;
        Record row;
        const EntitySchema &s = changeset.schema();
        const Record marks = {{kDeletedAtColumn, utcTimestamp()}};
        if(!repo.update(s, s.idOf(changeset.data()), marks, row, &err)) return persistenceFailure(err);
        return StepOutcome::success(row);
    };
    addStep(std::move(model));

    return run(StepKey(options.versionKey), [changeset, options](Repo &repo, const MultiResult&){
        return storeVersion(repo, ChangeCapture::capture(VersionEvent::SoftDelete, changeset, options));
    });
}

Multi& Multi::softDelete(const EntitySchema &schema, const Record &entity, const Options &options){
    return softDelete(Changeset::forEntity(schema, entity), options);
}

Multi& Multi::insertAll(const EntitySchema &schema, const std::vector<Record> &entries, const Options &options){
    if(strictMode) throw NotImplementedError("strict mode is not implemented for insertAll");
    BulkPlanner::planInsertAll(*this, schema, entries, options);
    return *this;
}

Multi& Multi::updateAll(const Query &query, const Record &set, const Options &options){
    if(strictMode) throw NotImplementedError("strict mode is not implemented for updateAll");
    BulkPlanner::planUpdateAll(*this, query, set, options);
    return *this;
}

Multi& Multi::softDeleteAll(const Query &query, const Options &options){
    if(strictMode) throw NotImplementedError("strict mode is not implemented for softDeleteAll");
    BulkPlanner::planSoftDeleteAll(*this, query, options);
    return *this;
}

TransactionOutcome Multi::transaction(Repo &repo) const {
    TransactionOutcome outcome;
    StepRunner runner(repo, outcome);
    if(!runner.checkPrechecks(stepList)) return outcome;

    const TransactionMode mode = strictMode ? TransactionMode::Immediate : TransactionMode::Deferred;
    std::string err;
    bool ok = repo.runInTransaction(mode, [&runner, this](std::string*){
        return runner.runSteps(stepList);
    }, &err);

    if(ok){
        outcome.ok = true;
        return outcome;
    }
    if(!outcome.failedStep){
        // begin or commit failed, no step to blame
        outcome.failedStep = StepKey("transaction");
        outcome.error = StepError(PersistenceError{err});
    }
    return outcome;
}

CommitResult Multi::commit(Repo &repo, const Options &options) const {
    return ResultShaper::shape(transaction(repo), options, strictMode, internalKeys());
}

} // namespace Chronicle
