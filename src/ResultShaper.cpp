#include "ResultShaper.hpp"
#include "EntitySchema.hpp"

namespace Chronicle {
namespace ResultShaper {

CommitResult shape(TransactionOutcome outcome, const Options &options, bool strict,
                   const std::vector<StepKey> &internalKeys){
    for(const auto &k : internalKeys) outcome.changes.erase(k);

    if(!outcome.ok){
        StepError error = outcome.error ? std::move(*outcome.error) : StepError(PersistenceError{"transaction failed"});
        if(strict){
            if(auto cs = std::get_if<Changeset>(&error)) cs->dropChanges({kFirstVersionColumn, kCurrentVersionColumn});
        }
        StepKey failed = outcome.failedStep ? *outcome.failedStep : StepKey("transaction");
        return CommitResult::failure(std::move(failed), std::move(error), std::move(outcome.changes));
    }

    if(!options.returnOperation) return CommitResult::success(std::move(outcome.changes));

    const StepKey selectedKey(*options.returnOperation);
    if(!outcome.changes.contains(selectedKey))
        throw std::invalid_argument("returnOperation names no step: " + *options.returnOperation);
    StepValue selected = outcome.changes.at(selectedKey);
    return CommitResult::success(std::move(outcome.changes), std::move(selected));
}

} // namespace ResultShaper
} // namespace Chronicle
