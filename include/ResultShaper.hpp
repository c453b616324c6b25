#pragma once
#include <vector>
#include "MultiResult.hpp"
#include "Config.hpp"

namespace Chronicle {

// Turns a raw transaction outcome into what commit() callers see.
namespace ResultShaper {

    // Success: internal steps are removed; with options.returnOperation the
    // named step's value is also exposed through CommitResult::selected()
    // (std::invalid_argument when no such step ran).
    // Failure: failed step, its error and the partial results. In strict mode
    // the version link fields are dropped from a changeset error.
    CommitResult shape(TransactionOutcome outcome, const Options &options, bool strict,
                       const std::vector<StepKey> &internalKeys);

} // namespace ResultShaper

} // namespace Chronicle
