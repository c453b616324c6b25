#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>
#include <stdexcept>
#include <cstdint>
#include "Changeset.hpp"
#include "Version.hpp"

namespace Chronicle {

// Name of one step of a Multi. Bulk inserts key each row's version by
// (version key, item id) so rows never collide.
struct StepKey {
    std::string name;
    std::optional<int64_t> itemId;

    StepKey() = default;
    StepKey(const char* n) : name(n) {}
    StepKey(std::string n) : name(std::move(n)) {}
    StepKey(std::string n, int64_t id) : name(std::move(n)), itemId(id) {}

    std::string toString() const;

    bool operator<(const StepKey &o) const { return name != o.name ? name < o.name : itemId < o.itemId; }
    bool operator==(const StepKey &o) const { return name == o.name && itemId == o.itemId; }
    bool operator!=(const StepKey &o) const { return !(*this == o); }
};

// Result of a batch entity operation (insertAll, updateAll, softDeleteAll).
struct EntityBatch {
    int64_t count = 0;
    std::optional<std::vector<Record>> rows;
};

// Result of a batch version insert; versions are present when returning was requested.
struct VersionBatch {
    int64_t count = 0;
    std::optional<std::vector<Version>> versions;
};

// std::monostate marks a step that deliberately produced nothing (an update
// without changes has no version).
using StepValue = std::variant<std::monostate, Record, Version, EntityBatch, VersionBatch>;

struct PersistenceError {
    std::string message;
    bool operator==(const PersistenceError &o) const { return message == o.message; }
};

// What a failing step reports: an invalid changeset, a storage failure, or a
// caller-supplied value (Multi::error, custom run steps).
using StepError = std::variant<Changeset, PersistenceError, nlohmann::json>;

std::string describeStepError(const StepError &error);

// Step results keyed by step name, in key order.
class MultiResult {
public:
    bool contains(const StepKey &key) const { return values.find(key) != values.end(); }
    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
    std::vector<StepKey> keys() const;

    void put(const StepKey &key, StepValue value) { values[key] = std::move(value); }
    void erase(const StepKey &key) { values.erase(key); }

    // Throws std::out_of_range for a missing key.
    const StepValue& at(const StepKey &key) const;

    // Typed access. get<T> throws std::out_of_range for a missing key and
    // std::bad_variant_access for the wrong type; find<T> returns nullptr instead.
    template <typename T>
    const T& get(const StepKey &key) const { return std::get<T>(at(key)); }

    template <typename T>
    const T* find(const StepKey &key) const {
        auto it = values.find(key);
        if(it == values.end()) return nullptr;
        return std::get_if<T>(&it->second);
    }

    const Record& entity(const StepKey &key) const { return get<Record>(key); }
    // nullptr when the step produced no version.
    const Version* version(const StepKey &key) const { return find<Version>(key); }

    const std::map<StepKey, StepValue>& all() const { return values; }

private:
    std::map<StepKey, StepValue> values;
};

// Raw outcome of running a Multi inside a transaction.
struct TransactionOutcome {
    bool ok = false;
    MultiResult changes;          // every step on success, steps before the failure otherwise
    std::optional<StepKey> failedStep;
    std::optional<StepError> error;
};

// Shaped outcome handed back to callers of commit().
class CommitResult {
public:
    static CommitResult success(MultiResult changes, std::optional<StepValue> selected = std::nullopt);
    static CommitResult failure(StepKey failedStep, StepError error, MultiResult partial);

    bool ok() const { return succeeded; }
    explicit operator bool() const { return succeeded; }

    // All step results on success; steps that completed before the failure otherwise.
    const MultiResult& changes() const { return results; }

    // Set when Options::returnOperation selected a single step.
    const std::optional<StepValue>& selected() const { return selectedValue; }

    const StepKey& failedStep() const;
    const StepError& error() const;
    const Changeset* changesetError() const;
    const PersistenceError* persistenceError() const;

private:
    bool succeeded = false;
    MultiResult results;
    std::optional<StepValue> selectedValue;
    std::optional<StepKey> failed;
    std::optional<StepError> err;
};

} // namespace Chronicle
