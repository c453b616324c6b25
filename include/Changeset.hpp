#pragma once
#include <string>
#include <vector>
#include <map>
#include "EntitySchema.hpp"

namespace Chronicle {

// A proposed mutation of one entity: base state, attribute changes and validity.
// The schema is borrowed and must outlive the changeset.
class Changeset {
public:
    Changeset(const EntitySchema &schema, Record data);

    // Keeps permitted, known attributes of `params` whose value differs from `data`.
    // Values that do not fit their column are recorded as "is invalid" errors.
    static Changeset cast(const EntitySchema &schema, Record data, const Record &params,
                          const std::vector<std::string> &permitted);

    // Changeset over a persisted entity with no changes (deletes, soft deletes).
    static Changeset forEntity(const EntitySchema &schema, Record data);

    Changeset& validateRequired(const std::vector<std::string> &fields);
    Changeset& putChange(const std::string &field, nlohmann::json value);
    Changeset& addError(const std::string &field, const std::string &message);
    Changeset& dropChanges(const std::vector<std::string> &fields);

    const EntitySchema& schema() const { return *schemaPtr; }
    const Record& data() const { return baseData; }
    const Record& changes() const { return changeMap; }
    const std::map<std::string, std::vector<std::string>>& errors() const { return fieldErrors; }
    bool isValid() const { return fieldErrors.empty(); }
    bool hasChanges() const { return !changeMap.empty(); }

    // Value of a field after the changes apply.
    nlohmann::json fetchField(const std::string &field) const;
    Record applyChanges() const;

    bool operator==(const Changeset &other) const;
    bool operator!=(const Changeset &other) const { return !(*this == other); }

private:
    const EntitySchema* schemaPtr;
    Record baseData;
    Record changeMap = Record::object();
    std::map<std::string, std::vector<std::string>> fieldErrors;
};

} // namespace Chronicle
