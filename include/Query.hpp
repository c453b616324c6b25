#pragma once
#include <string>
#include <vector>
#include <utility>
#include "EntitySchema.hpp"

namespace Chronicle {

enum class Op { Eq, NotEq, Lt, Lte, Gt, Gte, In, IsNull, NotNull };

struct Condition {
    std::string column;
    Op op = Op::Eq;
    nlohmann::json value; // array for Op::In, ignored for null checks
};

// A typed parameter produced by compiling a query.
struct BoundValue {
    Column column;
    nlohmann::json value;
};

// Conjunction of column comparisons over one entity table.
class Query {
public:
    explicit Query(const EntitySchema &schema) : schemaPtr(&schema) {}

    Query& where(const std::string &column, Op op, nlohmann::json value = nullptr);
    Query& where(const std::string &column, nlohmann::json value) { return where(column, Op::Eq, std::move(value)); }
    Query& whereIn(const std::string &column, std::vector<nlohmann::json> values);

    const EntitySchema& schema() const { return *schemaPtr; }
    const std::vector<Condition>& conditions() const { return conds; }

    // Produces " WHERE ..." (or an empty string) and appends its parameters.
    bool compile(std::string &outWhere, std::vector<BoundValue> &params, std::string *outError = nullptr) const;

private:
    const EntitySchema* schemaPtr;
    std::vector<Condition> conds;
};

// Binds compiled parameters starting at `firstIdx`; returns the next free index.
int bindAll(IStatement &stmt, int firstIdx, const std::vector<BoundValue> &params);

} // namespace Chronicle
