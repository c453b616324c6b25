#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "DBBackend.hpp"

namespace Chronicle {

// An entity row or attribute map, always a JSON object.
using Record = nlohmann::json;

enum class ColumnType { Integer, Real, Text, Boolean, Json, Date, Timestamp };

struct Column {
    std::string name;
    ColumnType type = ColumnType::Text;
    bool nullable = true;
    // optional "REFERENCES other(id)" clause appended to the DDL
    std::string references;
};

// Column names maintained by the composer rather than by callers.
inline constexpr const char* kInsertedAtColumn = "inserted_at";
inline constexpr const char* kUpdatedAtColumn = "updated_at";
inline constexpr const char* kDeletedAtColumn = "deleted_at";
inline constexpr const char* kFirstVersionColumn = "first_version_id";
inline constexpr const char* kCurrentVersionColumn = "current_version_id";

// Describes one tracked entity type and how its rows map onto a table.
struct EntitySchema {
    std::string itemType;           // logical type name recorded as Version::itemType
    std::string table;
    std::string primaryKey = "id";  // INTEGER PRIMARY KEY AUTOINCREMENT
    std::vector<Column> columns;    // application attributes, primary key excluded
    bool timestamps = true;         // inserted_at / updated_at
    bool softDelete = false;        // deleted_at
    bool versionLinks = false;      // first_version_id / current_version_id (strict mode)

    // Every persisted column in table order, primary key first.
    std::vector<Column> allColumns() const;
    std::optional<Column> findColumn(const std::string &name) const;
    bool hasColumn(const std::string &name) const { return findColumn(name).has_value(); }

    std::string createTableSQL() const;

    // SQL expression building a JSON object with every persisted attribute
    // of the current row, in the shape decodeRow() produces.
    std::string jsonObjectSQL() const;

    // Reads one row whose columns are named after schema columns.
    Record decodeRow(IResultSet &rs) const;

    // Row id or -1 when the record carries none.
    int64_t idOf(const Record &row) const;
};

// Checks that `value` fits `column` (null allowed when nullable).
bool valueFitsColumn(const Column &column, const nlohmann::json &value);

// Binds a JSON value to a statement parameter using the column's storage type.
void bindValue(IStatement &stmt, int idx, const Column &column, const nlohmann::json &value);

// Reads a column value back into its JSON representation.
nlohmann::json readValue(IResultSet &rs, int idx, const Column &column);

// Quotes an identifier for SQLite.
std::string quoteIdent(const std::string &name);

// Current UTC time formatted as YYYY-MM-DDTHH:MM:SS.
std::string utcTimestamp();

} // namespace Chronicle
