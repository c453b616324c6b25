#include "EntitySchema.hpp"
#include <plog/Log.h>
#include <ctime>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace Chronicle {

static const char* sqlStorageType(ColumnType type){
    switch(type){
        case ColumnType::Integer:
        case ColumnType::Boolean: return "INTEGER";
        case ColumnType::Real: return "REAL";
        default: return "TEXT";
    }
}

std::string quoteIdent(const std::string &name){
    std::string out = "\"";
    for(char c : name){ if(c == '"') out += "\"\""; else out += c; }
    out += "\"";
    return out;
}

std::string utcTimestamp(){
    std::time_t t = std::time(nullptr);
    std::tm tmv{};
    gmtime_r(&t, &tmv);
    std::ostringstream ss;
    ss << std::put_time(&tmv, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

std::vector<Column> EntitySchema::allColumns() const {
    std::vector<Column> out;
    out.push_back(Column{primaryKey, ColumnType::Integer, false, {}});
    for(const auto &c : columns) out.push_back(c);
    if(timestamps){
        out.push_back(Column{kInsertedAtColumn, ColumnType::Timestamp, true, {}});
        out.push_back(Column{kUpdatedAtColumn, ColumnType::Timestamp, true, {}});
    }
    if(softDelete) out.push_back(Column{kDeletedAtColumn, ColumnType::Timestamp, true, {}});
    if(versionLinks){
        out.push_back(Column{kFirstVersionColumn, ColumnType::Integer, true, {}});
        out.push_back(Column{kCurrentVersionColumn, ColumnType::Integer, true, {}});
    }
    return out;
}

std::optional<Column> EntitySchema::findColumn(const std::string &name) const {
    for(const auto &c : allColumns()) if(c.name == name) return c;
    return std::nullopt;
}

std::string EntitySchema::createTableSQL() const {
    std::ostringstream ss;
    ss << "CREATE TABLE IF NOT EXISTS " << quoteIdent(table) << " (";
    bool first = true;
    for(const auto &c : allColumns()){
        if(!first) ss << ", ";
        first = false;
        ss << quoteIdent(c.name) << " " << sqlStorageType(c.type);
        if(c.name == primaryKey){ ss << " PRIMARY KEY AUTOINCREMENT"; continue; }
        if(!c.nullable) ss << " NOT NULL";
        if(!c.references.empty()) ss << " REFERENCES " << c.references;
    }
    ss << ");";
    return ss.str();
}

std::string EntitySchema::jsonObjectSQL() const {
    std::ostringstream ss;
    ss << "json_object(";
    bool first = true;
    for(const auto &c : allColumns()){
        if(!first) ss << ", ";
        first = false;
        ss << "'" << c.name << "', ";
        const std::string col = quoteIdent(table) + "." + quoteIdent(c.name);
        switch(c.type){
            case ColumnType::Boolean:
                ss << "json(CASE WHEN " << col << " IS NULL THEN NULL WHEN " << col << " THEN 'true' ELSE 'false' END)";
                break;
            case ColumnType::Json:
                ss << "json(" << col << ")";
                break;
            default:
                ss << col;
        }
    }
    ss << ")";
    return ss.str();
}

Record EntitySchema::decodeRow(IResultSet &rs) const {
    Record row = Record::object();
    const auto cols = allColumns();
    const int n = rs.columnCount();
    for(int i = 0; i < n; ++i){
        const std::string name = rs.columnName(i);
        for(const auto &c : cols){
            if(c.name == name){ row[name] = readValue(rs, i, c); break; }
        }
    }
    return row;
}

int64_t EntitySchema::idOf(const Record &row) const {
    if(!row.is_object()) return -1;
    auto it = row.find(primaryKey);
    if(it == row.end() || !it->is_number_integer()) return -1;
    return it->get<int64_t>();
}

static bool isDateString(const std::string &s){
    if(s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    for(size_t i = 0; i < s.size(); ++i){
        if(i == 4 || i == 7) continue;
        if(s[i] < '0' || s[i] > '9') return false;
    }
    return true;
}

// Strings must be valid UTF-8 or the value cannot be written out as JSON.
static bool encodesAsJson(const nlohmann::json &value){
    try {
        (void)value.dump();
    } catch(const nlohmann::json::type_error &e){
        PLOGD << "valueFitsColumn: " << e.what();
        return false;
    }
    return true;
}

bool valueFitsColumn(const Column &column, const nlohmann::json &value){
    if(value.is_null()) return column.nullable;
    if(!encodesAsJson(value)) return false;
    switch(column.type){
        case ColumnType::Integer: return value.is_number_integer();
        case ColumnType::Real: return value.is_number();
        case ColumnType::Text:
        case ColumnType::Timestamp: return value.is_string();
        case ColumnType::Boolean: return value.is_boolean();
        case ColumnType::Json: return value.is_object() || value.is_array();
        case ColumnType::Date: return value.is_string() && isDateString(value.get<std::string>());
    }
    return false;
}

void bindValue(IStatement &stmt, int idx, const Column &column, const nlohmann::json &value){
    if(value.is_null()){ stmt.bindNull(idx); return; }
    switch(column.type){
        case ColumnType::Integer:
            if(value.is_number_integer()) stmt.bindInt(idx, value.get<int64_t>());
            else if(value.is_number()) stmt.bindInt(idx, static_cast<int64_t>(std::llround(value.get<double>())));
            else stmt.bindString(idx, value.is_string() ? value.get<std::string>() : value.dump());
            break;
        case ColumnType::Real:
            if(value.is_number()) stmt.bindDouble(idx, value.get<double>());
            else stmt.bindString(idx, value.dump());
            break;
        case ColumnType::Boolean:
            if(value.is_boolean()) stmt.bindInt32(idx, value.get<bool>() ? 1 : 0);
            else if(value.is_number_integer()) stmt.bindInt32(idx, value.get<int64_t>() != 0 ? 1 : 0);
            else stmt.bindString(idx, value.dump());
            break;
        case ColumnType::Json:
            stmt.bindString(idx, value.dump());
            break;
        default:
            stmt.bindString(idx, value.is_string() ? value.get<std::string>() : value.dump());
    }
}

nlohmann::json readValue(IResultSet &rs, int idx, const Column &column){
    if(rs.isNull(idx)) return nullptr;
    switch(column.type){
        case ColumnType::Integer: return rs.getInt64(idx);
        case ColumnType::Real: return rs.getDouble(idx);
        case ColumnType::Boolean: return rs.getInt64(idx) != 0;
        case ColumnType::Json: {
            std::string text = rs.getString(idx);
            auto parsed = nlohmann::json::parse(text, nullptr, false);
            if(parsed.is_discarded()){
                PLOGW << "readValue: column " << column.name << " holds invalid JSON";
                return text;
            }
            return parsed;
        }
        default: return rs.getString(idx);
    }
}

} // namespace Chronicle
