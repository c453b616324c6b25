#include "Repo.hpp"
#include "db/SQLiteBackend.hpp"
#include <plog/Log.h>
#include <algorithm>
#include <sstream>

namespace Chronicle {

Repo::Repo(IDBBackend* backend, std::string versionsTable)
    : db(backend), versionsTableName(std::move(versionsTable)), versionsTableSchema(versionsSchema(versionsTableName)) {}

Repo::~Repo() = default;

std::unique_ptr<Repo> Repo::Open(const ChronicleConfig &cfg, std::string *outError){
    std::unique_ptr<IDBBackend> backend;
    switch(cfg.connInfo.backend){
        case DBConnectionInfo::Backend::SQLite:
            backend = std::make_unique<SQLiteBackend>();
            break;
    }
    if(!backend || !backend->open(cfg.connInfo, outError)) return nullptr;
    auto repo = std::make_unique<Repo>(backend.get(), cfg.versionsTable);
    repo->ownedBackend = std::move(backend);
    if(!repo->ensureVersionsSchema(outError)) return nullptr;
    return repo;
}

bool Repo::ensureSchema(const EntitySchema &schema, std::string *outError){
    if(!db || !db->isOpen()){ if(outError) *outError = "DB not open"; return false; }
    if(!db->execute(schema.createTableSQL(), outError)){
        PLOGE << "Repo: failed to create table " << schema.table;
        return false;
    }
    // strict mode can be switched on for an existing table
    if(schema.versionLinks){
        for(const char* col : {kFirstVersionColumn, kCurrentVersionColumn}){
            if(db->hasColumn(schema.table, col)) continue;
            std::string alter = "ALTER TABLE " + quoteIdent(schema.table) + " ADD COLUMN " + quoteIdent(col) + " INTEGER;";
            if(!db->execute(alter, outError)) return false;
            PLOGI << "Repo: migration added " << col << " to " << schema.table;
        }
    }
    return true;
}

bool Repo::ensureVersionsSchema(std::string *outError){
    if(!ensureSchema(versionsTableSchema, outError)) return false;
    std::string idx = "CREATE INDEX IF NOT EXISTS " + quoteIdent(versionsTableName + "_item_idx") + " ON "
                    + quoteIdent(versionsTableName) + " (item_type, item_id);";
    return db->execute(idx, outError);
}

bool Repo::readRows(IStatement &stmt, const EntitySchema &schema, std::vector<Record> &outRows, std::string *outError){
    auto rs = stmt.executeQuery();
    while(rs->next()) outRows.push_back(schema.decodeRow(*rs));
    if(rs->failed()){
        if(outError) *outError = db->lastError();
        return false;
    }
    return true;
}

// Copies attrs restricted to schema columns and stamps missing timestamps.
static Record insertableAttrs(const EntitySchema &schema, const Record &attrs, const std::string &now){
    Record out = Record::object();
    for(const auto &c : schema.allColumns()){
        auto it = attrs.find(c.name);
        if(it != attrs.end()) out[c.name] = *it;
    }
    if(schema.timestamps){
        if(!out.contains(kInsertedAtColumn) || out[kInsertedAtColumn].is_null()) out[kInsertedAtColumn] = now;
        if(!out.contains(kUpdatedAtColumn) || out[kUpdatedAtColumn].is_null()) out[kUpdatedAtColumn] = now;
    }
    return out;
}

bool Repo::insert(const EntitySchema &schema, const Record &attrs, Record &outRow, std::string *outError){
    std::vector<Record> rows;
    if(!insertAll(schema, {attrs}, rows, outError)) return false;
    if(rows.empty()){ if(outError) *outError = "insert into " + schema.table + " returned no row"; return false; }
    outRow = rows.front();
    return true;
}

bool Repo::update(const EntitySchema &schema, int64_t id, const Record &changes, Record &outRow, std::string *outError){
    Record set = Record::object();
    for(auto it = changes.begin(); it != changes.end(); ++it){
        if(!schema.hasColumn(it.key())){ if(outError) *outError = "unknown column '" + it.key() + "' for " + schema.itemType; return false; }
        set[it.key()] = it.value();
    }
    if(set.empty()) return get(schema, id, outRow, outError);
    if(schema.timestamps && !set.contains(kUpdatedAtColumn)) set[kUpdatedAtColumn] = utcTimestamp();

    std::ostringstream ss;
    ss << "UPDATE " << quoteIdent(schema.table) << " SET ";
    bool first = true;
    for(auto it = set.begin(); it != set.end(); ++it){
        if(!first) ss << ", ";
        first = false;
        ss << quoteIdent(it.key()) << " = ?";
    }
    ss << " WHERE " << quoteIdent(schema.primaryKey) << " = ? RETURNING *;";
    std::string err;
    auto stmt = db->prepare(ss.str(), &err);
    if(!stmt){ PLOGW << "Repo::update prepare failed: " << err; if(outError) *outError = err; return false; }
    int idx = 1;
    for(auto it = set.begin(); it != set.end(); ++it) bindValue(*stmt, idx++, *schema.findColumn(it.key()), it.value());
    stmt->bindInt(idx, id);
    std::vector<Record> rows;
    if(!readRows(*stmt, schema, rows, outError)) return false;
    if(rows.empty()){ if(outError) *outError = "stale entity: no " + schema.itemType + " with id " + std::to_string(id); return false; }
    outRow = rows.front();
    return true;
}

bool Repo::remove(const EntitySchema &schema, int64_t id, std::string *outError){
    std::string err;
    auto stmt = db->prepare("DELETE FROM " + quoteIdent(schema.table) + " WHERE " + quoteIdent(schema.primaryKey) + " = ?;", &err);
    if(!stmt){ PLOGW << "Repo::remove prepare failed: " << err; if(outError) *outError = err; return false; }
    stmt->bindInt(1, id);
    if(!stmt->execute()){ if(outError) *outError = db->lastError(); return false; }
    if(db->changes() == 0){ if(outError) *outError = "stale entity: no " + schema.itemType + " with id " + std::to_string(id); return false; }
    return true;
}

bool Repo::get(const EntitySchema &schema, int64_t id, Record &outRow, std::string *outError){
    std::string err;
    auto stmt = db->prepare("SELECT * FROM " + quoteIdent(schema.table) + " WHERE " + quoteIdent(schema.primaryKey) + " = ?;", &err);
    if(!stmt){ PLOGW << "Repo::get prepare failed: " << err; if(outError) *outError = err; return false; }
    stmt->bindInt(1, id);
    std::vector<Record> rows;
    if(!readRows(*stmt, schema, rows, outError)) return false;
    if(rows.empty()){ if(outError) *outError = "no " + schema.itemType + " with id " + std::to_string(id); return false; }
    outRow = rows.front();
    return true;
}

bool Repo::select(const Query &query, std::vector<Record> &outRows, std::string *outError){
    std::string where;
    std::vector<BoundValue> params;
    if(!query.compile(where, params, outError)) return false;
    const EntitySchema &schema = query.schema();
    std::string err;
    auto stmt = db->prepare("SELECT * FROM " + quoteIdent(schema.table) + where + " ORDER BY " + quoteIdent(schema.primaryKey) + ";", &err);
    if(!stmt){ PLOGW << "Repo::select prepare failed: " << err; if(outError) *outError = err; return false; }
    bindAll(*stmt, 1, params);
    return readRows(*stmt, schema, outRows, outError);
}

int64_t Repo::count(const std::string &table){
    std::string err;
    auto stmt = db->prepare("SELECT COUNT(*) FROM " + quoteIdent(table) + ";", &err);
    if(!stmt){ PLOGW << "Repo::count prepare failed: " << err; return -1; }
    auto rs = stmt->executeQuery();
    if(rs->next()) return rs->getInt64(0);
    return -1;
}

bool Repo::insertAll(const EntitySchema &schema, const std::vector<Record> &entries, std::vector<Record> &outRows, std::string *outError){
    outRows.clear();
    if(entries.empty()) return true;
    const std::string now = utcTimestamp();
    std::vector<Record> rows;
    std::vector<std::string> columns;
    for(const auto &e : entries){
        rows.push_back(insertableAttrs(schema, e, now));
        for(auto it = rows.back().begin(); it != rows.back().end(); ++it){
            if(std::find(columns.begin(), columns.end(), it.key()) == columns.end()) columns.push_back(it.key());
        }
    }

    std::ostringstream ss;
    ss << "INSERT INTO " << quoteIdent(schema.table);
    if(columns.empty()){
        ss << " DEFAULT VALUES";
    } else {
        ss << " (";
        for(size_t i = 0; i < columns.size(); ++i){ if(i) ss << ", "; ss << quoteIdent(columns[i]); }
        ss << ") VALUES ";
        for(size_t r = 0; r < rows.size(); ++r){
            if(r) ss << ", ";
            ss << "(";
            for(size_t i = 0; i < columns.size(); ++i){ if(i) ss << ", "; ss << "?"; }
            ss << ")";
        }
    }
    ss << " RETURNING *;";
    if(columns.empty() && rows.size() > 1){
        if(outError) *outError = "insertAll: entries carry no attributes";
        return false;
    }

    std::string err;
    auto stmt = db->prepare(ss.str(), &err);
    if(!stmt){ PLOGW << "Repo::insertAll prepare failed: " << err; if(outError) *outError = err; return false; }
    int idx = 1;
    for(const auto &row : rows){
        for(const auto &col : columns){
            auto it = row.find(col);
            bindValue(*stmt, idx++, *schema.findColumn(col), it != row.end() ? *it : nlohmann::json());
        }
    }
    if(!readRows(*stmt, schema, outRows, outError)) return false;
    std::sort(outRows.begin(), outRows.end(), [&](const Record &a, const Record &b){ return schema.idOf(a) < schema.idOf(b); });
    return true;
}

bool Repo::updateAll(const Query &query, const Record &set, int64_t &outCount, std::string *outError){
    const EntitySchema &schema = query.schema();
    if(!set.is_object() || set.empty()){ if(outError) *outError = "updateAll: empty set"; return false; }
    std::string where;
    std::vector<BoundValue> params;
    if(!query.compile(where, params, outError)) return false;

    std::ostringstream ss;
    ss << "UPDATE " << quoteIdent(schema.table) << " SET ";
    bool first = true;
    for(auto it = set.begin(); it != set.end(); ++it){
        if(!schema.hasColumn(it.key())){ if(outError) *outError = "unknown column '" + it.key() + "' for " + schema.itemType; return false; }
        if(!first) ss << ", ";
        first = false;
        ss << quoteIdent(it.key()) << " = ?";
    }
    ss << where << ";";
    std::string err;
    auto stmt = db->prepare(ss.str(), &err);
    if(!stmt){ PLOGW << "Repo::updateAll prepare failed: " << err; if(outError) *outError = err; return false; }
    int idx = 1;
    for(auto it = set.begin(); it != set.end(); ++it) bindValue(*stmt, idx++, *schema.findColumn(it.key()), it.value());
    bindAll(*stmt, idx, params);
    if(!stmt->execute()){ if(outError) *outError = db->lastError(); return false; }
    outCount = db->changes();
    return true;
}

static bool encodeJson(const nlohmann::json &value, std::string &out, std::string *outError){
    try {
        out = value.dump();
    } catch(const nlohmann::json::type_error &e){
        PLOGW << "Repo: cannot encode version payload: " << e.what();
        if(outError) *outError = e.what();
        return false;
    }
    return true;
}

bool Repo::insertVersion(Version &version, bool explicitId, std::string *outError){
    std::string changesText, metaText;
    if(!encodeJson(version.itemChanges, changesText, outError)) return false;
    if(!version.meta.is_null() && !encodeJson(version.meta, metaText, outError)) return false;
    version.insertedAt = utcTimestamp();
    std::string sql = "INSERT INTO " + quoteIdent(versionsTableName) + " (";
    if(explicitId) sql += "id, ";
    sql += "event, item_type, item_id, item_changes, originator_id, origin, meta, inserted_at) VALUES (";
    if(explicitId) sql += "?, ";
    sql += "?, ?, ?, ?, ?, ?, ?, ?);";
    std::string err;
    auto stmt = db->prepare(sql, &err);
    if(!stmt){ PLOGW << "Repo::insertVersion prepare failed: " << err; if(outError) *outError = err; return false; }
    int idx = 1;
    if(explicitId) stmt->bindInt(idx++, version.id);
    stmt->bindString(idx++, eventName(version.event));
    stmt->bindString(idx++, version.itemType);
    stmt->bindInt(idx++, version.itemId);
    stmt->bindString(idx++, changesText);
    if(version.originatorId) stmt->bindInt(idx++, *version.originatorId); else stmt->bindNull(idx++);
    if(version.origin) stmt->bindString(idx++, *version.origin); else stmt->bindNull(idx++);
    if(version.meta.is_null()) stmt->bindNull(idx++); else stmt->bindString(idx++, metaText);
    stmt->bindString(idx++, version.insertedAt);
    if(!stmt->execute()){ if(outError) *outError = db->lastError(); return false; }
    if(!explicitId) version.id = db->lastInsertId();
    PLOGD << "Repo: inserted version " << version.id << " (" << eventName(version.event) << " " << version.itemType << "#" << version.itemId << ")";
    return true;
}

bool Repo::updateVersionChanges(int64_t versionId, const Record &itemChanges, std::string *outError){
    std::string changesText;
    if(!encodeJson(itemChanges, changesText, outError)) return false;
    std::string err;
    auto stmt = db->prepare("UPDATE " + quoteIdent(versionsTableName) + " SET item_changes = ? WHERE id = ?;", &err);
    if(!stmt){ PLOGW << "Repo::updateVersionChanges prepare failed: " << err; if(outError) *outError = err; return false; }
    stmt->bindString(1, changesText);
    stmt->bindInt(2, versionId);
    if(!stmt->execute()){ if(outError) *outError = db->lastError(); return false; }
    if(db->changes() == 0){ if(outError) *outError = "no version with id " + std::to_string(versionId); return false; }
    return true;
}

bool Repo::insertVersionsFrom(const VersionProjection &projection, bool returning, int64_t &outCount,
                              std::vector<Version> *outRows, std::string *outError){
    std::string sql = "INSERT INTO " + quoteIdent(versionsTableName)
                    + " (event, item_type, item_id, item_changes, originator_id, origin, meta, inserted_at) "
                    + projection.selectSQL;
    if(returning) sql += " RETURNING *";
    sql += ";";
    std::string err;
    auto stmt = db->prepare(sql, &err);
    if(!stmt){ PLOGW << "Repo::insertVersionsFrom prepare failed: " << err; if(outError) *outError = err; return false; }
    bindAll(*stmt, 1, projection.params);
    if(!returning){
        if(!stmt->execute()){ if(outError) *outError = db->lastError(); return false; }
        outCount = db->changes();
        return true;
    }
    std::vector<Record> rows;
    if(!readRows(*stmt, versionsTableSchema, rows, outError)) return false;
    outCount = static_cast<int64_t>(rows.size());
    if(outRows){
        outRows->clear();
        for(const auto &r : rows) outRows->push_back(Version::fromJSON(r));
        std::sort(outRows->begin(), outRows->end(), [](const Version &a, const Version &b){ return a.id < b.id; });
    }
    return true;
}

bool Repo::selectVersions(const std::string &whereSQL, const std::vector<BoundValue> &params,
                          const std::string &orderBy, std::vector<Version> &out, std::string *outError){
    std::string sql = "SELECT * FROM " + quoteIdent(versionsTableName) + whereSQL;
    if(!orderBy.empty()) sql += " ORDER BY " + orderBy;
    sql += ";";
    std::string err;
    auto stmt = db->prepare(sql, &err);
    if(!stmt){ PLOGW << "Repo::selectVersions prepare failed: " << err; if(outError) *outError = err; return false; }
    bindAll(*stmt, 1, params);
    std::vector<Record> rows;
    if(!readRows(*stmt, versionsTableSchema, rows, outError)) return false;
    out.clear();
    for(const auto &r : rows) out.push_back(Version::fromJSON(r));
    return true;
}

bool Repo::nextSequenceValue(const std::string &table, const std::string &primaryKey, int64_t &outValue, std::string *outError){
    int64_t seq = 0;
    // sqlite_sequence only exists once an AUTOINCREMENT table has been created
    if(auto s = db->prepare("SELECT seq FROM sqlite_sequence WHERE name = ?;")){
        s->bindString(1, table);
        auto rs = s->executeQuery();
        if(rs->next() && !rs->isNull(0)) seq = rs->getInt64(0);
    }
    std::string err;
    auto stmt = db->prepare("SELECT MAX(" + quoteIdent(primaryKey) + ") FROM " + quoteIdent(table) + ";", &err);
    if(!stmt){ if(outError) *outError = err; return false; }
    int64_t maxId = 0;
    auto rs = stmt->executeQuery();
    if(rs->next() && !rs->isNull(0)) maxId = rs->getInt64(0);
    if(rs->failed()){ if(outError) *outError = db->lastError(); return false; }
    outValue = std::max(seq, maxId) + 1;
    return true;
}

bool Repo::runInTransaction(TransactionMode mode, const std::function<bool(std::string*)> &body, std::string *outError){
    std::string err;
    if(!db->beginTransaction(mode, &err)){
        PLOGW << "Repo: begin failed: " << err;
        if(outError) *outError = err;
        return false;
    }
    PLOGD << "Repo: transaction begun (" << (mode == TransactionMode::Immediate ? "immediate" : "deferred") << ")";
    bool ok = false;
    try{
        ok = body(outError);
    } catch(...){
        std::string rbErr;
        if(!db->rollback(&rbErr)) PLOGE << "Repo: rollback after exception failed: " << rbErr;
        throw;
    }
    if(!ok){
        std::string rbErr;
        if(!db->rollback(&rbErr)) PLOGE << "Repo: rollback failed: " << rbErr;
        else PLOGD << "Repo: transaction rolled back";
        return false;
    }
    if(!db->commit(&err)){
        PLOGW << "Repo: commit failed: " << err;
        std::string rbErr;
        if(!db->rollback(&rbErr)) PLOGE << "Repo: rollback after failed commit failed: " << rbErr;
        if(outError) *outError = err;
        return false;
    }
    PLOGD << "Repo: transaction committed";
    return true;
}

} // namespace Chronicle
