#include "db/SQLiteBackend.hpp"
#include <plog/Log.h>
#include <cstring>

namespace Chronicle {

SQLiteBackend::SQLiteBackend() = default;
SQLiteBackend::~SQLiteBackend(){ close(); }

bool SQLiteBackend::open(const DBConnectionInfo &info, std::string *outError){
    if(db) close();
    std::string path;
    if(!info.sqlite_dir.empty()) path = info.sqlite_dir + "/" + info.sqlite_filename;
    else path = info.sqlite_filename;
    if(path.empty()){ if(outError) *outError = "SQLite: no database filename configured"; return false; }
    if(sqlite3_open(path.c_str(), &db) != SQLITE_OK){
        if(outError) *outError = db ? sqlite3_errmsg(db) : "sqlite3_open failed";
        if(db){ sqlite3_close(db); db = nullptr; }
        return false;
    }
    // foreign keys are off by default in sqlite; the composer relies on them failing the entity step
    char* err = nullptr;
    if(sqlite3_exec(db, "PRAGMA foreign_keys=ON;", nullptr, nullptr, &err) != SQLITE_OK){
        if(outError) *outError = err ? err : "failed to enable foreign keys";
        if(err) sqlite3_free(err);
        close();
        return false;
    }
    // WAL is a no-op for in-memory databases
    if(sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err) != SQLITE_OK){
        PLOGW << "SQLiteBackend: could not enable WAL: " << (err ? err : "(no message)");
        if(err){ sqlite3_free(err); err = nullptr; }
    }
    sqlite3_busy_timeout(db, 5000);
    PLOGI << "SQLiteBackend: opened " << path;
    return true;
}

void SQLiteBackend::close(){ if(db) { sqlite3_close_v2(db); db = nullptr; } }

bool SQLiteBackend::isOpen() const{ return db != nullptr; }

bool SQLiteBackend::execute(const std::string &sql, std::string *outError){
    if(!db){ if(outError) *outError = "DB not open"; return false; }
    char* err = nullptr;
    if(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK){
        if(outError) *outError = err ? err : sqlite3_errmsg(db);
        if(err) sqlite3_free(err);
        return false;
    }
    return true;
}

class SQLiteResultSetImpl : public IResultSet {
public:
    SQLiteResultSetImpl(sqlite3* db_, sqlite3_stmt* s) : db(db_), stmt(s) {}
    ~SQLiteResultSetImpl() override { if(stmt) sqlite3_reset(stmt); /* statement owns it */ }
    bool next() override {
        int r = sqlite3_step(stmt);
        if(r == SQLITE_ROW) return true;
        if(r != SQLITE_DONE){
            lastFailed = true;
            PLOGW << "SQLiteResultSet: step failed: " << sqlite3_errmsg(db);
        }
        return false;
    }
    bool failed() const override { return lastFailed; }
    int64_t getInt64(int idx) override { return sqlite3_column_int64(stmt, idx); }
    double getDouble(int idx) override { return sqlite3_column_double(stmt, idx); }
    std::string getString(int idx) override { const unsigned char* t = sqlite3_column_text(stmt, idx); return t ? reinterpret_cast<const char*>(t) : std::string(); }
    bool isNull(int idx) override { return sqlite3_column_type(stmt, idx) == SQLITE_NULL; }
    int columnCount() override { return sqlite3_column_count(stmt); }
    std::string columnName(int idx) override { const char* n = sqlite3_column_name(stmt, idx); return n ? n : std::string(); }
private:
    sqlite3* db;
    sqlite3_stmt* stmt;
    bool lastFailed = false;
};

class SQLiteStmtWrapper : public IStatement {
public:
    SQLiteStmtWrapper(sqlite3* db_, sqlite3_stmt* s_) : db(db_), stmt(s_) {}
    ~SQLiteStmtWrapper() override { if(stmt) sqlite3_finalize(stmt); }
    void bindInt(int idx, int64_t v) override { sqlite3_bind_int64(stmt, idx, v); }
    void bindInt32(int idx, int32_t v) override { sqlite3_bind_int(stmt, idx, v); }
    void bindDouble(int idx, double v) override { sqlite3_bind_double(stmt, idx, v); }
    void bindString(int idx, const std::string &s) override { sqlite3_bind_text(stmt, idx, s.c_str(), -1, SQLITE_TRANSIENT); }
    void bindNull(int idx) override { sqlite3_bind_null(stmt, idx); }
    bool execute() override {
        int r = sqlite3_step(stmt);
        sqlite3_reset(stmt);
        if(r == SQLITE_DONE || r == SQLITE_ROW) return true;
        PLOGW << "SQLiteStatement: execute failed: " << sqlite3_errmsg(db);
        return false;
    }
    std::unique_ptr<IResultSet> executeQuery() override { return std::make_unique<SQLiteResultSetImpl>(db, stmt); }
private:
    sqlite3* db;
    sqlite3_stmt* stmt;
};

std::unique_ptr<IStatement> SQLiteBackend::prepare(const std::string &sql, std::string *outError){
    if(!db){ if(outError) *outError = "DB not open"; return nullptr; }
    sqlite3_stmt* stmt = nullptr;
    if(sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK){ if(outError) *outError = sqlite3_errmsg(db); if(stmt) sqlite3_finalize(stmt); return nullptr; }
    return std::make_unique<SQLiteStmtWrapper>(db, stmt);
}

bool SQLiteBackend::beginTransaction(TransactionMode mode, std::string *outError){
    const char* sql = mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE TRANSACTION;" : "BEGIN TRANSACTION;";
    return execute(sql, outError);
}

bool SQLiteBackend::commit(std::string *outError){ return execute("COMMIT;", outError); }

bool SQLiteBackend::rollback(std::string *outError){
    // a failed statement may already have ended the transaction
    if(db && sqlite3_get_autocommit(db)) return true;
    return execute("ROLLBACK;", outError);
}

int64_t SQLiteBackend::lastInsertId(){ if(!db) return -1; return sqlite3_last_insert_rowid(db); }

int64_t SQLiteBackend::changes(){ if(!db) return 0; return sqlite3_changes(db); }

std::string SQLiteBackend::lastError() const { if(!db) return "DB not open"; return sqlite3_errmsg(db); }

bool SQLiteBackend::hasColumn(const std::string &table, const std::string &column){
    if(!db) return false;
    std::string q = "PRAGMA table_info('" + table + "');";
    sqlite3_stmt* stmt = nullptr;
    bool found = false;
    if(sqlite3_prepare_v2(db, q.c_str(), -1, &stmt, nullptr) == SQLITE_OK){
        while(sqlite3_step(stmt) == SQLITE_ROW){
            const unsigned char* name = sqlite3_column_text(stmt,1);
            if(name){ std::string cname = reinterpret_cast<const char*>(name); if(cname == column){ found = true; break; } }
        }
    }
    if(stmt) sqlite3_finalize(stmt);
    return found;
}

} // namespace Chronicle
