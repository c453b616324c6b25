#pragma once
#include <string>
#include <memory>
#include <cstdint>

// Minimal DB backend abstraction used by Repo
namespace Chronicle {

struct DBConnectionInfo {
    enum class Backend { SQLite };
    Backend backend = Backend::SQLite;
    // SQLite (":memory:" is accepted as filename)
    std::string sqlite_dir;
    std::string sqlite_filename;
};

// Deferred takes locks lazily; Immediate holds the write lock from BEGIN so
// concurrent writers are serialized for the whole transaction.
enum class TransactionMode { Deferred, Immediate };

struct IResultSet {
    virtual ~IResultSet() = default;
    virtual bool next() = 0;
    // true when the last next() stopped on an error rather than end of rows
    virtual bool failed() const = 0;
    virtual int64_t getInt64(int idx) = 0;
    virtual double getDouble(int idx) = 0;
    virtual std::string getString(int idx) = 0;
    virtual bool isNull(int idx) = 0;
    virtual int columnCount() = 0;
    virtual std::string columnName(int idx) = 0;
};

struct IStatement {
    virtual ~IStatement() = default;
    virtual void bindInt(int idx, int64_t v) = 0;
    virtual void bindInt32(int idx, int32_t v) = 0;
    virtual void bindDouble(int idx, double v) = 0;
    virtual void bindString(int idx, const std::string &s) = 0;
    virtual void bindNull(int idx) = 0;
    virtual bool execute() = 0; // for INSERT/UPDATE/DELETE
    virtual std::unique_ptr<IResultSet> executeQuery() = 0; // for SELECT and RETURNING
};

struct IDBBackend {
    virtual ~IDBBackend() = default;
    virtual bool open(const DBConnectionInfo &info, std::string *outError = nullptr) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual bool execute(const std::string &sql, std::string *outError = nullptr) = 0; // DDL / simple exec
    virtual std::unique_ptr<IStatement> prepare(const std::string &sql, std::string *outError = nullptr) = 0;
    virtual bool beginTransaction(TransactionMode mode = TransactionMode::Deferred, std::string *outError = nullptr) = 0;
    virtual bool commit(std::string *outError = nullptr) = 0;
    virtual bool rollback(std::string *outError = nullptr) = 0;
    virtual int64_t lastInsertId() = 0;
    // rows modified by the most recent INSERT/UPDATE/DELETE
    virtual int64_t changes() = 0;
    virtual std::string lastError() const = 0;

    // Introspection helper for migrations
    virtual bool hasColumn(const std::string &table, const std::string &column) = 0;
};

} // namespace Chronicle
