#pragma once
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>
#include "DBBackend.hpp"
#include "Config.hpp"
#include "EntitySchema.hpp"
#include "Query.hpp"
#include "Version.hpp"
#include "ChangeCapture.hpp"

namespace Chronicle {

// Row-level persistence operations over a backend, plus the version ledger.
// Every operation reports failure through its return value and `outError`.
class Repo {
public:
    // Borrows `backend`, which must stay open for the repo's lifetime.
    explicit Repo(IDBBackend* backend, std::string versionsTable = "versions");
    ~Repo();

    Repo(const Repo&) = delete;
    Repo& operator=(const Repo&) = delete;

    // Opens the configured backend and ensures the versions table exists.
    static std::unique_ptr<Repo> Open(const ChronicleConfig &cfg, std::string *outError = nullptr);

    IDBBackend* backend() const { return db; }
    const std::string& versionsTable() const { return versionsTableName; }
    const EntitySchema& versionSchema() const { return versionsTableSchema; }

    bool ensureSchema(const EntitySchema &schema, std::string *outError = nullptr);
    bool ensureVersionsSchema(std::string *outError = nullptr);

    // Inserts one row; the primary key may be supplied explicitly. Timestamps
    // are stamped when the schema carries them. outRow is the persisted row.
    bool insert(const EntitySchema &schema, const Record &attrs, Record &outRow, std::string *outError = nullptr);
    // Fails when no row has `id`.
    bool update(const EntitySchema &schema, int64_t id, const Record &changes, Record &outRow, std::string *outError = nullptr);
    bool remove(const EntitySchema &schema, int64_t id, std::string *outError = nullptr);
    bool get(const EntitySchema &schema, int64_t id, Record &outRow, std::string *outError = nullptr);
    bool select(const Query &query, std::vector<Record> &outRows, std::string *outError = nullptr);
    int64_t count(const std::string &table);

    // One INSERT for all entries, returning every persisted row.
    bool insertAll(const EntitySchema &schema, const std::vector<Record> &entries, std::vector<Record> &outRows, std::string *outError = nullptr);
    bool updateAll(const Query &query, const Record &set, int64_t &outCount, std::string *outError = nullptr);

    // Inserts into the ledger. With explicitId the row keeps version.id,
    // otherwise version.id is set from the engine. version.insertedAt is stamped.
    bool insertVersion(Version &version, bool explicitId, std::string *outError = nullptr);
    bool updateVersionChanges(int64_t versionId, const Record &itemChanges, std::string *outError = nullptr);
    bool insertVersionsFrom(const VersionProjection &projection, bool returning, int64_t &outCount,
                            std::vector<Version> *outRows, std::string *outError = nullptr);
    // whereSQL is appended verbatim after FROM (e.g. " WHERE item_id = ?").
    bool selectVersions(const std::string &whereSQL, const std::vector<BoundValue> &params,
                        const std::string &orderBy, std::vector<Version> &out, std::string *outError = nullptr);

    // Next id the table's AUTOINCREMENT key would hand out. Only stable
    // while the caller holds the write lock (TransactionMode::Immediate).
    bool nextSequenceValue(const std::string &table, const std::string &primaryKey, int64_t &outValue, std::string *outError = nullptr);

    // Runs body inside BEGIN/COMMIT. A false return or an exception rolls back;
    // exceptions are rethrown after the rollback.
    bool runInTransaction(TransactionMode mode, const std::function<bool(std::string*)> &body, std::string *outError = nullptr);

private:
    bool readRows(IStatement &stmt, const EntitySchema &schema, std::vector<Record> &outRows, std::string *outError);

    std::unique_ptr<IDBBackend> ownedBackend;
    IDBBackend* db = nullptr;
    std::string versionsTableName;
    EntitySchema versionsTableSchema;
};

} // namespace Chronicle
