#include <catch2/catch.hpp>
#include "Fixtures.hpp"
#include "db/SQLiteBackend.hpp"

using namespace Chronicle;
using namespace ChronicleTest;

namespace {

DBConnectionInfo memoryDb(){
    DBConnectionInfo info;
    info.sqlite_filename = ":memory:";
    return info;
}

int64_t scalar(IDBBackend &db, const std::string &sql){
    auto stmt = db.prepare(sql);
    REQUIRE(stmt);
    auto rs = stmt->executeQuery();
    REQUIRE(rs->next());
    return rs->getInt64(0);
}

} // namespace

TEST_CASE("SQLite backend executes statements and queries", "[backend]"){
    SQLiteBackend db;
    std::string err;
    REQUIRE(db.open(memoryDb(), &err));
    REQUIRE(db.isOpen());
    REQUIRE(db.execute("CREATE TABLE notes (id INTEGER PRIMARY KEY AUTOINCREMENT, body TEXT, score REAL);", &err));
    REQUIRE(db.hasColumn("notes", "body"));
    REQUIRE_FALSE(db.hasColumn("notes", "title"));

    auto ins = db.prepare("INSERT INTO notes (body, score) VALUES (?, ?);", &err);
    REQUIRE(ins);
    ins->bindString(1, "first");
    ins->bindDouble(2, 1.5);
    REQUIRE(ins->execute());
    CHECK(db.lastInsertId() == 1);
    CHECK(db.changes() == 1);

    // statements reset after execute and can be rebound
    ins->bindString(1, "second");
    ins->bindNull(2);
    REQUIRE(ins->execute());
    CHECK(db.lastInsertId() == 2);

    auto sel = db.prepare("SELECT id, body, score FROM notes ORDER BY id;");
    REQUIRE(sel);
    auto rs = sel->executeQuery();
    REQUIRE(rs->columnCount() == 3);
    CHECK(rs->columnName(1) == "body");
    REQUIRE(rs->next());
    CHECK(rs->getInt64(0) == 1);
    CHECK(rs->getString(1) == "first");
    CHECK(rs->getDouble(2) == Approx(1.5));
    REQUIRE(rs->next());
    CHECK(rs->isNull(2));
    CHECK_FALSE(rs->next());
    CHECK_FALSE(rs->failed());
}

TEST_CASE("SQLite backend reports errors", "[backend]"){
    SQLiteBackend db;
    std::string err;

    SECTION("operations on a closed backend fail"){
        CHECK_FALSE(db.execute("SELECT 1;", &err));
        CHECK(err == "DB not open");
        CHECK_FALSE(db.prepare("SELECT 1;"));
    }

    SECTION("bad SQL is reported through outError"){
        REQUIRE(db.open(memoryDb()));
        CHECK_FALSE(db.execute("CREATE TABL broken;", &err));
        CHECK_FALSE(err.empty());
        err.clear();
        CHECK_FALSE(db.prepare("SELECT * FROM missing_table;", &err));
        CHECK(err.find("missing_table") != std::string::npos);
    }

    SECTION("a filename is required"){
        DBConnectionInfo info;
        CHECK_FALSE(db.open(info, &err));
        CHECK_FALSE(db.isOpen());
    }
}

TEST_CASE("SQLite backend enforces foreign keys", "[backend]"){
    SQLiteBackend db;
    REQUIRE(db.open(memoryDb()));
    REQUIRE(db.execute("CREATE TABLE parents (id INTEGER PRIMARY KEY);"));
    REQUIRE(db.execute("CREATE TABLE children (id INTEGER PRIMARY KEY, parent_id INTEGER REFERENCES parents(id));"));
    std::string err;
    CHECK_FALSE(db.execute("INSERT INTO children (parent_id) VALUES (42);", &err));
    CHECK(err.find("FOREIGN KEY") != std::string::npos);
}

TEST_CASE("SQLite backend transactions commit and roll back", "[backend]"){
    SQLiteBackend db;
    REQUIRE(db.open(memoryDb()));
    REQUIRE(db.execute("CREATE TABLE t (v INTEGER);"));

    SECTION("commit keeps the rows"){
        REQUIRE(db.beginTransaction(TransactionMode::Immediate));
        REQUIRE(db.execute("INSERT INTO t VALUES (1);"));
        REQUIRE(db.commit());
        CHECK(scalar(db, "SELECT COUNT(*) FROM t;") == 1);
    }

    SECTION("rollback discards the rows"){
        REQUIRE(db.beginTransaction());
        REQUIRE(db.execute("INSERT INTO t VALUES (1);"));
        REQUIRE(db.rollback());
        CHECK(scalar(db, "SELECT COUNT(*) FROM t;") == 0);
    }

    SECTION("rollback outside a transaction is harmless"){
        CHECK(db.rollback());
    }
}

TEST_CASE("Repo row operations", "[repo]"){
    Database db;
    Repo &repo = *db.repo;
    std::string err;

    Record row;
    REQUIRE(repo.insert(db.company, {{"name", "Acme LLC"}, {"is_active", true}, {"location", {{"country", "Brazil"}}}}, row, &err));
    const int64_t id = db.company.idOf(row);
    CHECK(id == 1);
    CHECK(row["is_active"] == true);
    CHECK(row["location"] == Record{{"country", "Brazil"}});
    CHECK(row["inserted_at"].is_string());
    CHECK(row["city"].is_null());

    SECTION("get returns the persisted row"){
        Record fetched;
        REQUIRE(repo.get(db.company, id, fetched, &err));
        CHECK(fetched == row);
        CHECK_FALSE(repo.get(db.company, 99, fetched, &err));
        CHECK(err == "no SimpleCompany with id 99");
    }

    SECTION("update changes only the given columns"){
        Record updated;
        REQUIRE(repo.update(db.company, id, {{"city", "Hong Kong"}}, updated, &err));
        CHECK(updated["city"] == "Hong Kong");
        CHECK(updated["name"] == "Acme LLC");
        CHECK_FALSE(repo.update(db.company, id, {{"colour", "red"}}, updated, &err));
        CHECK_FALSE(repo.update(db.company, 99, {{"city", "Paris"}}, updated, &err));
    }

    SECTION("remove fails for a missing row"){
        REQUIRE(repo.remove(db.company, id, &err));
        CHECK(repo.count(db.company.table) == 0);
        CHECK_FALSE(repo.remove(db.company, id, &err));
    }

    SECTION("select filters with a query"){
        Record other;
        REQUIRE(repo.insert(db.company, {{"name", "Globex"}, {"city", "Springfield"}}, other, &err));
        std::vector<Record> rows;
        REQUIRE(repo.select(Query(db.company).where("city", "Springfield"), rows, &err));
        REQUIRE(rows.size() == 1);
        CHECK(rows[0]["name"] == "Globex");
        REQUIRE(repo.select(Query(db.company).where("city", Op::IsNull), rows, &err));
        REQUIRE(rows.size() == 1);
        CHECK(rows[0]["name"] == "Acme LLC");
    }

    SECTION("insert rejects a row violating NOT NULL"){
        Record bad;
        CHECK_FALSE(repo.insert(db.company, {{"city", "Nowhere"}}, bad, &err));
        CHECK(repo.count(db.company.table) == 1);
    }
}

TEST_CASE("Repo sequence values never reuse deleted ids", "[repo]"){
    Database db;
    Repo &repo = *db.repo;
    int64_t next = 0;
    REQUIRE(repo.nextSequenceValue(db.user.table, "id", next));
    CHECK(next == 1);

    Record a, b;
    REQUIRE(repo.insert(db.user, {{"token", "a"}}, a));
    REQUIRE(repo.insert(db.user, {{"token", "b"}}, b));
    REQUIRE(repo.remove(db.user, db.user.idOf(b)));
    REQUIRE(repo.nextSequenceValue(db.user.table, "id", next));
    CHECK(next == 3);
}

TEST_CASE("Repo runInTransaction rolls back on failure", "[repo]"){
    Database db;
    Repo &repo = *db.repo;

    SECTION("a false return rolls back"){
        bool ok = repo.runInTransaction(TransactionMode::Deferred, [&](std::string*){
            Record row;
            REQUIRE(repo.insert(db.user, {{"token", "t"}}, row));
            return false;
        });
        CHECK_FALSE(ok);
        CHECK(db.rowCount(db.user) == 0);
    }

    SECTION("an exception rolls back and propagates"){
        CHECK_THROWS_AS(repo.runInTransaction(TransactionMode::Immediate, [&](std::string*) -> bool {
            Record row;
            REQUIRE(repo.insert(db.user, {{"token", "t"}}, row));
            throw std::runtime_error("boom");
        }), std::runtime_error);
        CHECK(db.rowCount(db.user) == 0);
    }

    SECTION("success commits"){
        REQUIRE(repo.runInTransaction(TransactionMode::Deferred, [&](std::string *err){
            Record row;
            return repo.insert(db.user, {{"token", "t"}}, row, err);
        }));
        CHECK(db.rowCount(db.user) == 1);
    }
}
