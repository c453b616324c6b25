#include <catch2/catch.hpp>
#include "Fixtures.hpp"
#include "VersionedRepo.hpp"
#include "VersionQueries.hpp"

using namespace Chronicle;
using namespace ChronicleTest;

namespace {

std::vector<Record> insertTwoUsers(Database &db){
    VersionedRepo vr(*db.repo, db.cfg);
    std::vector<Record> users;
    users.push_back(vr.insertOrThrow(userChangeset(db.user, Record::object(), {{"token", "token-1"}, {"username", "alice"}})));
    users.push_back(vr.insertOrThrow(userChangeset(db.user, Record::object(), {{"token", "token-2"}, {"username", "bob"}})));
    return users;
}

Query usersWithTokens(const EntitySchema &user){
    Query q(user);
    q.whereIn("token", {"token-1", "token-2"});
    return q;
}

} // namespace

TEST_CASE("insertAll versions every inserted row under its own key", "[bulk]"){
    Database db;
    VersionedRepo vr(*db.repo, db.cfg);

    auto result = vr.insertAll(db.company, {
        {{"name", "Acme LLC"}, {"website", "http://www.acme.com"}},
        {{"name", "Acme LLC"}, {"website", "http://www.acme.com"}, {"city", "Greenwich 2"}},
    });
    REQUIRE(result.ok());

    const EntityBatch &batch = result.changes().get<EntityBatch>("model");
    CHECK(batch.count == 2);
    REQUIRE(batch.rows);
    REQUIRE(batch.rows->size() == 2);
    CHECK(db.rowCount(db.company) == 2);
    CHECK(db.versionCount() == 2);

    for(const auto &row : *batch.rows){
        const int64_t id = db.company.idOf(row);
        const Version *version = result.changes().version(StepKey("version", id));
        REQUIRE(version);
        CHECK(version->event == VersionEvent::Insert);
        CHECK(version->itemId == id);
        CHECK(version->itemChanges == row);
    }
    CHECK((*batch.rows)[1]["city"] == "Greenwich 2");
}

TEST_CASE("insertAll with no entries succeeds without versions", "[bulk]"){
    Database db;
    VersionedRepo vr(*db.repo, db.cfg);
    auto result = vr.insertAll(db.company, {});
    REQUIRE(result.ok());
    CHECK(result.changes().get<EntityBatch>("model").count == 0);
    CHECK(result.changes().size() == 1);
    CHECK(db.versionCount() == 0);
}

TEST_CASE("insertAll failures roll back the whole batch", "[bulk]"){
    Database db;
    VersionedRepo vr(*db.repo, db.cfg);
    auto result = vr.insertAll(db.company, {{{"name", "Acme LLC"}}, {{"city", "No name"}}});
    REQUIRE_FALSE(result.ok());
    CHECK(result.failedStep() == StepKey("model"));
    CHECK(db.rowCount(db.company) == 0);
    CHECK(db.versionCount() == 0);
}

TEST_CASE("updateAll versions each matched row with the set map", "[bulk]"){
    Database db;
    VersionedRepo vr(*db.repo, db.cfg);
    const auto users = insertTwoUsers(db);
    REQUIRE(db.versionCount() == 2);

    Options options;
    options.originatorId = db.user.idOf(users[0]);
    auto result = vr.updateAll(usersWithTokens(db.user), {{"username", "isaac"}}, options);
    REQUIRE(result.ok());
    CHECK(result.changes().get<EntityBatch>("model").count == 2);
    const VersionBatch &versions = result.changes().get<VersionBatch>("version");
    CHECK(versions.count == 2);
    CHECK_FALSE(versions.versions);
    CHECK(db.versionCount() == 4);

    for(const auto &user : users){
        std::vector<Version> history;
        REQUIRE(VersionQueries::getVersions(*db.repo, db.user, db.user.idOf(user), history));
        REQUIRE(history.size() == 2);
        const Version &latest = history.front();
        CHECK(latest.event == VersionEvent::Update);
        CHECK(latest.itemType == "User");
        CHECK(latest.itemChanges == Record{{"username", "isaac"}});
        CHECK(latest.originatorId == options.originatorId);

        Record stored;
        REQUIRE(db.repo->get(db.user, db.user.idOf(user), stored));
        CHECK(stored["username"] == "isaac");
    }
}

TEST_CASE("updateAll writes versions before the rows change", "[bulk]"){
    Database db;
    VersionedRepo vr(*db.repo, db.cfg);
    insertTwoUsers(db);

    // refuses any user update that has no update version yet
    REQUIRE(db.repo->backend()->execute(
        "CREATE TRIGGER users_need_version BEFORE UPDATE ON users "
        "WHEN NOT EXISTS (SELECT 1 FROM versions WHERE item_type = 'User' AND item_id = NEW.id AND event = 'update') "
        "BEGIN SELECT RAISE(ABORT, 'update without version'); END;"));

    const auto steps = vr.multi().updateAll(usersWithTokens(db.user), {{"username", "isaac"}}).toList();
    REQUIRE(steps.size() == 2);
    CHECK(steps[0] == StepKey("version"));
    CHECK(steps[1] == StepKey("model"));

    auto result = vr.updateAll(usersWithTokens(db.user), {{"username", "isaac"}});
    INFO((result.ok() ? std::string() : describeStepError(result.error())));
    REQUIRE(result.ok());
    CHECK(db.versionCount() == 4);
}

TEST_CASE("updateAll returning exposes the inserted versions", "[bulk]"){
    Database db;
    VersionedRepo vr(*db.repo, db.cfg);
    const auto users = insertTwoUsers(db);

    Options options;
    options.returning = true;
    options.returnOperation = "version";
    auto result = vr.updateAll(usersWithTokens(db.user), {{"username", "isaac"}}, options);
    REQUIRE(result.ok());
    REQUIRE(result.selected());
    const VersionBatch &batch = std::get<VersionBatch>(*result.selected());
    CHECK(batch.count == 2);
    REQUIRE(batch.versions);
    REQUIRE(batch.versions->size() == 2);
    CHECK((*batch.versions)[0].itemId == db.user.idOf(users[0]));
    CHECK((*batch.versions)[1].itemId == db.user.idOf(users[1]));
    for(const auto &v : *batch.versions){
        CHECK(v.event == VersionEvent::Update);
        CHECK(v.itemChanges == Record{{"username", "isaac"}});
        CHECK(v.id > 2);
    }

    SECTION("returning is ignored unless the version step is selected"){
        Options modelOnly;
        modelOnly.returning = true;
        auto again = vr.updateAll(usersWithTokens(db.user), {{"username", "jacob"}}, modelOnly);
        REQUIRE(again.ok());
        CHECK_FALSE(again.changes().get<VersionBatch>("version").versions);
    }
}

TEST_CASE("updateAll matching nothing is a successful no-op", "[bulk]"){
    Database db;
    VersionedRepo vr(*db.repo, db.cfg);
    insertTwoUsers(db);
    Query none(db.user);
    none.where("username", "nobody");
    auto result = vr.updateAll(none, {{"username", "isaac"}});
    REQUIRE(result.ok());
    CHECK(result.changes().get<EntityBatch>("model").count == 0);
    CHECK(result.changes().get<VersionBatch>("version").count == 0);
    CHECK(db.versionCount() == 2);
}

TEST_CASE("updateAll with an unknown column fails on the version step", "[bulk]"){
    Database db;
    VersionedRepo vr(*db.repo, db.cfg);
    insertTwoUsers(db);
    Query q(db.user);
    q.where("email", "x@y.z");
    auto result = vr.updateAll(q, {{"username", "isaac"}});
    REQUIRE_FALSE(result.ok());
    CHECK(result.failedStep() == StepKey("version"));
    REQUIRE(result.persistenceError());
    CHECK(result.persistenceError()->message == "unknown column 'email' for User");
}

TEST_CASE("updateAll with unencodable text fails on the version step", "[bulk]"){
    Database db;
    VersionedRepo vr(*db.repo, db.cfg);
    const auto users = insertTwoUsers(db);
    auto result = vr.updateAll(usersWithTokens(db.user), {{"username", "isaac \xff"}});
    REQUIRE_FALSE(result.ok());
    CHECK(result.failedStep() == StepKey("version"));
    REQUIRE(result.persistenceError());
    CHECK(result.persistenceError()->message.find("UTF-8") != std::string::npos);
    CHECK(db.versionCount() == 2);

    Record row;
    REQUIRE(db.repo->get(db.user, db.user.idOf(users.front()), row));
    CHECK(row["username"] == "alice");
}

TEST_CASE("softDeleteAll versions the full rows and marks them deleted", "[bulk]"){
    Database db;
    VersionedRepo vr(*db.repo, db.cfg);
    std::vector<Record> people;
    for(const char *name : {"Ada", "Grace"}){
        people.push_back(vr.insertOrThrow(personChangeset(db.person, Record::object(),
                                                          {{"first_name", name}, {"last_name", "Doe"}, {"gender", false}})));
    }
    vr.insertOrThrow(personChangeset(db.person, Record::object(), {{"first_name", "Alan"}, {"last_name", "Roe"}}));

    Query does(db.person);
    does.where("last_name", "Doe");
    Options options;
    options.returning = true;
    options.returnOperation = "version";
    auto result = vr.softDeleteAll(does, options);
    REQUIRE(result.ok());
    CHECK(result.changes().get<EntityBatch>("model").count == 2);

    const VersionBatch &batch = std::get<VersionBatch>(*result.selected());
    REQUIRE(batch.versions);
    REQUIRE(batch.versions->size() == 2);
    for(size_t i = 0; i < people.size(); ++i){
        const Version &v = (*batch.versions)[i];
        CHECK(v.event == VersionEvent::SoftDelete);
        CHECK(v.itemId == db.person.idOf(people[i]));
        CHECK(v.itemChanges["deleted_at"].is_string());
        Record before = people[i];
        before.erase("deleted_at");
        Record after = v.itemChanges;
        after.erase("deleted_at");
        CHECK(after == before);

        Record stored;
        REQUIRE(db.repo->get(db.person, v.itemId, stored));
        CHECK(stored["deleted_at"] == v.itemChanges["deleted_at"]);
    }
    CHECK(db.rowCount(db.person) == 3);

    CHECK_THROWS_AS(vr.softDeleteAll(Query(db.company)), std::invalid_argument);
}
