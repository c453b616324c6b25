#include <catch2/catch.hpp>
#include "Fixtures.hpp"
#include "Query.hpp"

using namespace Chronicle;
using namespace ChronicleTest;

TEST_CASE("Changeset cast keeps permitted differing attributes", "[changeset]"){
    const EntitySchema company = companySchema();
    const Record data = {{"id", 1}, {"name", "Acme LLC"}, {"city", "Greenwich"}};

    auto cs = Changeset::cast(company, data,
                              {{"name", "Acme LLC"}, {"city", "Hong Kong"}, {"twitter", "@acme"}, {"colour", "red"}},
                              {"name", "city", "colour"});
    CHECK(cs.isValid());
    CHECK(cs.changes() == Record{{"city", "Hong Kong"}});
    CHECK(cs.fetchField("city") == "Hong Kong");
    CHECK(cs.fetchField("name") == "Acme LLC");
    CHECK(cs.fetchField("website").is_null());
    CHECK(cs.applyChanges()["city"] == "Hong Kong");
    CHECK(cs.data() == data);
}

TEST_CASE("Changeset cast flags values that do not fit their column", "[changeset]"){
    const EntitySchema person = personSchema();
    auto cs = personChangeset(person, Record::object(),
                              {{"visit_count", "many"}, {"gender", true}, {"birthdate", "1992-04-01"}});
    CHECK_FALSE(cs.isValid());
    REQUIRE(cs.errors().count("visit_count") == 1);
    CHECK(cs.errors().at("visit_count") == std::vector<std::string>{"is invalid"});
    CHECK_FALSE(cs.changes().contains("visit_count"));
    CHECK(cs.changes()["gender"] == true);

    auto badDate = personChangeset(person, Record::object(), {{"birthdate", "April first"}});
    CHECK_FALSE(badDate.isValid());
}

TEST_CASE("Changeset cast rejects text that is not valid UTF-8", "[changeset]"){
    const EntitySchema company = companySchema();
    auto cs = companyChangeset(company, Record::object(), {{"name", "Acme \xff"}, {"city", "Greenwich"}});
    CHECK_FALSE(cs.isValid());
    REQUIRE(cs.errors().count("name") == 1);
    CHECK(cs.errors().at("name") == std::vector<std::string>{"is invalid"});
    CHECK(cs.changes() == Record{{"city", "Greenwich"}});

    auto nested = companyChangeset(company, Record::object(), {{"name", "Acme LLC"}, {"location", {{"country", "Bra\xc3"}}}});
    CHECK_FALSE(nested.isValid());
    CHECK(nested.errors().count("location") == 1);
}

TEST_CASE("Changeset validateRequired reports blank fields once", "[changeset]"){
    const EntitySchema company = companySchema();

    SECTION("missing on a new entity"){
        auto cs = companyChangeset(company, Record::object(), {{"name", nullptr}, {"city", "Greenwich"}});
        CHECK_FALSE(cs.isValid());
        CHECK(cs.errors().at("name") == std::vector<std::string>{"can't be blank"});
        cs.validateRequired({"name"});
        CHECK(cs.errors().at("name").size() == 1);
    }

    SECTION("cleared on an existing entity"){
        auto cs = companyChangeset(company, {{"id", 1}, {"name", "Acme LLC"}}, {{"name", ""}});
        CHECK_FALSE(cs.isValid());
        CHECK(cs.changes()["name"] == "");
    }

    SECTION("present in the base data"){
        auto cs = companyChangeset(company, {{"id", 1}, {"name", "Acme LLC"}}, {{"city", "Paris"}});
        CHECK(cs.isValid());
    }
}

TEST_CASE("Changeset change edits", "[changeset]"){
    const EntitySchema company = companySchema();
    Changeset cs(company, {{"id", 3}});
    cs.putChange("name", "Initech").putChange("city", "Austin");
    CHECK(cs.hasChanges());
    cs.dropChanges({"city", "not_there"});
    CHECK(cs.changes() == Record{{"name", "Initech"}});

    auto untouched = Changeset::forEntity(company, {{"id", 3}, {"name", "Initech"}});
    CHECK_FALSE(untouched.hasChanges());
    CHECK(untouched.isValid());
    CHECK(untouched != cs);
}

TEST_CASE("Query compiles conditions to a WHERE clause", "[query]"){
    const EntitySchema user = userSchema();
    std::string where;
    std::vector<BoundValue> params;
    std::string err;

    SECTION("no conditions"){
        REQUIRE(Query(user).compile(where, params, &err));
        CHECK(where.empty());
    }

    SECTION("comparisons and IN"){
        Query q(user);
        q.where("username", "isaac").where("id", Op::Gt, 2).whereIn("token", {"a", "b"});
        REQUIRE(q.compile(where, params, &err));
        CHECK(where == " WHERE \"users\".\"username\" = ? AND \"users\".\"id\" > ? AND \"users\".\"token\" IN (?, ?)");
        REQUIRE(params.size() == 4);
        CHECK(params[1].value == 2);
        CHECK(params[3].column.name == "token");
    }

    SECTION("null comparisons become IS NULL checks"){
        Query q(user);
        q.where("username", nullptr).where("token", Op::NotEq, nullptr);
        REQUIRE(q.compile(where, params, &err));
        CHECK(where == " WHERE \"users\".\"username\" IS NULL AND \"users\".\"token\" IS NOT NULL");
        CHECK(params.empty());
    }

    SECTION("empty IN matches nothing"){
        REQUIRE(Query(user).whereIn("id", {}).compile(where, params, &err));
        CHECK(where == " WHERE 0");
    }

    SECTION("unknown columns are rejected"){
        CHECK_FALSE(Query(user).where("email", "x").compile(where, params, &err));
        CHECK(err == "unknown column 'email' for User");
    }
}
