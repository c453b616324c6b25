#pragma once
#include <memory>
#include <string>
#include <vector>
#include <catch2/catch.hpp>
#include "Repo.hpp"
#include "Changeset.hpp"

namespace ChronicleTest {

using Chronicle::Column;
using Chronicle::ColumnType;
using Chronicle::EntitySchema;
using Chronicle::Record;

inline EntitySchema userSchema(){
    EntitySchema s;
    s.itemType = "User";
    s.table = "users";
    s.columns = {
        Column{"token", ColumnType::Text, false, {}},
        Column{"username", ColumnType::Text, true, {}},
    };
    return s;
}

inline EntitySchema companySchema(){
    EntitySchema s;
    s.itemType = "SimpleCompany";
    s.table = "simple_companies";
    s.columns = {
        Column{"name", ColumnType::Text, false, {}},
        Column{"is_active", ColumnType::Boolean, true, {}},
        Column{"website", ColumnType::Text, true, {}},
        Column{"city", ColumnType::Text, true, {}},
        Column{"address", ColumnType::Text, true, {}},
        Column{"facebook", ColumnType::Text, true, {}},
        Column{"twitter", ColumnType::Text, true, {}},
        Column{"founded_in", ColumnType::Text, true, {}},
        Column{"location", ColumnType::Json, true, {}},
        Column{"email_options", ColumnType::Json, true, {}},
    };
    return s;
}

inline EntitySchema personSchema(){
    EntitySchema s;
    s.itemType = "SimplePerson";
    s.table = "simple_people";
    s.softDelete = true;
    s.columns = {
        Column{"first_name", ColumnType::Text, true, {}},
        Column{"last_name", ColumnType::Text, true, {}},
        Column{"visit_count", ColumnType::Integer, true, {}},
        Column{"gender", ColumnType::Boolean, true, {}},
        Column{"birthdate", ColumnType::Date, true, {}},
        Column{"company_id", ColumnType::Integer, true, "simple_companies(id)"},
    };
    return s;
}

inline EntitySchema strictCompanySchema(){
    EntitySchema s;
    s.itemType = "StrictCompany";
    s.table = "strict_companies";
    s.versionLinks = true;
    s.softDelete = true;
    s.columns = {
        Column{"name", ColumnType::Text, false, {}},
        Column{"city", ColumnType::Text, true, {}},
        Column{"website", ColumnType::Text, true, {}},
    };
    return s;
}

inline std::vector<std::string> permittedColumns(const EntitySchema &schema){
    std::vector<std::string> out;
    for(const auto &c : schema.columns) out.push_back(c.name);
    return out;
}

// cast + validateRequired the way the fixture models validate.
inline Chronicle::Changeset companyChangeset(const EntitySchema &schema, Record data, const Record &params){
    auto cs = Chronicle::Changeset::cast(schema, std::move(data), params, permittedColumns(schema));
    cs.validateRequired({"name"});
    return cs;
}

inline Chronicle::Changeset personChangeset(const EntitySchema &schema, Record data, const Record &params){
    return Chronicle::Changeset::cast(schema, std::move(data), params, permittedColumns(schema));
}

inline Chronicle::Changeset userChangeset(const EntitySchema &schema, Record data, const Record &params){
    auto cs = Chronicle::Changeset::cast(schema, std::move(data), params, permittedColumns(schema));
    cs.validateRequired({"token"});
    return cs;
}

inline const Record& createCompanyParams(){
    static const Record params = {
        {"name", "Acme LLC"},
        {"is_active", true},
        {"city", "Greenwich"},
        {"location", {{"country", "Brazil"}}},
        {"email_options", {{"newsletter_enabled", false}}},
    };
    return params;
}

inline const Record& updateCompanyParams(){
    static const Record params = {
        {"city", "Hong Kong"},
        {"website", "http://www.acme.com"},
        {"facebook", "acme.llc"},
        {"location", {{"country", "Chile"}}},
        {"email_options", {{"newsletter_enabled", true}}},
    };
    return params;
}

// Fresh in-memory database with every fixture table.
struct Database {
    explicit Database(bool strict = false){
        cfg.connInfo.sqlite_filename = ":memory:";
        cfg.strictMode = strict;
        std::string err;
        repo = Chronicle::Repo::Open(cfg, &err);
        INFO(err);
        REQUIRE(repo);
        REQUIRE(repo->ensureSchema(user, &err));
        REQUIRE(repo->ensureSchema(company, &err));
        REQUIRE(repo->ensureSchema(person, &err));
        REQUIRE(repo->ensureSchema(strictCompany, &err));
    }

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    int64_t versionCount() const { return repo->count(repo->versionsTable()); }
    int64_t rowCount(const EntitySchema &schema) const { return repo->count(schema.table); }

    Chronicle::ChronicleConfig cfg;
    EntitySchema user = userSchema();
    EntitySchema company = companySchema();
    EntitySchema person = personSchema();
    EntitySchema strictCompany = strictCompanySchema();
    std::unique_ptr<Chronicle::Repo> repo;
};

// Drops the columns the database fills in.
inline Record withoutGenerated(Record row){
    for(const char *k : {"id", "inserted_at", "updated_at"}) row.erase(k);
    return row;
}

} // namespace ChronicleTest
