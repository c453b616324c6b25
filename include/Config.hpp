#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "DBBackend.hpp"

namespace Chronicle {

// Process configuration. Passed explicitly to every component that needs it.
struct ChronicleConfig {
    DBConnectionInfo connInfo;
    bool strictMode = false;
    std::string versionsTable = "versions";
    std::string logLevel = "info";
};

bool configFromJSON(const nlohmann::json &j, ChronicleConfig &out, std::string *outError = nullptr);
bool loadConfig(const std::string &path, ChronicleConfig &out, std::string *outError = nullptr);

// Per-call options for one composed operation.
struct Options {
    std::string modelKey = "model";
    std::string versionKey = "version";
    // when set, commit() surfaces only this step's result
    std::optional<std::string> returnOperation;
    std::optional<int64_t> originatorId;
    std::optional<std::string> origin;
    nlohmann::json meta; // null when absent
    // bulk version inserts return the inserted rows (only honoured when
    // returnOperation names the version step)
    bool returning = false;
};

} // namespace Chronicle
