#include "Config.hpp"
#include <plog/Log.h>
#include <fstream>

namespace Chronicle {

bool configFromJSON(const nlohmann::json &j, ChronicleConfig &out, std::string *outError){
    if(!j.is_object()){ if(outError) *outError = "config: expected a JSON object"; return false; }
    ChronicleConfig cfg;
    try{
        std::string backend = j.value("backend", std::string("sqlite"));
        if(backend != "sqlite"){
            if(outError) *outError = "config: unsupported backend '" + backend + "'";
            return false;
        }
        cfg.connInfo.backend = DBConnectionInfo::Backend::SQLite;
        cfg.connInfo.sqlite_dir = j.value("sqlite_dir", std::string());
        cfg.connInfo.sqlite_filename = j.value("sqlite_filename", std::string("chronicle.db"));
        cfg.strictMode = j.value("strict_mode", false);
        cfg.versionsTable = j.value("versions_table", std::string("versions"));
        cfg.logLevel = j.value("log_level", std::string("info"));
    } catch(const nlohmann::json::exception &ex){
        if(outError) *outError = std::string("config: ") + ex.what();
        return false;
    }
    if(cfg.versionsTable.empty()){ if(outError) *outError = "config: versions_table must not be empty"; return false; }
    out = cfg;
    return true;
}

bool loadConfig(const std::string &path, ChronicleConfig &out, std::string *outError){
    std::ifstream in(path);
    if(!in){ if(outError) *outError = "config: cannot open " + path; return false; }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if(j.is_discarded()){ if(outError) *outError = "config: malformed JSON in " + path; return false; }
    if(!configFromJSON(j, out, outError)) return false;
    PLOGI << "config: loaded " << path << " (strict_mode=" << (out.strictMode ? "true" : "false") << ")";
    return true;
}

} // namespace Chronicle
