#pragma once
#include <string>
#include <vector>
#include <optional>
#include "Repo.hpp"

namespace Chronicle {

// Read side of the ledger.
namespace VersionQueries {

    // Versions of one entity, newest first.
    bool getVersions(Repo &repo, const EntitySchema &schema, int64_t itemId, std::vector<Version> &out, std::string *outError = nullptr);
    // Latest version of one entity; out is empty when it has none.
    bool getVersion(Repo &repo, const EntitySchema &schema, int64_t itemId, std::optional<Version> &out, std::string *outError = nullptr);
    bool getVersionById(Repo &repo, int64_t versionId, std::optional<Version> &out, std::string *outError = nullptr);
    // Versions of one entity, oldest first.
    bool chain(Repo &repo, const EntitySchema &schema, int64_t itemId, std::vector<Version> &out, std::string *outError = nullptr);

    // Checks the link columns of a strict mode entity against its ledger:
    // first_version_id is the oldest version and current_version_id the newest.
    bool verifyChain(Repo &repo, const EntitySchema &schema, int64_t itemId, std::string *outError = nullptr);

} // namespace VersionQueries

} // namespace Chronicle
