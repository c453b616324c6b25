#pragma once
#include <string>
#include <cstdint>
#include "Repo.hpp"
#include "Changeset.hpp"

namespace Chronicle {

// Strict mode: links an entity to its versions through first_version_id and
// current_version_id in three phases run inside one transaction:
//   1. reserve the next version id (and, for inserts, entity id) and insert a
//      placeholder version carrying them
//   2. insert/update the entity pointing at the placeholder
//   3. rewrite the placeholder's item_changes from the persisted entity
// Soft deletes use phases 1 and 2 only: the placeholder already holds the
// prior row and phase 2 marks the row and moves current_version_id.
//
// Precondition: the transaction holds the write lock from BEGIN
// (TransactionMode::Immediate). Reserved ids are read as max(sequence, MAX(id)) + 1
// and written explicitly, which is only race free while writers are serialized.
class SequenceLinker {
public:
    static constexpr const char* kInitialVersionKey = "initial_version";

    struct Reservation {
        int64_t versionId = 0;
        int64_t entityId = 0; // only reserved for inserts
    };

    SequenceLinker(Repo &repo, const Options &options) : repo(repo), options(options) {}

    bool reserve(const EntitySchema &schema, VersionEvent event, Reservation &out, std::string *outError = nullptr);

    // Phase 1. For inserts the placeholder's item_id is the reserved entity id.
    bool insertPlaceholder(VersionEvent event, const Changeset &changeset, Version &outPlaceholder, std::string *outError = nullptr);

    // Phase 2.
    bool linkEntity(VersionEvent event, const Changeset &changeset, const Version &placeholder,
                    Record &outEntity, std::string *outError = nullptr);

    // Phase 3. outVersion is the placeholder as finally persisted.
    bool finalize(VersionEvent event, const Changeset &changeset, const Version &placeholder,
                  const Record &entity, Version &outVersion, std::string *outError = nullptr);

private:
    Repo &repo;
    const Options &options;
};

} // namespace Chronicle
