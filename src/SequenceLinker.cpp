#include "SequenceLinker.hpp"
#include "ChangeCapture.hpp"
#include <plog/Log.h>

namespace Chronicle {

bool SequenceLinker::reserve(const EntitySchema &schema, VersionEvent event, Reservation &out, std::string *outError){
    if(!repo.nextSequenceValue(repo.versionsTable(), "id", out.versionId, outError)) return false;
    if(event == VersionEvent::Insert){
        if(!repo.nextSequenceValue(schema.table, schema.primaryKey, out.entityId, outError)) return false;
    }
    PLOGD << "SequenceLinker: reserved version " << out.versionId << " for " << schema.itemType
          << (event == VersionEvent::Insert ? " entity " + std::to_string(out.entityId) : std::string());
    return true;
}

bool SequenceLinker::insertPlaceholder(VersionEvent event, const Changeset &changeset, Version &outPlaceholder, std::string *outError){
    const EntitySchema &schema = changeset.schema();
    Reservation r;
    if(!reserve(schema, event, r, outError)) return false;

    Version v;
    if(event == VersionEvent::Insert){
        Record predicted = changeset.applyChanges();
        predicted[schema.primaryKey] = r.entityId;
        predicted[kFirstVersionColumn] = r.versionId;
        predicted[kCurrentVersionColumn] = r.versionId;
        v = ChangeCapture::capture(VersionEvent::Insert, schema, predicted, options);
    } else if(event == VersionEvent::SoftDelete){
        // prior state, already pointing at the version that records it
        Record prior = changeset.data();
        prior[kCurrentVersionColumn] = r.versionId;
        v = ChangeCapture::capture(VersionEvent::SoftDelete, schema, prior, options);
    } else {
        Changeset target = changeset;
        target.putChange(kCurrentVersionColumn, r.versionId);
        v = ChangeCapture::capture(VersionEvent::Update, target, options);
    }
    v.id = r.versionId;
    if(!repo.insertVersion(v, true, outError)) return false;
    outPlaceholder = v;
    return true;
}

bool SequenceLinker::linkEntity(VersionEvent event, const Changeset &changeset, const Version &placeholder,
                                Record &outEntity, std::string *outError){
    const EntitySchema &schema = changeset.schema();
    if(event == VersionEvent::Insert){
        Record attrs = changeset.applyChanges();
        attrs[schema.primaryKey] = placeholder.itemId;
        attrs[kFirstVersionColumn] = placeholder.id;
        attrs[kCurrentVersionColumn] = placeholder.id;
        return repo.insert(schema, attrs, outEntity, outError);
    }
    Record changes = event == VersionEvent::SoftDelete ? Record{{kDeletedAtColumn, utcTimestamp()}} : changeset.changes();
    changes[kCurrentVersionColumn] = placeholder.id;
    return repo.update(schema, schema.idOf(changeset.data()), changes, outEntity, outError);
}

bool SequenceLinker::finalize(VersionEvent event, const Changeset &changeset, const Version &placeholder,
                              const Record &entity, Version &outVersion, std::string *outError){
    if(event == VersionEvent::SoftDelete){
        // payload was complete when the placeholder was written
        outVersion = placeholder;
        return true;
    }
    const EntitySchema &schema = changeset.schema();
    Version target = placeholder;
    if(event == VersionEvent::Insert){
        target.itemChanges = ChangeCapture::serialize(schema, entity);
        target.itemId = schema.idOf(entity);
    } else {
        target.itemChanges[kCurrentVersionColumn] = placeholder.id;
    }
    if(event == VersionEvent::Insert && target.itemId != placeholder.itemId){
        if(outError) *outError = "entity id " + std::to_string(target.itemId) + " does not match reserved id " + std::to_string(placeholder.itemId);
        return false;
    }
    if(!repo.updateVersionChanges(placeholder.id, target.itemChanges, outError)) return false;
    outVersion = target;
    return true;
}

} // namespace Chronicle
