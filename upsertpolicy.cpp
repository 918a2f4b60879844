#include "upsertpolicy.h"
#include "repository.h"

static QStringList fmodelReplace() {
    return { "key", "type", "is_entry", "sch" };
}

UpsertPolicy UpsertPolicy::changedFiles() {
    // el ancla puede no ser conocida aún por el cliente: se empareja por clave humana
    return { Repository::kFiles, { "key", "project_id" }, { "key", "order" }, false };
}

UpsertPolicy UpsertPolicy::changedFmodels() {
    return { Repository::kFmodels, { "anchor" }, fmodelReplace(), false };
}

UpsertPolicy UpsertPolicy::addedFiles() {
    // returning: los ids generados alimentan la inserción de fmodels
    return { Repository::kFiles, { "anchor" }, { "key", "order" }, true };
}

UpsertPolicy UpsertPolicy::addedFmodels() {
    return { Repository::kFmodels, { "anchor" }, fmodelReplace(), false };
}
