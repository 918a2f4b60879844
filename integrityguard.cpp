#include "integrityguard.h"

const char* const IntegrityGuard::kParentAnchor = "parentAnchor";

ParentResolution IntegrityGuard::putRequiredFileId(const QVector<FmodelAttrs>& fmodels,
                                                   const QVector<FileRef>& files)
{
    ParentResolution res;
    res.resolved.reserve(fmodels.size());

    for (FmodelAttrs fm : fmodels) {
        const QString key = QString::fromLatin1(kParentAnchor);
        const QString parentAnchor = FieldValue::from(fm.sch.value(key)).current().toString();
        fm.sch.remove(key);

        // primer archivo con ese ancla (los recién insertados van delante)
        const FileRef* parent = nullptr;
        for (const FileRef& f : files) {
            if (!parentAnchor.isEmpty() && f.anchor == parentAnchor) { parent = &f; break; }
        }

        if (!parent) {
            res.ok = false;
            res.resolved.clear();
            res.offending = fm;
            res.missingParent = parentAnchor;
            return res;
        }

        fm.values.insert("file_id", parent->id);
        res.resolved.push_back(fm);
    }
    return res;
}
