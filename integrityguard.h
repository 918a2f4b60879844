#ifndef INTEGRITYGUARD_H
#define INTEGRITYGUARD_H

#include <QVector>
#include "difftranslator.h"
#include "fmodels.h"

// Ok(resueltos) | Err(fmodel culpable)
struct ParentResolution {
    bool                 ok = true;
    QVector<FmodelAttrs> resolved;
    FmodelAttrs          offending;
    QString              missingParent; // parentAnchor que no se encontró
};

/*
 * Resuelve el archivo padre de cada fmodel a partir del "parentAnchor" que
 * viaja dentro de 'sch'. El marcador se quita siempre (no se persiste). Un solo
 * padre sin resolver invalida todo el lote: nunca se descarta un fmodel en
 * silencio.
 */
class IntegrityGuard {
public:
    static const char* const kParentAnchor; // "parentAnchor"

    static ParentResolution putRequiredFileId(const QVector<FmodelAttrs>& fmodels,
                                              const QVector<FileRef>& files);
};

#endif // INTEGRITYGUARD_H
