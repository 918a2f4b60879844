#pragma once
#include <QString>
#include <QVariantMap>
#include <QJsonObject>

#include "repository.h"
#include "reconciler.h"
#include "idprovider.h"

/*
 * API para quien recibe los diffs (servidor, CLI...):
 *   getProject(nombre)  -> por ancla si es UUID, si no por clave
 *   create(atributos)   -> clave por defecto "<prefijo><unix>"
 *   persistDiff(diff, proyecto)
 *   applyDiff(diff, proyecto) -> persistDiff + estado resultante
 *   toProjectSch(proyecto) -> representación anidada para el cliente
 */
class Projects {
public:
    Projects(Repository& repo, const IdProvider& ids,
             const QString& defaultKeyPrefix = QStringLiteral("project_"));

    bool getProject(const QString& name, Project* out, FsetError* err = nullptr) const;
    bool create(const QVariantMap& params, Project* out, FsetError* err = nullptr);
    bool persistDiff(const QJsonObject& diff, const Project& project, FsetError* err = nullptr);
    // Recarga por id: el diff puede cambiar la clave del proyecto
    bool applyDiff(const QJsonObject& diff, const Project& project, Project* result,
                   FsetError* err = nullptr);

    static QJsonObject toProjectSch(const Project& project);

private:
    Repository&       m_repo;
    const IdProvider& m_ids;
    Reconciler        m_reconciler;
    QString           m_keyPrefix;
};
