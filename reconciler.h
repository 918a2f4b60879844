#ifndef RECONCILER_H
#define RECONCILER_H

#include <QCoreApplication>
#include <QJsonObject>
#include <QVector>

#include "repository.h"
#include "difftranslator.h"
#include "idprovider.h"

/*
 * Aplica un diff {changed, removed, added} sobre un proyecto ya cargado, como
 * una sola transacción. Orden fijo:
 *   1. changed: update_project, update_files, update_fmodels
 *   2. removed: delete_fmodels, delete_files
 *   3. added:   insert_files (returning), insert_fmodels
 * insert_fmodels resuelve sus padres contra los archivos previos MÁS los que
 * insert_files devolvió dentro de la misma transacción.
 */
class Reconciler {
    Q_DECLARE_TR_FUNCTIONS(Reconciler)
public:
    Reconciler(Repository& repo, const IdProvider& ids);

    bool persistDiff(const QJsonObject& diff, const Project& project,
                     StepChanges* changes = nullptr, FsetError* err = nullptr);

    // Arma la unidad de trabajo sin ejecutarla (la traducción ocurre aquí)
    bool buildUnitOfWork(const QJsonObject& diff, const Project& project,
                         UnitOfWork& uow, FsetError* err = nullptr) const;

private:
    bool updateChangedDiff(UnitOfWork& uow, const Project& project,
                           const QJsonObject& diff, FsetError* err) const;
    bool deleteRemovedDiff(UnitOfWork& uow, const Project& project,
                           const QJsonObject& diff, FsetError* err) const;
    bool insertAddedDiff(UnitOfWork& uow, const Project& project,
                         const QJsonObject& diff, FsetError* err) const;

    // bucket[kind] como lista de entradas; ausente/null = vacío
    bool entriesOf(const QJsonObject& diff, const QString& bucket, const QString& kind,
                   QVector<QJsonValue>& out, FsetError* err) const;
    bool translateFiles(const QVector<QJsonValue>& entries, const Project& project,
                        QVector<Row>& rows, QVector<FileAttrs>* attrs, FsetError* err) const;
    bool translateFmodels(const QVector<QJsonValue>& entries,
                          QVector<FmodelAttrs>& out, FsetError* err) const;
    Row  putTimestamp(Row row) const;

    Repository&       m_repo;
    const IdProvider& m_ids;
};

#endif // RECONCILER_H
