#ifndef UNITOFWORK_H
#define UNITOFWORK_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QHash>
#include <QPair>
#include <functional>

#include "tablestore.h"
#include "upsertpolicy.h"
#include "fseterror.h"

// Resultado de un paso: filas afectadas y, si se pidió, las filas devueltas
struct StepResult {
    int          count = 0;
    QVector<Row> rows;
};
using StepChanges = QHash<QString, StepResult>;

/*
 * Lista ordenada de pasos con nombre que se ejecutan dentro de una única
 * transacción (ver Repository::submit). Cada paso recibe los resultados de
 * los anteriores, así un paso puede calcular sus filas a partir de lo que
 * otro acaba de insertar.
 */
class UnitOfWork {
public:
    using Step = std::function<bool(TableStore& store, const StepChanges& changes,
                                    StepResult& result, FsetError* err)>;
    using RowsBuilder = std::function<bool(const StepChanges& changes,
                                           QVector<Row>& rows, FsetError* err)>;

    UnitOfWork& run(const QString& name, Step step);

    UnitOfWork& insertAll(const QString& name, const UpsertPolicy& policy, const QVector<Row>& rows);
    UnitOfWork& insertAll(const QString& name, const UpsertPolicy& policy, RowsBuilder build);
    UnitOfWork& deleteAll(const QString& name, const QString& table, RowPredicate where);
    UnitOfWork& update(const QString& name, const QString& table, const QVariant& id, const Row& patch);

    QStringList stepNames() const;
    int  size() const { return m_steps.size(); }
    bool isEmpty() const { return m_steps.isEmpty(); }

    const QVector<QPair<QString, Step>>& steps() const { return m_steps; }

private:
    QVector<QPair<QString, Step>> m_steps;
};

#endif // UNITOFWORK_H
