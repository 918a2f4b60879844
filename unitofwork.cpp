#include "unitofwork.h"

UnitOfWork& UnitOfWork::run(const QString& name, Step step) {
    m_steps.push_back(qMakePair(name, std::move(step)));
    return *this;
}

UnitOfWork& UnitOfWork::insertAll(const QString& name, const UpsertPolicy& policy, const QVector<Row>& rows) {
    return insertAll(name, policy, [rows](const StepChanges&, QVector<Row>& out, FsetError*) {
        out = rows;
        return true;
    });
}

UnitOfWork& UnitOfWork::insertAll(const QString& name, const UpsertPolicy& policy, RowsBuilder build) {
    return run(name, [policy, build](TableStore& store, const StepChanges& changes,
                                     StepResult& result, FsetError* err) {
        QVector<Row> rows;
        if (!build(changes, rows, err)) return false;
        if (rows.isEmpty()) return true;

        QString e;
        QVector<Row> returned;
        if (!store.insertAll(policy.table, rows, policy.conflictTarget, policy.replaceColumns,
                             &returned, &e))
            return fail(err, FsetErrorKind::ConflictViolation, e);

        result.count = returned.size();
        if (policy.returning) result.rows = returned;
        return true;
    });
}

UnitOfWork& UnitOfWork::deleteAll(const QString& name, const QString& table, RowPredicate where) {
    return run(name, [table, where](TableStore& store, const StepChanges&,
                                    StepResult& result, FsetError* err) {
        QString e;
        const int n = store.deleteWhere(table, where, &e);
        if (n < 0) return fail(err, FsetErrorKind::ConflictViolation, e);
        result.count = n;
        return true;
    });
}

UnitOfWork& UnitOfWork::update(const QString& name, const QString& table, const QVariant& id, const Row& patch) {
    return run(name, [table, id, patch](TableStore& store, const StepChanges&,
                                        StepResult& result, FsetError* err) {
        QString e;
        Row updated;
        if (!store.updateById(table, id, patch, &updated, &e))
            return fail(err, FsetErrorKind::ConflictViolation, e);
        result.count = patch.isEmpty() ? 0 : 1;
        result.rows  = { updated };
        return true;
    });
}

QStringList UnitOfWork::stepNames() const {
    QStringList names;
    for (const auto& s : m_steps) names << s.first;
    return names;
}
