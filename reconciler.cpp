#include "reconciler.h"
#include "integrityguard.h"
#include "upsertpolicy.h"

#include <QJsonArray>
#include <QSet>
#include <QDebug>

static const QString kChanged = QStringLiteral("changed");
static const QString kRemoved = QStringLiteral("removed");
static const QString kAdded   = QStringLiteral("added");

static const QString kProjectDiff = QStringLiteral("project");
static const QString kFileDiff    = QStringLiteral("files");
static const QString kFmodelDiff  = QStringLiteral("fmodels");

Reconciler::Reconciler(Repository& repo, const IdProvider& ids)
    : m_repo(repo), m_ids(ids) {}

/* ====================== Helpers ====================== */

static QJsonObject offendingJson(const FmodelAttrs& fm) {
    QJsonObject o = QJsonObject::fromVariantMap(fm.values);
    o.insert("sch", fm.sch);
    return o;
}

// Convierte el resultado del guardián en filas, o en un aborto del paso
static bool resolveParents(const QVector<FmodelAttrs>& fmodels, const QVector<FileRef>& files,
                           const QDateTime& ts, QVector<Row>& rows, FsetError* err)
{
    const ParentResolution res = IntegrityGuard::putRequiredFileId(fmodels, files);
    if (!res.ok) {
        if (err) {
            err->kind      = FsetErrorKind::UnresolvedParent;
            err->message   = Reconciler::tr("El fmodel %1 referencia un archivo inexistente (%2).")
                                 .arg(res.offending.anchor, res.missingParent);
            err->offending = offendingJson(res.offending);
        }
        return false;
    }
    for (const FmodelAttrs& fm : res.resolved) {
        Row row = fm.toRow();
        row.insert("inserted_at", ts);
        row.insert("updated_at", ts);
        rows.push_back(row);
    }
    return true;
}

Row Reconciler::putTimestamp(Row row) const {
    const QDateTime ts = m_ids.now();
    row.insert("inserted_at", ts);
    row.insert("updated_at", ts);
    return row;
}

bool Reconciler::entriesOf(const QJsonObject& diff, const QString& bucket, const QString& kind,
                           QVector<QJsonValue>& out, FsetError* err) const
{
    out.clear();
    const QJsonValue b = diff.value(bucket);
    if (b.isUndefined() || b.isNull()) return true;
    if (!b.isObject())
        return fail(err, FsetErrorKind::MalformedEntry, tr("\"%1\" debe ser un objeto.").arg(bucket));

    const QJsonValue k = b.toObject().value(kind);
    if (k.isUndefined() || k.isNull()) return true;
    if (k.isObject()) {
        const QJsonObject o = k.toObject();
        for (auto it = o.constBegin(); it != o.constEnd(); ++it) out.push_back(it.value());
        return true;
    }
    if (k.isArray()) {
        for (const auto& v : k.toArray()) out.push_back(v);
        return true;
    }
    return fail(err, FsetErrorKind::MalformedEntry,
                tr("\"%1.%2\" debe ser un objeto de entradas.").arg(bucket, kind));
}

bool Reconciler::translateFiles(const QVector<QJsonValue>& entries, const Project& project,
                                QVector<Row>& rows, QVector<FileAttrs>* attrs, FsetError* err) const
{
    for (const QJsonValue& e : entries) {
        FileAttrs fa;
        QString msg;
        if (!DiffTranslator::fromFileSch(e, fa, &msg))
            return fail(err, FsetErrorKind::MalformedEntry, msg);

        Row row = fa.values;
        row.insert("project_id", project.id);
        rows.push_back(putTimestamp(row));
        if (attrs) attrs->push_back(fa);
    }
    return true;
}

bool Reconciler::translateFmodels(const QVector<QJsonValue>& entries,
                                  QVector<FmodelAttrs>& out, FsetError* err) const
{
    for (const QJsonValue& e : entries) {
        FmodelAttrs fm;
        QString msg;
        if (!DiffTranslator::fromFmodelSch(e, fm, &msg))
            return fail(err, FsetErrorKind::MalformedEntry, msg);
        out.push_back(fm);
    }
    return true;
}

// Fmodels anidados en "fields" de un archivo: sin parentAnchor, el padre es ese archivo
static void appendNestedFmodels(const QVector<FileAttrs>& files, QVector<FmodelAttrs>& out) {
    const QString key = QString::fromLatin1(IntegrityGuard::kParentAnchor);
    for (const FileAttrs& fa : files) {
        for (FmodelAttrs fm : fa.fmodels) {
            if (!fm.sch.contains(key)) fm.sch.insert(key, fa.anchor);
            out.push_back(fm);
        }
    }
}

/* ====================== Fases ====================== */

bool Reconciler::updateChangedDiff(UnitOfWork& uow, const Project& project,
                                   const QJsonObject& diff, FsetError* err) const
{
    const QJsonValue changed = diff.value(kChanged);
    if (changed.isUndefined() || changed.isNull()) return true;
    if (!changed.isObject())
        return fail(err, FsetErrorKind::MalformedEntry, tr("\"changed\" debe ser un objeto."), "update_project");

    // Proyecto: parche de atributos por identidad
    ProjectAttrs pa;
    QString msg;
    if (!DiffTranslator::fromProjectSch(changed.toObject().value(kProjectDiff), pa, &msg))
        return fail(err, FsetErrorKind::MalformedEntry, msg, "update_project");

    Row patch = pa.values;
    if (!project.anchor.isEmpty()) {
        // el ancla no cambia una vez asignada
        if (pa.values.contains("anchor") && pa.anchor != project.anchor)
            qWarning() << "[fset] se ignora cambio de ancla del proyecto" << project.key
                       << project.anchor << "->" << pa.anchor;
        patch.remove("anchor");
    }
    if (!patch.isEmpty()) patch.insert("updated_at", m_ids.now());
    uow.update("update_project", Repository::kProjects, project.id, patch);

    // Archivos: upsert por (key, project_id)
    QVector<QJsonValue> entries;
    QVector<Row> fileRows;
    QVector<FileAttrs> fileAttrs;
    if (!entriesOf(diff, kChanged, kFileDiff, entries, err)
        || !translateFiles(entries, project, fileRows, &fileAttrs, err)) {
        if (err) err->step = "update_files";
        return false;
    }
    uow.insertAll("update_files", UpsertPolicy::changedFiles(), fileRows);

    // Fmodels: solo contra los archivos que ya existían antes del diff
    QVector<FmodelAttrs> fmodels;
    if (!entriesOf(diff, kChanged, kFmodelDiff, entries, err)
        || !translateFmodels(entries, fmodels, err)) {
        if (err) err->step = "update_fmodels";
        return false;
    }
    appendNestedFmodels(fileAttrs, fmodels);

    const QVector<FileRef> existing = fileRefsOf(project);
    const QDateTime ts = m_ids.now();
    uow.insertAll("update_fmodels", UpsertPolicy::changedFmodels(),
                  [fmodels, existing, ts](const StepChanges&, QVector<Row>& rows, FsetError* e) {
                      return resolveParents(fmodels, existing, ts, rows, e);
                  });
    return true;
}

bool Reconciler::deleteRemovedDiff(UnitOfWork& uow, const Project& project,
                                   const QJsonObject& diff, FsetError* err) const
{
    const QJsonValue removed = diff.value(kRemoved);
    if (removed.isUndefined() || removed.isNull()) return true;

    QVector<QJsonValue> entries;
    QString msg;

    QSet<QString> fileAnchors;
    if (!entriesOf(diff, kRemoved, kFileDiff, entries, err)) {
        if (err) err->step = "delete_files";
        return false;
    }
    for (const QJsonValue& e : entries) {
        FileAttrs fa;
        if (!DiffTranslator::fromFileSch(e, fa, &msg))
            return fail(err, FsetErrorKind::MalformedEntry, msg, "delete_files");
        fileAnchors.insert(fa.anchor);
    }

    QSet<QString> fmodelAnchors;
    if (!entriesOf(diff, kRemoved, kFmodelDiff, entries, err)) {
        if (err) err->step = "delete_fmodels";
        return false;
    }
    for (const QJsonValue& e : entries) {
        FmodelAttrs fm;
        if (!DiffTranslator::fromFmodelSch(e, fm, &msg))
            return fail(err, FsetErrorKind::MalformedEntry, msg, "delete_fmodels");
        fmodelAnchors.insert(fm.anchor);
    }

    // hijos antes que padres; los anchors de fmodel son globales
    uow.deleteAll("delete_fmodels", Repository::kFmodels, [fmodelAnchors](const Row& r) {
        return fmodelAnchors.contains(r.value("anchor").toString());
    });
    const qint64 projectId = project.id;
    uow.deleteAll("delete_files", Repository::kFiles, [fileAnchors, projectId](const Row& r) {
        return r.value("project_id").toLongLong() == projectId
            && fileAnchors.contains(r.value("anchor").toString());
    });
    return true;
}

bool Reconciler::insertAddedDiff(UnitOfWork& uow, const Project& project,
                                 const QJsonObject& diff, FsetError* err) const
{
    const QJsonValue added = diff.value(kAdded);
    if (added.isUndefined() || added.isNull()) return true;

    QVector<QJsonValue> entries;
    QVector<Row> fileRows;
    QVector<FileAttrs> fileAttrs;
    if (!entriesOf(diff, kAdded, kFileDiff, entries, err)
        || !translateFiles(entries, project, fileRows, &fileAttrs, err)) {
        if (err) err->step = "insert_files";
        return false;
    }
    uow.insertAll("insert_files", UpsertPolicy::addedFiles(), fileRows);

    QVector<FmodelAttrs> fmodels;
    if (!entriesOf(diff, kAdded, kFmodelDiff, entries, err)
        || !translateFmodels(entries, fmodels, err)) {
        if (err) err->step = "insert_fmodels";
        return false;
    }
    appendNestedFmodels(fileAttrs, fmodels);

    // Las filas de fmodels se calculan con el RESULTADO de insert_files
    const QVector<FileRef> existing = fileRefsOf(project);
    const QDateTime ts = m_ids.now();
    uow.insertAll("insert_fmodels", UpsertPolicy::addedFmodels(),
                  [fmodels, existing, ts](const StepChanges& changes, QVector<Row>& rows, FsetError* e) {
                      QVector<FileRef> files;
                      for (const Row& r : changes.value("insert_files").rows)
                          files.push_back(FileRef{ r.value("id").toLongLong(), r.value("anchor").toString() });
                      files += existing;
                      return resolveParents(fmodels, files, ts, rows, e);
                  });
    return true;
}

/* ====================== API ====================== */

bool Reconciler::buildUnitOfWork(const QJsonObject& diff, const Project& project,
                                 UnitOfWork& uow, FsetError* err) const
{
    if (project.id < 0)
        return fail(err, FsetErrorKind::NotFound, tr("El proyecto no está persistido."));

    return updateChangedDiff(uow, project, diff, err)
        && deleteRemovedDiff(uow, project, diff, err)
        && insertAddedDiff(uow, project, diff, err);
}

bool Reconciler::persistDiff(const QJsonObject& diff, const Project& project,
                             StepChanges* changes, FsetError* err)
{
    UnitOfWork uow;
    if (!buildUnitOfWork(diff, project, uow, err)) {
        qWarning() << "[fset] diff rechazado para" << project.key << ":"
                   << (err ? err->toString() : QString());
        return false;
    }
    if (!m_repo.submit(uow, changes, err)) return false;

    qInfo() << "[fset] diff aplicado a" << project.key << "pasos:" << uow.stepNames();
    return true;
}
