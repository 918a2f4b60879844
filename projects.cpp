#include "projects.h"

#include <QUuid>
#include <QJsonArray>
#include <QDebug>

Projects::Projects(Repository& repo, const IdProvider& ids, const QString& defaultKeyPrefix)
    : m_repo(repo), m_ids(ids), m_reconciler(repo, ids), m_keyPrefix(defaultKeyPrefix) {}

bool Projects::getProject(const QString& name, Project* out, FsetError* err) const {
    const QUuid uuid = QUuid::fromString(name);
    if (!uuid.isNull())
        return m_repo.projectByAnchor(uuid.toString(QUuid::WithoutBraces), out, err);
    return m_repo.projectByKey(name, out, err);
}

bool Projects::create(const QVariantMap& params, Project* out, FsetError* err) {
    Row attrs;
    for (const char* k : { "key", "anchor", "order", "description" }) {
        if (params.contains(k)) attrs.insert(k, params.value(k));
    }

    const QDateTime now = m_ids.now();
    if (attrs.value("key").toString().isEmpty())
        attrs.insert("key", m_keyPrefix + QString::number(now.toSecsSinceEpoch()));
    if (attrs.value("anchor").toString().isEmpty())
        attrs.insert("anchor", m_ids.newAnchor());
    attrs.insert("inserted_at", now);
    attrs.insert("updated_at", now);

    return m_repo.insertProject(attrs, out, err);
}

bool Projects::persistDiff(const QJsonObject& diff, const Project& project, FsetError* err) {
    return m_reconciler.persistDiff(diff, project, nullptr, err);
}

bool Projects::applyDiff(const QJsonObject& diff, const Project& project, Project* result,
                         FsetError* err)
{
    if (!persistDiff(diff, project, err)) return false;
    return m_repo.projectById(project.id, result, err);
}

/* ====================== Representación para el cliente ====================== */

static QJsonValue orderToJson(const QVariant& order) {
    if (!order.isValid() || order.isNull()) return QJsonValue();
    return QJsonValue(static_cast<qint64>(order.toLongLong()));
}

// Columna nula => null en el JSON (no "" ni false)
static QJsonValue nullableToJson(const QVariant& v) {
    if (!v.isValid() || v.isNull()) return QJsonValue();
    return QJsonValue::fromVariant(v);
}

static QJsonObject toFmodelSch(const Fmodel& m) {
    QJsonObject o;
    o["type"]     = nullableToJson(m.type);
    o["key"]      = nullableToJson(m.key);
    o["sch"]      = m.sch;
    o["is_entry"] = nullableToJson(m.isEntry);
    o["anchor"]   = m.anchor;
    return o;
}

static QJsonObject toFileSch(const File& f) {
    QJsonObject o;
    o["key"]    = f.key;
    o["order"]  = orderToJson(f.order);
    o["anchor"] = f.anchor;

    QJsonArray fmodels;
    for (const Fmodel& m : f.fmodels) fmodels.append(toFmodelSch(m));
    o["fmodels"] = fmodels;
    return o;
}

QJsonObject Projects::toProjectSch(const Project& project) {
    QJsonObject o;
    o["key"]    = project.key;
    o["order"]  = orderToJson(project.order);
    o["anchor"] = project.anchor;

    QJsonArray files;
    for (const File& f : project.files) files.append(toFileSch(f));
    o["files"] = files;
    return o;
}
