#include "repository.h"

#include <QMutexLocker>
#include <QDebug>
#include <algorithm>

const char* const Repository::kProjects = "projects";
const char* const Repository::kFiles    = "files";
const char* const Repository::kFmodels  = "fmodels";

Repository::Repository(TableStore& store) : m_store(store) {}

/* ====================== Esquema ====================== */

static FieldDef col(const QString& name, const QString& type,
                    bool requerido = false, const QString& indexado = QString("No"))
{
    FieldDef f;
    f.name      = name;
    f.type      = type;
    f.requerido = requerido;
    f.indexado  = indexado;
    return f;
}

static FieldDef idCol() {
    FieldDef f = col("id", "Autonumeración", true);
    f.pk = true;
    return f;
}

static const QString kUnique = QStringLiteral("Sí (sin duplicados)");

bool Repository::ensureSchema(QString* err) {
    if (!m_store.hasTable(kProjects)) {
        const Schema s {
            idCol(),
            col("anchor",      "Texto corto", true, kUnique),
            col("key",         "Texto corto", true, kUnique),
            col("order",       "Número"),
            col("description", "Texto largo"),
            col("inserted_at", "Fecha/Hora"),
            col("updated_at",  "Fecha/Hora"),
        };
        if (!m_store.createTable(kProjects, s, err)) return false;
    }
    if (!m_store.hasTable(kFiles)) {
        const Schema s {
            idCol(),
            col("anchor",      "Texto corto", true, kUnique),
            col("key",         "Texto corto"),
            col("order",       "Número"),
            col("project_id",  "Número", true),
            col("inserted_at", "Fecha/Hora"),
            col("updated_at",  "Fecha/Hora"),
        };
        if (!m_store.createTable(kFiles, s, err)) return false;
    }
    if (!m_store.hasTable(kFmodels)) {
        const Schema s {
            idCol(),
            col("anchor",      "Texto corto", true, kUnique),
            col("type",        "Texto corto"),
            col("key",         "Texto corto"),
            col("is_entry",    "Sí/No"),
            col("sch",         "JSON"),
            col("file_id",     "Número", true),
            col("inserted_at", "Fecha/Hora"),
            col("updated_at",  "Fecha/Hora"),
        };
        if (!m_store.createTable(kFmodels, s, err)) return false;
    }

    // (key, project_id): clave humana de un archivo dentro de su proyecto
    const QStringList fileKey { "key", "project_id" };
    if (!m_store.hasUniqueIndex(kFiles, fileKey)
        && !m_store.addUniqueIndex(kFiles, fileKey, err)) return false;

    auto hasFk = [this](const QString& child, const QString& parent) {
        for (const auto& fk : m_store.relationshipsFor(child))
            if (fk.parentTable == parent) return true;
        return false;
    };
    if (!hasFk(kFiles, kProjects)
        && !m_store.addRelationship(kFiles, "project_id", kProjects, "id", FkAction::Restrict, err))
        return false;
    if (!hasFk(kFmodels, kFiles)
        && !m_store.addRelationship(kFmodels, "file_id", kFiles, "id", FkAction::Cascade, err))
        return false;
    return true;
}

bool Repository::open(const QString& dataFile, FsetError* err) {
    QMutexLocker lock(&m_store.mutex());
    QString e;
    if (!ensureSchema(&e))
        return fail(err, FsetErrorKind::StorageFailure, e, "schema");
    if (!dataFile.isEmpty() && !m_store.loadFromJson(dataFile, &e))
        return fail(err, FsetErrorKind::StorageFailure, e, "load");
    m_store.setDataPath(dataFile);
    qInfo() << "[fset] almacén abierto:" << (dataFile.isEmpty() ? QString("(memoria)") : dataFile);
    return true;
}

/* ====================== Conversión fila -> entidad ====================== */

static Fmodel fmodelFromRow(const Row& r) {
    Fmodel m;
    m.id      = r.value("id").toLongLong();
    m.anchor  = r.value("anchor").toString();
    m.type    = r.value("type");
    m.key     = r.value("key");
    m.isEntry = r.value("is_entry");
    m.sch     = r.value("sch").value<QJsonObject>();
    m.fileId  = r.value("file_id").toLongLong();
    return m;
}

static File fileFromRow(const Row& r) {
    File f;
    f.id        = r.value("id").toLongLong();
    f.anchor    = r.value("anchor").toString();
    f.key       = r.value("key").toString();
    f.order     = r.value("order");
    f.projectId = r.value("project_id").toLongLong();
    return f;
}

static Project projectFromRow(const Row& r) {
    Project p;
    p.id          = r.value("id").toLongLong();
    p.anchor      = r.value("anchor").toString();
    p.key         = r.value("key").toString();
    p.order       = r.value("order");
    p.description = r.value("description").toString();
    return p;
}

// Orden de presentación: "order" ascendente (nulos al final), luego id
static bool byOrderThenId(const Row& a, const Row& b) {
    const QVariant oa = a.value("order"), ob = b.value("order");
    const bool na = oa.isNull(), nb = ob.isNull();
    if (na != nb) return nb;
    if (!na && oa.toLongLong() != ob.toLongLong()) return oa.toLongLong() < ob.toLongLong();
    return a.value("id").toLongLong() < b.value("id").toLongLong();
}

/* ====================== Búsquedas ====================== */

bool Repository::loadProject(const RowPredicate& where, const QString& what,
                             Project* out, FsetError* err) const
{
    QMutexLocker lock(&m_store.mutex());

    const QVector<Row> found = m_store.select(kProjects, where);
    if (found.isEmpty())
        return fail(err, FsetErrorKind::NotFound, tr("No existe el proyecto %1").arg(what));

    Project p = projectFromRow(found.first());

    QVector<Row> files = m_store.select(kFiles, [&p](const Row& r) {
        return r.value("project_id").toLongLong() == p.id;
    });
    std::sort(files.begin(), files.end(), byOrderThenId);

    for (const Row& fr : files) {
        File f = fileFromRow(fr);
        QVector<Row> fms = m_store.select(kFmodels, [&f](const Row& r) {
            return r.value("file_id").toLongLong() == f.id;
        });
        std::sort(fms.begin(), fms.end(), [](const Row& a, const Row& b) {
            return a.value("id").toLongLong() < b.value("id").toLongLong();
        });
        for (const Row& mr : fms) f.fmodels.push_back(fmodelFromRow(mr));
        p.files.push_back(f);
    }

    if (out) *out = p;
    return true;
}

bool Repository::projectByKey(const QString& key, Project* out, FsetError* err) const {
    return loadProject([&key](const Row& r) { return r.value("key").toString() == key; },
                       key, out, err);
}

bool Repository::projectByAnchor(const QString& anchor, Project* out, FsetError* err) const {
    return loadProject([&anchor](const Row& r) { return r.value("anchor").toString() == anchor; },
                       anchor, out, err);
}

bool Repository::projectById(qint64 id, Project* out, FsetError* err) const {
    return loadProject([id](const Row& r) { return r.value("id").toLongLong() == id; },
                       QString::number(id), out, err);
}

/* ====================== Escritura ====================== */

bool Repository::insertProject(const Row& attrs, Project* out, FsetError* err) {
    StoreTransaction tx(m_store);
    if (!tx.isActive())
        return fail(err, FsetErrorKind::StorageFailure, tx.beginError(), "insert_project");

    QString e;
    QVector<Row> returned;
    if (!m_store.insertAll(kProjects, { attrs }, {}, {}, &returned, &e))
        return fail(err, FsetErrorKind::ConflictViolation, e, "insert_project");
    if (!tx.commit(&e))
        return fail(err, FsetErrorKind::StorageFailure, e, "commit");

    if (out) *out = projectFromRow(returned.first());
    qInfo() << "[fset] proyecto creado:" << returned.first().value("key").toString();
    return true;
}

bool Repository::submit(const UnitOfWork& uow, StepChanges* changes, FsetError* err) {
    StoreTransaction tx(m_store);
    if (!tx.isActive())
        return fail(err, FsetErrorKind::StorageFailure, tx.beginError(), "begin");

    StepChanges done;
    for (const auto& step : uow.steps()) {
        StepResult result;
        FsetError e;
        if (!step.second(m_store, done, result, &e)) {
            tx.rollback();
            e.step = step.first;
            qWarning().noquote() << "[fset] rollback:" << e.toString();
            if (err) *err = e;
            return false;
        }
        done.insert(step.first, result);
    }

    QString ce;
    if (!tx.commit(&ce))
        return fail(err, FsetErrorKind::StorageFailure, ce, "commit");

    qDebug() << "[fset] commit" << uow.stepNames();
    if (changes) *changes = done;
    return true;
}
