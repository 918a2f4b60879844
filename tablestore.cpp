#include "tablestore.h"

#include <QtGlobal>
#include <QRegularExpression>
#include <QDateTime>
#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QDebug>
#include <algorithm>
#include <cmath>

/* ====================== Singleton ====================== */

TableStore& TableStore::instance() {
    static TableStore inst;
    return inst;
}

TableStore::TableStore(QObject* parent) : QObject(parent) {}

/* ====================== Helpers (libres) ====================== */

static inline bool isEmptyVar(const QVariant& v) {
    return !v.isValid() || v.isNull();
}

// Mapea el texto de FieldDef.type a una etiqueta estable
static inline QString normType_free(const QString& t) {
    const QString s = t.trimmed().toLower();
    if (s.startsWith(QStringLiteral("auto")))                                         return "autonumeracion";
    if (s.startsWith(QStringLiteral("número")) || s.startsWith(QStringLiteral("numero"))) return "numero";
    if (s.startsWith(QStringLiteral("fecha")))                                        return "fecha_hora";
    if (s.startsWith(QStringLiteral("sí/no")) || s.startsWith(QStringLiteral("si/no")))   return "booleano";
    if (s.startsWith(QStringLiteral("texto largo")))                                  return "texto_largo";
    if (s.startsWith(QStringLiteral("json")))                                         return "json";
    return "texto"; // por defecto (Texto corto)
}

QString TableStore::normType(const QString& t) const {
    return normType_free(t);
}

static bool isValidTableName(const QString& n) {
    static const QRegularExpression rx("^[A-Za-z_][A-Za-z0-9_]*$");
    return rx.match(n).hasMatch();
}

int TableStore::pkColumn(const Schema& s) const {
    for (int i = 0; i < s.size(); ++i)
        if (s[i].pk) return i;
    return -1;
}

int TableStore::autoColumn(const Schema& s) const {
    for (int i = 0; i < s.size(); ++i)
        if (normType(s[i].type) == "autonumeracion")
            return i;
    return -1;
}

int TableStore::fieldIndex(const Schema& s, const QString& name) const {
    for (int i = 0; i < s.size(); ++i)
        if (s[i].name == name) return i;
    return -1;
}

bool TableStore::sameValue(const QVariant& a, const QVariant& b) const {
    if (isEmptyVar(a) || isEmptyVar(b)) return false; // NULL nunca es igual a nada
    if (a.userType() == b.userType()) return a == b;

    // Comparación tolerante:
    bool okA = false, okB = false;
    const double da = a.toDouble(&okA);
    const double db = b.toDouble(&okB);
    if (okA && okB) return std::fabs(da - db) < 1e-9;
    return a.toString() == b.toString();
}

bool TableStore::requireTx(QString* err) const {
    if (m_inTx) return true;
    if (err) *err = tr("Operación de escritura fuera de una transacción.");
    return false;
}

/* ====================== Normalización ====================== */

bool TableStore::normalizeValue(const FieldDef& col, QVariant& v, QString* err) const {
    const QString t = normType(col.type);
    if (isEmptyVar(v)) {
        // Autonumeración: permitir vacío (lo llena assignAutonumberIfNeeded)
        if (t == "autonumeracion") { v = QVariant(); return true; }
        if (col.requerido) {
            if (err) *err = tr("El campo \"%1\" es requerido.").arg(col.name);
            return false;
        }
        v = QVariant();
        return true;
    }

    if (t == "autonumeracion" || t == "numero") {
        bool ok = false;
        const double d = v.toDouble(&ok);
        if (!ok || v.userType() == QMetaType::QVariantMap || v.userType() == QMetaType::QVariantList) {
            if (err) *err = tr("El campo \"%1\" debe ser entero.").arg(col.name);
            return false;
        }
        v = static_cast<qint64>(std::llround(d));
        return true;
    }

    if (t == "booleano") {
        if (v.userType() == QMetaType::Bool) { v = v.toBool(); return true; }
        const QString s = v.toString().trimmed().toLower();
        if (s=="1" || s=="true" || s=="sí" || s=="si" || s=="yes") { v = true;  return true; }
        if (s=="0" || s=="false"|| s=="no")                         { v = false; return true; }
        if (err) *err = tr("El campo \"%1\" debe ser Sí/No.").arg(col.name);
        return false;
    }

    if (t == "fecha_hora") {
        QDateTime dt;
        if (v.userType() == QMetaType::QDateTime) dt = v.toDateTime();
        else dt = QDateTime::fromString(v.toString().trimmed(), Qt::ISODate);
        if (!dt.isValid()) {
            if (err) *err = tr("Fecha inválida en \"%1\".").arg(col.name);
            return false;
        }
        v = dt.toUTC();
        return true;
    }

    if (t == "json") {
        // Documento opaco: solo se exige que sea un objeto
        if (v.userType() == QMetaType::QJsonObject) return true;
        if (v.userType() == QMetaType::QVariantMap) {
            v = QVariant::fromValue(QJsonObject::fromVariantMap(v.toMap()));
            return true;
        }
        if (v.userType() == QMetaType::QVariantHash) {
            v = QVariant::fromValue(QJsonObject::fromVariantHash(v.toHash()));
            return true;
        }
        if (err) *err = tr("El campo \"%1\" debe ser un objeto JSON.").arg(col.name);
        return false;
    }

    // Texto corto / largo
    if (!v.canConvert<QString>() || v.userType() == QMetaType::QVariantMap
        || v.userType() == QMetaType::QVariantList) {
        if (err) *err = tr("El campo \"%1\" debe ser texto.").arg(col.name);
        return false;
    }
    v = v.toString();
    return true;
}

bool TableStore::validate(const Schema& s, Record& r, QString* err) const {
    if (r.size() < s.size()) r.resize(s.size());
    for (int i = 0; i < s.size(); ++i) {
        QVariant v = r[i];
        if (!normalizeValue(s[i], v, err)) return false;
        r[i] = v;
    }
    return true;
}

bool TableStore::toRecord(const QString& table, const Schema& s, const Row& row,
                          Record& out, QSet<int>& present, QString* err) const
{
    out = Record(s.size());
    present.clear();
    for (auto it = row.constBegin(); it != row.constEnd(); ++it) {
        const int c = fieldIndex(s, it.key());
        if (c < 0) {
            if (err) *err = tr("Columna inexistente: %1.%2").arg(table, it.key());
            return false;
        }
        QVariant v = it.value();
        if (!normalizeValue(s[c], v, err)) return false;
        out[c] = v;
        present.insert(c);
    }
    return true;
}

Row TableStore::toRow(const Schema& s, const Record& r) const {
    Row row;
    for (int i = 0; i < s.size(); ++i)
        row.insert(s[i].name, i < r.size() ? r[i] : QVariant());
    return row;
}

/* ====================== Esquema ====================== */

bool TableStore::createTable(const QString& name, const Schema& s, QString* err) {
    if (!isValidTableName(name)) { if (err) *err = tr("Nombre de tabla inválido: %1").arg(name); return false; }
    if (m_schemas.contains(name)) { if (err) *err = tr("La tabla ya existe: %1").arg(name); return false; }

    Schema s2 = s;
    QSet<QString> names;
    int pkCount   = 0;
    int autoCount = 0;

    for (int i = 0; i < s2.size(); ++i) {
        const auto& c = s2[i];
        if (c.name.trimmed().isEmpty()) { if (err) *err = tr("Columna sin nombre."); return false; }
        if (names.contains(c.name))      { if (err) *err = tr("Columna duplicada: %1").arg(c.name); return false; }
        names.insert(c.name);

        if (c.pk) ++pkCount;
        if (normType(c.type) == "autonumeracion") {
            ++autoCount;
            s2[i].requerido = true; // Autonumeración SIEMPRE requerido
        }
    }
    if (pkCount > 1)   { if (err) *err = tr("Solo se permite una PK."); return false; }
    if (autoCount > 1) { if (err) *err = tr("Solo se permite un campo de Autonumeración por tabla."); return false; }
    const int pk = pkColumn(s2);
    if (pk >= 0) s2[pk].requerido = true;

    m_schemas.insert(name, s2);
    m_data.insert(name, {});
    m_freeList.insert(name, {});
    return true;
}

QVector<QVector<int>> TableStore::uniqueIndexes(const QString& table) const {
    QVector<QVector<int>> out;
    const Schema s = m_schemas.value(table);
    for (int c = 0; c < s.size(); ++c) {
        if (s[c].pk || s[c].indexado.contains("sin duplicados", Qt::CaseInsensitive))
            out.push_back(QVector<int>{c});
    }
    for (const QStringList& cols : m_compositeUnique.value(table)) {
        QVector<int> idx;
        for (const QString& n : cols) idx.push_back(fieldIndex(s, n));
        out.push_back(idx);
    }
    return out;
}

bool TableStore::hasUniqueIndex(const QString& table, const QStringList& columns) const {
    const Schema s = m_schemas.value(table);
    QSet<int> wanted;
    for (const QString& n : columns) {
        const int c = fieldIndex(s, n);
        if (c < 0) return false;
        wanted.insert(c);
    }
    for (const auto& idx : uniqueIndexes(table)) {
        QSet<int> have;
        for (int c : idx) have.insert(c);
        if (have == wanted) return true;
    }
    return false;
}

bool TableStore::addUniqueIndex(const QString& table, const QStringList& columns, QString* err) {
    if (!m_schemas.contains(table)) { if (err) *err = tr("No existe la tabla: %1").arg(table); return false; }
    if (columns.isEmpty())          { if (err) *err = tr("Índice sin columnas."); return false; }
    const Schema s = m_schemas.value(table);
    QVector<int> idx;
    for (const QString& n : columns) {
        const int c = fieldIndex(s, n);
        if (c < 0) { if (err) *err = tr("Columna inexistente: %1.%2").arg(table, n); return false; }
        idx.push_back(c);
    }
    if (hasUniqueIndex(table, columns)) { if (err) *err = tr("El índice ya existe."); return false; }

    // Integridad previa: no se crea si los datos actuales ya tienen duplicados
    const auto& vec = m_data.value(table);
    for (int i = 0; i < vec.size(); ++i) {
        if (vec[i].isEmpty()) continue;
        const int other = findByColumns(table, idx, vec[i]);
        if (other >= 0 && other != i) {
            if (err) *err = tr("No se puede crear el índice: hay valores duplicados en %1 (%2).")
                           .arg(table, columns.join(", "));
            return false;
        }
    }

    m_compositeUnique[table].push_back(columns);
    return true;
}

bool TableStore::addRelationship(const QString& childTable, const QString& childColName,
                                 const QString& parentTable, const QString& parentColName,
                                 FkAction onDelete, QString* err)
{
    if (!m_schemas.contains(childTable) || !m_schemas.contains(parentTable)) {
        if (err) *err = tr("Tabla inexistente en relación.");
        return false;
    }
    const Schema cs = m_schemas.value(childTable);
    const Schema ps = m_schemas.value(parentTable);

    const int cc = fieldIndex(cs, childColName);
    const int pc = fieldIndex(ps, parentColName);
    if (cc < 0 || pc < 0) { if (err) *err = tr("Columna inexistente en relación."); return false; }

    auto normCompat = [this](const FieldDef& f){
        const QString t = normType(f.type);
        return (t == "autonumeracion") ? QString("numero") : t;
    };
    if (normCompat(cs[cc]) != normCompat(ps[pc])) {
        if (err) *err = tr("Tipos incompatibles: %1.%2 (%3) → %4.%5 (%6)")
                       .arg(childTable, cs[cc].name, cs[cc].type, parentTable, ps[pc].name, ps[pc].type);
        return false;
    }

    for (const auto& existing : m_fksByChild.value(childTable)) {
        if (existing.childCol==cc && existing.parentTable==parentTable && existing.parentCol==pc) {
            if (err) *err = tr("La relación ya existe.");
            return false;
        }
    }

    // Integridad previa: no permitir crear la FK si ya hay valores huérfanos
    {
        QSet<QString> parentKeys;
        for (const auto& pr : m_data.value(parentTable)) {
            if (pr.isEmpty()) continue;
            if (pc < pr.size() && !isEmptyVar(pr[pc])) parentKeys.insert(pr[pc].toString());
        }
        for (const auto& r : m_data.value(childTable)) {
            if (r.isEmpty() || cc >= r.size() || isEmptyVar(r[cc])) continue;
            if (!parentKeys.contains(r[cc].toString())) {
                if (err) *err = tr("No se puede crear la relación: hay filas en %1.%2 sin padre en %3.%4.")
                               .arg(childTable, cs[cc].name, parentTable, ps[pc].name);
                return false;
            }
        }
    }

    ForeignKey fk;
    fk.childTable  = childTable;
    fk.childCol    = cc;
    fk.parentTable = parentTable;
    fk.parentCol   = pc;
    fk.onDelete    = onDelete;
    m_fksByChild[childTable].push_back(fk);
    return true;
}

QVector<ForeignKey> TableStore::relationshipsFor(const QString& table) const {
    return m_fksByChild.value(table);
}

QVector<ForeignKey> TableStore::incomingRelationshipsTo(const QString& table) const {
    QVector<ForeignKey> r;
    for (auto it = m_fksByChild.constBegin(); it != m_fksByChild.constEnd(); ++it) {
        for (const auto& fk : it.value())
            if (fk.parentTable == table) r.push_back(fk);
    }
    return r;
}

/* ====================== Transacciones ====================== */

bool TableStore::beginTransaction(QString* err) {
    if (m_inTx) { if (err) *err = tr("Ya hay una transacción abierta."); return false; }
    m_snapshot.data         = m_data;
    m_snapshot.freeList     = m_freeList;
    m_snapshot.lastIssuedId = m_lastIssuedId;
    m_touched.clear();
    m_inTx = true;
    return true;
}

bool TableStore::commitTransaction(QSet<QString>* touched, QString* err) {
    if (!m_inTx) { if (err) *err = tr("No hay transacción abierta."); return false; }

    if (!m_dataPath.isEmpty() && !m_touched.isEmpty()) {
        QString saveErr;
        if (!saveToJson(m_dataPath, &saveErr)) {
            qWarning() << "[fset-store] commit no persistido, se revierte:" << saveErr;
            rollbackTransaction();
            if (err) *err = saveErr;
            return false;
        }
    }

    if (touched) *touched = m_touched;
    m_inTx = false;
    m_touched.clear();
    m_snapshot = Snapshot{};
    return true;
}

void TableStore::rollbackTransaction() {
    if (!m_inTx) return;
    m_data         = m_snapshot.data;
    m_freeList     = m_snapshot.freeList;
    m_lastIssuedId = m_snapshot.lastIssuedId;
    m_snapshot = Snapshot{};
    m_touched.clear();
    m_inTx = false;
}

void TableStore::notifyCommitted(const QSet<QString>& tables) {
    QStringList names = tables.values();
    names.sort();
    for (const QString& t : names) emit rowsChanged(t);
}

/* ====================== Autonumeración ====================== */

void TableStore::ensureAutoCounterInitialized(const QString& table) {
    if (m_lastIssuedId.contains(table)) return;

    const int ac = autoColumn(m_schemas.value(table));
    if (ac < 0) { m_lastIssuedId.insert(table, 0); return; }

    qint64 maxId = 0;
    for (const Record& rec : m_data.value(table)) {
        if (rec.isEmpty() || ac >= rec.size()) continue;
        bool ok = false;
        const qint64 v = rec[ac].toLongLong(&ok);
        if (ok && v > maxId) maxId = v;
    }
    m_lastIssuedId.insert(table, maxId);   // arranca en el máximo existente
}

QVariant TableStore::nextAutoNumber(const QString& name) {
    ensureAutoCounterInitialized(name);
    return QVariant(m_lastIssuedId.value(name, 0) + 1);
}

void TableStore::assignAutonumberIfNeeded(const QString& table, const Schema& s, Record& r) {
    const int ac = autoColumn(s);
    if (ac < 0) return;
    r.resize(std::max(r.size(), s.size()));
    if (isEmptyVar(r[ac])) r[ac] = nextAutoNumber(table);
}

void TableStore::advanceAutoCounter(const QString& table, const Schema& s, const Record& r) {
    const int ac = autoColumn(s);
    if (ac < 0) return;
    ensureAutoCounterInitialized(table);
    bool ok = false;
    const qint64 v = (ac < r.size() ? r[ac].toLongLong(&ok) : 0);
    if (ok && v > m_lastIssuedId.value(table, 0)) m_lastIssuedId[table] = v;
}

/* ====================== Integridad ====================== */

int TableStore::findByColumns(const QString& table, const QVector<int>& cols, const Record& probe) const {
    for (int c : cols)
        if (c < 0 || c >= probe.size() || isEmptyVar(probe[c])) return -1; // NULL no colisiona

    const auto& vec = m_data.value(table);
    for (int i = 0; i < vec.size(); ++i) {
        const Record& rec = vec[i];
        if (rec.isEmpty()) continue; // omitir tombstones
        bool all = true;
        for (int c : cols) {
            if (c >= rec.size() || !sameValue(rec[c], probe[c])) { all = false; break; }
        }
        if (all) return i;
    }
    return -1;
}

bool TableStore::checkUniqueness(const QString& table, const Record& candidate, int skipRow, QString* err) const {
    const Schema s = m_schemas.value(table);
    const auto& vec = m_data.value(table);
    for (const auto& idx : uniqueIndexes(table)) {
        bool hasNull = false;
        for (int c : idx) if (c >= candidate.size() || isEmptyVar(candidate[c])) { hasNull = true; break; }
        if (hasNull) continue;

        for (int i = 0; i < vec.size(); ++i) {
            if (i == skipRow || vec[i].isEmpty()) continue;
            bool all = true;
            for (int c : idx) {
                if (c >= vec[i].size() || !sameValue(vec[i][c], candidate[c])) { all = false; break; }
            }
            if (!all) continue;

            if (idx.size() == 1 && s[idx[0]].pk) {
                if (err) *err = tr("Clave primaria duplicada: %1").arg(candidate[idx[0]].toString());
            } else {
                QStringList cols, vals;
                for (int c : idx) { cols << s[c].name; vals << candidate[c].toString(); }
                if (err) *err = tr("Valor duplicado en índice único %1(%2): %3")
                               .arg(table, cols.join(", "), vals.join(", "));
            }
            return false;
        }
    }
    return true;
}

// Verifica que todo valor FK (no nulo) exista en su tabla padre
bool TableStore::checkFksOnWrite(const QString& childTable, const Record& r, QString* err) const {
    const auto fks = m_fksByChild.value(childTable);
    for (const auto& fk : fks) {
        if (fk.childCol < 0 || fk.childCol >= r.size()) continue;
        const QVariant v = r[fk.childCol];
        if (isEmptyVar(v)) continue;

        const auto& parentRows = m_data.value(fk.parentTable);
        const Schema ps = m_schemas.value(fk.parentTable);
        bool found = false;
        for (const auto& pr : parentRows) {
            if (pr.isEmpty()) continue; // omitir tombstones
            if (pr.size() > fk.parentCol && sameValue(pr[fk.parentCol], v)) { found = true; break; }
        }
        if (!found) {
            if (err) *err = tr("Violación FK: valor \"%1\" no existe en %2.%3")
                           .arg(v.toString(), fk.parentTable, ps.value(fk.parentCol).name);
            return false;
        }
    }
    return true;
}

void TableStore::tombstoneRows(const QString& table, const QList<int>& rows) {
    auto& vec  = m_data[table];
    auto& free = m_freeList[table];
    for (int r : rows) {
        if (r < 0 || r >= vec.size()) continue;
        if (vec[r].isEmpty()) continue;   // ya era hueco
        vec[r].clear();                   // tombstone
        free.push_back(r);                // Avail List (LIFO)
    }
    touch(table);
}

// Aplica acciones de borrado referencial para filas padre
bool TableStore::handleParentDeletes(const QString& parentTable, const QList<int>& parentRows, QString* err) {
    const auto incoming = incomingRelationshipsTo(parentTable);
    if (incoming.isEmpty()) return true;

    const auto& parentVec = m_data.value(parentTable);

    for (const auto& fk : incoming) {
        // Valores padre que van a desaparecer
        QList<QVariant> doomed;
        for (int r : parentRows) {
            if (r < 0 || r >= parentVec.size()) continue;
            const Record& rec = parentVec[r];
            if (rec.isEmpty() || fk.parentCol >= rec.size()) continue;
            doomed.append(rec[fk.parentCol]);
        }
        if (doomed.isEmpty()) continue;

        const auto& cvec = m_data.value(fk.childTable);
        QList<int> hitRows;
        for (int i = 0; i < cvec.size(); ++i) {
            const Record& cr = cvec[i];
            if (cr.isEmpty() || fk.childCol >= cr.size()) continue;
            for (const QVariant& d : doomed) {
                if (sameValue(cr[fk.childCol], d)) { hitRows.push_back(i); break; }
            }
        }
        if (hitRows.isEmpty()) continue;

        if (fk.onDelete == FkAction::Restrict) {
            if (err) *err = tr("Restrict: no se puede borrar de %1 porque existen registros en %2.")
                           .arg(parentTable, fk.childTable);
            return false;
        } else if (fk.onDelete == FkAction::SetNull) {
            auto& wvec = m_data[fk.childTable];
            for (int i : hitRows) wvec[i][fk.childCol] = QVariant();
            touch(fk.childTable);
        } else if (fk.onDelete == FkAction::Cascade) {
            // los hijos pueden tener sus propios hijos
            if (!handleParentDeletes(fk.childTable, hitRows, err)) return false;
            tombstoneRows(fk.childTable, hitRows);
        }
    }
    return true;
}

/* ====================== Datos ====================== */

QVector<Row> TableStore::select(const QString& table, const RowPredicate& where) const {
    QVector<Row> out;
    const Schema s = m_schemas.value(table);
    for (const Record& rec : m_data.value(table)) {
        if (rec.isEmpty()) continue;
        const Row row = toRow(s, rec);
        if (!where || where(row)) out.push_back(row);
    }
    return out;
}

int TableStore::liveRowCount(const QString& table) const {
    int n = 0;
    for (const Record& rec : m_data.value(table))
        if (!rec.isEmpty()) ++n;
    return n;
}

int TableStore::storeRecord(const QString& table, const Record& r) {
    auto& vec  = m_data[table];
    auto& free = m_freeList[table];

    // Avail List: reutiliza huecos antes de hacer append
    if (!free.isEmpty()) {
        const int idx = free.back();
        free.pop_back();
        if (idx >= 0 && idx < vec.size() && vec[idx].isEmpty()) {
            vec[idx] = r;
            return idx;
        }
    }
    vec.push_back(r);
    return vec.size() - 1;
}

bool TableStore::insertAll(const QString& table, const QVector<Row>& rows,
                           const QStringList& conflictTarget, const QStringList& replaceColumns,
                           QVector<Row>* returned, QString* err)
{
    if (!requireTx(err)) return false;
    if (!m_schemas.contains(table)) { if (err) *err = tr("No existe la tabla: %1").arg(table); return false; }
    const Schema s = m_schemas.value(table);

    QVector<int> targetCols;
    if (!conflictTarget.isEmpty()) {
        if (!hasUniqueIndex(table, conflictTarget)) {
            if (err) *err = tr("No hay un índice único que coincida con ON CONFLICT (%1) en %2.")
                           .arg(conflictTarget.join(", "), table);
            return false;
        }
        for (const QString& n : conflictTarget) targetCols.push_back(fieldIndex(s, n));
    }

    QVector<int> replaceCols;
    for (const QString& n : replaceColumns) {
        const int c = fieldIndex(s, n);
        if (c < 0) { if (err) *err = tr("Columna inexistente: %1.%2").arg(table, n); return false; }
        replaceCols.push_back(c);
    }

    QSet<int> affected; // filas ya tocadas en este lote
    for (const Row& row : rows) {
        Record rec;
        QSet<int> present;
        if (!toRecord(table, s, row, rec, present, err)) return false;

        const int existing = targetCols.isEmpty() ? -1 : findByColumns(table, targetCols, rec);
        if (existing >= 0) {
            if (affected.contains(existing)) {
                if (err) *err = tr("ON CONFLICT DO UPDATE no puede afectar la misma fila dos veces en %1.").arg(table);
                return false;
            }
            // DO UPDATE: solo columnas a reemplazar que vienen en la fila
            Record upd = m_data[table][existing];
            for (int c : replaceCols)
                if (present.contains(c)) upd[c] = rec[c];

            if (!validate(s, upd, err)) return false;
            if (!checkFksOnWrite(table, upd, err)) return false;
            if (!checkUniqueness(table, upd, existing, err)) return false;

            m_data[table][existing] = upd;
            affected.insert(existing);
            if (returned) returned->push_back(toRow(s, upd));
        } else {
            assignAutonumberIfNeeded(table, s, rec);
            if (!validate(s, rec, err)) return false;
            if (!checkFksOnWrite(table, rec, err)) return false;
            if (!checkUniqueness(table, rec, -1, err)) return false;

            const int idx = storeRecord(table, rec);
            advanceAutoCounter(table, s, rec);
            affected.insert(idx);
            if (returned) returned->push_back(toRow(s, rec));
        }
    }

    if (!rows.isEmpty()) touch(table);
    return true;
}

bool TableStore::updateById(const QString& table, const QVariant& id, const Row& patch,
                            Row* updated, QString* err)
{
    if (!requireTx(err)) return false;
    if (!m_schemas.contains(table)) { if (err) *err = tr("No existe la tabla: %1").arg(table); return false; }
    const Schema s = m_schemas.value(table);
    const int pk = pkColumn(s);
    if (pk < 0) { if (err) *err = tr("La tabla %1 no tiene clave primaria.").arg(table); return false; }

    Record probe(s.size());
    probe[pk] = id;
    const int row = findByColumns(table, QVector<int>{pk}, probe);
    if (row < 0) { if (err) *err = tr("La fila no existe."); return false; }

    Record patchRec;
    QSet<int> present;
    if (!toRecord(table, s, patch, patchRec, present, err)) return false;
    if (present.contains(pk) && !sameValue(patchRec[pk], id)) {
        if (err) *err = tr("No se permite cambiar la clave primaria de %1.").arg(table);
        return false;
    }

    Record r = m_data[table][row];
    for (int c : present) r[c] = patchRec[c];

    if (!validate(s, r, err)) return false;
    if (!checkFksOnWrite(table, r, err)) return false;
    if (!checkUniqueness(table, r, row, err)) return false;

    m_data[table][row] = r;
    if (!present.isEmpty()) touch(table);
    if (updated) *updated = toRow(s, r);
    return true;
}

int TableStore::deleteWhere(const QString& table, const RowPredicate& where, QString* err) {
    if (!requireTx(err)) return -1;
    if (!m_schemas.contains(table)) { if (err) *err = tr("No existe la tabla: %1").arg(table); return -1; }
    const Schema s = m_schemas.value(table);

    QList<int> doomed;
    const auto& vec = m_data.value(table);
    for (int i = 0; i < vec.size(); ++i) {
        if (vec[i].isEmpty()) continue;
        if (!where || where(toRow(s, vec[i]))) doomed.push_back(i);
    }
    if (doomed.isEmpty()) return 0;

    // Acciones FK entrantes respecto a 'table' como padre
    if (!handleParentDeletes(table, doomed, err)) return -1;
    tombstoneRows(table, doomed);
    return doomed.size();
}

/* ====================== Persistencia JSON ====================== */

// Convertir un QVariant a JSON según el tipo lógico de la columna
static QJsonValue cellToJson(const FieldDef& col, const QVariant& v) {
    if (isEmptyVar(v)) return QJsonValue(); // null
    const QString t = normType_free(col.type);
    if (t == "fecha_hora")                        return QJsonValue(v.toDateTime().toUTC().toString(Qt::ISODate));
    if (t == "booleano")                          return QJsonValue(v.toBool());
    if (t == "numero" || t == "autonumeracion")   return QJsonValue(static_cast<qint64>(v.toLongLong()));
    if (t == "json")                              return QJsonValue(v.value<QJsonObject>());
    return QJsonValue(v.toString());
}

// Inversa: JSON -> QVariant usando el esquema
static QVariant jsonToCell(const FieldDef& col, const QJsonValue& j) {
    if (j.isUndefined() || j.isNull()) return QVariant();
    const QString t = normType_free(col.type);
    if (t == "fecha_hora")                        return QDateTime::fromString(j.toString(), Qt::ISODate);
    if (t == "booleano")                          return j.toBool();
    if (t == "numero" || t == "autonumeracion")   return static_cast<qint64>(j.toDouble());
    if (t == "json")                              return QVariant::fromValue(j.toObject());
    return j.toString();
}

QByteArray TableStore::toJson() const {
    QJsonObject root;
    root["version"] = 1;

    QJsonObject jt;
    for (auto it = m_schemas.constBegin(); it != m_schemas.constEnd(); ++it) {
        const QString table = it.key();
        const Schema  s     = it.value();

        QJsonObject tobj;
        QJsonArray cols;
        for (const auto& c : s) cols.append(c.name);
        tobj["columns"] = cols;

        // Filas: los tombstones se guardan como null para conservar las posiciones
        QJsonArray jrows;
        for (const auto& r : m_data.value(table)) {
            if (r.isEmpty()) { jrows.append(QJsonValue()); continue; }
            QJsonArray jrow;
            for (int i = 0; i < s.size(); ++i)
                jrow.append(cellToJson(s[i], i < r.size() ? r[i] : QVariant()));
            jrows.append(jrow);
        }
        tobj["rows"] = jrows;

        if (m_lastIssuedId.contains(table))
            tobj["lastId"] = QJsonValue(m_lastIssuedId.value(table));

        jt.insert(table, tobj);
    }
    root["tables"] = jt;
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

bool TableStore::saveToJson(const QString& path, QString* err) const {
    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
        if (err) *err = tr("No se puede escribir %1").arg(path);
        return false;
    }
    const QByteArray data = toJson();
    if (f.write(data) != data.size() || !f.commit()) {
        if (err) *err = tr("No se pudo completar la escritura de %1").arg(path);
        return false;
    }
    return true;
}

bool TableStore::loadFromJson(const QString& path, QString* err) {
    if (m_inTx) { if (err) *err = tr("No se puede cargar con una transacción abierta."); return false; }

    QFile f(path);
    if (!f.exists()) return true; // nada que cargar
    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = tr("No se puede abrir %1").arg(path);
        return false;
    }
    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = tr("JSON inválido: %1").arg(pe.errorString());
        return false;
    }
    const QJsonObject root = doc.object();
    if (root.value("version").toInt() != 1) {
        if (err) *err = tr("Versión de datos no soportada en %1").arg(path);
        return false;
    }

    // Se arma todo aparte y se reemplaza solo si no hubo errores
    QMap<QString, QVector<Record>> data;
    QMap<QString, QVector<int>>    freeList;
    QHash<QString, qint64>         lastIds;

    const QJsonObject jt = root.value("tables").toObject();
    for (auto it = jt.constBegin(); it != jt.constEnd(); ++it) {
        const QString name = it.key();
        if (!m_schemas.contains(name)) {
            if (err) *err = tr("Tabla desconocida en %1: %2").arg(path, name);
            return false;
        }
        const Schema s = m_schemas.value(name);
        const QJsonObject tobj = it.value().toObject();

        QVector<int> colMap; // posición en archivo -> posición en schema
        for (const auto& jc : tobj.value("columns").toArray()) {
            const int c = fieldIndex(s, jc.toString());
            if (c < 0) {
                if (err) *err = tr("Columna desconocida en %1: %2.%3").arg(path, name, jc.toString());
                return false;
            }
            colMap.push_back(c);
        }

        auto& vec  = data[name];
        auto& free = freeList[name];
        const QJsonArray jrows = tobj.value("rows").toArray();
        for (int ri = 0; ri < jrows.size(); ++ri) {
            if (jrows.at(ri).isNull()) {
                vec.push_back(Record{}); // tombstone
                free.push_back(ri);
                continue;
            }
            const QJsonArray ja = jrows.at(ri).toArray();
            Record r(s.size());
            for (int i = 0; i < colMap.size() && i < ja.size(); ++i)
                r[colMap[i]] = jsonToCell(s[colMap[i]], ja.at(i));
            if (!validate(s, r, err)) return false;
            vec.push_back(r);
        }

        if (tobj.contains("lastId"))
            lastIds.insert(name, static_cast<qint64>(tobj.value("lastId").toDouble()));
    }

    for (auto it = m_schemas.constBegin(); it != m_schemas.constEnd(); ++it) {
        m_data[it.key()]     = data.value(it.key());
        m_freeList[it.key()] = freeList.value(it.key());
    }
    m_lastIssuedId = lastIds;
    return true;
}

/* ====================== StoreTransaction ====================== */

StoreTransaction::StoreTransaction(TableStore& store) : m_store(store) {
    m_store.mutex().lock();
    m_locked = true;
    m_active = m_store.beginTransaction(&m_beginError);
    if (!m_active) release();
}

StoreTransaction::~StoreTransaction() {
    rollback();
    release();
}

bool StoreTransaction::commit(QString* err) {
    if (!m_active) {
        if (err) *err = QObject::tr("La transacción no está activa.");
        return false;
    }
    QSet<QString> touched;
    const bool ok = m_store.commitTransaction(&touched, err);
    m_active = false;
    release();
    if (ok) m_store.notifyCommitted(touched); // fuera del lock
    return ok;
}

void StoreTransaction::rollback() {
    if (!m_active) return;
    m_store.rollbackTransaction();
    m_active = false;
    release();
}

void StoreTransaction::release() {
    if (!m_locked) return;
    m_store.mutex().unlock();
    m_locked = false;
}
