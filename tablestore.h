#ifndef TABLESTORE_H
#define TABLESTORE_H

#include <QObject>
#include <QMap>
#include <QHash>
#include <QSet>
#include <QVector>
#include <QVariant>
#include <QVariantMap>
#include <QString>
#include <QStringList>
#include <QList>
#include <QMutex>
#include <QByteArray>
#include <functional>

/* ======================== Relaciones (FK) ======================== */
enum class FkAction { Restrict, Cascade, SetNull };

struct ForeignKey {
    QString childTable;   // tabla hija (donde vive la FK)
    int     childCol = -1;
    QString parentTable;  // tabla padre (a la que apunta)
    int     parentCol = -1;
    FkAction onDelete = FkAction::Restrict;
};

/* ======================== Definiciones ======================== */
struct FieldDef {
    QString name;
    QString type;      // "Autonumeración","Número","Sí/No","Texto corto","Texto largo","JSON","Fecha/Hora"
    bool    pk = false;
    bool    requerido = false;
    QString indexado;  // "No" / "Sí (con duplicados)" / "Sí (sin duplicados)"
};

// Lista de campos de una tabla (en orden de almacenamiento).
using Schema = QList<FieldDef>;
// Fila interna (mismo orden/longitud que el Schema). Vacía = tombstone.
using Record = QVector<QVariant>;
// Fila expuesta hacia afuera: columna -> valor. Solo las columnas presentes cuentan.
using Row = QVariantMap;
using RowPredicate = std::function<bool(const Row&)>;

/* ========================= Núcleo de datos ========================= */
/*
 * Almacén relacional en memoria con transacciones por snapshot.
 *  - Autonumeración monótona por tabla (no retrocede con borrados, sí con rollback)
 *  - Índices únicos simples (PK / "sin duplicados") y compuestos
 *  - FKs con Restrict / Cascade / SetNull al borrar
 *  - Durabilidad: al hacer commit se reescribe el archivo JSON (QSaveFile)
 *
 * Las operaciones de escritura solo son válidas dentro de una transacción.
 * Quien abre la transacción (StoreTransaction) sostiene mutex() hasta cerrarla;
 * las lecturas externas deben tomar el mismo mutex.
 */
class TableStore : public QObject {
    Q_OBJECT
public:
    explicit TableStore(QObject* parent = nullptr);
    static TableStore& instance();

    QMutex& mutex() const { return m_mutex; }

    /* ---------- Persistencia ---------- */
    void    setDataPath(const QString& path) { m_dataPath = path; }
    bool loadFromJson(const QString& file, QString* err = nullptr);
    bool saveToJson(const QString& file, QString* err = nullptr) const;
    QByteArray toJson() const;   // volcado determinista de todas las filas

    /* ---------- Esquema ---------- */
    bool createTable(const QString& name, const Schema& s, QString* err = nullptr);
    bool hasTable(const QString& name) const { return m_schemas.contains(name); }

    bool addUniqueIndex(const QString& table, const QStringList& columns, QString* err = nullptr);
    bool hasUniqueIndex(const QString& table, const QStringList& columns) const;

    bool addRelationship(const QString& childTable, const QString& childColName,
                         const QString& parentTable, const QString& parentColName,
                         FkAction onDelete = FkAction::Restrict,
                         QString* err = nullptr);
    QVector<ForeignKey> relationshipsFor(const QString& table) const; // como hija
    QVector<ForeignKey> incomingRelationshipsTo(const QString& table) const;

    /* ---------- Transacciones ---------- */
    bool beginTransaction(QString* err = nullptr);
    bool commitTransaction(QSet<QString>* touched = nullptr, QString* err = nullptr);
    void rollbackTransaction();
    bool inTransaction() const { return m_inTx; }
    void notifyCommitted(const QSet<QString>& tables);

    /* ---------- Datos ---------- */
    QVector<Row> select(const QString& table, const RowPredicate& where = RowPredicate()) const;
    int liveRowCount(const QString& table) const;

    // INSERT ... ON CONFLICT (conflictTarget) DO UPDATE SET replaceColumns.
    // conflictTarget vacío = insert simple (cualquier duplicado es error).
    bool insertAll(const QString& table, const QVector<Row>& rows,
                   const QStringList& conflictTarget, const QStringList& replaceColumns,
                   QVector<Row>* returned = nullptr, QString* err = nullptr);

    bool updateById(const QString& table, const QVariant& id, const Row& patch,
                    Row* updated = nullptr, QString* err = nullptr);

    // Devuelve la cantidad borrada, o -1 si algo lo impide (Restrict, fuera de tx...)
    int deleteWhere(const QString& table, const RowPredicate& where, QString* err = nullptr);

signals:
    void rowsChanged(const QString& name);

private:
    Q_DISABLE_COPY(TableStore)

    struct Snapshot {
        QMap<QString, QVector<Record>> data;
        QMap<QString, QVector<int>>    freeList;
        QHash<QString, qint64>         lastIssuedId;
    };

    /* ---------------- Normalización / validación por tipo ---------------- */
    bool normalizeValue(const FieldDef& col, QVariant& v, QString* err) const;
    bool validate(const Schema& s, Record& r, QString* err) const;
    QString normType(const QString& t) const;

    int  fieldIndex(const Schema& s, const QString& name) const;
    bool sameValue(const QVariant& a, const QVariant& b) const;

    bool toRecord(const QString& table, const Schema& s, const Row& row,
                  Record& out, QSet<int>& present, QString* err) const;
    Row  toRow(const Schema& s, const Record& r) const;

    // Índices únicos efectivos (PK, "sin duplicados" y compuestos) como listas de columnas
    QVector<QVector<int>> uniqueIndexes(const QString& table) const;
    int  findByColumns(const QString& table, const QVector<int>& cols, const Record& probe) const;
    bool checkUniqueness(const QString& table, const Record& candidate, int skipRow, QString* err) const;
    bool checkFksOnWrite(const QString& childTable, const Record& r, QString* err) const;
    bool handleParentDeletes(const QString& parentTable, const QList<int>& parentRows, QString* err);
    void tombstoneRows(const QString& table, const QList<int>& rows);

    int      pkColumn(const Schema& s) const;   // -1 si no hay
    int      autoColumn(const Schema& s) const; // -1 si no hay
    QVariant nextAutoNumber(const QString& name);
    void assignAutonumberIfNeeded(const QString& table, const Schema& s, Record& r);
    void ensureAutoCounterInitialized(const QString& table);
    void advanceAutoCounter(const QString& table, const Schema& s, const Record& r);
    int  storeRecord(const QString& table, const Record& r);

    bool requireTx(QString* err) const;
    void touch(const QString& table) { if (m_inTx) m_touched.insert(table); }

private:
    mutable QMutex m_mutex;
    QString        m_dataPath;

    QMap<QString, Schema>            m_schemas;   // tabla -> schema
    QMap<QString, QVector<Record>>   m_data;      // tabla -> filas (incluye tombstones)
    QMap<QString, QVector<int>>      m_freeList;  // huecos reutilizables (LIFO)
    QHash<QString, qint64>           m_lastIssuedId;
    QHash<QString, QVector<QStringList>> m_compositeUnique;
    QHash<QString, QVector<ForeignKey>>  m_fksByChild;

    bool          m_inTx = false;
    Snapshot      m_snapshot;
    QSet<QString> m_touched;
};

/*
 * Alcance RAII de una transacción: toma el mutex del almacén, abre la
 * transacción y, si se destruye sin commit(), hace rollback.
 */
class StoreTransaction {
public:
    explicit StoreTransaction(TableStore& store);
    ~StoreTransaction();
    StoreTransaction(const StoreTransaction&) = delete;
    StoreTransaction& operator=(const StoreTransaction&) = delete;

    bool isActive() const { return m_active; }
    QString beginError() const { return m_beginError; }

    bool commit(QString* err = nullptr);
    void rollback();

private:
    void release();

    TableStore& m_store;
    bool        m_locked = false;
    bool        m_active = false;
    QString     m_beginError;
};

#endif // TABLESTORE_H
