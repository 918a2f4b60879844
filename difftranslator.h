#ifndef DIFFTRANSLATOR_H
#define DIFFTRANSLATOR_H

#include <QCoreApplication>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QVariantMap>
#include <QJsonValue>
#include <QJsonObject>

/* ====================== Valor de campo en el diff ====================== */
// Un campo cambiado puede venir como escalar o como {"old": v0, "new": v1}.
class FieldValue {
public:
    enum class Kind { Absent, Scalar, OldNew };

    static FieldValue from(const QJsonValue& raw);

    Kind       kind() const { return m_kind; }
    bool       isPresent() const { return m_kind != Kind::Absent; }
    QJsonValue current() const { return m_new; }   // "new" o el escalar
    QJsonValue previous() const { return m_old; }  // solo para OldNew

private:
    Kind       m_kind = Kind::Absent;
    QJsonValue m_old;
    QJsonValue m_new;
};

/* ====================== Atributos parciales ====================== */
// 'values' solo contiene las columnas presentes en la entrada: ausente = no tocar.

struct ProjectAttrs {
    QString     anchor;
    QVariantMap values;
    bool isEmpty() const { return values.isEmpty(); }
};

struct FmodelAttrs {
    QString     anchor;
    QVariantMap values;   // anchor, type, key, is_entry (+ file_id al resolver el padre)
    QJsonObject sch;      // todo lo no reconocido, verbatim (incluye parentAnchor hasta resolverlo)
    QVariantMap toRow() const;
};

struct FileAttrs {
    QString              anchor;
    QVariantMap          values;   // anchor, key, order
    bool                 hasFmodels = false;
    QVector<FmodelAttrs> fmodels;  // desde "fields"
};

/* ====================== Traductor ====================== */
class DiffTranslator {
    Q_DECLARE_TR_FUNCTIONS(DiffTranslator)
public:
    static const char* const kAnchor;   // "$anchor"

    // Entrada nula/ausente => atributos vacíos (no es error)
    static bool fromProjectSch(const QJsonValue& entry, ProjectAttrs& out, QString* err = nullptr);
    static bool fromFileSch(const QJsonValue& entry, FileAttrs& out, QString* err = nullptr);
    static bool fromFmodelSch(const QJsonValue& entry, FmodelAttrs& out, QString* err = nullptr);

    // Campos reconocidos de un fmodel; lo demás va a 'sch'
    static QStringList fmodelKnownFields();

private:
    static bool requireObject(const QJsonValue& entry, const char* kind, QJsonObject& out, QString* err);
    // "$anchor": debe existir y ser texto no vacío
    static bool putRequired(QVariantMap& map, const QString& putKey,
                            const QJsonObject& from, const QString& getKey, QString* err);
    // resto de campos: si no viene (o viene null) no se toca el mapa
    static void putOptional(QVariantMap& map, const QString& putKey,
                            const QJsonObject& from, const QString& getKey);
};

#endif // DIFFTRANSLATOR_H
