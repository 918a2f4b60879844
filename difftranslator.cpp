#include "difftranslator.h"

#include <QJsonArray>
#include <QStringList>

const char* const DiffTranslator::kAnchor = "$anchor";

/* ====================== FieldValue ====================== */

FieldValue FieldValue::from(const QJsonValue& raw) {
    FieldValue fv;
    if (raw.isUndefined() || raw.isNull()) return fv; // Absent

    if (raw.isObject()) {
        const QJsonObject o = raw.toObject();
        bool onlyOldNew = o.contains("new");
        for (auto it = o.constBegin(); onlyOldNew && it != o.constEnd(); ++it)
            if (it.key() != "old" && it.key() != "new") onlyOldNew = false;
        if (onlyOldNew) {
            fv.m_kind = Kind::OldNew;
            fv.m_old  = o.value("old");
            fv.m_new  = o.value("new");
            return fv;
        }
    }
    fv.m_kind = Kind::Scalar;
    fv.m_new  = raw;
    return fv;
}

/* ====================== Atributos ====================== */

QVariantMap FmodelAttrs::toRow() const {
    QVariantMap row = values;
    row.insert("sch", QVariant::fromValue(sch));
    return row;
}

/* ====================== Helpers ====================== */

bool DiffTranslator::requireObject(const QJsonValue& entry, const char* kind, QJsonObject& out, QString* err) {
    if (!entry.isObject()) {
        if (err) *err = tr("Entrada de %1 inválida: se esperaba un objeto.").arg(QLatin1String(kind));
        return false;
    }
    out = entry.toObject();
    return true;
}

bool DiffTranslator::putRequired(QVariantMap& map, const QString& putKey,
                                 const QJsonObject& from, const QString& getKey, QString* err)
{
    if (!from.contains(getKey)) {
        if (err) *err = tr("Falta el campo requerido \"%1\".").arg(getKey);
        return false;
    }
    const FieldValue fv = FieldValue::from(from.value(getKey));
    const QJsonValue v = fv.current();
    if (!v.isString() || v.toString().isEmpty()) {
        if (err) *err = tr("El campo \"%1\" debe ser un texto no vacío.").arg(getKey);
        return false;
    }
    map.insert(putKey, v.toString());
    return true;
}

void DiffTranslator::putOptional(QVariantMap& map, const QString& putKey,
                                 const QJsonObject& from, const QString& getKey)
{
    const FieldValue fv = FieldValue::from(from.value(getKey));
    if (!fv.isPresent()) return;
    map.insert(putKey, fv.current().toVariant());
}

QStringList DiffTranslator::fmodelKnownFields() {
    return { QString::fromLatin1(kAnchor), "type", "key", "is_entry" };
}

/* ====================== Traducciones ====================== */

bool DiffTranslator::fromProjectSch(const QJsonValue& entry, ProjectAttrs& out, QString* err) {
    out = ProjectAttrs{};
    if (entry.isUndefined() || entry.isNull()) return true; // sin cambios de proyecto

    QJsonObject o;
    if (!requireObject(entry, "proyecto", o, err)) return false;
    if (!putRequired(out.values, "anchor", o, kAnchor, err)) return false;
    putOptional(out.values, "description", o, "description");
    putOptional(out.values, "key",         o, "key");
    putOptional(out.values, "order",       o, "order");
    out.anchor = out.values.value("anchor").toString();
    return true;
}

bool DiffTranslator::fromFmodelSch(const QJsonValue& entry, FmodelAttrs& out, QString* err) {
    out = FmodelAttrs{};
    QJsonObject o;
    if (!requireObject(entry, "fmodel", o, err)) return false;
    if (!putRequired(out.values, "anchor", o, kAnchor, err)) return false;
    putOptional(out.values, "type",     o, "type");
    putOptional(out.values, "key",      o, "key");
    putOptional(out.values, "is_entry", o, "is_entry");
    out.anchor = out.values.value("anchor").toString();

    // Lo no reconocido pasa verbatim al payload opaco
    QJsonObject sch = o;
    for (const QString& k : fmodelKnownFields()) sch.remove(k);
    out.sch = sch;
    return true;
}

bool DiffTranslator::fromFileSch(const QJsonValue& entry, FileAttrs& out, QString* err) {
    out = FileAttrs{};
    QJsonObject o;
    if (!requireObject(entry, "archivo", o, err)) return false;
    if (!putRequired(out.values, "anchor", o, kAnchor, err)) return false;
    putOptional(out.values, "key",   o, "key");
    putOptional(out.values, "order", o, "order");
    out.anchor = out.values.value("anchor").toString();

    // "fields": fmodels anidados (mapa id -> entrada, o lista de entradas)
    const FieldValue fields = FieldValue::from(o.value("fields"));
    if (fields.isPresent()) {
        const QJsonValue fv = fields.current();
        QVector<QJsonValue> entries;
        if (fv.isObject()) {
            const QJsonObject fo = fv.toObject();
            for (auto it = fo.constBegin(); it != fo.constEnd(); ++it) entries.push_back(it.value());
        } else if (fv.isArray()) {
            for (const auto& v : fv.toArray()) entries.push_back(v);
        } else if (!fv.isNull()) {
            if (err) *err = tr("\"fields\" debe ser un objeto o una lista.");
            return false;
        }
        out.hasFmodels = true;
        for (const QJsonValue& e : entries) {
            FmodelAttrs fm;
            if (!fromFmodelSch(e, fm, err)) return false;
            out.fmodels.push_back(fm);
        }
    }
    return true;
}
