#include "fsetconfig.h"
#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>

const char* const FsetConfig::kDefaultFile = "fset.json";

bool FsetConfig::load(const QString& path, QString* err) {
    QFile f(path);
    if (!f.exists()) return true; // valores por defecto
    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = QString("No se pudo abrir %1").arg(path);
        return false;
    }
    QJsonParseError pe;
    const auto doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = QString("Configuración inválida en %1: %2").arg(path, pe.errorString());
        return false;
    }
    const auto obj = doc.object();
    if (obj.contains("dataFile"))         dataFile_  = obj.value("dataFile").toString();
    if (obj.contains("defaultKeyPrefix")) keyPrefix_ = obj.value("defaultKeyPrefix").toString();
    if (obj.contains("logRules"))         logRules_  = obj.value("logRules").toString();
    return true;
}

bool FsetConfig::save(const QString& path, QString* err) const {
    QJsonObject obj;
    obj.insert("dataFile", dataFile_);
    obj.insert("defaultKeyPrefix", keyPrefix_);
    obj.insert("logRules", logRules_);

    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
        if (err) *err = QString("No se pudo escribir %1").arg(path);
        return false;
    }
    f.write(QJsonDocument(obj).toJson(QJsonDocument::Indented));
    if (!f.commit()) {
        if (err) *err = QString("No se pudo escribir %1").arg(path);
        return false;
    }
    return true;
}

void FsetConfig::applyLogRules() const {
    if (!logRules_.isEmpty())
        QLoggingCategory::setFilterRules(logRules_);
}
