#pragma once
#include <QString>

/**
 * Configuración en JSON ("fset.json" en el cwd si no se indica otra ruta).
 *   dataFile          archivo de durabilidad del almacén ("" = solo memoria)
 *   defaultKeyPrefix  prefijo de la clave por defecto de un proyecto
 *   logRules          reglas para QLoggingCategory::setFilterRules
 * Si el archivo no existe se usan los valores por defecto.
 */
class FsetConfig {
public:
    static const char* const kDefaultFile;

    FsetConfig() = default;

    bool load(const QString& path = QString::fromLatin1(kDefaultFile), QString* err = nullptr);
    bool save(const QString& path = QString::fromLatin1(kDefaultFile), QString* err = nullptr) const;

    QString dataFile() const { return dataFile_; }
    void    setDataFile(const QString& f) { dataFile_ = f; }

    QString defaultKeyPrefix() const { return keyPrefix_; }
    void    setDefaultKeyPrefix(const QString& p) { keyPrefix_ = p; }

    QString logRules() const { return logRules_; }
    void    setLogRules(const QString& r) { logRules_ = r; }
    void    applyLogRules() const;

private:
    QString dataFile_  = QStringLiteral("fset_data.json");
    QString keyPrefix_ = QStringLiteral("project_");
    QString logRules_;
};
