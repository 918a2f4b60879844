#pragma once
#include <QDateTime>
#include <QString>

/*
 * Fuente de reloj e identificadores. Se inyecta para que las claves por
 * defecto ("project_<unix>"), los anchors y los timestamps sean reproducibles.
 */
class IdProvider {
public:
    virtual ~IdProvider() = default;
    virtual QDateTime now() const = 0;       // UTC, truncado a segundos
    virtual QString   newAnchor() const = 0; // UUID sin llaves
};

class SystemIdProvider : public IdProvider {
public:
    QDateTime now() const override;
    QString   newAnchor() const override;
};
