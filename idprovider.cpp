#include "idprovider.h"

#include <QUuid>

QDateTime SystemIdProvider::now() const {
    const QDateTime t = QDateTime::currentDateTimeUtc();
    return QDateTime::fromSecsSinceEpoch(t.toSecsSinceEpoch(), Qt::UTC);
}

QString SystemIdProvider::newAnchor() const {
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}
