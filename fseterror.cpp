#include "fseterror.h"

#include <QJsonDocument>

QString FsetError::kindName() const {
    switch (kind) {
    case FsetErrorKind::None:              return "None";
    case FsetErrorKind::MalformedEntry:    return "MalformedEntry";
    case FsetErrorKind::UnresolvedParent:  return "UnresolvedParent";
    case FsetErrorKind::ConflictViolation: return "ConflictViolation";
    case FsetErrorKind::NotFound:          return "NotFound";
    case FsetErrorKind::StorageFailure:    return "StorageFailure";
    }
    return "None";
}

QString FsetError::toString() const {
    QString s = kindName();
    if (!step.isEmpty()) s += QString(" [%1]").arg(step);
    if (!message.isEmpty()) s += ": " + message;
    if (!offending.isEmpty())
        s += " " + QString::fromUtf8(QJsonDocument(offending).toJson(QJsonDocument::Compact));
    return s;
}

bool fail(FsetError* err, FsetErrorKind kind, const QString& message, const QString& step) {
    if (err) {
        err->kind    = kind;
        err->message = message;
        err->step    = step;
    }
    return false;
}
