#pragma once
#include <QString>
#include <QJsonObject>

/* ===================== Errores de la capa fset ===================== */
enum class FsetErrorKind {
    None,
    MalformedEntry,     // entrada del diff sin "$anchor" o con forma inválida
    UnresolvedParent,   // fmodel cuyo parentAnchor no coincide con ningún archivo
    ConflictViolation,  // el almacén rechazó la escritura (únicos, FKs, requeridos)
    NotFound,           // búsqueda de proyecto sin resultado
    StorageFailure      // no se pudo abrir/persistir la transacción
};

struct FsetError {
    FsetErrorKind kind = FsetErrorKind::None;
    QString       step;      // paso de la unidad de trabajo que falló ("insert_fmodels"...)
    QString       message;
    QJsonObject   offending; // fmodel culpable (UnresolvedParent)

    QString kindName() const;
    QString toString() const;
};

// Rellena *err si no es nulo; siempre devuelve false para poder hacer "return fail(...)"
bool fail(FsetError* err, FsetErrorKind kind, const QString& message,
          const QString& step = QString());
