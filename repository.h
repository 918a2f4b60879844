#ifndef REPOSITORY_H
#define REPOSITORY_H

#include <QCoreApplication>
#include <QString>

#include "tablestore.h"
#include "unitofwork.h"
#include "fmodels.h"
#include "fseterror.h"

/*
 * Acceso a proyectos / archivos / fmodels sobre el TableStore.
 *  - búsquedas por clave natural con archivos y fmodels precargados
 *  - submit(): ejecuta una UnitOfWork completa en una sola transacción
 */
class Repository {
    Q_DECLARE_TR_FUNCTIONS(Repository)
public:
    static const char* const kProjects;
    static const char* const kFiles;
    static const char* const kFmodels;

    explicit Repository(TableStore& store);

    TableStore& store() const { return m_store; }

    // Crea el esquema (si falta), carga el archivo de datos y activa la durabilidad.
    // dataFile vacío = solo memoria.
    bool open(const QString& dataFile, FsetError* err = nullptr);
    bool ensureSchema(QString* err = nullptr);

    bool projectByKey(const QString& key, Project* out, FsetError* err = nullptr) const;
    bool projectByAnchor(const QString& anchor, Project* out, FsetError* err = nullptr) const;
    bool projectById(qint64 id, Project* out, FsetError* err = nullptr) const;

    bool insertProject(const Row& attrs, Project* out, FsetError* err = nullptr);

    bool submit(const UnitOfWork& uow, StepChanges* changes = nullptr, FsetError* err = nullptr);

private:
    bool loadProject(const RowPredicate& where, const QString& what,
                     Project* out, FsetError* err) const;

    TableStore& m_store;
};

#endif // REPOSITORY_H
