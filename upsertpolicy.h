#pragma once
#include <QString>
#include <QStringList>

/*
 * Política de upsert por entidad y fase: qué índice único detecta el conflicto
 * y qué columnas se reescriben cuando lo hay.
 *
 *  Entidad  Fase     Conflicto           Reemplaza
 *  File     changed  (key, project_id)   key, order
 *  Fmodel   changed  anchor              key, type, is_entry, sch
 *  File     added    anchor              key, order
 *  Fmodel   added    anchor              key, type, is_entry, sch
 *
 * El proyecto no pasa por aquí: se actualiza por identidad con los atributos del parche.
 */
struct UpsertPolicy {
    QString     table;
    QStringList conflictTarget;
    QStringList replaceColumns;
    bool        returning = false;

    static UpsertPolicy changedFiles();
    static UpsertPolicy changedFmodels();
    static UpsertPolicy addedFiles();
    static UpsertPolicy addedFmodels();
};
