#ifndef FMODELS_H
#define FMODELS_H

#include <QString>
#include <QVariant>
#include <QVector>
#include <QJsonObject>

/* ================= Entidades persistidas (proyecto > archivo > fmodel) ================= */

struct Fmodel {
    qint64      id = -1;
    QString     anchor;
    QVariant    type;      // qué clase de nodo de esquema es; nulo si no vino
    QVariant    key;
    QVariant    isEntry;
    QJsonObject sch;       // documento opaco, se guarda tal cual
    qint64      fileId = -1;
};

struct File {
    qint64           id = -1;
    QString          anchor;
    QString          key;
    QVariant         order;   // puede venir nulo
    qint64           projectId = -1;
    QVector<Fmodel>  fmodels;
};

struct Project {
    qint64          id = -1;
    QString         anchor;
    QString         key;
    QVariant        order;
    QString         description;
    QVector<File>   files;
};

// Lo mínimo que el guardián necesita de un archivo para resolver padres
struct FileRef {
    qint64  id = -1;
    QString anchor;
};

inline QVector<FileRef> fileRefsOf(const Project& p) {
    QVector<FileRef> refs;
    refs.reserve(p.files.size());
    for (const File& f : p.files) refs.push_back(FileRef{f.id, f.anchor});
    return refs;
}

#endif // FMODELS_H
