#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QFile>
#include <QJsonObject>
#include <QTemporaryDir>

#include "tablestore.h"
#include "fset_test_support.h"

// ====================================================================
// Helpers
// ====================================================================

static FieldDef field(const QString& name, const QString& type, bool requerido = false,
                      const QString& indexado = QString("No"), bool pk = false) {
    FieldDef f;
    f.name = name;
    f.type = type;
    f.requerido = requerido;
    f.indexado = indexado;
    f.pk = pk;
    return f;
}

// parents(id, code único) <- children(id, parent_id, tag) <- toys(id, child_id)
static void buildFamily(TableStore& store, FkAction childAction, FkAction toyAction) {
    const QString unique = "Sí (sin duplicados)";
    REQUIRE(store.createTable("parents", {
        field("id", "Autonumeración", true, "No", true),
        field("code", "Texto corto", true, unique),
    }));
    REQUIRE(store.createTable("children", {
        field("id", "Autonumeración", true, "No", true),
        field("parent_id", "Número", true),
        field("tag", "Texto corto"),
        field("n", "Número"),
        field("doc", "JSON"),
    }));
    REQUIRE(store.createTable("toys", {
        field("id", "Autonumeración", true, "No", true),
        field("child_id", "Número"),
    }));
    REQUIRE(store.addUniqueIndex("children", { "parent_id", "tag" }));
    REQUIRE(store.addRelationship("children", "parent_id", "parents", "id", childAction));
    REQUIRE(store.addRelationship("toys", "child_id", "children", "id", toyAction));
}

static qint64 insertOne(TableStore& store, const QString& table, const Row& row) {
    QVector<Row> back;
    QString err;
    REQUIRE(store.insertAll(table, { row }, {}, {}, &back, &err));
    REQUIRE(back.size() == 1);
    return back.first().value("id").toLongLong();
}

// ====================================================================
// Transacciones
// ====================================================================

TEST_CASE("Escribir fuera de una transacción falla", "[tablestore]") {
    TableStore store;
    buildFamily(store, FkAction::Restrict, FkAction::Restrict);

    QString err;
    REQUIRE_FALSE(store.insertAll("parents", { Row{ { "code", "a" } } }, {}, {}, nullptr, &err));
    REQUIRE_FALSE(err.isEmpty());
    REQUIRE(store.deleteWhere("parents", RowPredicate(), &err) == -1);
    REQUIRE(store.liveRowCount("parents") == 0);
}

TEST_CASE("Autonumeración monótona dentro y entre transacciones", "[tablestore]") {
    TableStore store;
    buildFamily(store, FkAction::Restrict, FkAction::Restrict);

    {
        StoreTransaction tx(store);
        REQUIRE(tx.isActive());
        REQUIRE(insertOne(store, "parents", { { "code", "a" } }) == 1);
        REQUIRE(insertOne(store, "parents", { { "code", "b" } }) == 2);
        REQUIRE(tx.commit());
    }
    {
        StoreTransaction tx(store);
        REQUIRE(store.deleteWhere("parents", [](const Row& r) { return r.value("code") == "b"; }) == 1);
        REQUIRE(insertOne(store, "parents", { { "code", "c" } }) == 3);
        REQUIRE(tx.commit());
    }
    REQUIRE(store.liveRowCount("parents") == 2);
}

TEST_CASE("Rollback deja el almacén idéntico", "[tablestore]") {
    TableStore store;
    buildFamily(store, FkAction::Cascade, FkAction::Cascade);
    {
        StoreTransaction tx(store);
        const qint64 p = insertOne(store, "parents", { { "code", "a" } });
        insertOne(store, "children", { { "parent_id", p }, { "tag", "x" } });
        REQUIRE(tx.commit());
    }
    const QByteArray before = store.toJson();

    SECTION("explícito") {
        StoreTransaction tx(store);
        insertOne(store, "parents", { { "code", "b" } });
        REQUIRE(store.deleteWhere("parents", RowPredicate()) == 2);
        tx.rollback();
        REQUIRE_FALSE(store.inTransaction());
    }
    SECTION("al destruirse sin commit") {
        StoreTransaction tx(store);
        insertOne(store, "parents", { { "code", "b" } });
    }

    REQUIRE(store.toJson() == before);

    // el contador de autonumeración también vuelve atrás
    StoreTransaction tx(store);
    REQUIRE(insertOne(store, "parents", { { "code", "z" } }) == 2);
    tx.rollback();
}

TEST_CASE("No se abren transacciones anidadas en el mismo almacén", "[tablestore]") {
    TableStore store;
    REQUIRE(store.beginTransaction());
    QString err;
    REQUIRE_FALSE(store.beginTransaction(&err));
    REQUIRE_FALSE(err.isEmpty());
    store.rollbackTransaction();
    REQUIRE_FALSE(store.inTransaction());
}

// ====================================================================
// Integridad
// ====================================================================

TEST_CASE("Índice único simple y compuesto", "[tablestore]") {
    TableStore store;
    buildFamily(store, FkAction::Restrict, FkAction::Restrict);
    StoreTransaction tx(store);

    const qint64 p1 = insertOne(store, "parents", { { "code", "a" } });
    const qint64 p2 = insertOne(store, "parents", { { "code", "b" } });

    QString err;
    REQUIRE_FALSE(store.insertAll("parents", { Row{ { "code", "a" } } }, {}, {}, nullptr, &err));
    REQUIRE(err.contains("code"));

    insertOne(store, "children", { { "parent_id", p1 }, { "tag", "x" } });
    insertOne(store, "children", { { "parent_id", p2 }, { "tag", "x" } });
    REQUIRE_FALSE(store.insertAll("children", { Row{ { "parent_id", p1 }, { "tag", "x" } } },
                                  {}, {}, nullptr, &err));

    // NULL no colisiona
    insertOne(store, "children", { { "parent_id", p1 } });
    insertOne(store, "children", { { "parent_id", p1 } });
    REQUIRE(store.liveRowCount("children") == 4);

    REQUIRE(store.hasUniqueIndex("children", { "tag", "parent_id" }));
    REQUIRE_FALSE(store.hasUniqueIndex("children", { "tag" }));
}

TEST_CASE("Requeridos y columnas desconocidas", "[tablestore]") {
    TableStore store;
    buildFamily(store, FkAction::Restrict, FkAction::Restrict);
    StoreTransaction tx(store);

    QString err;
    REQUIRE_FALSE(store.insertAll("parents", { Row{} }, {}, {}, nullptr, &err));
    REQUIRE(err.contains("code"));
    REQUIRE_FALSE(store.insertAll("parents", { Row{ { "code", "a" }, { "nope", 1 } } },
                                  {}, {}, nullptr, &err));
    REQUIRE(err.contains("nope"));
}

TEST_CASE("FK en escritura y Restrict al borrar", "[tablestore]") {
    TableStore store;
    buildFamily(store, FkAction::Restrict, FkAction::Restrict);
    StoreTransaction tx(store);

    QString err;
    REQUIRE_FALSE(store.insertAll("children", { Row{ { "parent_id", 99 } } }, {}, {}, nullptr, &err));
    REQUIRE(err.contains("FK"));

    const qint64 p = insertOne(store, "parents", { { "code", "a" } });
    insertOne(store, "children", { { "parent_id", p } });
    REQUIRE(store.deleteWhere("parents", RowPredicate(), &err) == -1);
    REQUIRE(err.contains("Restrict"));
    REQUIRE(store.liveRowCount("parents") == 1);
}

TEST_CASE("Cascade borra nietos", "[tablestore]") {
    TableStore store;
    buildFamily(store, FkAction::Cascade, FkAction::Cascade);
    StoreTransaction tx(store);

    const qint64 p = insertOne(store, "parents", { { "code", "a" } });
    const qint64 c = insertOne(store, "children", { { "parent_id", p } });
    insertOne(store, "toys", { { "child_id", c } });
    insertOne(store, "toys", { { "child_id", c } });

    REQUIRE(store.deleteWhere("parents", RowPredicate()) == 1);
    REQUIRE(store.liveRowCount("children") == 0);
    REQUIRE(store.liveRowCount("toys") == 0);
}

TEST_CASE("SetNull deja huérfanos sin referencia", "[tablestore]") {
    TableStore store;
    buildFamily(store, FkAction::Cascade, FkAction::SetNull);
    StoreTransaction tx(store);

    const qint64 p = insertOne(store, "parents", { { "code", "a" } });
    const qint64 c = insertOne(store, "children", { { "parent_id", p } });
    insertOne(store, "toys", { { "child_id", c } });

    REQUIRE(store.deleteWhere("children", RowPredicate()) == 1);
    const auto toys = store.select("toys");
    REQUIRE(toys.size() == 1);
    REQUIRE(toys.first().value("child_id").isNull());
}

// ====================================================================
// Upsert
// ====================================================================

TEST_CASE("ON CONFLICT reemplaza solo las columnas presentes", "[tablestore][upsert]") {
    TableStore store;
    buildFamily(store, FkAction::Restrict, FkAction::Restrict);
    StoreTransaction tx(store);

    const qint64 p = insertOne(store, "parents", { { "code", "a" } });
    insertOne(store, "children", { { "parent_id", p }, { "tag", "x" }, { "n", 1 },
                                   { "doc", QVariant::fromValue(QJsonObject{ { "k", 1 } }) } });

    QVector<Row> back;
    QString err;
    REQUIRE(store.insertAll("children",
                            { Row{ { "parent_id", p }, { "tag", "x" }, { "n", 5 } } },
                            { "parent_id", "tag" }, { "n", "doc" }, &back, &err));
    REQUIRE(back.size() == 1);
    REQUIRE(back.first().value("id").toLongLong() == 1);
    REQUIRE(back.first().value("n").toLongLong() == 5);
    // "doc" no venía: se conserva
    REQUIRE(back.first().value("doc").value<QJsonObject>().value("k").toInt() == 1);
    REQUIRE(store.liveRowCount("children") == 1);
}

TEST_CASE("ON CONFLICT exige un índice único y no toca dos veces la misma fila", "[tablestore][upsert]") {
    TableStore store;
    buildFamily(store, FkAction::Restrict, FkAction::Restrict);
    StoreTransaction tx(store);
    const qint64 p = insertOne(store, "parents", { { "code", "a" } });

    QString err;
    REQUIRE_FALSE(store.insertAll("children", { Row{ { "parent_id", p } } },
                                  { "n" }, { "tag" }, nullptr, &err));
    REQUIRE(err.contains("ON CONFLICT"));

    const Row dup{ { "parent_id", p }, { "tag", "x" } };
    REQUIRE_FALSE(store.insertAll("children", { dup, dup }, { "parent_id", "tag" }, { "n" },
                                  nullptr, &err));
    REQUIRE(err.contains("dos veces"));
}

TEST_CASE("updateById no cambia la clave primaria", "[tablestore]") {
    TableStore store;
    buildFamily(store, FkAction::Restrict, FkAction::Restrict);
    StoreTransaction tx(store);
    const qint64 p = insertOne(store, "parents", { { "code", "a" } });

    Row updated;
    REQUIRE(store.updateById("parents", p, { { "code", "b" } }, &updated));
    REQUIRE(updated.value("code").toString() == "b");

    QString err;
    REQUIRE_FALSE(store.updateById("parents", p, { { "id", p + 1 } }, nullptr, &err));
    REQUIRE_FALSE(store.updateById("parents", 42, { { "code", "c" } }, nullptr, &err));
}

// ====================================================================
// Durabilidad
// ====================================================================

TEST_CASE("El commit persiste y otro almacén lo carga", "[tablestore][durability]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("data.json");

    TableStore store;
    buildFamily(store, FkAction::Cascade, FkAction::Cascade);
    store.setDataPath(path);
    {
        StoreTransaction tx(store);
        const qint64 p = insertOne(store, "parents", { { "code", "a" } });
        insertOne(store, "children", { { "parent_id", p }, { "tag", "x" },
                                       { "doc", QVariant::fromValue(QJsonObject{ { "k", "v" } }) } });
        insertOne(store, "parents", { { "code", "b" } });
        REQUIRE(store.deleteWhere("parents", [](const Row& r) { return r.value("code") == "b"; }) == 1);
        REQUIRE(tx.commit());
    }
    REQUIRE(QFile::exists(path));

    TableStore other;
    buildFamily(other, FkAction::Cascade, FkAction::Cascade);
    QString err;
    REQUIRE(other.loadFromJson(path, &err));
    REQUIRE(other.toJson() == store.toJson());

    const auto kids = other.select("children");
    REQUIRE(kids.size() == 1);
    REQUIRE(kids.first().value("doc").value<QJsonObject>().value("k").toString() == "v");

    // el id borrado no se reutiliza tras recargar
    StoreTransaction tx(other);
    REQUIRE(insertOne(other, "parents", { { "code", "c" } }) == 3);
    tx.rollback();
}

TEST_CASE("Si no se puede escribir el archivo el commit se revierte", "[tablestore][durability]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    TableStore store;
    buildFamily(store, FkAction::Restrict, FkAction::Restrict);
    store.setDataPath(dir.filePath("no/such/dir/data.json"));

    StoreTransaction tx(store);
    insertOne(store, "parents", { { "code", "a" } });
    QString err;
    REQUIRE_FALSE(tx.commit(&err));
    REQUIRE_FALSE(err.isEmpty());
    REQUIRE_FALSE(store.inTransaction());
    REQUIRE(store.liveRowCount("parents") == 0);
}

TEST_CASE("Archivo inexistente da almacén vacío y versión desconocida da error", "[tablestore][durability]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    TableStore store;
    buildFamily(store, FkAction::Restrict, FkAction::Restrict);
    REQUIRE(store.loadFromJson(dir.filePath("missing.json")));

    QFile f(dir.filePath("v9.json"));
    REQUIRE(f.open(QIODevice::WriteOnly));
    f.write("{\"version\":9,\"tables\":{}}");
    f.close();

    QString err;
    REQUIRE_FALSE(store.loadFromJson(f.fileName(), &err));
    REQUIRE(err.contains("Versión"));
}

// ====================================================================
// Señales
// ====================================================================

TEST_CASE("rowsChanged se emite al confirmar por cada tabla tocada", "[tablestore]") {
    TableStore store;
    buildFamily(store, FkAction::Cascade, FkAction::Cascade);

    QStringList seen;
    QObject::connect(&store, &TableStore::rowsChanged, [&seen](const QString& t) { seen << t; });

    {
        StoreTransaction tx(store);
        const qint64 p = insertOne(store, "parents", { { "code", "a" } });
        insertOne(store, "children", { { "parent_id", p } });
        tx.rollback();
    }
    REQUIRE(seen.isEmpty());

    {
        StoreTransaction tx(store);
        const qint64 p = insertOne(store, "parents", { { "code", "a" } });
        insertOne(store, "children", { { "parent_id", p } });
        REQUIRE(tx.commit());
    }
    REQUIRE(seen == QStringList{ "children", "parents" });
}
