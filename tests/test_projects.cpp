#include <catch2/catch_test_macros.hpp>

#include <QJsonArray>
#include <QTemporaryDir>

#include "projects.h"
#include "fset_test_support.h"

// ====================================================================
// create / getProject
// ====================================================================

TEST_CASE("create sin clave usa el prefijo y el reloj", "[projects]") {
    MemoryRepo db;
    REQUIRE(db.opened);
    FixedIdProvider ids(1700000000);
    Projects projects(db.repo, ids);

    Project p;
    FsetError err;
    REQUIRE(projects.create(QVariantMap(), &p, &err));
    REQUIRE(p.id > 0);
    REQUIRE(p.key == "project_1700000000");
    REQUIRE(p.anchor == "00000000-0000-4000-8000-000000000001");

    const auto rows = db.store.select(Repository::kProjects);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows.first().value("inserted_at").toDateTime() == ids.now());
    REQUIRE(rows.first().value("updated_at").toDateTime() == ids.now());
}

TEST_CASE("create respeta los atributos dados y el prefijo configurado", "[projects]") {
    MemoryRepo db;
    REQUIRE(db.opened);
    FixedIdProvider ids(42);
    Projects projects(db.repo, ids, "form_");

    Project p;
    REQUIRE(projects.create({ { "key", "personas" }, { "description", "Altas" }, { "order", 2 },
                              { "ignored", "x" } }, &p));
    REQUIRE(p.key == "personas");
    REQUIRE(p.description == "Altas");
    REQUIRE(p.order.toLongLong() == 2);

    Project q;
    REQUIRE(projects.create(QVariantMap(), &q));
    REQUIRE(q.key == "form_42");
}

TEST_CASE("Claves de proyecto duplicadas son un conflicto", "[projects]") {
    MemoryRepo db;
    REQUIRE(db.opened);
    FixedIdProvider ids;
    Projects projects(db.repo, ids);

    REQUIRE(projects.create({ { "key", "P" } }, nullptr));
    FsetError err;
    REQUIRE_FALSE(projects.create({ { "key", "P" } }, nullptr, &err));
    REQUIRE(err.kind == FsetErrorKind::ConflictViolation);
    REQUIRE(err.step == "insert_project");
    REQUIRE(db.store.liveRowCount(Repository::kProjects) == 1);
}

TEST_CASE("getProject busca por ancla si el nombre es un UUID y si no por clave", "[projects]") {
    MemoryRepo db;
    REQUIRE(db.opened);
    FixedIdProvider ids;
    Projects projects(db.repo, ids);

    Project created;
    REQUIRE(projects.create({ { "key", "P" } }, &created));

    Project byKey, byAnchor, byBraces;
    REQUIRE(projects.getProject("P", &byKey));
    REQUIRE(projects.getProject(created.anchor, &byAnchor));
    REQUIRE(projects.getProject("{" + created.anchor + "}", &byBraces));
    REQUIRE(byKey.id == created.id);
    REQUIRE(byAnchor.id == created.id);
    REQUIRE(byBraces.id == created.id);

    FsetError err;
    REQUIRE_FALSE(projects.getProject("Q", nullptr, &err));
    REQUIRE(err.kind == FsetErrorKind::NotFound);
    REQUIRE_FALSE(projects.getProject("00000000-0000-4000-8000-0000000000ff", nullptr, &err));
    REQUIRE(err.kind == FsetErrorKind::NotFound);
}

// ====================================================================
// Representación
// ====================================================================

TEST_CASE("toProjectSch anida archivos y fmodels", "[projects]") {
    MemoryRepo db;
    REQUIRE(db.opened);
    FixedIdProvider ids;
    Projects projects(db.repo, ids);

    Project p;
    REQUIRE(projects.create({ { "key", "P" } }, &p));
    REQUIRE(projects.persistDiff(json(R"({"added": {
        "files":   {"1": {"$anchor": "a-f1", "key": "person", "order": 1},
                    "2": {"$anchor": "a-f2", "key": "empty"}},
        "fmodels": {"1": {"$anchor": "a-m1", "type": "object", "key": "root",
                          "is_entry": true, "parentAnchor": "a-f1", "title": "Persona"}}
    }})"), p));
    REQUIRE(projects.getProject("P", &p));

    const QJsonObject sch = Projects::toProjectSch(p);
    REQUIRE(sch.value("key").toString() == "P");
    REQUIRE(sch.value("anchor").toString() == p.anchor);
    REQUIRE(sch.value("order").isNull());

    const QJsonArray files = sch.value("files").toArray();
    REQUIRE(files.size() == 2);
    REQUIRE(files.at(0).toObject().value("key").toString() == "person");
    REQUIRE(files.at(0).toObject().value("order").toInt() == 1);
    REQUIRE(files.at(1).toObject().value("order").isNull());
    REQUIRE(files.at(1).toObject().value("fmodels").toArray().isEmpty());

    const QJsonObject m = files.at(0).toObject().value("fmodels").toArray().at(0).toObject();
    REQUIRE(m == json(R"({"type": "object", "key": "root", "is_entry": true,
                          "anchor": "a-m1", "sch": {"title": "Persona"}})"));
}

TEST_CASE("toProjectSch conserva los nulos del fmodel", "[projects]") {
    MemoryRepo db;
    REQUIRE(db.opened);
    FixedIdProvider ids;
    Projects projects(db.repo, ids);

    Project p;
    REQUIRE(projects.create({ { "key", "P" } }, &p));
    REQUIRE(projects.persistDiff(json(R"({"added": {
        "files":   {"1": {"$anchor": "a-f1", "key": "person"}},
        "fmodels": {"1": {"$anchor": "a-m1", "parentAnchor": "a-f1"},
                    "2": {"$anchor": "a-m2", "parentAnchor": "a-f1",
                          "type": "string", "is_entry": false}}
    }})"), p));
    REQUIRE(projects.getProject("P", &p));

    const QJsonArray fmodels =
        Projects::toProjectSch(p).value("files").toArray().at(0).toObject().value("fmodels").toArray();
    REQUIRE(fmodels.size() == 2);

    const QJsonObject bare = fmodels.at(0).toObject();
    REQUIRE(bare.value("type").isNull());
    REQUIRE(bare.value("key").isNull());
    REQUIRE(bare.value("is_entry").isNull());

    const QJsonObject full = fmodels.at(1).toObject();
    REQUIRE(full.value("type").toString() == "string");
    REQUIRE(full.value("is_entry").isBool());
    REQUIRE_FALSE(full.value("is_entry").toBool());
}

// ====================================================================
// applyDiff
// ====================================================================

TEST_CASE("applyDiff devuelve el proyecto aunque el diff cambie su clave", "[projects]") {
    MemoryRepo db;
    REQUIRE(db.opened);
    FixedIdProvider ids;
    Projects projects(db.repo, ids);

    Project p;
    REQUIRE(projects.create({ { "key", "P" } }, &p));

    QJsonObject projectPatch;
    projectPatch["$anchor"] = p.anchor;
    projectPatch["key"]     = json(R"({"old": "P", "new": "P2"})");
    QJsonObject changed;
    changed["project"] = projectPatch;
    QJsonObject diff;
    diff["changed"] = changed;

    Project after;
    FsetError err;
    REQUIRE(projects.applyDiff(diff, p, &after, &err));
    REQUIRE(after.id == p.id);
    REQUIRE(after.key == "P2");
    REQUIRE(Projects::toProjectSch(after).value("key").toString() == "P2");

    REQUIRE_FALSE(projects.getProject("P", nullptr));
    REQUIRE(projects.getProject("P2", nullptr));
}

TEST_CASE("applyDiff rechazado no devuelve estado", "[projects]") {
    MemoryRepo db;
    REQUIRE(db.opened);
    FixedIdProvider ids;
    Projects projects(db.repo, ids);

    Project p;
    REQUIRE(projects.create({ { "key", "P" } }, &p));

    Project after;
    FsetError err;
    REQUIRE_FALSE(projects.applyDiff(json(R"({"added": {
        "fmodels": {"1": {"$anchor": "a-m1", "parentAnchor": "ghost"}}
    }})"), p, &after, &err));
    REQUIRE(err.kind == FsetErrorKind::UnresolvedParent);
    REQUIRE(after.id == -1);
}

// ====================================================================
// Durabilidad de punta a punta
// ====================================================================

TEST_CASE("Lo confirmado sobrevive a reabrir el archivo de datos", "[projects][durability]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("fset_data.json");
    FixedIdProvider ids;

    {
        TableStore store;
        Repository repo(store);
        REQUIRE(repo.open(path));
        Projects projects(repo, ids);

        Project p;
        REQUIRE(projects.create({ { "key", "P" } }, &p));
        REQUIRE(projects.persistDiff(json(R"({"added": {
            "files":   {"1": {"$anchor": "a-f1", "key": "person"}},
            "fmodels": {"1": {"$anchor": "a-m1", "key": "name", "parentAnchor": "a-f1", "min": 1}}
        }})"), p));

        // un diff rechazado no llega al archivo
        REQUIRE_FALSE(projects.persistDiff(json(R"({"added": {
            "fmodels": {"1": {"$anchor": "a-m2", "parentAnchor": "ghost"}}
        }})"), p));
    }

    TableStore store;
    Repository repo(store);
    FsetError err;
    REQUIRE(repo.open(path, &err));
    Projects projects(repo, ids);

    Project p;
    REQUIRE(projects.getProject("P", &p));
    REQUIRE(p.files.size() == 1);
    REQUIRE(p.files.first().fmodels.size() == 1);
    REQUIRE(p.files.first().fmodels.first().anchor == "a-m1");
    REQUIRE(p.files.first().fmodels.first().sch == json(R"({"min": 1})"));
}
