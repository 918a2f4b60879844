#include <catch2/catch_test_macros.hpp>

#include "integrityguard.h"
#include "fset_test_support.h"

static FmodelAttrs fmodel(const char* text) {
    FmodelAttrs fm;
    REQUIRE(DiffTranslator::fromFmodelSch(json(text), fm));
    return fm;
}

TEST_CASE("Cada fmodel recibe el file_id de su archivo padre", "[integrityguard]") {
    const QVector<FileRef> files{ { 10, "f1" }, { 20, "f2" } };
    const QVector<FmodelAttrs> fmodels{
        fmodel(R"({"$anchor": "m1", "parentAnchor": "f2"})"),
        fmodel(R"({"$anchor": "m2", "parentAnchor": {"old": "f2", "new": "f1"}, "x": 1})"),
    };

    const ParentResolution res = IntegrityGuard::putRequiredFileId(fmodels, files);
    REQUIRE(res.ok);
    REQUIRE(res.resolved.size() == 2);
    REQUIRE(res.resolved.at(0).values.value("file_id").toLongLong() == 20);
    REQUIRE(res.resolved.at(1).values.value("file_id").toLongLong() == 10);

    // el marcador no se persiste, el resto del payload sí
    REQUIRE_FALSE(res.resolved.at(0).sch.contains("parentAnchor"));
    REQUIRE_FALSE(res.resolved.at(1).sch.contains("parentAnchor"));
    REQUIRE(res.resolved.at(1).sch.value("x").toInt() == 1);
}

TEST_CASE("Gana el primer archivo con ese ancla", "[integrityguard]") {
    const QVector<FileRef> files{ { 7, "f1" }, { 3, "f1" } };
    const ParentResolution res = IntegrityGuard::putRequiredFileId(
        { fmodel(R"({"$anchor": "m1", "parentAnchor": "f1"})") }, files);
    REQUIRE(res.ok);
    REQUIRE(res.resolved.first().values.value("file_id").toLongLong() == 7);
}

TEST_CASE("Un padre inexistente invalida todo el lote", "[integrityguard]") {
    const QVector<FileRef> files{ { 10, "f1" } };
    const QVector<FmodelAttrs> fmodels{
        fmodel(R"({"$anchor": "m1", "parentAnchor": "f1"})"),
        fmodel(R"({"$anchor": "m2", "parentAnchor": "ghost"})"),
        fmodel(R"({"$anchor": "m3", "parentAnchor": "f1"})"),
    };

    const ParentResolution res = IntegrityGuard::putRequiredFileId(fmodels, files);
    REQUIRE_FALSE(res.ok);
    REQUIRE(res.resolved.isEmpty());
    REQUIRE(res.offending.anchor == "m2");
    REQUIRE(res.missingParent == "ghost");
}

TEST_CASE("Sin parentAnchor tampoco hay padre", "[integrityguard]") {
    const ParentResolution res = IntegrityGuard::putRequiredFileId(
        { fmodel(R"({"$anchor": "m1"})") }, { { 10, "f1" } });
    REQUIRE_FALSE(res.ok);
    REQUIRE(res.offending.anchor == "m1");
    REQUIRE(res.missingParent.isEmpty());
}

TEST_CASE("Lote vacío resuelve a vacío", "[integrityguard]") {
    const ParentResolution res = IntegrityGuard::putRequiredFileId({}, {});
    REQUIRE(res.ok);
    REQUIRE(res.resolved.isEmpty());
}
