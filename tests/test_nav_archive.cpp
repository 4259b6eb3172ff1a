// NavArchiveLoader tests against the ZIP fixture (tests/fixtures/sample_nav.zip)
//
// The fixture holds maps/Test_Map.nav (version 16, two adjacent 100x100
// areas at z 0 and z 20, one place "Spawn") and an unrelated readme.txt.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "NavArchiveLoader.h"
#include "NavLoader.h"

namespace fs = std::filesystem;
using namespace HammerNav;
using Catch::Approx;

static std::string fixturePath() {
    return std::string(FIXTURES_DIR) + "/sample_nav.zip";
}

static bool fixtureAvailable() {
    if (fs::exists(fixturePath()))
        return true;

    std::fprintf(stderr, "Fixture zip not found: %s\n", fixturePath().c_str());
    return false;
}

// ---- Test cases ----

TEST_CASE("NavArchiveLoader lists nav entries", "[archive]") {
    if (!fixtureAvailable()) SKIP("fixture not available");

    NavArchiveLoader archive(fixturePath());
    REQUIRE(archive.isOpen());

    std::vector<std::string> entries = archive.listNavEntries();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0] == "maps/Test_Map.nav");
}

TEST_CASE("NavArchiveLoader reads entries case-insensitively", "[archive]") {
    if (!fixtureAvailable()) SKIP("fixture not available");

    NavArchiveLoader archive(fixturePath());
    REQUIRE(archive.isOpen());

    std::vector<uint8_t> exact = archive.loadEntry("maps/Test_Map.nav");
    std::vector<uint8_t> lower = archive.loadEntry("maps/test_map.nav");
    std::vector<uint8_t> noExt = archive.loadEntry("MAPS/TEST_MAP");

    REQUIRE(exact.size() == 250);
    CHECK(lower == exact);
    CHECK(noExt == exact);

    CHECK(archive.loadEntry("maps/missing.nav").empty());
}

TEST_CASE("Nav mesh from the archive decodes and answers heights", "[archive]") {
    if (!fixtureAvailable()) SKIP("fixture not available");

    NavArchiveLoader archive(fixturePath());
    std::vector<uint8_t> data = archive.loadEntry("maps/Test_Map.nav");
    REQUIRE_FALSE(data.empty());

    LoadedNavMesh loaded = loadNavMesh(data);
    const NavMesh &mesh = *loaded.mesh;

    CHECK(mesh.getVersion() == 16);
    CHECK(mesh.getHeader().isAnalyzed);
    REQUIRE(mesh.getAreaCount() == 2);
    CHECK(mesh.getPlaceName(mesh.getArea(1).getMetadata().place) == "Spawn");
    CHECK(mesh.getArea(1).getConnections(NAV_EAST) == std::vector<NavAreaID>{2});

    CHECK(*loaded.tree->findBestHeight(50.0f, 50.0f, 0.0f) == Approx(0.0f));
    CHECK(*loaded.tree->findBestHeight(150.0f, 50.0f, 0.0f) == Approx(20.0f));
    CHECK_FALSE(loaded.tree->findBestHeight(250.0f, 50.0f, 0.0f).has_value());
}

TEST_CASE("NavArchiveLoader on a missing archive", "[archive]") {
    NavArchiveLoader archive("/tmp/nonexistent_hammernav_archive_xyz.zip");

    CHECK_FALSE(archive.isOpen());
    CHECK(archive.listNavEntries().empty());
    CHECK(archive.loadEntry("anything.nav").empty());
}

TEST_CASE("NavArchiveLoader extension check", "[archive]") {
    CHECK(NavArchiveLoader::hasNavExtension("a.nav"));
    CHECK(NavArchiveLoader::hasNavExtension("MAPS/DE_DUST.NAV"));
    CHECK_FALSE(NavArchiveLoader::hasNavExtension("nav"));
    CHECK_FALSE(NavArchiveLoader::hasNavExtension("readme.txt"));
}
