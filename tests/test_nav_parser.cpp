// NavFileParser tests: version gated layouts, header checks, count guards,
// truncation and cross reference validation. Inputs come from the
// NavTestWriter encoder.

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include "NavException.h"
#include "NavFileParser.h"
#include "NavTestWriter.h"

using namespace HammerNav;
using namespace HammerNavTest;

// ============================================================================
// Helpers
// ============================================================================

// Decode data, returning the error if it throws
static std::optional<NavException> decodeFailure(const std::vector<uint8_t> &data) {
    try {
        parseNavMesh(data);
    } catch (const NavException &e) {
        return e;
    }
    return std::nullopt;
}

static void patchU32(std::vector<uint8_t> &data, size_t offset, uint32_t value) {
    for (int i = 0; i < 4; ++i)
        data[offset + i] = static_cast<uint8_t>(value >> (8 * i));
}

// Two adjacent 100x100 areas plus one of every optional record.
// Area 1 spans x 0..100, area 2 spans x 100..200, both y 0..100.
static NavTestWriter twoAreaWriter(uint32_t version, uint32_t subVersion = 0) {
    NavTestWriter w;
    w.version = version;
    w.subVersion = subVersion;
    w.places = {"BombsiteA", "Tunnels"};

    TestArea a = flatArea(1, 0.0f, 0.0f, 100.0f, 100.0f, 0.0f);
    a.flags = 0x05;
    a.northEastZ = 4.0f;
    a.southWestZ = 8.0f;
    a.connections[NAV_EAST] = {2};
    a.meta.place = 1;
    a.meta.hidingSpots.push_back(NavHidingSpot{11, Vector3(10.0f, 20.0f, 0.0f), 2});
    a.meta.approachAreas.push_back(NavApproachArea{1, 2, 3, 0, 4});
    NavEncounterPath path;
    path.fromAreaID = 1;
    path.fromDirection = NAV_WEST;
    path.toAreaID = 2;
    path.toDirection = NAV_EAST;
    path.spots.push_back(NavEncounterSpot{11, 255});
    a.meta.encounterPaths.push_back(path);
    a.meta.ladderConnections[NAV_LADDER_UP] = {7};
    a.meta.earliestOccupyTime = {{1.5f, 2.5f}};
    a.meta.lightIntensity = {{0.25f, 0.5f, 0.75f, 1.0f}};
    a.meta.visibleAreas.push_back(NavVisibleArea{2, 1});
    a.meta.gameAttributes = 0xABCD;

    TestArea b = flatArea(2, 100.0f, 0.0f, 200.0f, 100.0f, 10.0f);
    b.flags = 0x01;
    b.connections[NAV_WEST] = {1};
    b.meta.place = 2;
    b.meta.inheritVisibilityFrom = 1;

    w.areas = {a, b};

    TestLadder l;
    l.id = 7;
    l.isDangling = true;
    l.areas[0] = 2; // top forward
    l.areas[4] = 1; // bottom
    w.ladders = {l};

    return w;
}

// ============================================================================
// Version gated layouts
// ============================================================================

TEST_CASE("NavFileParser decodes every supported version", "[parser]") {
    const uint32_t versions[] = {6, 9, 11, 12, 14, 15, 16};
    const uint32_t subVersions[] = {0, 2};

    for (uint32_t version : versions) {
        for (uint32_t sub : subVersions) {
            if (version < 10 && sub != 0)
                continue; // no sub-version word before 10

            CAPTURE(version, sub);

            NavTestWriter w = twoAreaWriter(version, sub);
            w.customData = {0xDE, 0xAD, 0xBE, 0xEF};
            NavMeshPtr mesh = parseNavMesh(w.build());

            REQUIRE(mesh);
            CHECK(mesh->getVersion() == version);
            CHECK(mesh->getSubVersion() == sub);
            CHECK(mesh->getHeader().bspSize == 123456);
            CHECK(mesh->getHeader().isAnalyzed == (version >= 14));
            REQUIRE(mesh->getAreaCount() == 2);

            const NavArea &a = mesh->getArea(1);
            CHECK(a.getFlags() == 0x05);
            REQUIRE(a.getCornerCount() == 4);
            CHECK(a.getCorners()[NAV_NORTH_WEST] == Vector3(0.0f, 0.0f, 0.0f));
            CHECK(a.getCorners()[NAV_NORTH_EAST] == Vector3(100.0f, 0.0f, 4.0f));
            CHECK(a.getCorners()[NAV_SOUTH_EAST] == Vector3(100.0f, 100.0f, 0.0f));
            CHECK(a.getCorners()[NAV_SOUTH_WEST] == Vector3(0.0f, 100.0f, 8.0f));
            CHECK(a.getConnections(NAV_EAST) == std::vector<NavAreaID>{2});
            CHECK(a.getConnectionCount() == 1);

            const NavAreaMetadata &m = a.getMetadata();
            REQUIRE(m.hidingSpots.size() == 1);
            CHECK(m.hidingSpots[0].id == 11);
            CHECK(m.hidingSpots[0].position == Vector3(10.0f, 20.0f, 0.0f));
            CHECK(m.approachAreas.size() == (version < 15 ? 1u : 0u));
            REQUIRE(m.encounterPaths.size() == 1);
            CHECK(m.encounterPaths[0].toAreaID == 2);
            REQUIRE(m.encounterPaths[0].spots.size() == 1);
            CHECK(m.encounterPaths[0].spots[0].getDistanceFraction() == 1.0f);
            CHECK(m.place == 1);
            CHECK(m.ladderConnections[NAV_LADDER_UP] == std::vector<NavLadderID>{7});
            CHECK(m.earliestOccupyTime[1] == 2.5f);

            if (version >= 11)
                CHECK(m.lightIntensity[NAV_NORTH_EAST] == 0.5f);
            else
                CHECK(m.lightIntensity[NAV_NORTH_EAST] == 1.0f);

            CHECK(m.visibleAreas.size() == (version >= 16 ? 1u : 0u));
            CHECK(m.gameAttributes == (sub > 0 ? 0xABCDu : 0u));

            const NavArea &b = mesh->getArea(2);
            CHECK(b.getMetadata().inheritVisibilityFrom ==
                  (version >= 16 ? 1u : 0u));

            REQUIRE(mesh->getLadders().size() == 1);
            const NavLadder &l = mesh->getLadders()[0];
            CHECK(l.id == 7);
            CHECK(l.topForwardArea == 2);
            CHECK(l.bottomArea == 1);
            CHECK(l.isDangling == (version == 6));

            CHECK(mesh->getPlaces() ==
                  std::vector<std::string>{"BombsiteA", "Tunnels"});
            CHECK(mesh->getCustomData() ==
                  std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});
        }
    }
}

TEST_CASE("NavFileParser flag width follows the version", "[parser]") {
    SECTION("version 8 stores one byte") {
        NavTestWriter w = twoAreaWriter(8);
        w.areas[0].flags = 0x1FF; // only the low byte survives
        NavMeshPtr mesh = parseNavMesh(w.build());
        CHECK(mesh->getArea(1).getFlags() == 0xFF);
    }

    SECTION("version 12 stores two bytes") {
        NavTestWriter w = twoAreaWriter(12);
        w.areas[0].flags = 0x1FFFF;
        NavMeshPtr mesh = parseNavMesh(w.build());
        CHECK(mesh->getArea(1).getFlags() == 0xFFFF);
    }

    SECTION("version 13 stores four bytes") {
        NavTestWriter w = twoAreaWriter(13);
        w.areas[0].flags = 0x12345678;
        NavMeshPtr mesh = parseNavMesh(w.build());
        CHECK(mesh->getArea(1).getFlags() == 0x12345678);
    }
}

TEST_CASE("NavFileParser accepts an empty mesh", "[parser]") {
    NavTestWriter w;
    NavMeshPtr mesh = parseNavMesh(w.build());

    CHECK(mesh->getAreaCount() == 0);
    CHECK(mesh->getLadders().empty());
    CHECK(mesh->getCustomData().empty());
    CHECK(mesh->getBounds().isEmpty());
}

// ============================================================================
// Header errors
// ============================================================================

TEST_CASE("NavFileParser rejects a bad magic number", "[parser][error]") {
    NavTestWriter w = twoAreaWriter(16);
    w.magic = 0xCAFEBABE;

    auto err = decodeFailure(w.build());
    REQUIRE(err);
    CHECK(err->getType() == NavException::INVALID_MAGIC);
    CHECK(err->getOffset() == 0);
}

TEST_CASE("NavFileParser rejects unsupported versions", "[parser][error]") {
    const uint32_t bad[] = {0, 5, 17, 0xFFFFFFFF};

    for (uint32_t version : bad) {
        CAPTURE(version);
        NavTestWriter w;
        w.version = version;

        auto err = decodeFailure(w.build());
        REQUIRE(err);
        CHECK(err->getType() == NavException::UNSUPPORTED_VERSION);
        CHECK(err->getOffset() == 4);
    }
}

TEST_CASE("NavFileParser reports EOF for every truncation", "[parser][error]") {
    const uint32_t versions[] = {6, 11, 14, 16};

    for (uint32_t version : versions) {
        NavTestWriter w = twoAreaWriter(version, version >= 10 ? 1 : 0);
        std::vector<uint8_t> full = w.build();

        // sanity: the untruncated buffer decodes
        REQUIRE(parseNavMesh(full));

        for (size_t len = 0; len < full.size(); ++len) {
            CAPTURE(version, len);
            std::vector<uint8_t> prefix(full.begin(), full.begin() + len);

            auto err = decodeFailure(prefix);
            REQUIRE(err);
            CHECK(err->getType() == NavException::UNEXPECTED_EOF);
            CHECK(err->getOffset() <= len);
        }
    }
}

// ============================================================================
// Count guards
// ============================================================================

TEST_CASE("NavFileParser rejects oversize counts", "[parser][error]") {
    SECTION("area count") {
        NavTestWriter w;
        std::vector<uint8_t> data = w.build();
        // empty mesh ends with area count then ladder count
        size_t countPos = data.size() - 8;
        patchU32(data, countPos, 0xFFFFFFFF);

        auto err = decodeFailure(data);
        REQUIRE(err);
        CHECK(err->getType() == NavException::CORRUPT_COUNT);
        CHECK(err->getOffset() == countPos);
    }

    SECTION("connection count") {
        NavTestWriter w = twoAreaWriter(16);
        std::vector<uint8_t> data = w.build();
        // id, u32 flags, two corners, two heights precede the north list
        size_t countPos = w.areaOffsets[0] + 4 + 4 + 12 + 12 + 4 + 4;
        patchU32(data, countPos, 0x00100000);

        auto err = decodeFailure(data);
        REQUIRE(err);
        CHECK(err->getType() == NavException::CORRUPT_COUNT);
        CHECK(err->getOffset() == countPos);
    }

    SECTION("count below the maximum but beyond the data is EOF") {
        NavTestWriter w;
        std::vector<uint8_t> data = w.build();
        patchU32(data, data.size() - 8, 5000);

        auto err = decodeFailure(data);
        REQUIRE(err);
        CHECK(err->getType() == NavException::UNEXPECTED_EOF);
    }
}

// ============================================================================
// Reference validation
// ============================================================================

TEST_CASE("NavFileParser rejects duplicate area ids", "[parser][error]") {
    NavTestWriter w = twoAreaWriter(16);
    w.areas[1].id = 1;
    w.areas[0].connections[NAV_EAST].clear();
    w.areas[0].meta.encounterPaths.clear();
    w.areas[0].meta.visibleAreas.clear();
    w.ladders[0].areas[0] = 0;

    std::vector<uint8_t> data = w.build();
    auto err = decodeFailure(data);
    REQUIRE(err);
    CHECK(err->getType() == NavException::DUPLICATE_AREA);
    CHECK(err->getOffset() == w.areaOffsets[1]);
}

TEST_CASE("NavFileParser rejects dangling references", "[parser][error]") {
    NavTestWriter w = twoAreaWriter(16);

    SECTION("connection to a missing area") {
        w.areas[1].connections[NAV_NORTH] = {99};
        std::vector<uint8_t> data = w.build();

        auto err = decodeFailure(data);
        REQUIRE(err);
        CHECK(err->getType() == NavException::DANGLING_REFERENCE);
        CHECK(err->getOffset() == w.areaOffsets[1]);
    }

    SECTION("encounter path to a missing area") {
        w.areas[0].meta.encounterPaths[0].toAreaID = 42;
        std::vector<uint8_t> data = w.build();

        auto err = decodeFailure(data);
        REQUIRE(err);
        CHECK(err->getType() == NavException::DANGLING_REFERENCE);
        CHECK(err->getOffset() == w.areaOffsets[0]);
    }

    SECTION("visible area that does not exist") {
        w.areas[0].meta.visibleAreas.push_back(NavVisibleArea{77, 0});
        auto err = decodeFailure(w.build());
        REQUIRE(err);
        CHECK(err->getType() == NavException::DANGLING_REFERENCE);
    }

    SECTION("inherited visibility from a missing area") {
        w.areas[1].meta.inheritVisibilityFrom = 5;
        auto err = decodeFailure(w.build());
        REQUIRE(err);
        CHECK(err->getType() == NavException::DANGLING_REFERENCE);
    }

    SECTION("area uses a ladder missing from the table") {
        w.areas[1].meta.ladderConnections[NAV_LADDER_DOWN] = {8};
        auto err = decodeFailure(w.build());
        REQUIRE(err);
        CHECK(err->getType() == NavException::DANGLING_REFERENCE);
    }

    SECTION("ladder touches a missing area") {
        w.ladders[0].areas[2] = 1234;
        std::vector<uint8_t> data = w.build();

        auto err = decodeFailure(data);
        REQUIRE(err);
        CHECK(err->getType() == NavException::DANGLING_REFERENCE);
        CHECK(err->getOffset() == w.ladderOffsets[0]);
    }

    SECTION("place index beyond the place table") {
        w.areas[1].meta.place = 3;
        auto err = decodeFailure(w.build());
        REQUIRE(err);
        CHECK(err->getType() == NavException::DANGLING_REFERENCE);
    }

    SECTION("approach area to a missing area (version 14)") {
        NavTestWriter old = twoAreaWriter(14);
        old.areas[0].meta.approachAreas[0].next = 66;
        auto err = decodeFailure(old.build());
        REQUIRE(err);
        CHECK(err->getType() == NavException::DANGLING_REFERENCE);
    }

    SECTION("zero in optional slots means none") {
        w.areas[0].meta.encounterPaths[0].fromAreaID = 0;
        w.areas[1].meta.inheritVisibilityFrom = 0;
        w.ladders[0].areas[0] = 0;
        CHECK_NOTHROW(parseNavMesh(w.build()));
    }
}

// ============================================================================
// Mesh accessors
// ============================================================================

TEST_CASE("NavMesh lookups", "[parser][mesh]") {
    NavTestWriter w = twoAreaWriter(16);
    NavMeshPtr mesh = parseNavMesh(w.build());

    SECTION("areas keep file order") {
        CHECK(mesh->getAreas()[0].getID() == 1);
        CHECK(mesh->getAreas()[1].getID() == 2);
        CHECK(mesh->getAreaIndex(2) == 1);
    }

    SECTION("lookup by id") {
        CHECK(mesh->hasArea(2));
        CHECK(mesh->findArea(2) == &mesh->getAreas()[1]);
        CHECK(mesh->findArea(99) == nullptr);
        CHECK_FALSE(mesh->hasArea(99));

        try {
            mesh->getArea(99);
            FAIL("expected AREA_NOT_FOUND");
        } catch (const NavException &e) {
            CHECK(e.getType() == NavException::AREA_NOT_FOUND);
            CHECK_FALSE(e.hasOffset());
        }
    }

    SECTION("places are 1-based") {
        CHECK(mesh->getPlaceName(0).empty());
        CHECK(mesh->getPlaceName(1) == "BombsiteA");
        CHECK(mesh->getPlaceName(2) == "Tunnels");
        CHECK(mesh->getPlaceName(3).empty());
        CHECK(mesh->getPlaceName(mesh->getArea(2).getMetadata().place) ==
              "Tunnels");
    }

    SECTION("ladders by id") {
        REQUIRE(mesh->findLadder(7));
        CHECK(mesh->findLadder(7)->bottomArea == 1);
        CHECK(mesh->findLadder(8) == nullptr);
    }

    SECTION("bounds cover all areas") {
        const BBox2 &b = mesh->getBounds();
        CHECK(b.min == Vector2(0.0f, 0.0f));
        CHECK(b.max == Vector2(200.0f, 100.0f));
    }
}

TEST_CASE("NavArea rejects degenerate corner lists", "[mesh][error]") {
    std::vector<Vector3> two = {Vector3(0.0f), Vector3(1.0f, 0.0f, 0.0f)};

    try {
        NavArea area(1, 0, two);
        FAIL("expected INVALID_AREA");
    } catch (const NavException &e) {
        CHECK(e.getType() == NavException::INVALID_AREA);
    }
}

TEST_CASE("NavMesh rejects duplicate ids when built directly", "[mesh][error]") {
    std::vector<NavArea> areas;
    areas.push_back(NavArea::fromExtent(3, 0, Vector3(0.0f), Vector3(1.0f, 1.0f, 0.0f),
                                        0.0f, 0.0f));
    areas.push_back(NavArea::fromExtent(3, 0, Vector3(5.0f), Vector3(6.0f, 6.0f, 0.0f),
                                        0.0f, 0.0f));

    CHECK_THROWS_AS(NavMesh(NavHeader(), std::move(areas)), NavException);
}
