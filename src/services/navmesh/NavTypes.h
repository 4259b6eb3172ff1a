/******************************************************************************
 *
 *    This file is part of the hammernav project
 *
 *    Shared value types of the nav mesh model. Everything here is a plain
 *    copyable record filled by the file parser and stored verbatim; none of
 *    it is consumed by the height query.
 *
 *****************************************************************************/

#ifndef __NAVTYPES_H
#define __NAVTYPES_H

#include <array>
#include <cstdint>
#include <vector>

#include "NavMath.h"

namespace HammerNav {

// ============================================================================
// Identifiers and enumerations
// ============================================================================

/// Area identifier, unique within one mesh. 0 is used by the file format as
/// "no area" in optional reference slots.
using NavAreaID = uint32_t;

/// Ladder identifier
using NavLadderID = uint32_t;

/// Directions of the four connection lists, in file order
enum NavDirection {
    NAV_NORTH = 0,
    NAV_EAST,
    NAV_SOUTH,
    NAV_WEST,
    NAV_NUM_DIRECTIONS
};

/// Ladder connection directions, in file order
enum NavLadderDirection { NAV_LADDER_UP = 0, NAV_LADDER_DOWN, NAV_NUM_LADDER_DIRECTIONS };

/// Corner order of decoded areas
enum NavCorner {
    NAV_NORTH_WEST = 0,
    NAV_NORTH_EAST,
    NAV_SOUTH_EAST,
    NAV_SOUTH_WEST,
    NAV_NUM_CORNERS
};

/// Printable direction name
inline const char *navDirectionName(int dir) {
    static const char *names[] = {"north", "east", "south", "west"};
    if (dir < 0 || dir >= NAV_NUM_DIRECTIONS)
        return "invalid";
    return names[dir];
}

// ============================================================================
// Per-area metadata records
// ============================================================================

/// Target area ids per direction
using NavConnections = std::array<std::vector<NavAreaID>, NAV_NUM_DIRECTIONS>;

/// Ladder ids per ladder direction
using NavLadderConnections =
    std::array<std::vector<NavLadderID>, NAV_NUM_LADDER_DIRECTIONS>;

struct NavHidingSpot {
    uint32_t id;
    Vector3 position;
    uint8_t flags;
};

/// Pre-computed approach route through an area (files older than version 15)
struct NavApproachArea {
    NavAreaID here;
    NavAreaID prev;
    uint8_t prevToHereHow;
    NavAreaID next;
    uint8_t hereToNextHow;
};

struct NavEncounterSpot {
    uint32_t hidingSpotID;
    uint8_t distance; // fraction of the path length, in 1/255 steps

    float getDistanceFraction() const { return distance / 255.0f; }
};

struct NavEncounterPath {
    NavAreaID fromAreaID;
    uint8_t fromDirection;
    NavAreaID toAreaID;
    uint8_t toDirection;
    std::vector<NavEncounterSpot> spots;
};

struct NavVisibleArea {
    NavAreaID areaID;
    uint8_t attributes;
};

/// Everything an area carries besides its geometry and connections
struct NavAreaMetadata {
    std::vector<NavHidingSpot> hidingSpots;
    std::vector<NavApproachArea> approachAreas;
    std::vector<NavEncounterPath> encounterPaths;
    /// 1-based index into the mesh place table, 0 = no place
    uint16_t place = 0;
    NavLadderConnections ladderConnections;
    std::array<float, 2> earliestOccupyTime = {{0.0f, 0.0f}};
    /// Per corner, NavCorner order
    std::array<float, NAV_NUM_CORNERS> lightIntensity = {{1.0f, 1.0f, 1.0f, 1.0f}};
    std::vector<NavVisibleArea> visibleAreas;
    NavAreaID inheritVisibilityFrom = 0;
    /// Game specific attribute word (files with a sub-version)
    uint32_t gameAttributes = 0;
};

// ============================================================================
// Mesh level records
// ============================================================================

struct NavLadder {
    NavLadderID id;
    float width;
    Vector3 top;
    Vector3 bottom;
    float length;
    uint32_t direction;
    bool isDangling; // stored by version 6 only

    NavAreaID topForwardArea;
    NavAreaID topLeftArea;
    NavAreaID topRightArea;
    NavAreaID topBehindArea;
    NavAreaID bottomArea;
};

/// File header values
struct NavHeader {
    uint32_t version = 0;
    uint32_t subVersion = 0;
    uint32_t bspSize = 0;
    bool isAnalyzed = false;
    bool hasUnnamedAreas = false;
};

} // namespace HammerNav

#endif // __NAVTYPES_H
