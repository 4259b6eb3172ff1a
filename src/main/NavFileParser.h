/******************************************************************************
 *
 *    This file is part of the hammernav project
 *    Copyright (C) 2026 hammernav team
 *
 *    This program is free software; you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation; either version 2 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program; if not, write to the Free Software
 *    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 *****************************************************************************/

// NavFileParser: decodes Source engine .nav files (magic 0xFEEDFACE,
// versions 6..16) into an immutable NavMesh.
//
// Input: raw .nav bytes (from disk, an archive, or a test encoder).
// Output: NavMeshPtr, or a NavException. A mesh is only returned once every
// area, table and cross reference has been read and checked.
//
// Version gates (all in readHeader/readArea/readLadder below):
//   v >= 10  sub-version word in the header
//   v >= 12  "has unnamed areas" byte
//   v >= 14  "is analyzed" byte
//   v <= 8   u8 area flags, v <= 12 u16 flags, u32 after that
//   v <  15  approach areas per area
//   v >= 11  per-corner light intensity
//   v >= 16  visible area list + inherit-visibility id
//   v == 6   ladder "dangling" byte
//   sub > 0  game specific u32 after each area

#pragma once

#include "ByteCursor.h"
#include "NavException.h"
#include "logger.h"
#include "navmesh/NavMesh.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace HammerNav {

// File format constants
const uint32_t NAV_MAGIC_NUMBER = 0xFEEDFACE;
const uint32_t NAV_MIN_VERSION = 6;
const uint32_t NAV_MAX_VERSION = 16;

// Sanity bounds on length prefixes. Anything above is treated as corruption.
const uint32_t NAV_MAX_AREAS = 1000000;
const uint32_t NAV_MAX_CONNECTIONS = 65536;
const uint32_t NAV_MAX_ENCOUNTER_PATHS = 65536;
const uint32_t NAV_MAX_LADDER_LINKS = 65536;
const uint32_t NAV_MAX_VISIBLE_AREAS = 1000000;
const uint32_t NAV_MAX_LADDERS = 65536;

// ── Internal parser state ──

namespace detail {

class NavParser {
public:
    NavParser(const uint8_t *data, size_t size) : mCursor(data, size) {}

    NavMeshPtr parse() {
        readHeader();
        readPlaces();

        if (mHeader.version >= 12)
            mHeader.hasUnnamedAreas = mCursor.readU8() != 0;

        readAreas();
        readLadders();

        // whatever follows belongs to the game that wrote the file
        std::vector<uint8_t> customData = mCursor.readBytes(mCursor.remaining());

        validateReferences();

        LOG_INFO("NavFileParser: v%u.%u, %zu areas, %zu places, %zu ladders, "
                 "%zu custom bytes",
                 mHeader.version, mHeader.subVersion, mAreas.size(),
                 mPlaces.size(), mLadders.size(), customData.size());

        return std::make_shared<const NavMesh>(
            mHeader, std::move(mAreas), std::move(mPlaces), std::move(mLadders),
            std::move(customData));
    }

private:
    // ── Header and global tables ──

    void readHeader() {
        size_t magicPos = mCursor.tell();
        uint32_t magic = mCursor.readU32();
        if (magic != NAV_MAGIC_NUMBER) {
            char buf[64];
            std::snprintf(buf, sizeof(buf),
                          "magic 0x%08X, expected 0x%08X", magic,
                          NAV_MAGIC_NUMBER);
            throw NavException(NavException::INVALID_MAGIC, buf, magicPos);
        }

        size_t versionPos = mCursor.tell();
        mHeader.version = mCursor.readU32();
        if (mHeader.version < NAV_MIN_VERSION ||
            mHeader.version > NAV_MAX_VERSION) {
            throw NavException(NavException::UNSUPPORTED_VERSION,
                               "version " + std::to_string(mHeader.version) +
                                   " is not in " +
                                   std::to_string(NAV_MIN_VERSION) + ".." +
                                   std::to_string(NAV_MAX_VERSION),
                               versionPos);
        }

        if (mHeader.version >= 10)
            mHeader.subVersion = mCursor.readU32();

        mHeader.bspSize = mCursor.readU32();

        if (mHeader.version >= 14)
            mHeader.isAnalyzed = mCursor.readU8() != 0;

        LOG_DEBUG("NavFileParser: version %u, sub-version %u, bsp size %u%s",
                  mHeader.version, mHeader.subVersion, mHeader.bspSize,
                  mHeader.isAnalyzed ? ", analyzed" : "");
    }

    void readPlaces() {
        uint16_t count = mCursor.readU16();

        // each entry is at least its u16 length
        mPlaces.reserve(std::min<size_t>(count, mCursor.remaining() / 2));
        for (uint16_t i = 0; i < count; ++i)
            mPlaces.push_back(mCursor.readString());
    }

    void readAreas() {
        uint32_t count = readCount(NAV_MAX_AREAS, "area");

        // smallest possible area record is far above 16 bytes
        mAreas.reserve(std::min<size_t>(count, mCursor.remaining() / 16));
        mAreaOffsets.reserve(mAreas.capacity());

        for (uint32_t i = 0; i < count; ++i)
            readArea();
    }

    void readLadders() {
        uint32_t count = readCount(NAV_MAX_LADDERS, "ladder");

        mLadders.reserve(std::min<size_t>(count, mCursor.remaining() / 48));
        for (uint32_t i = 0; i < count; ++i) {
            mLadderOffsets.push_back(mCursor.tell());
            mLadders.push_back(readLadder());
        }
    }

    // ── Area records ──

    void readArea() {
        const uint32_t version = mHeader.version;
        size_t areaPos = mCursor.tell();

        NavAreaID id = mCursor.readU32();
        if (!mSeenIDs.insert(id).second) {
            throw NavException(NavException::DUPLICATE_AREA,
                               "area id " + std::to_string(id) +
                                   " is used more than once",
                               areaPos);
        }

        uint32_t flags;
        if (version <= 8)
            flags = mCursor.readU8();
        else if (version <= 12)
            flags = mCursor.readU16();
        else
            flags = mCursor.readU32();

        Vector3 northWest, southEast;
        float northEastZ, southWestZ;
        mCursor >> northWest >> southEast >> northEastZ >> southWestZ;

        NavConnections connections;
        for (int dir = 0; dir < NAV_NUM_DIRECTIONS; ++dir)
            readIDList(connections[dir], NAV_MAX_CONNECTIONS, "connection");

        NavAreaMetadata meta;

        uint8_t spotCount = mCursor.readU8();
        meta.hidingSpots.reserve(spotCount);
        for (uint8_t i = 0; i < spotCount; ++i) {
            NavHidingSpot spot;
            mCursor >> spot.id >> spot.position >> spot.flags;
            meta.hidingSpots.push_back(spot);
        }

        if (version < 15) {
            uint8_t approachCount = mCursor.readU8();
            meta.approachAreas.reserve(approachCount);
            for (uint8_t i = 0; i < approachCount; ++i) {
                NavApproachArea ap;
                mCursor >> ap.here >> ap.prev >> ap.prevToHereHow >> ap.next >>
                    ap.hereToNextHow;
                meta.approachAreas.push_back(ap);
            }
        }

        uint32_t pathCount = readCount(NAV_MAX_ENCOUNTER_PATHS, "encounter path");
        meta.encounterPaths.reserve(
            std::min<size_t>(pathCount, mCursor.remaining() / 11));
        for (uint32_t i = 0; i < pathCount; ++i) {
            NavEncounterPath path;
            mCursor >> path.fromAreaID >> path.fromDirection >> path.toAreaID >>
                path.toDirection;

            uint8_t encounterSpots = mCursor.readU8();
            path.spots.reserve(encounterSpots);
            for (uint8_t s = 0; s < encounterSpots; ++s) {
                NavEncounterSpot es;
                mCursor >> es.hidingSpotID >> es.distance;
                path.spots.push_back(es);
            }

            meta.encounterPaths.push_back(std::move(path));
        }

        meta.place = mCursor.readU16();

        for (int dir = 0; dir < NAV_NUM_LADDER_DIRECTIONS; ++dir) {
            readIDList(meta.ladderConnections[dir], NAV_MAX_LADDER_LINKS,
                       "ladder connection");
        }

        mCursor >> meta.earliestOccupyTime[0] >> meta.earliestOccupyTime[1];

        if (version >= 11) {
            for (int c = 0; c < NAV_NUM_CORNERS; ++c)
                mCursor >> meta.lightIntensity[c];
        }

        if (version >= 16) {
            uint32_t visCount = readCount(NAV_MAX_VISIBLE_AREAS, "visible area");
            meta.visibleAreas.reserve(
                std::min<size_t>(visCount, mCursor.remaining() / 5));
            for (uint32_t i = 0; i < visCount; ++i) {
                NavVisibleArea va;
                mCursor >> va.areaID >> va.attributes;
                meta.visibleAreas.push_back(va);
            }

            mCursor >> meta.inheritVisibilityFrom;
        }

        if (mHeader.subVersion > 0)
            mCursor >> meta.gameAttributes;

        mAreaOffsets.push_back(areaPos);
        mAreas.push_back(NavArea::fromExtent(id, flags, northWest, southEast,
                                             northEastZ, southWestZ,
                                             std::move(connections),
                                             std::move(meta)));

        LOG_VERBOSE("NavFileParser: area %u at 0x%zX, %zu connections", id,
                    areaPos, mAreas.back().getConnectionCount());
    }

    NavLadder readLadder() {
        NavLadder ladder;

        mCursor >> ladder.id >> ladder.width >> ladder.top >> ladder.bottom >>
            ladder.length >> ladder.direction;

        ladder.isDangling = false;
        if (mHeader.version == 6)
            ladder.isDangling = mCursor.readU8() != 0;

        mCursor >> ladder.topForwardArea >> ladder.topLeftArea >>
            ladder.topRightArea >> ladder.topBehindArea >> ladder.bottomArea;

        return ladder;
    }

    // ── Helpers ──

    /// Reads a u32 count and rejects values above max
    uint32_t readCount(uint32_t max, const char *what) {
        size_t pos = mCursor.tell();
        uint32_t count = mCursor.readU32();

        if (count > max) {
            throw NavException(NavException::CORRUPT_COUNT,
                               std::string(what) + " count " +
                                   std::to_string(count) + " exceeds " +
                                   std::to_string(max),
                               pos);
        }

        return count;
    }

    /// u32 count followed by that many u32 ids
    void readIDList(std::vector<uint32_t> &ids, uint32_t max, const char *what) {
        uint32_t count = readCount(max, what);

        ids.reserve(std::min<size_t>(count, mCursor.remaining() / 4));
        for (uint32_t i = 0; i < count; ++i)
            ids.push_back(mCursor.readU32());
    }

    // ── Cross reference validation ──

    void validateReferences() const {
        std::unordered_set<NavLadderID> ladderIDs;
        for (const NavLadder &ladder : mLadders)
            ladderIDs.insert(ladder.id);

        for (size_t i = 0; i < mAreas.size(); ++i) {
            const NavArea &area = mAreas[i];
            const NavAreaMetadata &meta = area.getMetadata();
            const size_t pos = mAreaOffsets[i];

            for (int dir = 0; dir < NAV_NUM_DIRECTIONS; ++dir) {
                for (NavAreaID target : area.getConnections()[dir]) {
                    if (!mSeenIDs.count(target)) {
                        dangling(pos, "area " + std::to_string(area.getID()) +
                                          " connects " +
                                          navDirectionName(dir) +
                                          " to missing area " +
                                          std::to_string(target));
                    }
                }
            }

            for (const NavApproachArea &ap : meta.approachAreas) {
                checkOptionalArea(ap.here, area, "approach (here)", pos);
                checkOptionalArea(ap.prev, area, "approach (prev)", pos);
                checkOptionalArea(ap.next, area, "approach (next)", pos);
            }

            for (const NavEncounterPath &path : meta.encounterPaths) {
                checkOptionalArea(path.fromAreaID, area, "encounter path (from)",
                                  pos);
                checkOptionalArea(path.toAreaID, area, "encounter path (to)",
                                  pos);
            }

            for (const NavVisibleArea &va : meta.visibleAreas)
                checkOptionalArea(va.areaID, area, "visible area", pos);

            checkOptionalArea(meta.inheritVisibilityFrom, area,
                              "inherited visibility", pos);

            for (const auto &ladders : meta.ladderConnections) {
                for (NavLadderID lid : ladders) {
                    if (!ladderIDs.count(lid)) {
                        dangling(pos, "area " + std::to_string(area.getID()) +
                                          " uses missing ladder " +
                                          std::to_string(lid));
                    }
                }
            }

            if (meta.place > mPlaces.size()) {
                dangling(pos, "area " + std::to_string(area.getID()) +
                                  " names place " + std::to_string(meta.place) +
                                  " of " + std::to_string(mPlaces.size()));
            }
        }

        for (size_t i = 0; i < mLadders.size(); ++i) {
            const NavLadder &ladder = mLadders[i];
            const NavAreaID refs[] = {ladder.topForwardArea, ladder.topLeftArea,
                                      ladder.topRightArea, ladder.topBehindArea,
                                      ladder.bottomArea};

            for (NavAreaID ref : refs) {
                if (ref != 0 && !mSeenIDs.count(ref)) {
                    dangling(mLadderOffsets[i],
                             "ladder " + std::to_string(ladder.id) +
                                 " touches missing area " + std::to_string(ref));
                }
            }
        }
    }

    /// 0 means "none" in optional slots
    void checkOptionalArea(NavAreaID id, const NavArea &owner, const char *what,
                           size_t pos) const {
        if (id != 0 && !mSeenIDs.count(id)) {
            dangling(pos, "area " + std::to_string(owner.getID()) + " " + what +
                              " refers to missing area " + std::to_string(id));
        }
    }

    [[noreturn]] static void dangling(size_t pos, const std::string &detail) {
        throw NavException(NavException::DANGLING_REFERENCE, detail, pos);
    }

    // ── Member state ──

    ByteCursor mCursor;
    NavHeader mHeader;

    std::vector<std::string> mPlaces;
    std::vector<NavArea> mAreas;
    std::vector<size_t> mAreaOffsets;   // start offset of each area record
    std::unordered_set<NavAreaID> mSeenIDs;
    std::vector<NavLadder> mLadders;
    std::vector<size_t> mLadderOffsets; // start offset of each ladder record
};

} // namespace detail

// ── Public API ──

/// Decode a .nav file from a raw memory buffer.
/// @throw NavException on any malformed, truncated or inconsistent input
inline NavMeshPtr parseNavMesh(const uint8_t *data, size_t size) {
    detail::NavParser parser(data, size);
    return parser.parse();
}

inline NavMeshPtr parseNavMesh(const std::vector<uint8_t> &data) {
    return parseNavMesh(data.data(), data.size());
}

} // namespace HammerNav
