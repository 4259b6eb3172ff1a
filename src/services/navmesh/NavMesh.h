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
/** @file NavMesh.h
 * @brief Decoded nav mesh - areas plus the global tables of the file.
 */

#ifndef __NAVMESH_H
#define __NAVMESH_H

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "NavArea.h"
#include "NavTypes.h"

namespace HammerNav {

/** @brief Immutable nav mesh. Areas keep file order, lookups go by id.
 * Safe to share between threads once constructed.
 */
class NavMesh {
public:
    /** @throw NavException(DUPLICATE_AREA) if two areas share an id */
    NavMesh(const NavHeader &header, std::vector<NavArea> areas,
            std::vector<std::string> places = std::vector<std::string>(),
            std::vector<NavLadder> ladders = std::vector<NavLadder>(),
            std::vector<uint8_t> customData = std::vector<uint8_t>());

    const NavHeader &getHeader() const { return mHeader; }

    uint32_t getVersion() const { return mHeader.version; }

    uint32_t getSubVersion() const { return mHeader.subVersion; }

    // --- Areas ---

    /// All areas, in file order
    const std::vector<NavArea> &getAreas() const { return mAreas; }

    size_t getAreaCount() const { return mAreas.size(); }

    /** @return area with the given id
     * @throw NavException(AREA_NOT_FOUND) */
    const NavArea &getArea(NavAreaID id) const;

    /// Area with the given id, or nullptr if none
    const NavArea *findArea(NavAreaID id) const;

    bool hasArea(NavAreaID id) const { return mAreaIndex.count(id) != 0; }

    /** Position of the area in file order
     * @throw NavException(AREA_NOT_FOUND) */
    size_t getAreaIndex(NavAreaID id) const;

    /// Union of all area footprints (empty box for an empty mesh)
    const BBox2 &getBounds() const { return mBounds; }

    // --- Global tables ---

    const std::vector<std::string> &getPlaces() const { return mPlaces; }

    /// Place name for a 1-based place index, "" for 0 or out of range
    const std::string &getPlaceName(uint16_t place) const;

    const std::vector<NavLadder> &getLadders() const { return mLadders; }

    /// Ladder with the given id, or nullptr if none
    const NavLadder *findLadder(NavLadderID id) const;

    /// Bytes following the ladder table, kept verbatim
    const std::vector<uint8_t> &getCustomData() const { return mCustomData; }

private:
    NavHeader mHeader;
    std::vector<NavArea> mAreas;
    std::unordered_map<NavAreaID, size_t> mAreaIndex;
    BBox2 mBounds;
    std::vector<std::string> mPlaces;
    std::vector<NavLadder> mLadders;
    std::vector<uint8_t> mCustomData;
};

/// Shared pointer to an immutable mesh
typedef std::shared_ptr<const NavMesh> NavMeshPtr;

} // namespace HammerNav

#endif
