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
/** @file NavArea.h
 * @brief A single walkable area of the nav mesh.
 */

#ifndef __NAVAREA_H
#define __NAVAREA_H

#include <vector>

#include "NavMath.h"
#include "NavTypes.h"

namespace HammerNav {

/** @brief A convex polygon of the walkable surface with per-corner height.
 * The surface between corners is interpolated: bilinearly for quads, as a
 * fan of planar triangles otherwise. Immutable after construction.
 */
class NavArea {
public:
    /// Upper bound on corners accepted for one area
    static const size_t MAX_CORNERS = 64;

    /// Distance (world units) a point may lie outside an edge and still count
    /// as inside. Adjacent areas share edges exactly, so this only absorbs
    /// float noise.
    static constexpr float EDGE_TOLERANCE = 1e-3f;

    /** Builds an area from its ordered corners (either winding).
     * @throw NavException(INVALID_AREA) with fewer than 3 or more than
     * MAX_CORNERS corners */
    NavArea(NavAreaID id, uint32_t flags, std::vector<Vector3> corners,
            NavConnections connections = NavConnections(),
            NavAreaMetadata metadata = NavAreaMetadata());

    /** Builds the axis aligned quad of the file format.
     * Corners become NW, NE (x2, y1, neZ), SE, SW (x1, y2, swZ). */
    static NavArea fromExtent(NavAreaID id, uint32_t flags,
                              const Vector3 &northWest,
                              const Vector3 &southEast, float northEastZ,
                              float southWestZ,
                              NavConnections connections = NavConnections(),
                              NavAreaMetadata metadata = NavAreaMetadata());

    NavAreaID getID() const { return mID; }

    uint32_t getFlags() const { return mFlags; }

    const std::vector<Vector3> &getCorners() const { return mCorners; }

    size_t getCornerCount() const { return mCorners.size(); }

    /// Footprint box computed from the corners at construction
    const BBox2 &getBounds() const { return mBounds; }

    /// Mean of the corners
    Vector3 getCenter() const;

    const NavConnections &getConnections() const { return mConnections; }

    const std::vector<NavAreaID> &getConnections(NavDirection dir) const {
        return mConnections[dir];
    }

    /// Total connection count over all directions
    size_t getConnectionCount() const;

    const NavAreaMetadata &getMetadata() const { return mMetadata; }

    /// True if (x, y) lies within the footprint polygon, edges included
    bool containsPoint(float x, float y) const;

    /** Interpolated surface height at (x, y). Meaningful for points inside
     * the footprint; outside points get the height of the clamped
     * parametric position. */
    float getZHeight(float x, float y) const;

private:
    float getQuadZHeight(float x, float y) const;
    float getFanZHeight(float x, float y) const;

    NavAreaID mID;
    uint32_t mFlags;
    std::vector<Vector3> mCorners;
    BBox2 mBounds;
    /// +1 for counter-clockwise corner order, -1 for clockwise
    float mWinding;
    NavConnections mConnections;
    NavAreaMetadata mMetadata;
};

} // namespace HammerNav

#endif
