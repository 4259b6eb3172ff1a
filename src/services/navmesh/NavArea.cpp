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

#include "NavArea.h"
#include "NavException.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace HammerNav {

namespace {

// Slack on the [0, 1] parametric range when picking a quadratic root
const float PARAM_TOLERANCE = 1e-4f;

inline Vector2 xy(const Vector3 &v) { return Vector2(v.x, v.y); }

inline float clamp01(float v) { return std::min(1.0f, std::max(0.0f, v)); }

} // namespace

const size_t NavArea::MAX_CORNERS;
const float NavArea::EDGE_TOLERANCE;

/*----------------------------------------------------*/
/*----------------------- NavArea --------------------*/
/*----------------------------------------------------*/
NavArea::NavArea(NavAreaID id, uint32_t flags, std::vector<Vector3> corners,
                 NavConnections connections, NavAreaMetadata metadata)
    : mID(id), mFlags(flags), mCorners(std::move(corners)), mBounds(),
      mWinding(1.0f), mConnections(std::move(connections)),
      mMetadata(std::move(metadata)) {
    if (mCorners.size() < 3 || mCorners.size() > MAX_CORNERS) {
        throw NavException(NavException::INVALID_AREA,
                           "area " + std::to_string(id) + " has " +
                               std::to_string(mCorners.size()) +
                               " corners, need 3.." +
                               std::to_string(MAX_CORNERS));
    }

    // bounds and winding (shoelace) in one pass
    float twiceArea = 0.0f;
    const size_t n = mCorners.size();
    for (size_t i = 0; i < n; ++i) {
        const Vector3 &a = mCorners[i];
        const Vector3 &b = mCorners[(i + 1) % n];
        mBounds.merge(xy(a));
        twiceArea += a.x * b.y - b.x * a.y;
    }

    mWinding = (twiceArea < 0.0f) ? -1.0f : 1.0f;
}

//------------------------------------------------------
NavArea NavArea::fromExtent(NavAreaID id, uint32_t flags,
                            const Vector3 &northWest, const Vector3 &southEast,
                            float northEastZ, float southWestZ,
                            NavConnections connections,
                            NavAreaMetadata metadata) {
    std::vector<Vector3> corners(NAV_NUM_CORNERS);
    corners[NAV_NORTH_WEST] = northWest;
    corners[NAV_NORTH_EAST] = Vector3(southEast.x, northWest.y, northEastZ);
    corners[NAV_SOUTH_EAST] = southEast;
    corners[NAV_SOUTH_WEST] = Vector3(northWest.x, southEast.y, southWestZ);

    return NavArea(id, flags, std::move(corners), std::move(connections),
                   std::move(metadata));
}

//------------------------------------------------------
Vector3 NavArea::getCenter() const {
    Vector3 sum(0.0f);
    for (const Vector3 &c : mCorners)
        sum += c;
    return sum / static_cast<float>(mCorners.size());
}

//------------------------------------------------------
size_t NavArea::getConnectionCount() const {
    size_t count = 0;
    for (const auto &dir : mConnections)
        count += dir.size();
    return count;
}

//------------------------------------------------------
bool NavArea::containsPoint(float x, float y) const {
    if (!mBounds.expanded(EDGE_TOLERANCE).contains(x, y))
        return false;

    // convex polygon: the point must be on the inner side of every edge
    const Vector2 p(x, y);
    const size_t n = mCorners.size();
    for (size_t i = 0; i < n; ++i) {
        const Vector2 a = xy(mCorners[i]);
        const Vector2 edge = xy(mCorners[(i + 1) % n]) - a;

        float len = glm::length(edge);
        if (len <= 0.0f)
            continue; // coincident corners

        float side = cross2D(edge, p - a) * mWinding;
        if (side < -EDGE_TOLERANCE * len)
            return false;
    }

    return true;
}

//------------------------------------------------------
float NavArea::getZHeight(float x, float y) const {
    if (mCorners.size() == 4)
        return getQuadZHeight(x, y);

    return getFanZHeight(x, y);
}

//------------------------------------------------------
float NavArea::getQuadZHeight(float x, float y) const {
    // Inverse bilinear mapping. With P(u,v) = a + u*e + v*f + u*v*g the
    // v parameter of point p solves k2*v^2 + k1*v + k0 = 0.
    const Vector3 &ca = mCorners[0];
    const Vector3 &cb = mCorners[1];
    const Vector3 &cc = mCorners[2];
    const Vector3 &cd = mCorners[3];

    const Vector2 a = xy(ca);
    const Vector2 e = xy(cb) - a;
    const Vector2 f = xy(cd) - a;
    const Vector2 g = a - xy(cb) + xy(cc) - xy(cd);
    const Vector2 h = Vector2(x, y) - a;

    const float k2 = cross2D(g, f);
    const float k1 = cross2D(e, f) + cross2D(h, g);
    const float k0 = cross2D(h, e);

    // u from v, using the better conditioned axis
    auto solveU = [&](float v, float &u) -> bool {
        float dx = e.x + g.x * v;
        float dy = e.y + g.y * v;
        if (std::fabs(dx) >= std::fabs(dy)) {
            if (dx == 0.0f)
                return false;
            u = (h.x - f.x * v) / dx;
        } else {
            u = (h.y - f.y * v) / dy;
        }
        return true;
    };

    auto inRange = [](float t) {
        return t >= -PARAM_TOLERANCE && t <= 1.0f + PARAM_TOLERANCE;
    };

    float u = 0.0f, v = 0.0f;
    const float scale = std::fabs(k1) + std::fabs(k0);

    if (std::fabs(k2) <= 1e-6f * scale) {
        // parallelogram (or close to it): the equation is linear
        if (k1 == 0.0f)
            return getFanZHeight(x, y);

        v = -k0 / k1;
        if (!solveU(v, u))
            return getFanZHeight(x, y);
    } else {
        float w = k1 * k1 - 4.0f * k0 * k2;
        w = std::sqrt(std::max(0.0f, w));
        const float ik2 = 0.5f / k2;

        v = (-k1 - w) * ik2;
        bool ok = solveU(v, u);

        if (!ok || !inRange(u) || !inRange(v)) {
            v = (-k1 + w) * ik2;
            if (!solveU(v, u))
                return getFanZHeight(x, y);
        }
    }

    u = clamp01(u);
    v = clamp01(v);

    return ca.z + u * (cb.z - ca.z) + v * (cd.z - ca.z) +
           u * v * (ca.z - cb.z + cc.z - cd.z);
}

//------------------------------------------------------
float NavArea::getFanZHeight(float x, float y) const {
    // Fan of triangles (0, i, i+1). Use the triangle containing the point,
    // or the one it is least outside of.
    const Vector2 p(x, y);
    const Vector2 a = xy(mCorners[0]);

    bool found = false;
    float bestScore = 0.0f;
    float bestZ = 0.0f;

    for (size_t i = 1; i + 1 < mCorners.size(); ++i) {
        const Vector2 b = xy(mCorners[i]);
        const Vector2 c = xy(mCorners[i + 1]);

        float denom = cross2D(b - a, c - a);
        if (denom == 0.0f)
            continue; // collinear corners

        float lb = cross2D(p - a, c - a) / denom;
        float lc = cross2D(b - a, p - a) / denom;
        float la = 1.0f - lb - lc;

        float score = std::min(la, std::min(lb, lc));
        if (!found || score > bestScore) {
            found = true;
            bestScore = score;
            bestZ = la * mCorners[0].z + lb * mCorners[i].z +
                    lc * mCorners[i + 1].z;
        }

        if (score >= 0.0f)
            break;
    }

    if (!found) {
        // every triangle degenerate: flat average
        return getCenter().z;
    }

    return bestZ;
}

} // namespace HammerNav
