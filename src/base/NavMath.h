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

/// @file NavMath.h
/// @brief Central math header, GLM-backed type aliases for hammernav.
///
/// All nav code includes this header for Vector2, Vector3 and BBox2.
/// The underlying implementation is GLM (MIT license).

#pragma once

#include <glm/glm.hpp>

#include <algorithm>
#include <limits>

namespace HammerNav {

// --- Core type aliases ---

using Vector2 = glm::vec2;
using Vector3 = glm::vec3;

/// 2D cross product (z component of the 3D cross of two xy vectors)
inline float cross2D(const Vector2 &a, const Vector2 &b) {
    return a.x * b.y - a.y * b.x;
}

// --- BBox2 ---
// Axis-aligned footprint box. All edges are inclusive: a point lying exactly
// on an edge is inside, and boxes sharing only an edge intersect.

struct BBox2 {
    Vector2 min;
    Vector2 max;

    BBox2()
        : min(std::numeric_limits<float>::max()),
          max(std::numeric_limits<float>::lowest()) {}
    BBox2(const Vector2 &min_, const Vector2 &max_) : min(min_), max(max_) {}

    /// True until at least one point was merged in
    bool isEmpty() const { return min.x > max.x || min.y > max.y; }

    void merge(const Vector2 &p) {
        min = glm::min(min, p);
        max = glm::max(max, p);
    }

    void merge(const BBox2 &other) {
        if (other.isEmpty())
            return;
        merge(other.min);
        merge(other.max);
    }

    bool contains(float x, float y) const {
        return x >= min.x && x <= max.x && y >= min.y && y <= max.y;
    }

    bool intersects(const BBox2 &other) const {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y;
    }

    Vector2 center() const { return (min + max) * 0.5f; }

    Vector2 size() const { return max - min; }

    /// Copy grown by amount on every side
    BBox2 expanded(float amount) const {
        return BBox2(min - Vector2(amount), max + Vector2(amount));
    }
};

} // namespace HammerNav
