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

// NavLoader: one call from raw .nav bytes to a decoded mesh plus its
// spatial index.

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "NavException.h"
#include "NavFileParser.h"
#include "logger.h"
#include "navquery/AreaQuadTree.h"

namespace HammerNav {

struct LoadedNavMesh {
    NavMeshPtr mesh;
    NavAreaTreePtr tree;
};

/// Decode data and build the quad-tree over the result.
/// @throw NavException on any decode error, nothing is returned partially
inline LoadedNavMesh loadNavMesh(const uint8_t *data, size_t size,
                                 const AreaQuadTree::Params &params =
                                     AreaQuadTree::Params()) {
    LoadedNavMesh result;

    try {
        result.mesh = parseNavMesh(data, size);
    } catch (const NavException &e) {
        LOG_ERROR("NavLoader: decode failed: %s", e.what());
        throw;
    }

    result.tree = buildAreaTree(result.mesh, params);
    return result;
}

inline LoadedNavMesh loadNavMesh(const std::vector<uint8_t> &data,
                                 const AreaQuadTree::Params &params =
                                     AreaQuadTree::Params()) {
    return loadNavMesh(data.data(), data.size(), params);
}

} // namespace HammerNav
