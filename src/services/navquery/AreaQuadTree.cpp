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

#include "AreaQuadTree.h"
#include "logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace HammerNav {

/*----------------------------------------------------*/
/*-------------------- AreaQuadTree ------------------*/
/*----------------------------------------------------*/
AreaQuadTree::AreaQuadTree(NavMeshPtr mesh, const Params &params)
    : mMesh(std::move(mesh)), mParams(params), mNodes(), mDepth(0) {
    if (!mMesh)
        throw std::invalid_argument("AreaQuadTree: null mesh");

    if (mParams.leafCapacity == 0)
        mParams.leafCapacity = 1;

    Node root;
    if (mMesh->getAreaCount() > 0) {
        root.bounds = mMesh->getBounds().expanded(1.0f);

        const size_t count = mMesh->getAreaCount();
        root.areas.reserve(count);
        for (size_t i = 0; i < count; ++i)
            root.areas.push_back(static_cast<uint32_t>(i));
    } else {
        root.bounds.min = Vector2(0.0f);
        root.bounds.max = Vector2(0.0f);
    }

    mNodes.push_back(std::move(root));
    build(0, 0);

    LOG_DEBUG("AreaQuadTree: %zu nodes, %zu leaves, depth %u, %zu entries",
              mNodes.size(), getLeafCount(), mDepth, getEntryCount());
}

//------------------------------------------------------
void AreaQuadTree::build(size_t nodeIdx, unsigned depth) {
    mDepth = std::max(mDepth, depth);

    if (mNodes[nodeIdx].areas.size() <= mParams.leafCapacity ||
        depth >= mParams.maxDepth)
        return;

    const BBox2 parentBounds = mNodes[nodeIdx].bounds;
    const size_t parentCount = mNodes[nodeIdx].areas.size();

    Node children[4];
    bool narrows = false;
    for (int q = 0; q < 4; ++q) {
        children[q].bounds = childBounds(parentBounds, q);

        for (uint32_t idx : mNodes[nodeIdx].areas) {
            if (children[q].bounds.intersects(insertBounds(idx)))
                children[q].areas.push_back(idx);
        }

        if (children[q].areas.size() < parentCount)
            narrows = true;
    }

    // every quadrant would repeat the parent's list (stacked or covering
    // areas), splitting further cannot separate them
    if (!narrows)
        return;

    // mNodes may reallocate below, so only indices are held across pushes
    const size_t first = mNodes.size();
    for (int q = 0; q < 4; ++q)
        mNodes.push_back(std::move(children[q]));

    mNodes[nodeIdx].firstChild = static_cast<int32_t>(first);
    std::vector<uint32_t>().swap(mNodes[nodeIdx].areas);

    for (size_t q = 0; q < 4; ++q)
        build(first + q, depth + 1);
}

//------------------------------------------------------
BBox2 AreaQuadTree::insertBounds(uint32_t areaIdx) const {
    // containsPoint accepts points this close outside the polygon
    return mMesh->getAreas()[areaIdx].getBounds().expanded(
        NavArea::EDGE_TOLERANCE);
}

//------------------------------------------------------
BBox2 AreaQuadTree::childBounds(const BBox2 &parent, int which) {
    const Vector2 mid = parent.center();
    BBox2 out;

    out.min.x = (which & 1) ? mid.x : parent.min.x;
    out.max.x = (which & 1) ? parent.max.x : mid.x;
    out.min.y = (which & 2) ? mid.y : parent.min.y;
    out.max.y = (which & 2) ? parent.max.y : mid.y;

    return out;
}

//------------------------------------------------------
std::vector<uint32_t> AreaQuadTree::collect(float x, float y) const {
    std::vector<uint32_t> result;

    if (mNodes.empty() || !mNodes.front().bounds.contains(x, y))
        return result;

    // points on a split line descend into both sides
    std::vector<size_t> stack;
    stack.push_back(0);

    while (!stack.empty()) {
        const Node &node = mNodes[stack.back()];
        stack.pop_back();

        if (node.isLeaf()) {
            result.insert(result.end(), node.areas.begin(), node.areas.end());
            continue;
        }

        for (int q = 0; q < 4; ++q) {
            size_t childIdx = static_cast<size_t>(node.firstChild) + q;
            if (mNodes[childIdx].bounds.contains(x, y))
                stack.push_back(childIdx);
        }
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());

    return result;
}

//------------------------------------------------------
std::vector<const NavArea *> AreaQuadTree::queryCandidates(float x,
                                                           float y) const {
    std::vector<const NavArea *> out;
    const std::vector<NavArea> &areas = mMesh->getAreas();

    for (uint32_t idx : collect(x, y)) {
        if (insertBounds(idx).contains(x, y))
            out.push_back(&areas[idx]);
    }

    return out;
}

//------------------------------------------------------
std::vector<const NavArea *> AreaQuadTree::query(float x, float y) const {
    std::vector<const NavArea *> out;
    const std::vector<NavArea> &areas = mMesh->getAreas();

    for (uint32_t idx : collect(x, y)) {
        if (areas[idx].containsPoint(x, y))
            out.push_back(&areas[idx]);
    }

    return out;
}

//------------------------------------------------------
std::vector<float> AreaQuadTree::findZHeights(float x, float y) const {
    std::vector<float> heights;

    for (const NavArea *area : query(x, y))
        heights.push_back(area->getZHeight(x, y));

    return heights;
}

//------------------------------------------------------
const NavArea *AreaQuadTree::findBestArea(float x, float y,
                                          float zHint) const {
    const NavArea *best = nullptr;
    float bestDist = 0.0f;

    // query() is in file order, strict < keeps the first of equal candidates
    for (const NavArea *area : query(x, y)) {
        float dist = std::fabs(area->getZHeight(x, y) - zHint);
        if (!best || dist < bestDist) {
            best = area;
            bestDist = dist;
        }
    }

    return best;
}

//------------------------------------------------------
std::optional<float> AreaQuadTree::findBestHeight(float x, float y,
                                                  float zHint) const {
    const NavArea *area = findBestArea(x, y, zHint);
    if (!area)
        return std::nullopt;

    return area->getZHeight(x, y);
}

//------------------------------------------------------
size_t AreaQuadTree::getLeafCount() const {
    size_t count = 0;
    for (const Node &node : mNodes) {
        if (node.isLeaf())
            ++count;
    }
    return count;
}

//------------------------------------------------------
size_t AreaQuadTree::getEntryCount() const {
    size_t count = 0;
    for (const Node &node : mNodes)
        count += node.areas.size();
    return count;
}

//------------------------------------------------------
NavAreaTreePtr buildAreaTree(NavMeshPtr mesh,
                             const AreaQuadTree::Params &params) {
    return std::make_shared<const AreaQuadTree>(std::move(mesh), params);
}

} // namespace HammerNav
