/******************************************************************************
 *
 *    This file is part of the hammernav project
 *
 *    AreaQuadTree: quad-tree over nav area footprints for point queries.
 *    Regions split into four quadrants while they hold more than the leaf
 *    capacity and a split would separate some of their areas; areas
 *    straddling a split are stored in every quadrant they touch. Area boxes
 *    are grown by NavArea::EDGE_TOLERANCE so near-edge points reach them.
 *    A point query then only tests the handful of areas stored in the
 *    leaves around that point instead of the whole mesh.
 *
 *    Built once, immutable afterwards. All queries are const and may run
 *    concurrently from any number of threads.
 *
 *****************************************************************************/

#ifndef __AREAQUADTREE_H
#define __AREAQUADTREE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "NavMath.h"
#include "navmesh/NavMesh.h"

namespace HammerNav {

/// Build parameters of AreaQuadTree
struct AreaQuadTreeParams {
    /// Areas a leaf may hold before it is split
    size_t leafCapacity = 8;
    /// Depth at which splitting stops regardless of leaf size
    unsigned maxDepth = 10;
};

class AreaQuadTree {
public:
    typedef AreaQuadTreeParams Params;

    /// Builds the tree over every area of mesh. Holds a reference on mesh.
    /// @throw std::invalid_argument if mesh is null
    explicit AreaQuadTree(NavMeshPtr mesh, const Params &params = Params());

    // -- Queries --

    /// Areas whose footprint box (plus edge tolerance) may contain (x, y), deduplicated, in file
    /// order. Cheap broad phase, no polygon test.
    std::vector<const NavArea *> queryCandidates(float x, float y) const;

    /// Areas whose footprint polygon contains (x, y), in file order.
    std::vector<const NavArea *> query(float x, float y) const;

    /// Interpolated height of every area containing (x, y), in file order.
    /// Stacked geometry gives several values.
    std::vector<float> findZHeights(float x, float y) const;

    /// Height at (x, y) of the containing area closest to zHint.
    /// Equal distances resolve to the earlier area in file order.
    /// @return std::nullopt if no area contains the point
    std::optional<float> findBestHeight(float x, float y, float zHint) const;

    /// Like findBestHeight, but returns the winning area (nullptr if none)
    const NavArea *findBestArea(float x, float y, float zHint) const;

    // -- Diagnostics --

    const NavMeshPtr &getMesh() const { return mMesh; }

    const Params &getParams() const { return mParams; }

    /// Root region (mesh bounds grown by one unit)
    const BBox2 &getBounds() const { return mNodes.front().bounds; }

    size_t getNodeCount() const { return mNodes.size(); }

    size_t getLeafCount() const;

    /// Deepest leaf level, root is 0
    unsigned getDepth() const { return mDepth; }

    /// Total area references over all leaves (>= area count when areas
    /// straddle splits)
    size_t getEntryCount() const;

    /// Visit every leaf: fn(const BBox2 &region, const std::vector<uint32_t>
    /// &areaIndices). Used by diagnostics and tests.
    template <typename Fn> void forEachLeaf(Fn &&fn) const {
        for (const Node &node : mNodes) {
            if (node.isLeaf())
                fn(node.bounds, node.areas);
        }
    }

private:
    struct Node {
        BBox2 bounds;
        /// Index of the first of four consecutive children, -1 for leaves
        int32_t firstChild = -1;
        /// Indices into NavMesh::getAreas()
        std::vector<uint32_t> areas;

        bool isLeaf() const { return firstChild < 0; }
    };

    void build(size_t nodeIdx, unsigned depth);

    /// Footprint box of an area grown by the containment tolerance
    BBox2 insertBounds(uint32_t areaIdx) const;

    /// Region of quadrant which (0=min-min, 1=max-min, 2=min-max, 3=max-max)
    static BBox2 childBounds(const BBox2 &parent, int which);

    /// Leaf area indices around (x, y), sorted and unique
    std::vector<uint32_t> collect(float x, float y) const;

    NavMeshPtr mMesh;
    Params mParams;
    std::vector<Node> mNodes; // flat storage, root first
    unsigned mDepth;
};

/// Shared pointer to a built tree
typedef std::shared_ptr<const AreaQuadTree> NavAreaTreePtr;

/// Builds the spatial index for mesh
NavAreaTreePtr buildAreaTree(NavMeshPtr mesh,
                             const AreaQuadTree::Params &params =
                                 AreaQuadTree::Params());

} // namespace HammerNav

#endif // __AREAQUADTREE_H
