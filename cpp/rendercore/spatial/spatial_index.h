#pragma once

#include "rendercore/core/config.h"
#include "rendercore/core/types.h"
#include "rendercore/geometry/aabb.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace rendercore {

struct IndexStats {
    std::uint32_t totalNodes;
    std::uint32_t leafNodes;
    std::uint32_t maxDepth;
    std::uint32_t totalElements;
};

struct QueryStats {
    std::uint32_t nodesVisited;
    std::uint32_t entriesTested;
};

// Quadtree over element bounds. Owns the id -> AABB mapping; element content
// lives with the caller. Single writer: every method must be called from the
// interactive context.
//
// Each element is stored at the deepest node whose region fully contains it.
// Elements straddling a quadrant boundary stay at the parent. The root region
// doubles toward any element that falls outside it, so world space is
// effectively unbounded, and shrinks back once the far side empties.
// The depth cap counts from the initial root level.
class SpatialIndex {
public:
    explicit SpatialIndex(const QuadtreeConfig& config = QuadtreeConfig{});
    ~SpatialIndex();

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    // Adds or relocates an element. Returns false (and stores nothing) for
    // non-finite or inverted bounds; callers validate before inserting.
    bool insert(ElementId id, const AABB& bounds);

    // No-op returning false when the id is absent.
    bool remove(ElementId id);

    void clear();

    // Appends every element whose bounds intersect `range`. Order is
    // unspecified.
    void query(const AABB& range, std::vector<ElementId>& out) const;

    // Drops the node tree and re-inserts every element in id order.
    void rebuild();

    // Linear mode keeps only the id -> AABB map and scans it on query.
    void setQuadtreeEnabled(bool enabled);
    bool isQuadtreeEnabled() const noexcept { return quadtreeEnabled_; }

    // Applies new subdivision parameters and rebuilds the tree.
    void setConfig(const QuadtreeConfig& config);
    const QuadtreeConfig& config() const noexcept { return config_; }

    std::size_t size() const noexcept { return bounds_.size(); }
    bool contains(ElementId id) const;
    const AABB* boundsOf(ElementId id) const;
    AABB rootBounds() const;

    IndexStats getStats() const;
    QueryStats getLastQueryStats() const { return lastQueryStats_; }

private:
    struct Entry {
        ElementId id;
        AABB bounds;
    };

    struct Node {
        explicit Node(const AABB& r) : region(r) {}
        AABB region;
        std::vector<Entry> entries;
        std::unique_ptr<Node> children[4];
        bool isLeaf() const { return !children[0]; }
    };

    QuadtreeConfig config_;
    std::unique_ptr<Node> root_;
    std::unordered_map<ElementId, AABB> bounds_;
    bool quadtreeEnabled_{true};
    mutable QueryStats lastQueryStats_{0, 0};
    // Doublings of the root since the last reset.
    std::uint32_t growSteps_{0};

    void resetRoot();
    bool growRootToContain(const AABB& bounds);
    // Undoes growth while the only occupied quadrant of the root is the one
    // holding the initial root region.
    void shrinkRoot();
    void insertIntoTree(ElementId id, const AABB& bounds);
    bool removeFromNode(Node& node, ElementId id, const AABB& bounds);
    void split(Node& node, std::uint32_t depth);
    bool canSplit(const Node& node, std::uint32_t depth) const;
    void collapseIfSparse(Node& node);
    void queryNode(const Node& node, const AABB& range, std::vector<ElementId>& out) const;
    void collectStats(const Node& node, std::uint32_t depth, IndexStats& stats) const;

    static AABB quadrantRegion(const AABB& region, int quadrant);
    static int childIndexFor(const Node& node, const AABB& bounds);
};

} // namespace rendercore
