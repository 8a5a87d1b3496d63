#include "rendercore/spatial/spatial_index.h"
#include "rendercore/core/logging.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace rendercore {

SpatialIndex::SpatialIndex(const QuadtreeConfig& config)
    : config_(sanitizeConfig(config)) {
    resetRoot();
}

SpatialIndex::~SpatialIndex() = default;

void SpatialIndex::resetRoot() {
    growSteps_ = 0;
    if (quadtreeEnabled_) {
        root_ = std::make_unique<Node>(config_.initialBounds);
    } else {
        root_.reset();
    }
}

AABB SpatialIndex::quadrantRegion(const AABB& r, int quadrant) {
    const double midX = centerX(r);
    const double midY = centerY(r);
    // Bit 0 selects the max-X half, bit 1 the max-Y half.
    const bool hiX = (quadrant & 1) != 0;
    const bool hiY = (quadrant & 2) != 0;
    return AABB{
        hiX ? midX : r.minX,
        hiY ? midY : r.minY,
        hiX ? r.maxX : midX,
        hiY ? r.maxY : midY
    };
}

int SpatialIndex::childIndexFor(const Node& node, const AABB& bounds) {
    if (node.isLeaf()) return -1;
    for (int i = 0; i < 4; ++i) {
        if (rendercore::contains(node.children[i]->region, bounds)) return i;
    }
    return -1;
}

// `depth` counts from the current root; the cap applies from the level of the
// initial root, which sits growSteps_ levels down.
bool SpatialIndex::canSplit(const Node& node, std::uint32_t depth) const {
    if (depth >= growSteps_ + config_.maxDepth) return false;
    const double shorter = std::min(width(node.region), height(node.region));
    return shorter > config_.minNodeSize;
}

bool SpatialIndex::growRootToContain(const AABB& bounds) {
    std::uint32_t steps = 0;
    while (!rendercore::contains(root_->region, bounds)) {
        if (steps++ >= kMaxRootGrowSteps) return false;

        const AABB r = root_->region;
        const double w = width(r);
        const double h = height(r);
        const bool growLowX = bounds.minX < r.minX;
        const bool growLowY = bounds.minY < r.minY;
        const AABB grown{
            growLowX ? r.minX - w : r.minX,
            growLowY ? r.minY - h : r.minY,
            growLowX ? r.maxX : r.maxX + w,
            growLowY ? r.maxY : r.maxY + h
        };
        if (!isFinite(grown)) return false;

        // The old root becomes the quadrant on the side opposite the growth.
        const int oldQuadrant = (growLowX ? 1 : 0) | (growLowY ? 2 : 0);
        auto newRoot = std::make_unique<Node>(grown);
        for (int i = 0; i < 4; ++i) {
            if (i == oldQuadrant) {
                newRoot->children[i] = std::move(root_);
            } else {
                newRoot->children[i] = std::make_unique<Node>(quadrantRegion(grown, i));
            }
        }
        root_ = std::move(newRoot);
        ++growSteps_;
        RENDERCORE_LOG_DEBUG("quadtree: root grown to [%g, %g, %g, %g]",
                             grown.minX, grown.minY, grown.maxX, grown.maxY);
    }
    return true;
}

void SpatialIndex::shrinkRoot() {
    while (growSteps_ > 0 && !root_->isLeaf() && root_->entries.empty()) {
        int inner = -1;
        for (int i = 0; i < 4; ++i) {
            const Node& child = *root_->children[i];
            if (inner < 0 && rendercore::contains(child.region, config_.initialBounds)) {
                inner = i;
            } else if (!child.isLeaf() || !child.entries.empty()) {
                return;
            }
        }
        if (inner < 0) return;

        std::unique_ptr<Node> child = std::move(root_->children[inner]);
        root_ = std::move(child);
        --growSteps_;
        RENDERCORE_LOG_DEBUG("quadtree: root shrunk to [%g, %g, %g, %g]",
                             root_->region.minX, root_->region.minY, root_->region.maxX, root_->region.maxY);
    }
}

void SpatialIndex::split(Node& node, std::uint32_t depth) {
    for (int i = 0; i < 4; ++i) {
        node.children[i] = std::make_unique<Node>(quadrantRegion(node.region, i));
    }

    std::vector<Entry> kept;
    kept.reserve(node.entries.size());
    for (const Entry& e : node.entries) {
        const int q = childIndexFor(node, e.bounds);
        if (q < 0) {
            kept.push_back(e);
        } else {
            node.children[q]->entries.push_back(e);
        }
    }
    node.entries = std::move(kept);

    for (int i = 0; i < 4; ++i) {
        Node& child = *node.children[i];
        if (child.entries.size() > config_.capacity && canSplit(child, depth + 1)) {
            split(child, depth + 1);
        }
    }
}

void SpatialIndex::insertIntoTree(ElementId id, const AABB& bounds) {
    if (!growRootToContain(bounds)) {
        // Beyond what the root can grow to; the root scans its own entries
        // on every query, so the element is still found.
        RENDERCORE_LOG_WARN("quadtree: element %u kept at root, bounds out of growable range", id);
        root_->entries.push_back(Entry{id, bounds});
        return;
    }

    Node* node = root_.get();
    std::uint32_t depth = 0;
    while (true) {
        if (node->isLeaf()) {
            node->entries.push_back(Entry{id, bounds});
            if (node->entries.size() > config_.capacity && canSplit(*node, depth)) {
                split(*node, depth);
            }
            return;
        }
        const int q = childIndexFor(*node, bounds);
        if (q < 0) {
            node->entries.push_back(Entry{id, bounds});
            return;
        }
        node = node->children[q].get();
        ++depth;
    }
}

void SpatialIndex::collapseIfSparse(Node& node) {
    if (node.isLeaf()) return;
    std::size_t total = node.entries.size();
    for (int i = 0; i < 4; ++i) {
        if (!node.children[i]->isLeaf()) return;
        total += node.children[i]->entries.size();
    }
    // Half the capacity leaves room so a remove/insert pair does not
    // split and collapse the same node back and forth.
    if (total > config_.capacity / 2) return;

    node.entries.reserve(total);
    for (int i = 0; i < 4; ++i) {
        auto& childEntries = node.children[i]->entries;
        node.entries.insert(node.entries.end(), childEntries.begin(), childEntries.end());
        node.children[i].reset();
    }
}

bool SpatialIndex::removeFromNode(Node& node, ElementId id, const AABB& bounds) {
    for (std::size_t i = 0; i < node.entries.size(); ++i) {
        if (node.entries[i].id == id) {
            node.entries[i] = node.entries.back();
            node.entries.pop_back();
            return true;
        }
    }
    if (node.isLeaf()) return false;

    // Degenerate boxes on a quadrant edge fit more than one child.
    for (int i = 0; i < 4; ++i) {
        Node& child = *node.children[i];
        if (!rendercore::contains(child.region, bounds)) continue;
        if (removeFromNode(child, id, bounds)) {
            collapseIfSparse(node);
            return true;
        }
    }
    return false;
}

bool SpatialIndex::insert(ElementId id, const AABB& bounds) {
    if (!isValid(bounds)) {
        RENDERCORE_LOG_WARN("quadtree: rejected element %u with invalid bounds", id);
        return false;
    }

    auto it = bounds_.find(id);
    if (it != bounds_.end()) {
        if (it->second == bounds) return true;
        if (root_ && !removeFromNode(*root_, id, it->second)) {
            RENDERCORE_LOG_WARN("quadtree: element %u missing from tree during relocate", id);
        }
        it->second = bounds;
    } else {
        bounds_.emplace(id, bounds);
    }

    if (root_) {
        insertIntoTree(id, bounds);
        shrinkRoot();
    }
    return true;
}

bool SpatialIndex::remove(ElementId id) {
    auto it = bounds_.find(id);
    if (it == bounds_.end()) return false;
    if (root_ && !removeFromNode(*root_, id, it->second)) {
        RENDERCORE_LOG_WARN("quadtree: element %u missing from tree during remove", id);
    }
    bounds_.erase(it);
    if (root_) shrinkRoot();
    return true;
}

void SpatialIndex::clear() {
    bounds_.clear();
    resetRoot();
}

void SpatialIndex::queryNode(const Node& node, const AABB& range, std::vector<ElementId>& out) const {
    lastQueryStats_.nodesVisited++;
    for (const Entry& e : node.entries) {
        lastQueryStats_.entriesTested++;
        if (intersects(e.bounds, range)) out.push_back(e.id);
    }
    if (node.isLeaf()) return;
    for (int i = 0; i < 4; ++i) {
        const Node& child = *node.children[i];
        if (intersects(child.region, range)) queryNode(child, range, out);
    }
}

void SpatialIndex::query(const AABB& range, std::vector<ElementId>& out) const {
    lastQueryStats_ = QueryStats{0, 0};
    // Rejects NaN as well as inverted ranges.
    if (!(range.minX <= range.maxX && range.minY <= range.maxY)) return;
    if (bounds_.empty()) return;

    if (!root_) {
        for (const auto& kv : bounds_) {
            lastQueryStats_.entriesTested++;
            if (intersects(kv.second, range)) out.push_back(kv.first);
        }
        return;
    }
    // The root is always visited: it may hold elements outside its region.
    queryNode(*root_, range, out);
}

void SpatialIndex::rebuild() {
    resetRoot();
    if (!root_) return;

    std::vector<ElementId> ids;
    ids.reserve(bounds_.size());
    for (const auto& kv : bounds_) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());
    for (ElementId id : ids) {
        insertIntoTree(id, bounds_.find(id)->second);
    }
    RENDERCORE_LOG_DEBUG("quadtree: rebuilt with %zu elements", ids.size());
}

void SpatialIndex::setQuadtreeEnabled(bool enabled) {
    if (quadtreeEnabled_ == enabled) return;
    quadtreeEnabled_ = enabled;
    rebuild();
}

void SpatialIndex::setConfig(const QuadtreeConfig& config) {
    config_ = sanitizeConfig(config);
    rebuild();
}

bool SpatialIndex::contains(ElementId id) const {
    return bounds_.find(id) != bounds_.end();
}

const AABB* SpatialIndex::boundsOf(ElementId id) const {
    auto it = bounds_.find(id);
    return it == bounds_.end() ? nullptr : &it->second;
}

AABB SpatialIndex::rootBounds() const {
    return root_ ? root_->region : config_.initialBounds;
}

void SpatialIndex::collectStats(const Node& node, std::uint32_t depth, IndexStats& stats) const {
    stats.totalNodes++;
    stats.totalElements += static_cast<std::uint32_t>(node.entries.size());
    stats.maxDepth = std::max(stats.maxDepth, depth);
    if (node.isLeaf()) {
        stats.leafNodes++;
        return;
    }
    for (int i = 0; i < 4; ++i) {
        collectStats(*node.children[i], depth + 1, stats);
    }
}

IndexStats SpatialIndex::getStats() const {
    IndexStats stats{0, 0, 0, 0};
    if (!root_) {
        stats.totalElements = static_cast<std::uint32_t>(bounds_.size());
        return stats;
    }
    collectStats(*root_, 0, stats);
    return stats;
}

} // namespace rendercore
