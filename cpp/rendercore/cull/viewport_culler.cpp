#include "rendercore/cull/viewport_culler.h"
#include "rendercore/core/util.h"
#include "rendercore/scene/draw_order.h"
#include "rendercore/spatial/spatial_index.h"

#include <algorithm>
#include <cmath>

namespace rendercore {

ViewportCuller::ViewportCuller(const CullConfig& config)
    : config_(sanitizeConfig(config)) {}

void ViewportCuller::setConfig(const CullConfig& config) {
    config_ = sanitizeConfig(config);
}

ViewportTransform ViewportCuller::effectiveTransform(const ViewportTransform& t) const {
    return ViewportTransform{t.panX, t.panY, clampZoom(t.zoom, config_.minZoom, config_.maxZoom)};
}

AABB ViewportCuller::worldRect(const ViewportTransform& t, const ScreenSize& screen) const {
    return screenRectToWorld(effectiveTransform(t), screen);
}

AABB ViewportCuller::expandedWorldRect(const ViewportTransform& t, const ScreenSize& screen) const {
    const AABB rect = worldRect(t, screen);
    return expand(rect, width(rect) * config_.marginFraction, height(rect) * config_.marginFraction);
}

void ViewportCuller::cull(const SpatialIndex& index,
                          const ViewportTransform& t,
                          const ScreenSize& screen,
                          const DrawOrder& order,
                          std::vector<ElementId>& out) {
    const double start = nowMs();
    out.clear();
    lastStats_ = CullStats{static_cast<std::uint32_t>(order.size()), 0, 0, 0, 0.0};

    if (isDegenerate(t, screen) || order.size() == 0) {
        lastStats_.culledCount = lastStats_.totalCount;
        lastStats_.cullTimeMs = nowMs() - start;
        return;
    }

    const AABB range = expandedWorldRect(t, screen);
    candidates_.clear();
    index.query(range, candidates_);
    lastStats_.candidateCount = static_cast<std::uint32_t>(candidates_.size());

    // Sorting k candidates by rank costs k*log(k); past the draw order size a
    // straight walk of the order is cheaper.
    const double k = static_cast<double>(candidates_.size());
    const bool walkOrder = k > 1.0 && k * std::log2(k) > static_cast<double>(order.size());

    if (walkOrder) {
        out.reserve(candidates_.size());
        order.forEach([&](ElementId id) {
            const AABB* b = index.boundsOf(id);
            if (b && intersects(*b, range)) out.push_back(id);
        });
    } else {
        ranked_.clear();
        ranked_.reserve(candidates_.size());
        for (ElementId id : candidates_) {
            if (!order.contains(id)) continue;
            ranked_.emplace_back(order.rankOf(id), id);
        }
        std::sort(ranked_.begin(), ranked_.end());
        out.reserve(ranked_.size());
        for (const auto& r : ranked_) out.push_back(r.second);
    }

    lastStats_.visibleCount = static_cast<std::uint32_t>(out.size());
    lastStats_.culledCount = lastStats_.totalCount - lastStats_.visibleCount;
    lastStats_.cullTimeMs = nowMs() - start;
}

void ViewportCuller::collectAll(const DrawOrder& order, std::vector<ElementId>& out) {
    const double start = nowMs();
    out.clear();
    out.reserve(order.size());
    order.forEach([&](ElementId id) { out.push_back(id); });
    const auto count = static_cast<std::uint32_t>(out.size());
    lastStats_ = CullStats{count, count, 0, count, nowMs() - start};
}

} // namespace rendercore
