#pragma once

#include "rendercore/core/config.h"
#include "rendercore/core/types.h"
#include "rendercore/geometry/aabb.h"
#include "rendercore/geometry/viewport.h"

#include <cstdint>
#include <utility>
#include <vector>

namespace rendercore {

class SpatialIndex;
class DrawOrder;

struct CullStats {
    std::uint32_t totalCount;
    std::uint32_t visibleCount;
    std::uint32_t culledCount;
    std::uint32_t candidateCount;
    double cullTimeMs;
};

class ViewportCuller {
public:
    explicit ViewportCuller(const CullConfig& config = CullConfig{});

    void setConfig(const CullConfig& config);
    const CullConfig& config() const noexcept { return config_; }

    // Transform with zoom clamped to the configured range.
    ViewportTransform effectiveTransform(const ViewportTransform& t) const;

    // World rectangle shown on screen, without the hysteresis margin.
    AABB worldRect(const ViewportTransform& t, const ScreenSize& screen) const;

    // worldRect() grown by marginFraction of its extent on every side.
    AABB expandedWorldRect(const ViewportTransform& t, const ScreenSize& screen) const;

    // Visible ids in draw order. Empty for a degenerate viewport.
    void cull(const SpatialIndex& index,
              const ViewportTransform& t,
              const ScreenSize& screen,
              const DrawOrder& order,
              std::vector<ElementId>& out);

    // Culling disabled: every ordered element is visible.
    void collectAll(const DrawOrder& order, std::vector<ElementId>& out);

    CullStats getLastStats() const { return lastStats_; }

private:
    CullConfig config_;
    std::vector<ElementId> candidates_;
    std::vector<std::pair<std::uint32_t, ElementId>> ranked_;
    CullStats lastStats_{0, 0, 0, 0, 0.0};
};

} // namespace rendercore
