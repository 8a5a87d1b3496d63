#pragma once

#include "rendercore/core/types.h"
#include "rendercore/geometry/aabb.h"

#include <cstdint>

namespace rendercore {

struct QuadtreeConfig {
    std::uint32_t capacity{kDefaultNodeCapacity};
    std::uint32_t maxDepth{kDefaultMaxDepth};
    double minNodeSize{kDefaultMinNodeSize};
    AABB initialBounds{-kDefaultRootHalfExtent, -kDefaultRootHalfExtent,
                       kDefaultRootHalfExtent, kDefaultRootHalfExtent};
};

struct CullConfig {
    double marginFraction{kDefaultCullMargin};
    double minZoom{kDefaultMinZoom};
    double maxZoom{kDefaultMaxZoom};
};

struct GenerationConfig {
    std::uint32_t chunkSize{kDefaultChunkSize};
    std::uint32_t channelCapacity{kDefaultChannelCapacity};
};

struct MetricsConfig {
    double minElapsedMs{kDefaultFpsWindowMs};
    double publishIntervalMs{kDefaultFpsPublishIntervalMs};
    double minFpsDelta{kDefaultMinFpsDelta};
};

enum class PerfToggle : std::uint32_t {
    Culling = 1 << 0,
    Batching = 1 << 1,
    Quadtree = 1 << 2,
};

static constexpr std::uint32_t kAllToggles =
    static_cast<std::uint32_t>(PerfToggle::Culling)
    | static_cast<std::uint32_t>(PerfToggle::Batching)
    | static_cast<std::uint32_t>(PerfToggle::Quadtree);

inline bool hasToggle(std::uint32_t toggles, PerfToggle t) {
    return (toggles & static_cast<std::uint32_t>(t)) != 0;
}

struct CoreConfig {
    QuadtreeConfig quadtree{};
    CullConfig cull{};
    GenerationConfig generation{};
    MetricsConfig metrics{};
    std::uint32_t toggles{kAllToggles};
};

// Replaces out-of-range or non-finite values with their defaults so the
// components never see a config they cannot honor.
QuadtreeConfig sanitizeConfig(const QuadtreeConfig& cfg);
CullConfig sanitizeConfig(const CullConfig& cfg);
GenerationConfig sanitizeConfig(const GenerationConfig& cfg);
MetricsConfig sanitizeConfig(const MetricsConfig& cfg);
CoreConfig sanitizeConfig(const CoreConfig& cfg);

} // namespace rendercore
