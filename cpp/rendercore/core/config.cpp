#include "rendercore/core/config.h"
#include "rendercore/core/logging.h"

#include <cmath>

namespace rendercore {

namespace {
    bool positiveFinite(double v) {
        return std::isfinite(v) && v > 0.0;
    }
}

QuadtreeConfig sanitizeConfig(const QuadtreeConfig& cfg) {
    QuadtreeConfig out = cfg;
    const QuadtreeConfig defaults{};
    if (out.capacity == 0) out.capacity = defaults.capacity;
    if (out.maxDepth == 0) out.maxDepth = defaults.maxDepth;
    if (!positiveFinite(out.minNodeSize)) out.minNodeSize = defaults.minNodeSize;
    if (!isValid(out.initialBounds) || width(out.initialBounds) <= 0.0 || height(out.initialBounds) <= 0.0) {
        RENDERCORE_LOG_WARN("quadtree: invalid initial bounds, using default root");
        out.initialBounds = defaults.initialBounds;
    }
    return out;
}

CullConfig sanitizeConfig(const CullConfig& cfg) {
    CullConfig out = cfg;
    const CullConfig defaults{};
    if (!std::isfinite(out.marginFraction) || out.marginFraction < 0.0) {
        out.marginFraction = defaults.marginFraction;
    }
    if (out.marginFraction > 1.0) out.marginFraction = 1.0;
    if (!positiveFinite(out.minZoom) || !positiveFinite(out.maxZoom) || out.minZoom > out.maxZoom) {
        RENDERCORE_LOG_WARN("cull: invalid zoom range [%g, %g], using default", out.minZoom, out.maxZoom);
        out.minZoom = defaults.minZoom;
        out.maxZoom = defaults.maxZoom;
    }
    return out;
}

GenerationConfig sanitizeConfig(const GenerationConfig& cfg) {
    GenerationConfig out = cfg;
    const GenerationConfig defaults{};
    if (out.chunkSize == 0) out.chunkSize = defaults.chunkSize;
    if (out.channelCapacity == 0) out.channelCapacity = defaults.channelCapacity;
    return out;
}

MetricsConfig sanitizeConfig(const MetricsConfig& cfg) {
    MetricsConfig out = cfg;
    const MetricsConfig defaults{};
    if (!positiveFinite(out.minElapsedMs)) out.minElapsedMs = defaults.minElapsedMs;
    if (!positiveFinite(out.publishIntervalMs)) out.publishIntervalMs = defaults.publishIntervalMs;
    if (!std::isfinite(out.minFpsDelta) || out.minFpsDelta < 0.0) out.minFpsDelta = defaults.minFpsDelta;
    return out;
}

CoreConfig sanitizeConfig(const CoreConfig& cfg) {
    CoreConfig out;
    out.quadtree = sanitizeConfig(cfg.quadtree);
    out.cull = sanitizeConfig(cfg.cull);
    out.generation = sanitizeConfig(cfg.generation);
    out.metrics = sanitizeConfig(cfg.metrics);
    out.toggles = cfg.toggles & kAllToggles;
    return out;
}

} // namespace rendercore
