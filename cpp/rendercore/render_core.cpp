#include "rendercore/render_core.h"
#include "rendercore/core/logging.h"
#include "rendercore/internal/core_state.h"

namespace rendercore {

CoreState::CoreState(const CoreConfig& cfg)
    : config(sanitizeConfig(cfg)),
      index(config.quadtree),
      culler(config.cull),
      generator(config.generation) {
    index.setQuadtreeEnabled(hasToggle(config.toggles, PerfToggle::Quadtree));
}

RenderCore::RenderCore(MetricsCollector& metrics, const CoreConfig& config)
    : metrics_(metrics),
      state_(std::make_unique<CoreState>(config)) {
    RENDERCORE_LOG_DEBUG("core: created (capacity %u, depth %u, margin %.3f, toggles 0x%x)",
        state().config.quadtree.capacity, state().config.quadtree.maxDepth,
        state().config.cull.marginFraction, state().config.toggles);
}

RenderCore::~RenderCore() = default;

CoreError RenderCore::getLastError() const {
    return state().lastError;
}

void RenderCore::clearError() const {
    state().lastError = CoreError::Ok;
}

void RenderCore::setError(CoreError err) const {
    state().lastError = err;
}

const CoreConfig& RenderCore::getConfig() const {
    return state().config;
}

void RenderCore::setToggles(std::uint32_t mask, std::uint32_t value) {
    CoreState& s = state();
    mask &= kAllToggles;
    const std::uint32_t next = (s.config.toggles & ~mask) | (value & mask);
    if (next == s.config.toggles) return;

    const bool quadtree = hasToggle(next, PerfToggle::Quadtree);
    if (quadtree != hasToggle(s.config.toggles, PerfToggle::Quadtree)) {
        s.index.setQuadtreeEnabled(quadtree);
    }
    s.config.toggles = next;
    RENDERCORE_LOG_DEBUG("core: toggles 0x%x", next);
}

std::uint32_t RenderCore::getToggles() const {
    return state().config.toggles;
}

void RenderCore::setCullMargin(double fraction) {
    CoreState& s = state();
    CullConfig cfg = s.config.cull;
    cfg.marginFraction = fraction;
    s.config.cull = sanitizeConfig(cfg);
    s.culler.setConfig(s.config.cull);
}

void RenderCore::setZoomRange(double minZoom, double maxZoom) {
    CoreState& s = state();
    CullConfig cfg = s.config.cull;
    cfg.minZoom = minZoom;
    cfg.maxZoom = maxZoom;
    s.config.cull = sanitizeConfig(cfg);
    s.culler.setConfig(s.config.cull);
}

void RenderCore::setQuadtreeParams(std::uint32_t capacity, std::uint32_t maxDepth, double minNodeSize) {
    CoreState& s = state();
    QuadtreeConfig cfg = s.config.quadtree;
    cfg.capacity = capacity;
    cfg.maxDepth = maxDepth;
    cfg.minNodeSize = minNodeSize;
    s.config.quadtree = sanitizeConfig(cfg);
    s.index.setConfig(s.config.quadtree);
}

} // namespace rendercore
