#include "rendercore/render_core.h"
#include "rendercore/internal/core_state.h"

namespace rendercore {

namespace {
    BatchKey resolveBatchKey(void* ctx, ElementId id) {
        const auto* s = static_cast<const CoreState*>(ctx);
        const auto it = s->batchKeys.find(id);
        return it == s->batchKeys.end() ? BatchKey{0, 0} : it->second;
    }
}

const std::vector<Batch>& RenderCore::getVisibleBatches(const ViewportTransform& transform, const ScreenSize& screen) {
    CoreState& s = state();
    if (hasToggle(s.config.toggles, PerfToggle::Culling)) {
        s.culler.cull(s.index, transform, screen, s.drawOrder, s.visibleIds);
    } else {
        s.culler.collectAll(s.drawOrder, s.visibleIds);
    }

    if (hasToggle(s.config.toggles, PerfToggle::Batching)) {
        s.batcher.batch(s.visibleIds, &resolveBatchKey, &s, s.batches);
    } else {
        s.batcher.batchEach(s.visibleIds, &resolveBatchKey, &s, s.batches);
    }
    return s.batches;
}

const std::vector<ElementId>& RenderCore::getVisibleIds() const {
    return state().visibleIds;
}

CullStats RenderCore::getLastCullStats() const {
    return state().culler.getLastStats();
}

BatchStats RenderCore::getLastBatchStats() const {
    return state().batcher.getLastStats();
}

void RenderCore::endFrame(double timestampMs, double renderTimeMs) {
    const CoreState& s = state();
    FrameStats frame;
    frame.renderTimeMs = renderTimeMs;
    frame.elementCount = static_cast<std::uint32_t>(s.index.size());
    frame.visibleCount = static_cast<std::uint32_t>(s.visibleIds.size());
    metrics_.sample(timestampMs, frame);
}

} // namespace rendercore
