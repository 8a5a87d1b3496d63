#include "rendercore/render_core.h"
#include "rendercore/core/logging.h"
#include "rendercore/internal/core_state.h"

namespace rendercore {

void RenderCore::trackNextElementId(ElementId id) {
    CoreState& s = state();
    if (id >= s.nextElementId && id != 0xFFFFFFFFu) {
        s.nextElementId = id + 1;
    }
}

CoreError RenderCore::upsertElement(ElementId id, const AABB& bounds) {
    if (id == kNoElement) {
        setError(CoreError::InvalidOperation);
        return CoreError::InvalidOperation;
    }
    if (!isValid(bounds)) {
        RENDERCORE_LOG_WARN("element %u: rejected bounds [%g, %g, %g, %g]",
            id, bounds.minX, bounds.minY, bounds.maxX, bounds.maxY);
        setError(CoreError::InvalidGeometry);
        return CoreError::InvalidGeometry;
    }

    CoreState& s = state();
    if (!s.index.insert(id, bounds)) {
        setError(CoreError::InvalidGeometry);
        return CoreError::InvalidGeometry;
    }
    s.drawOrder.append(id);
    trackNextElementId(id);
    return CoreError::Ok;
}

void RenderCore::removeElement(ElementId id) {
    CoreState& s = state();
    s.index.remove(id);
    s.drawOrder.remove(id);
    s.batchKeys.erase(id);
}

bool RenderCore::isPendingGeneratedId(ElementId id) const {
    const CoreState& s = state();
    if (s.generator.state() != GenerationState::Generating) return false;
    const std::uint64_t first = static_cast<std::uint64_t>(s.genFirstId) + s.genCommitted;
    const std::uint64_t end = static_cast<std::uint64_t>(s.genFirstId) + s.genTotal;
    return id >= first && id < end;
}

CoreError RenderCore::upsertHostElement(ElementId id, const AABB& bounds) {
    if (isPendingGeneratedId(id)) {
        RENDERCORE_LOG_WARN("element %u: id reserved by generation job %u", id, state().generator.activeJobId());
        setError(CoreError::InvalidOperation);
        return CoreError::InvalidOperation;
    }
    return upsertElement(id, bounds);
}

CoreError RenderCore::notifyElementAdded(ElementId id, const AABB& bounds) {
    return upsertHostElement(id, bounds);
}

CoreError RenderCore::notifyElementMoved(ElementId id, const AABB& bounds) {
    return upsertHostElement(id, bounds);
}

CoreError RenderCore::notifyElementRemoved(ElementId id) {
    if (id == kNoElement) return CoreError::Ok;
    removeElement(id);
    return CoreError::Ok;
}

CoreError RenderCore::setElementBatchKey(ElementId id, const BatchKey& key) {
    CoreState& s = state();
    if (!s.index.contains(id)) {
        setError(CoreError::InvalidOperation);
        return CoreError::InvalidOperation;
    }
    if (key == BatchKey{0, 0}) {
        s.batchKeys.erase(id);
    } else {
        s.batchKeys[id] = key;
    }
    return CoreError::Ok;
}

void RenderCore::setDrawOrder(const ElementId* ids, std::uint32_t count) {
    if (!ids && count > 0) return;
    state().drawOrder.setOrder(ids, count);
}

void RenderCore::clear() {
    CoreState& s = state();
    const std::uint32_t jobId = s.generator.activeJobId();
    if (s.generator.state() == GenerationState::Generating) {
        s.generator.cancel(jobId);
    }
    s.index.clear();
    s.drawOrder.clear();
    s.batchKeys.clear();
    s.visibleIds.clear();
    s.batches.clear();
    RENDERCORE_LOG_DEBUG("core: cleared");
}

ElementId RenderCore::allocateElementId() {
    return allocateElementIds(1);
}

ElementId RenderCore::allocateElementIds(std::uint32_t count) {
    CoreState& s = state();
    if (count == 0) return s.nextElementId;
    if (static_cast<std::uint64_t>(s.nextElementId) + count > 0xFFFFFFFFull) {
        setError(CoreError::InvalidOperation);
        return kNoElement;
    }
    const ElementId first = s.nextElementId;
    s.nextElementId += count;
    return first;
}

std::vector<ElementId> RenderCore::queryArea(const AABB& area) const {
    std::vector<ElementId> out;
    state().index.query(area, out);
    return out;
}

IndexStats RenderCore::getIndexStats() const {
    return state().index.getStats();
}

std::size_t RenderCore::getElementCount() const {
    return state().index.size();
}

bool RenderCore::hasElement(ElementId id) const {
    return state().index.contains(id);
}

const AABB* RenderCore::getElementBounds(ElementId id) const {
    return state().index.boundsOf(id);
}

BatchKey RenderCore::getElementBatchKey(ElementId id) const {
    const CoreState& s = state();
    const auto it = s.batchKeys.find(id);
    return it == s.batchKeys.end() ? BatchKey{0, 0} : it->second;
}

} // namespace rendercore
