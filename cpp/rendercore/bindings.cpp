#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "rendercore/render_core.h"

#include <cstdint>
#include <cstdlib>
#include <vector>

#ifdef EMSCRIPTEN
namespace {

using namespace rendercore;

// JS-facing session: owns the metrics collector so the host gets one object
// per canvas.
class RenderSession {
public:
    RenderSession() : core_(metrics_) {}

    std::uintptr_t allocBytes(std::uint32_t byteCount) {
        return reinterpret_cast<std::uintptr_t>(std::malloc(byteCount));
    }
    void freeBytes(std::uintptr_t ptr) {
        std::free(reinterpret_cast<void*>(ptr));
    }

    std::uint32_t applyCommandBuffer(std::uintptr_t ptr, std::uint32_t byteCount) {
        return static_cast<std::uint32_t>(core_.applyCommandBuffer(reinterpret_cast<const std::uint8_t*>(ptr), byteCount));
    }

    std::uint32_t notifyElementAdded(std::uint32_t id, double minX, double minY, double maxX, double maxY) {
        return static_cast<std::uint32_t>(core_.notifyElementAdded(id, AABB{minX, minY, maxX, maxY}));
    }
    std::uint32_t notifyElementMoved(std::uint32_t id, double minX, double minY, double maxX, double maxY) {
        return static_cast<std::uint32_t>(core_.notifyElementMoved(id, AABB{minX, minY, maxX, maxY}));
    }
    std::uint32_t notifyElementRemoved(std::uint32_t id) {
        return static_cast<std::uint32_t>(core_.notifyElementRemoved(id));
    }
    std::uint32_t setElementBatchKey(std::uint32_t id, std::uint32_t styleClass, std::uint32_t clipRegion) {
        return static_cast<std::uint32_t>(core_.setElementBatchKey(id, BatchKey{styleClass, clipRegion}));
    }
    void clear() { core_.clear(); }

    // Culls and batches, then flattens the result as [count, styleClass, clipRegion, ids...]*
    // into a buffer the host reads through getFrameBufferPtr().
    std::uint32_t buildFrame(double panX, double panY, double zoom, double width, double height) {
        const std::vector<Batch>& batches = core_.getVisibleBatches(ViewportTransform{panX, panY, zoom}, ScreenSize{width, height});
        frame_.clear();
        for (const Batch& b : batches) {
            frame_.push_back(static_cast<std::uint32_t>(b.ids.size()));
            frame_.push_back(b.key.styleClass);
            frame_.push_back(b.key.clipRegion);
            frame_.insert(frame_.end(), b.ids.begin(), b.ids.end());
        }
        return static_cast<std::uint32_t>(batches.size());
    }
    std::uintptr_t getFrameBufferPtr() const { return reinterpret_cast<std::uintptr_t>(frame_.data()); }
    std::uint32_t getFrameBufferLength() const { return static_cast<std::uint32_t>(frame_.size()); }

    void endFrame(double timestampMs, double renderTimeMs) { core_.endFrame(timestampMs, renderTimeMs); }
    MetricsSnapshot getMetricsSnapshot() const { return core_.getMetricsSnapshot(); }
    CullStats getLastCullStats() const { return core_.getLastCullStats(); }
    IndexStats getIndexStats() const { return core_.getIndexStats(); }

    std::uint32_t startGeneration(std::uint32_t testType, double seed) {
        return core_.startGeneration(static_cast<TestType>(testType), seedFromNumber(seed)).jobId;
    }
    bool cancelGeneration(std::uint32_t jobId) { return core_.cancelGeneration(GenerationHandle{jobId}); }
    std::uint32_t pumpGeneration(std::uint32_t maxChunks) { return core_.pumpGeneration(maxChunks); }
    std::uint32_t getGenerationState() const { return static_cast<std::uint32_t>(core_.getGenerationProgress().state); }
    std::uint32_t getGenerationCommitted() const { return core_.getGenerationProgress().committed; }
    std::uint32_t getGenerationTotal() const { return core_.getGenerationProgress().total; }

    void setToggles(std::uint32_t mask, std::uint32_t value) { core_.setToggles(mask, value); }
    std::uint32_t getToggles() const { return core_.getToggles(); }
    void setCullMargin(double fraction) { core_.setCullMargin(fraction); }
    void setZoomRange(double minZoom, double maxZoom) { core_.setZoomRange(minZoom, maxZoom); }
    void setQuadtreeParams(std::uint32_t capacity, std::uint32_t maxDepth, double minNodeSize) {
        core_.setQuadtreeParams(capacity, maxDepth, minNodeSize);
    }

    std::uint32_t allocateElementId() { return core_.allocateElementId(); }
    std::uint32_t getLastError() const { return static_cast<std::uint32_t>(core_.getLastError()); }

private:
    MetricsCollector metrics_;
    RenderCore core_;
    std::vector<std::uint32_t> frame_;
};

} // namespace

EMSCRIPTEN_BINDINGS(rendercore_module) {
    emscripten::enum_<TestType>("TestType")
        .value("Light", TestType::Light)
        .value("Medium", TestType::Medium)
        .value("Heavy", TestType::Heavy)
        .value("Extreme", TestType::Extreme)
        .value("Clustered", TestType::Clustered)
        .value("Grid", TestType::Grid)
        .value("Infinite", TestType::Infinite);

    emscripten::enum_<GenerationState>("GenerationState")
        .value("Idle", GenerationState::Idle)
        .value("Generating", GenerationState::Generating)
        .value("Done", GenerationState::Done)
        .value("Error", GenerationState::Error)
        .value("Cancelled", GenerationState::Cancelled);

    emscripten::class_<RenderSession>("RenderSession")
        .constructor<>()
        .function("allocBytes", &RenderSession::allocBytes)
        .function("freeBytes", &RenderSession::freeBytes)
        .function("applyCommandBuffer", &RenderSession::applyCommandBuffer)
        .function("notifyElementAdded", &RenderSession::notifyElementAdded)
        .function("notifyElementMoved", &RenderSession::notifyElementMoved)
        .function("notifyElementRemoved", &RenderSession::notifyElementRemoved)
        .function("setElementBatchKey", &RenderSession::setElementBatchKey)
        .function("clear", &RenderSession::clear)
        .function("buildFrame", &RenderSession::buildFrame)
        .function("getFrameBufferPtr", &RenderSession::getFrameBufferPtr)
        .function("getFrameBufferLength", &RenderSession::getFrameBufferLength)
        .function("endFrame", &RenderSession::endFrame)
        .function("getMetricsSnapshot", &RenderSession::getMetricsSnapshot)
        .function("getLastCullStats", &RenderSession::getLastCullStats)
        .function("getIndexStats", &RenderSession::getIndexStats)
        .function("startGeneration", &RenderSession::startGeneration)
        .function("cancelGeneration", &RenderSession::cancelGeneration)
        .function("pumpGeneration", &RenderSession::pumpGeneration)
        .function("getGenerationState", &RenderSession::getGenerationState)
        .function("getGenerationCommitted", &RenderSession::getGenerationCommitted)
        .function("getGenerationTotal", &RenderSession::getGenerationTotal)
        .function("setToggles", &RenderSession::setToggles)
        .function("getToggles", &RenderSession::getToggles)
        .function("setCullMargin", &RenderSession::setCullMargin)
        .function("setZoomRange", &RenderSession::setZoomRange)
        .function("setQuadtreeParams", &RenderSession::setQuadtreeParams)
        .function("allocateElementId", &RenderSession::allocateElementId)
        .function("getLastError", &RenderSession::getLastError);

    emscripten::value_object<MetricsSnapshot>("MetricsSnapshot")
        .field("fps", &MetricsSnapshot::fps)
        .field("renderTimeMs", &MetricsSnapshot::renderTimeMs)
        .field("elementCount", &MetricsSnapshot::elementCount)
        .field("visibleCount", &MetricsSnapshot::visibleCount);

    emscripten::value_object<CullStats>("CullStats")
        .field("totalCount", &CullStats::totalCount)
        .field("visibleCount", &CullStats::visibleCount)
        .field("culledCount", &CullStats::culledCount)
        .field("candidateCount", &CullStats::candidateCount)
        .field("cullTimeMs", &CullStats::cullTimeMs);

    emscripten::value_object<IndexStats>("IndexStats")
        .field("totalNodes", &IndexStats::totalNodes)
        .field("leafNodes", &IndexStats::leafNodes)
        .field("maxDepth", &IndexStats::maxDepth)
        .field("totalElements", &IndexStats::totalElements);
}
#endif
