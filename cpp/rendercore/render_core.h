#pragma once

#include "rendercore/batch/batcher.h"
#include "rendercore/core/config.h"
#include "rendercore/core/types.h"
#include "rendercore/cull/viewport_culler.h"
#include "rendercore/generation/bulk_generator.h"
#include "rendercore/generation/layouts.h"
#include "rendercore/geometry/aabb.h"
#include "rendercore/geometry/viewport.h"
#include "rendercore/metrics/metrics_collector.h"
#include "rendercore/spatial/spatial_index.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rendercore {

struct CoreState;
class RenderCoreTestAccessor;

struct GenerationHandle {
    std::uint32_t jobId;
};

struct GenerationProgress {
    GenerationState state;
    std::uint32_t jobId;
    TestType testType;
    std::uint32_t committed;       // elements inserted into the index so far
    std::uint32_t total;
    std::uint32_t chunksCommitted;
    ElementId firstId;
    std::string error;
};

// Rendering-performance core of one canvas session. Owns the spatial index,
// the draw order, the culler, the batcher and the bulk generator; reports
// frame statistics into the session's MetricsCollector.
//
// Not thread-safe: every call comes from the interactive thread. The only
// background work is the generator worker, which never touches this object.
class RenderCore {
    friend class RenderCoreTestAccessor;
    friend CoreError dispatchCommand(RenderCore* core, std::uint32_t op, std::uint32_t id, const std::uint8_t* payload, std::uint32_t payloadByteCount);
public:
    explicit RenderCore(MetricsCollector& metrics, const CoreConfig& config = CoreConfig{});
    ~RenderCore();

    RenderCore(const RenderCore&) = delete;
    RenderCore& operator=(const RenderCore&) = delete;

    // ---- Mutation API ----

    // Non-finite or inverted bounds are refused with InvalidGeometry and the
    // element is not stored. Id 0 is reserved, as are ids a running
    // generation job has allocated but not committed (InvalidOperation).
    CoreError notifyElementAdded(ElementId id, const AABB& bounds);
    // Unknown ids are added.
    CoreError notifyElementMoved(ElementId id, const AABB& bounds);
    // Unknown ids are ignored.
    CoreError notifyElementRemoved(ElementId id);
    CoreError setElementBatchKey(ElementId id, const BatchKey& key);
    // Listed ids paint first in the given order; elements not listed keep
    // their relative order after them. Unknown ids are skipped.
    void setDrawOrder(const ElementId* ids, std::uint32_t count);
    void setDrawOrder(const std::vector<ElementId>& ids) {
        setDrawOrder(ids.data(), static_cast<std::uint32_t>(ids.size()));
    }
    // Removes every element and cancels an active generation job.
    void clear();

    ElementId allocateElementId();
    // Reserves `count` consecutive ids and returns the first, or kNoElement
    // when the id space is exhausted.
    ElementId allocateElementIds(std::uint32_t count);

    // ---- Query API ----

    const std::vector<Batch>& getVisibleBatches(const ViewportTransform& transform, const ScreenSize& screen);
    // Visible ids of the last getVisibleBatches() call, in paint order.
    const std::vector<ElementId>& getVisibleIds() const;
    std::vector<ElementId> queryArea(const AABB& area) const;
    MetricsSnapshot getMetricsSnapshot() const { return metrics_.snapshot(); }
    IndexStats getIndexStats() const;
    CullStats getLastCullStats() const;
    BatchStats getLastBatchStats() const;
    std::size_t getElementCount() const;
    bool hasElement(ElementId id) const;
    // Null for unknown ids.
    const AABB* getElementBounds(ElementId id) const;
    BatchKey getElementBatchKey(ElementId id) const;

    // ---- Frame hook ----

    void endFrame(double timestampMs, double renderTimeMs);

    // ---- Generation control ----

    GenerationHandle startGeneration(TestType type, std::uint64_t seed = kDefaultGenerationSeed);
    // Ids are always allocated here; job.firstId is overwritten.
    GenerationHandle startGenerationJob(GenerationJob job);
    bool cancelGeneration(GenerationHandle handle);
    // Commits up to `maxChunks` queued chunks and returns how many were committed.
    std::uint32_t pumpGeneration(std::uint32_t maxChunks);
    GenerationProgress getGenerationProgress() const;

    // ---- Toggles and configuration ----

    // Bits of `mask` take the corresponding bits of `value`. See PerfToggle.
    void setToggles(std::uint32_t mask, std::uint32_t value);
    std::uint32_t getToggles() const;
    void setCullMargin(double fraction);
    void setZoomRange(double minZoom, double maxZoom);
    void setQuadtreeParams(std::uint32_t capacity, std::uint32_t maxDepth, double minNodeSize);
    const CoreConfig& getConfig() const;

    // ---- Command buffer ----

    CoreError applyCommandBuffer(const std::uint8_t* bytes, std::uint32_t byteCount);
    float getLastApplyMs() const;

    CoreError getLastError() const;
    void clearError() const;

private:
    MetricsCollector& metrics_;
    std::unique_ptr<CoreState> state_;

    CoreState& state() { return *state_; }
    const CoreState& state() const { return *state_; }

    void setError(CoreError err) const;

    CoreError upsertElement(ElementId id, const AABB& bounds);
    // Refuses ids a running generation job has reserved but not committed yet.
    CoreError upsertHostElement(ElementId id, const AABB& bounds);
    bool isPendingGeneratedId(ElementId id) const;
    void removeElement(ElementId id);
    void trackNextElementId(ElementId id);
    void commitChunk(const ChunkMessage& msg);
};

} // namespace rendercore
