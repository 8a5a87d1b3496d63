#pragma once

#include "rendercore/batch/batcher.h"
#include "rendercore/core/config.h"
#include "rendercore/core/types.h"
#include "rendercore/cull/viewport_culler.h"
#include "rendercore/generation/bulk_generator.h"
#include "rendercore/generation/layouts.h"
#include "rendercore/scene/draw_order.h"
#include "rendercore/spatial/spatial_index.h"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace rendercore {

struct CoreState {
    explicit CoreState(const CoreConfig& config);

    CoreState(const CoreState&) = delete;
    CoreState& operator=(const CoreState&) = delete;

    CoreConfig config;

    SpatialIndex index;
    DrawOrder drawOrder;
    ViewportCuller culler;
    Batcher batcher;
    BulkGenerator generator;

    // Only non-default keys are stored.
    std::unordered_map<ElementId, BatchKey> batchKeys;

    std::vector<ElementId> visibleIds;
    std::vector<Batch> batches;

    // Progress of the most recent generation job, as seen by the committer.
    TestType genTestType{TestType::Light};
    std::uint32_t genCommitted{0};
    std::uint32_t genTotal{0};
    std::uint32_t genChunksCommitted{0};
    ElementId genFirstId{kNoElement};
    std::string genError;

    ElementId nextElementId{1};
    float lastApplyMs{0.0f};

    mutable CoreError lastError{CoreError::Ok};
};

} // namespace rendercore
