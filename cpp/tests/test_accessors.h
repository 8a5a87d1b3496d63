#pragma once

#include "rendercore/render_core.h"
#include "rendercore/internal/core_state.h"

namespace rendercore {

class RenderCoreTestAccessor {
public:
    static const SpatialIndex& index(const RenderCore& core) {
        return core.state().index;
    }

    static const DrawOrder& drawOrder(const RenderCore& core) {
        return core.state().drawOrder;
    }

    static BulkGenerator& generator(RenderCore& core) {
        return core.state().generator;
    }

    static ElementId nextElementId(const RenderCore& core) {
        return core.state().nextElementId;
    }

    static std::size_t storedBatchKeys(const RenderCore& core) {
        return core.state().batchKeys.size();
    }
};

} // namespace rendercore
