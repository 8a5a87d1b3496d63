#pragma once

#include "rendercore/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rendercore {

// Draw-state compatibility supplied by the caller. Two elements with equal
// keys can share one draw call; the batcher never looks inside.
struct BatchKey {
    std::uint32_t styleClass;
    std::uint32_t clipRegion;
};

inline bool operator==(const BatchKey& a, const BatchKey& b) {
    return a.styleClass == b.styleClass && a.clipRegion == b.clipRegion;
}

inline bool operator!=(const BatchKey& a, const BatchKey& b) {
    return !(a == b);
}

struct Batch {
    BatchKey key;
    std::vector<ElementId> ids;
};

using BatchKeyFn = BatchKey(*)(void* ctx, ElementId id);

struct BatchStats {
    std::uint32_t batchCount;
    std::uint32_t elementCount;
};

class Batcher {
public:
    // Greedy run grouping: a new batch starts whenever the key changes from the
    // previous element. Paint order is preserved; nothing is reordered.
    // A null keyOf puts every element under the default key.
    void batch(const std::vector<ElementId>& visibleIds,
               BatchKeyFn keyOf,
               void* ctx,
               std::vector<Batch>& out);

    // Batching disabled: one batch per element, same order.
    void batchEach(const std::vector<ElementId>& visibleIds,
                   BatchKeyFn keyOf,
                   void* ctx,
                   std::vector<Batch>& out);

    BatchStats getLastStats() const { return lastStats_; }

private:
    BatchStats lastStats_{0, 0};

    // Reuses the id storage of batches from the previous frame.
    static Batch& openBatch(std::vector<Batch>& out, std::size_t index, const BatchKey& key);
};

} // namespace rendercore
