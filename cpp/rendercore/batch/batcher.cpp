#include "rendercore/batch/batcher.h"

namespace rendercore {

namespace {
    BatchKey resolveKey(BatchKeyFn keyOf, void* ctx, ElementId id) {
        return keyOf ? keyOf(ctx, id) : BatchKey{0, 0};
    }
}

Batch& Batcher::openBatch(std::vector<Batch>& out, std::size_t index, const BatchKey& key) {
    if (index < out.size()) {
        Batch& b = out[index];
        b.key = key;
        b.ids.clear();
        return b;
    }
    out.push_back(Batch{key, {}});
    return out.back();
}

void Batcher::batch(const std::vector<ElementId>& visibleIds,
                    BatchKeyFn keyOf,
                    void* ctx,
                    std::vector<Batch>& out) {
    std::size_t count = 0;
    Batch* current = nullptr;
    for (ElementId id : visibleIds) {
        const BatchKey key = resolveKey(keyOf, ctx, id);
        if (!current || current->key != key) {
            current = &openBatch(out, count++, key);
        }
        current->ids.push_back(id);
    }
    out.resize(count);
    lastStats_ = BatchStats{static_cast<std::uint32_t>(count), static_cast<std::uint32_t>(visibleIds.size())};
}

void Batcher::batchEach(const std::vector<ElementId>& visibleIds,
                        BatchKeyFn keyOf,
                        void* ctx,
                        std::vector<Batch>& out) {
    std::size_t count = 0;
    for (ElementId id : visibleIds) {
        openBatch(out, count++, resolveKey(keyOf, ctx, id)).ids.push_back(id);
    }
    out.resize(count);
    lastStats_ = BatchStats{static_cast<std::uint32_t>(count), static_cast<std::uint32_t>(visibleIds.size())};
}

} // namespace rendercore
