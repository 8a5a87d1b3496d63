#pragma once

#include "rendercore/core/types.h"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace rendercore {

// Canonical z-order of the scene (back to front). New elements go on top;
// the collaborator can replace the order wholesale with setOrder().
class DrawOrder {
public:
    void clear();

    // No-op when the id is already ordered.
    void append(ElementId id);
    bool remove(ElementId id);

    // Re-ranks members by `ids`. Unknown and repeated ids are ignored; members
    // missing from `ids` keep their previous relative order after the listed ones.
    void setOrder(const ElementId* ids, std::size_t count);

    bool contains(ElementId id) const { return rank_.find(id) != rank_.end(); }

    // Smaller rank paints first. Only meaningful for members.
    std::uint32_t rankOf(ElementId id) const;

    std::size_t size() const noexcept { return rank_.size(); }

    std::vector<ElementId> ids() const;

    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (ElementId id : slots_) {
            if (id != kNoElement) fn(id);
        }
    }

private:
    // Removed slots hold kNoElement until the next compaction.
    std::vector<ElementId> slots_;
    std::unordered_map<ElementId, std::uint32_t> rank_;
    std::size_t holes_{0};

    void compactIfSparse();
    void compact();
};

} // namespace rendercore
