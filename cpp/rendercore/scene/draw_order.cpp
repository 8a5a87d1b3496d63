#include "rendercore/scene/draw_order.h"

#include <unordered_set>

namespace rendercore {

namespace {
    constexpr std::size_t kMinHolesBeforeCompact = 1024;
}

void DrawOrder::clear() {
    slots_.clear();
    rank_.clear();
    holes_ = 0;
}

void DrawOrder::append(ElementId id) {
    if (id == kNoElement || contains(id)) return;
    rank_.emplace(id, static_cast<std::uint32_t>(slots_.size()));
    slots_.push_back(id);
}

bool DrawOrder::remove(ElementId id) {
    auto it = rank_.find(id);
    if (it == rank_.end()) return false;
    slots_[it->second] = kNoElement;
    rank_.erase(it);
    ++holes_;
    compactIfSparse();
    return true;
}

void DrawOrder::setOrder(const ElementId* ids, std::size_t count) {
    std::vector<ElementId> next;
    next.reserve(rank_.size());
    std::unordered_set<ElementId> placed;
    placed.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        const ElementId id = ids[i];
        if (!contains(id)) continue;
        if (!placed.insert(id).second) continue;
        next.push_back(id);
    }
    for (ElementId id : slots_) {
        if (id == kNoElement) continue;
        if (placed.find(id) != placed.end()) continue;
        next.push_back(id);
    }

    slots_ = std::move(next);
    holes_ = 0;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        rank_[slots_[i]] = static_cast<std::uint32_t>(i);
    }
}

std::uint32_t DrawOrder::rankOf(ElementId id) const {
    auto it = rank_.find(id);
    return it == rank_.end() ? 0u : it->second;
}

std::vector<ElementId> DrawOrder::ids() const {
    std::vector<ElementId> out;
    out.reserve(rank_.size());
    forEach([&](ElementId id) { out.push_back(id); });
    return out;
}

void DrawOrder::compactIfSparse() {
    if (holes_ < kMinHolesBeforeCompact) return;
    if (holes_ * 2 < slots_.size()) return;
    compact();
}

void DrawOrder::compact() {
    std::size_t w = 0;
    for (std::size_t r = 0; r < slots_.size(); ++r) {
        const ElementId id = slots_[r];
        if (id == kNoElement) continue;
        slots_[w] = id;
        rank_[id] = static_cast<std::uint32_t>(w);
        ++w;
    }
    slots_.resize(w);
    holes_ = 0;
}

} // namespace rendercore
