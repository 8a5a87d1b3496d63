#include "rendercore/generation/chunk_channel.h"

#include <algorithm>

namespace rendercore {

ChunkChannel::ChunkChannel(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool ChunkChannel::push(ChunkMessage&& msg, const std::atomic<bool>& cancelled) {
    std::unique_lock<std::mutex> lock(mutex_);
    notFull_.wait(lock, [&] {
        return cancelled.load(std::memory_order_acquire) || queue_.size() < capacity_;
    });
    if (cancelled.load(std::memory_order_acquire)) return false;
    queue_.push_back(std::move(msg));
    return true;
}

void ChunkChannel::pushTerminal(ChunkMessage&& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(msg));
}

bool ChunkChannel::tryPop(ChunkMessage& out) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
    }
    notFull_.notify_one();
    return true;
}

void ChunkChannel::wakeProducer() {
    // Empty critical section: a producer between predicate and wait must not miss this.
    { std::lock_guard<std::mutex> lock(mutex_); }
    notFull_.notify_all();
}

std::size_t ChunkChannel::discardJob(std::uint32_t jobId) {
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto before = queue_.size();
        queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                    [jobId](const ChunkMessage& m) { return m.jobId == jobId; }),
                     queue_.end());
        dropped = before - queue_.size();
    }
    if (dropped > 0) notFull_.notify_all();
    return dropped;
}

std::size_t ChunkChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace rendercore
