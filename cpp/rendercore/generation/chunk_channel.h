#ifndef RENDERCORE_GENERATION_CHUNK_CHANNEL_H
#define RENDERCORE_GENERATION_CHUNK_CHANNEL_H

#include "rendercore/generation/layouts.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace rendercore {

enum class MessageKind : std::uint8_t {
    Chunk = 0,
    Done = 1,
    Error = 2,
};

struct ChunkMessage {
    MessageKind kind{MessageKind::Chunk};
    std::uint32_t jobId{0};
    std::uint32_t sequence{0};  // chunk index within the job
    std::uint32_t produced{0};  // elements generated so far, this chunk included
    std::uint32_t total{0};
    std::vector<ElementDescriptor> items;
    std::string error;
};

// Bounded single-producer/single-consumer queue between a generation worker
// and the interactive thread. Chunk pushes block while the queue holds
// `capacity` messages; terminal messages (Done/Error) never block.
class ChunkChannel {
public:
    explicit ChunkChannel(std::size_t capacity);

    ChunkChannel(const ChunkChannel&) = delete;
    ChunkChannel& operator=(const ChunkChannel&) = delete;

    // Returns false without enqueuing when `cancelled` is raised while waiting.
    bool push(ChunkMessage&& msg, const std::atomic<bool>& cancelled);
    void pushTerminal(ChunkMessage&& msg);

    bool tryPop(ChunkMessage& out);

    // Wakes a producer blocked in push() so it can observe its cancel flag.
    void wakeProducer();

    // Drops every queued message belonging to `jobId`. Returns the number dropped.
    std::size_t discardJob(std::uint32_t jobId);

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notFull_;
    std::deque<ChunkMessage> queue_;
};

} // namespace rendercore

#endif // RENDERCORE_GENERATION_CHUNK_CHANNEL_H
