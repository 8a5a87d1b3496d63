#ifndef RENDERCORE_GENERATION_BULK_GENERATOR_H
#define RENDERCORE_GENERATION_BULK_GENERATOR_H

#include "rendercore/core/config.h"
#include "rendercore/generation/chunk_channel.h"
#include "rendercore/generation/layouts.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace rendercore {

enum class GenerationState : std::uint8_t {
    Idle = 0,
    Generating = 1,
    Done = 2,
    Error = 3,
    Cancelled = 4,
};

const char* generationStateName(GenerationState state);

// Produces element descriptors on a background thread and hands them over in
// chunks through a bounded channel. Owns at most one worker at a time.
//
// The state machine is driven from the consumer side: start() and cancel()
// are called by the interactive thread, poll() observes worker messages.
class BulkGenerator {
public:
    explicit BulkGenerator(const GenerationConfig& config = GenerationConfig{});
    ~BulkGenerator();

    BulkGenerator(const BulkGenerator&) = delete;
    BulkGenerator& operator=(const BulkGenerator&) = delete;

    // Cancels and joins any running job, then launches `job`. Returns the new
    // job id (never 0). An invalid job moves straight to Error with no chunks.
    std::uint32_t start(const GenerationJob& job);

    // Stops the worker and discards its queued chunks. Returns false when
    // `jobId` is not the active, still-generating job.
    bool cancel(std::uint32_t jobId);

    // Non-blocking. Messages from superseded or cancelled jobs are dropped.
    bool poll(ChunkMessage& out);

    GenerationState state() const { return state_; }
    std::uint32_t activeJobId() const { return activeJobId_; }
    const std::string& lastError() const { return lastError_; }

    std::size_t pendingMessages() const { return channel_.size(); }

private:
    void run(GenerationJob job, std::uint32_t jobId);
    void stopWorker();

    GenerationConfig config_;
    ChunkChannel channel_;
    std::thread worker_;
    std::atomic<bool> cancelRequested_{false};

    GenerationState state_{GenerationState::Idle};
    std::uint32_t nextJobId_{1};
    std::uint32_t activeJobId_{0};
    std::string lastError_;
};

} // namespace rendercore

#endif // RENDERCORE_GENERATION_BULK_GENERATOR_H
