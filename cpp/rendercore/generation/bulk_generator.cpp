#include "rendercore/generation/bulk_generator.h"
#include "rendercore/core/logging.h"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

namespace rendercore {

const char* generationStateName(GenerationState state) {
    switch (state) {
        case GenerationState::Idle: return "idle";
        case GenerationState::Generating: return "generating";
        case GenerationState::Done: return "done";
        case GenerationState::Error: return "error";
        case GenerationState::Cancelled: return "cancelled";
    }
    return "unknown";
}

BulkGenerator::BulkGenerator(const GenerationConfig& config)
    : config_(sanitizeConfig(config)),
      channel_(config_.channelCapacity) {}

BulkGenerator::~BulkGenerator() {
    stopWorker();
}

void BulkGenerator::stopWorker() {
    cancelRequested_.store(true, std::memory_order_release);
    channel_.wakeProducer();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::uint32_t BulkGenerator::start(const GenerationJob& job) {
    if (activeJobId_ != 0) {
        stopWorker();
        channel_.discardJob(activeJobId_);
        RENDERCORE_LOG_DEBUG("generation: job %u superseded (was %s)", activeJobId_, generationStateName(state_));
    }

    const std::uint32_t jobId = nextJobId_++;
    if (nextJobId_ == 0) nextJobId_ = 1;
    activeJobId_ = jobId;
    lastError_.clear();

    const CoreError err = validateJob(job);
    if (err != CoreError::Ok) {
        state_ = GenerationState::Error;
        lastError_ = "invalid generation job";
        RENDERCORE_LOG_WARN("generation: job %u rejected (error %u)", jobId, static_cast<unsigned>(err));
        return jobId;
    }

    cancelRequested_.store(false, std::memory_order_release);
    state_ = GenerationState::Generating;
    try {
        worker_ = std::thread(&BulkGenerator::run, this, job, jobId);
        RENDERCORE_LOG_DEBUG("generation: job %u started (%s, %u elements, chunk %u)",
            jobId, testTypeName(job.testType), job.targetCount, job.chunkSize);
    } catch (const std::system_error& e) {
        state_ = GenerationState::Error;
        lastError_ = e.what();
        RENDERCORE_LOG_WARN("generation: failed to start worker: %s", e.what());
    }
    return jobId;
}

bool BulkGenerator::cancel(std::uint32_t jobId) {
    if (jobId == 0 || jobId != activeJobId_ || state_ != GenerationState::Generating) {
        return false;
    }
    stopWorker();
    const std::size_t dropped = channel_.discardJob(jobId);
    state_ = GenerationState::Cancelled;
    RENDERCORE_LOG_DEBUG("generation: job %u cancelled (%zu queued chunks dropped)", jobId, dropped);
    (void)dropped;
    return true;
}

bool BulkGenerator::poll(ChunkMessage& out) {
    while (channel_.tryPop(out)) {
        if (out.jobId != activeJobId_ || state_ != GenerationState::Generating) {
            continue;
        }
        if (out.kind == MessageKind::Done) {
            state_ = GenerationState::Done;
        } else if (out.kind == MessageKind::Error) {
            state_ = GenerationState::Error;
            lastError_ = out.error;
        }
        if (out.kind != MessageKind::Chunk) {
            RENDERCORE_LOG_DEBUG("generation: job %u %s", out.jobId, generationStateName(state_));
        }
        return true;
    }
    return false;
}

void BulkGenerator::run(GenerationJob job, std::uint32_t jobId) {
    try {
        std::uint32_t produced = 0;
        std::uint32_t sequence = 0;
        while (produced < job.targetCount) {
            if (cancelRequested_.load(std::memory_order_acquire)) return;

            const std::uint32_t count = std::min(job.chunkSize, job.targetCount - produced);
            ChunkMessage msg;
            msg.kind = MessageKind::Chunk;
            msg.jobId = jobId;
            msg.sequence = sequence++;
            msg.produced = produced + count;
            msg.total = job.targetCount;
            generateChunk(job, produced, count, msg.items);

            if (!channel_.push(std::move(msg), cancelRequested_)) return;
            produced += count;
            std::this_thread::yield();
        }

        ChunkMessage done;
        done.kind = MessageKind::Done;
        done.jobId = jobId;
        done.sequence = sequence;
        done.produced = produced;
        done.total = job.targetCount;
        channel_.pushTerminal(std::move(done));
    } catch (const std::exception& e) {
        ChunkMessage failed;
        failed.kind = MessageKind::Error;
        failed.jobId = jobId;
        failed.total = job.targetCount;
        failed.error = e.what();
        channel_.pushTerminal(std::move(failed));
    }
}

} // namespace rendercore
