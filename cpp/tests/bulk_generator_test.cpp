#include <gtest/gtest.h>
#include "rendercore/generation/bulk_generator.h"
#include "rendercore/generation/chunk_channel.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace rendercore;

namespace {

// Polls until a message arrives or the deadline passes.
bool waitForMessage(BulkGenerator& gen, ChunkMessage& out, int timeoutMs = 5000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (gen.poll(out)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return false;
}

GenerationJob smallJob(std::uint32_t count, std::uint32_t chunkSize) {
    GenerationJob job = makeGenerationJob(TestType::Light, 77);
    job.targetCount = count;
    job.chunkSize = chunkSize;
    return job;
}

} // namespace

TEST(ChunkChannelTest, PushBlocksWhenFullUntilPopped) {
    ChunkChannel channel(1);
    std::atomic<bool> cancelled{false};
    ASSERT_TRUE(channel.push(ChunkMessage{}, cancelled));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        ChunkMessage msg;
        msg.sequence = 1;
        pushed.store(channel.push(std::move(msg), cancelled));
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(pushed.load());

    ChunkMessage first;
    ASSERT_TRUE(channel.tryPop(first));
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(channel.size(), 1u);
}

TEST(ChunkChannelTest, CancelReleasesBlockedProducer) {
    ChunkChannel channel(1);
    std::atomic<bool> cancelled{false};
    ASSERT_TRUE(channel.push(ChunkMessage{}, cancelled));

    bool result = true;
    std::thread producer([&] { result = channel.push(ChunkMessage{}, cancelled); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    cancelled.store(true);
    channel.wakeProducer();
    producer.join();

    EXPECT_FALSE(result);
    EXPECT_EQ(channel.size(), 1u);
}

TEST(ChunkChannelTest, TerminalMessagesIgnoreCapacityAndDiscardFiltersByJob) {
    ChunkChannel channel(1);
    std::atomic<bool> cancelled{false};
    ChunkMessage a;
    a.jobId = 1;
    ASSERT_TRUE(channel.push(std::move(a), cancelled));
    ChunkMessage done;
    done.kind = MessageKind::Done;
    done.jobId = 2;
    channel.pushTerminal(std::move(done));
    EXPECT_EQ(channel.size(), 2u);

    EXPECT_EQ(channel.discardJob(1), 1u);
    ChunkMessage out;
    ASSERT_TRUE(channel.tryPop(out));
    EXPECT_EQ(out.kind, MessageKind::Done);
    EXPECT_EQ(out.jobId, 2u);
    EXPECT_FALSE(channel.tryPop(out));
}

TEST(BulkGeneratorTest, EmitsChunksInOrderThenDone) {
    BulkGenerator gen;
    const std::uint32_t jobId = gen.start(smallJob(2500, 1000));
    EXPECT_NE(jobId, 0u);
    EXPECT_EQ(gen.state(), GenerationState::Generating);

    std::vector<std::uint32_t> sizes;
    ChunkMessage msg;
    while (waitForMessage(gen, msg)) {
        EXPECT_EQ(msg.jobId, jobId);
        if (msg.kind != MessageKind::Chunk) break;
        EXPECT_EQ(msg.sequence, sizes.size());
        sizes.push_back(static_cast<std::uint32_t>(msg.items.size()));
    }
    EXPECT_EQ(msg.kind, MessageKind::Done);
    EXPECT_EQ(sizes, (std::vector<std::uint32_t>{1000, 1000, 500}));
    EXPECT_EQ(gen.state(), GenerationState::Done);
}

TEST(BulkGeneratorTest, ChunksMatchPureGeneration) {
    const GenerationJob job = smallJob(1200, 500);
    BulkGenerator gen;
    gen.start(job);

    std::vector<ElementDescriptor> received;
    ChunkMessage msg;
    while (waitForMessage(gen, msg) && msg.kind == MessageKind::Chunk) {
        received.insert(received.end(), msg.items.begin(), msg.items.end());
    }
    ASSERT_EQ(received.size(), job.targetCount);
    for (std::uint32_t i = 0; i < job.targetCount; ++i) {
        const ElementDescriptor expected = generateElement(job, i);
        EXPECT_EQ(received[i].id, expected.id);
        EXPECT_EQ(received[i].bounds, expected.bounds);
    }
}

TEST(BulkGeneratorTest, CancelStopsFurtherChunks) {
    GenerationConfig cfg;
    cfg.channelCapacity = 2;
    BulkGenerator gen(cfg);
    const std::uint32_t jobId = gen.start(smallJob(50000, 100));

    ChunkMessage msg;
    ASSERT_TRUE(waitForMessage(gen, msg));
    EXPECT_EQ(msg.kind, MessageKind::Chunk);

    EXPECT_TRUE(gen.cancel(jobId));
    EXPECT_EQ(gen.state(), GenerationState::Cancelled);
    EXPECT_FALSE(gen.poll(msg));
    EXPECT_EQ(gen.pendingMessages(), 0u);
    EXPECT_FALSE(gen.cancel(jobId));
    EXPECT_STREQ(generationStateName(gen.state()), "cancelled");
}

TEST(BulkGeneratorTest, StartSupersedesRunningJob) {
    GenerationConfig cfg;
    cfg.channelCapacity = 1;
    BulkGenerator gen(cfg);
    const std::uint32_t first = gen.start(smallJob(100000, 10));
    const std::uint32_t second = gen.start(smallJob(30, 10));
    EXPECT_NE(first, second);
    EXPECT_FALSE(gen.cancel(first));

    ChunkMessage msg;
    std::uint32_t chunks = 0;
    while (waitForMessage(gen, msg)) {
        EXPECT_EQ(msg.jobId, second);
        if (msg.kind != MessageKind::Chunk) break;
        ++chunks;
    }
    EXPECT_EQ(chunks, 3u);
    EXPECT_EQ(gen.state(), GenerationState::Done);
    EXPECT_STREQ(generationStateName(gen.state()), "done");
}

TEST(BulkGeneratorTest, InvalidJobFailsWithoutChunks) {
    BulkGenerator gen;
    GenerationJob job = smallJob(100, 10);
    job.region.regions.clear();
    job.region.layout = LayoutKind::MultiRegion;
    gen.start(job);
    EXPECT_EQ(gen.state(), GenerationState::Error);
    EXPECT_FALSE(gen.lastError().empty());

    ChunkMessage msg;
    EXPECT_FALSE(gen.poll(msg));
}

TEST(BulkGeneratorTest, EmptyJobCompletesImmediately) {
    BulkGenerator gen;
    gen.start(smallJob(0, 10));
    ChunkMessage msg;
    ASSERT_TRUE(waitForMessage(gen, msg));
    EXPECT_EQ(msg.kind, MessageKind::Done);
    EXPECT_EQ(gen.state(), GenerationState::Done);
}

TEST(BulkGeneratorTest, DestructorJoinsBlockedWorker) {
    GenerationConfig cfg;
    cfg.channelCapacity = 1;
    {
        BulkGenerator gen(cfg);
        gen.start(smallJob(100000, 10));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    SUCCEED();
}
