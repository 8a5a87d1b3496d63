#include <gtest/gtest.h>
#include "rendercore/command/commands.h"
#include "rendercore/render_core.h"
#include "tests/test_accessors.h"

#include <cstring>
#include <vector>

using namespace rendercore;

namespace {

struct Ctx { int count = 0; std::uint32_t lastOp = 0; };

CoreError countingCb(void* ctx, std::uint32_t op, std::uint32_t id, const std::uint8_t* payload, std::uint32_t payloadByteCount) {
    Ctx* c = reinterpret_cast<Ctx*>(ctx);
    (void)payload; (void)payloadByteCount; (void)id;
    c->count++;
    c->lastOp = op;
    return CoreError::Ok;
}

class CommandWriter {
public:
    explicit CommandWriter(std::uint32_t magic = commandMagicRcmd, std::uint32_t version = commandVersionRcmd) {
        pushU32(magic);
        pushU32(version);
        pushU32(0); // command count, patched in bytes()
        pushU32(0);
    }

    void command(CommandOp op, std::uint32_t id, const void* payload, std::uint32_t payloadBytes) {
        pushU32(static_cast<std::uint32_t>(op));
        pushU32(id);
        pushU32(payloadBytes);
        pushU32(0);
        const auto* p = static_cast<const std::uint8_t*>(payload);
        buf_.insert(buf_.end(), p, p + payloadBytes);
        ++count_;
    }

    void upsert(std::uint32_t id, double minX, double minY, double maxX, double maxY, std::uint32_t style = 0) {
        ElementPayload p{minX, minY, maxX, maxY, style, 0};
        command(CommandOp::UpsertElement, id, &p, sizeof(p));
    }

    void remove(std::uint32_t id) { command(CommandOp::RemoveElement, id, nullptr, 0); }

    void drawOrder(const std::vector<std::uint32_t>& ids) {
        std::vector<std::uint8_t> payload(sizeof(DrawOrderPayloadHeader) + ids.size() * 4);
        DrawOrderPayloadHeader hdr{static_cast<std::uint32_t>(ids.size()), 0};
        std::memcpy(payload.data(), &hdr, sizeof(hdr));
        if (!ids.empty()) std::memcpy(payload.data() + sizeof(hdr), ids.data(), ids.size() * 4);
        command(CommandOp::SetDrawOrder, 0, payload.data(), static_cast<std::uint32_t>(payload.size()));
    }

    std::vector<std::uint8_t> bytes() const {
        std::vector<std::uint8_t> out = buf_;
        std::memcpy(out.data() + 8, &count_, 4);
        return out;
    }

private:
    void pushU32(std::uint32_t v) {
        std::uint8_t b[4];
        std::memcpy(b, &v, 4);
        buf_.insert(buf_.end(), b, b + 4);
    }

    std::vector<std::uint8_t> buf_;
    std::uint32_t count_ = 0;
};

} // namespace

TEST(CommandsTest, ParseSingle) {
    CommandWriter w;
    w.command(CommandOp::ClearAll, 0, nullptr, 0);
    const auto buf = w.bytes();

    Ctx ctx;
    const CoreError err = parseCommandBuffer(buf.data(), static_cast<std::uint32_t>(buf.size()), &countingCb, &ctx);
    EXPECT_EQ(err, CoreError::Ok);
    EXPECT_EQ(ctx.count, 1);
    EXPECT_EQ(ctx.lastOp, static_cast<std::uint32_t>(CommandOp::ClearAll));
}

TEST(CommandsTest, RejectsBadHeader) {
    Ctx ctx;
    const auto badMagic = CommandWriter(0x43445745).bytes();
    EXPECT_EQ(parseCommandBuffer(badMagic.data(), static_cast<std::uint32_t>(badMagic.size()), &countingCb, &ctx), CoreError::InvalidMagic);

    const auto badVersion = CommandWriter(commandMagicRcmd, 9).bytes();
    EXPECT_EQ(parseCommandBuffer(badVersion.data(), static_cast<std::uint32_t>(badVersion.size()), &countingCb, &ctx), CoreError::UnsupportedVersion);

    const std::uint8_t tiny[4] = {0, 0, 0, 0};
    EXPECT_EQ(parseCommandBuffer(tiny, 4, &countingCb, &ctx), CoreError::BufferTruncated);
    EXPECT_EQ(parseCommandBuffer(nullptr, 0, &countingCb, &ctx), CoreError::BufferTruncated);
    EXPECT_EQ(ctx.count, 0);
}

TEST(CommandsTest, TruncatedPayloadStopsParsing) {
    CommandWriter w;
    w.upsert(1, 0, 0, 10, 10);
    w.upsert(2, 0, 0, 10, 10);
    auto buf = w.bytes();
    buf.resize(buf.size() - 8);

    Ctx ctx;
    EXPECT_EQ(parseCommandBuffer(buf.data(), static_cast<std::uint32_t>(buf.size()), &countingCb, &ctx), CoreError::BufferTruncated);
    EXPECT_EQ(ctx.count, 1);
}

TEST(CommandsTest, ApplyBufferMutatesCore) {
    MetricsCollector metrics;
    RenderCore core(metrics);

    CommandWriter w;
    w.upsert(10, 0, 0, 10, 10, 2);
    w.upsert(11, 20, 0, 30, 10, 2);
    w.upsert(12, 40, 0, 50, 10, 3);
    w.remove(11);
    w.drawOrder({12, 10});
    const auto buf = w.bytes();

    ASSERT_EQ(core.applyCommandBuffer(buf.data(), static_cast<std::uint32_t>(buf.size())), CoreError::Ok);
    EXPECT_EQ(core.getElementCount(), 2u);
    EXPECT_FALSE(core.hasElement(11));
    EXPECT_EQ(core.getElementBatchKey(12), (BatchKey{3, 0}));
    EXPECT_EQ(RenderCoreTestAccessor::drawOrder(core).ids(), (std::vector<ElementId>{12, 10}));
    EXPECT_GT(RenderCoreTestAccessor::nextElementId(core), 12u);
}

TEST(CommandsTest, FailingCommandKeepsEarlierOnes) {
    MetricsCollector metrics;
    RenderCore core(metrics);

    CommandWriter w;
    w.upsert(1, 0, 0, 10, 10);
    w.upsert(2, 5, 5, 0, 0); // inverted
    w.upsert(3, 0, 0, 10, 10);
    const auto buf = w.bytes();

    EXPECT_EQ(core.applyCommandBuffer(buf.data(), static_cast<std::uint32_t>(buf.size())), CoreError::InvalidGeometry);
    EXPECT_EQ(core.getLastError(), CoreError::InvalidGeometry);
    EXPECT_TRUE(core.hasElement(1));
    EXPECT_FALSE(core.hasElement(2));
    EXPECT_FALSE(core.hasElement(3));
}

TEST(CommandsTest, PayloadSizeAndUnknownOpAreErrors) {
    MetricsCollector metrics;
    RenderCore core(metrics);

    CommandWriter shortPayload;
    const std::uint32_t junk = 0;
    shortPayload.command(CommandOp::UpsertElement, 1, &junk, sizeof(junk));
    auto buf = shortPayload.bytes();
    EXPECT_EQ(core.applyCommandBuffer(buf.data(), static_cast<std::uint32_t>(buf.size())), CoreError::InvalidPayloadSize);

    CommandWriter unknown;
    unknown.command(static_cast<CommandOp>(99), 1, nullptr, 0);
    buf = unknown.bytes();
    EXPECT_EQ(core.applyCommandBuffer(buf.data(), static_cast<std::uint32_t>(buf.size())), CoreError::UnknownCommand);

    CommandWriter keyForMissing;
    BatchKeyPayload key{1, 1};
    keyForMissing.command(CommandOp::SetBatchKey, 500, &key, sizeof(key));
    buf = keyForMissing.bytes();
    EXPECT_EQ(core.applyCommandBuffer(buf.data(), static_cast<std::uint32_t>(buf.size())), CoreError::InvalidOperation);
}

TEST(CommandsTest, ClearAllEmptiesCore) {
    MetricsCollector metrics;
    RenderCore core(metrics);
    core.notifyElementAdded(1, AABB{0, 0, 1, 1});
    core.setElementBatchKey(1, BatchKey{4, 0});

    CommandWriter w;
    w.command(CommandOp::ClearAll, 0, nullptr, 0);
    const auto buf = w.bytes();
    ASSERT_EQ(core.applyCommandBuffer(buf.data(), static_cast<std::uint32_t>(buf.size())), CoreError::Ok);
    EXPECT_EQ(core.getElementCount(), 0u);
    EXPECT_EQ(RenderCoreTestAccessor::storedBatchKeys(core), 0u);
}
