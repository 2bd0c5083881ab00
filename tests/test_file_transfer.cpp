/*
 * Chunked transfer: byte-exact delivery, statement accounting, aborts.
 */
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "../src/file_transfer.hpp"
#include "../src/flash_errors.hpp"
#include "fake_badge.hpp"
#include "test_harness.hpp"

static ReplTiming fastTiming()
{
    ReplTiming t;
    t.interruptGapMs = 0;
    t.settleMs = 0;
    t.bannerTimeoutMs = 100;
    t.execTimeoutMs = 100;
    t.writeGapMs = 0;
    t.rebootPauseMs = 0;
    return t;
}

// Deterministic bytes covering the full 0..255 range, quotes and control codes included.
static std::vector<uint8_t> pattern(size_t n)
{
    std::vector<uint8_t> v(n);
    uint32_t x = 0x12345678u;
    for (size_t i = 0; i < n; ++i)
    {
        x = x * 1103515245u + 12345u;
        v[i] = static_cast<uint8_t>(x >> 16);
    }
    return v;
}

static TransferPlan planFor(const std::vector<uint8_t> &payload, int chunk)
{
    TransferPlan plan;
    plan.destPath = "/main.py";
    plan.payload = payload;
    plan.chunkBytes = chunk;
    return plan;
}

struct Rig
{
    FakeBadge badge;
    FakeLink link;
    RawReplController repl;
    Rig() : link(badge), repl(link, fastTiming())
    {
        repl.interrupt();
        repl.enterRawMode();
    }
};

TEST(payload_arrives_byte_for_byte_across_chunk_boundaries) {
    const int chunk = 64;
    const size_t sizes[] = {0, 1, 63, 64, 65, 128, 5 * 64 + 7};
    for (size_t n : sizes)
    {
        Rig rig;
        std::vector<uint8_t> payload = pattern(n);
        TransferPlan plan = planFor(payload, chunk);
        ChunkedTransfer transfer(rig.repl, plan);
        TransferReport r = transfer.run();
        ASSERT_TRUE(rig.badge.files.count("/main.py") == 1);
        ASSERT_TRUE(rig.badge.files["/main.py"] == payload);
        ASSERT_TRUE(rig.badge.files.count("/main.py.tmp") == 0);
        ASSERT_EQ((n + chunk - 1) / chunk, r.chunks);
        ASSERT_EQ(n, r.bytes);
    }
}

TEST(empty_payload_makes_empty_file) {
    Rig rig;
    rig.badge.files["/main.py"] = pattern(10);
    TransferPlan plan = planFor(std::vector<uint8_t>(), 192);
    ChunkedTransfer transfer(rig.repl, plan);
    TransferReport r = transfer.run();
    ASSERT_EQ(0, rig.badge.writes);
    ASSERT_EQ(2, r.statements);
    ASSERT_TRUE(rig.badge.files["/main.py"].empty());
}

TEST(fifty_kb_in_512_byte_chunks_statement_count) {
    Rig rig;
    std::vector<uint8_t> payload = pattern(50000);
    TransferPlan plan = planFor(payload, 512);
    ChunkedTransfer transfer(rig.repl, plan);
    size_t progressCalls = 0;
    transfer.setProgress([&progressCalls](size_t, size_t) { ++progressCalls; });
    TransferReport r = transfer.run();
    ASSERT_EQ(98, rig.badge.writes); // ceil(50000 / 512)
    ASSERT_EQ(1, rig.badge.opens);
    ASSERT_EQ(1, rig.badge.closes);
    ASSERT_EQ(100, r.statements);
    ASSERT_EQ(98u, progressCalls);
    ASSERT_TRUE(rig.badge.files["/main.py"] == payload);
}

TEST(failed_chunk_aborts_and_keeps_old_file) {
    Rig rig;
    std::vector<uint8_t> old = pattern(300);
    rig.badge.files["/main.py"] = old;
    rig.badge.failWriteAt = 2;
    TransferPlan plan = planFor(pattern(1000), 100);
    ChunkedTransfer transfer(rig.repl, plan);
    try
    {
        transfer.run();
        throw std::runtime_error("expected DeviceExecutionError");
    }
    catch (const DeviceExecutionError &e)
    {
        ASSERT_TRUE(e.text().find("incorrect padding") != std::string::npos);
    }
    ASSERT_EQ(3, rig.badge.writes); // nothing after the failing chunk
    ASSERT_EQ(0, rig.badge.closes);
    ASSERT_EQ(1, rig.badge.aborts);
    ASSERT_TRUE(rig.badge.files["/main.py"] == old);
    ASSERT_TRUE(rig.badge.files.count("/main.py.tmp") == 0);
}

TEST(direct_write_when_not_atomic) {
    Rig rig;
    std::vector<uint8_t> payload = pattern(500);
    TransferPlan plan = planFor(payload, 192);
    plan.atomic = false;
    ChunkedTransfer transfer(rig.repl, plan);
    transfer.run();
    ASSERT_TRUE(rig.badge.files["/main.py"] == payload);
    for (const auto &s : rig.badge.statements)
        ASSERT_TRUE(s.find("/main.py.tmp") == std::string::npos);
}

TEST(plan_rejects_chunks_over_the_line_limit) {
    TransferPlan plan = planFor(pattern(10), 512);
    plan.maxLineBytes = 700; // 684 base64 chars + statement overhead
    ASSERT_THROWS(plan.validate(), std::invalid_argument);
    plan.maxLineBytes = 1024;
    plan.validate();

    TransferPlan relative = planFor(pattern(10), 64);
    relative.destPath = "main.py";
    ASSERT_THROWS(relative.validate(), std::invalid_argument);

    TransferPlan zero = planFor(pattern(10), 0);
    ASSERT_THROWS(zero.validate(), std::invalid_argument);
}

TEST(every_statement_fits_the_line_limit) {
    Rig rig;
    TransferPlan plan = planFor(pattern(2000), 192);
    ChunkedTransfer transfer(rig.repl, plan);
    transfer.run();
    for (const auto &s : rig.badge.statements)
        ASSERT_TRUE(s.size() < static_cast<size_t>(plan.maxLineBytes));
    ASSERT_EQ(plan.writeStatementLength(), rig.badge.statements[1].size());
}

int main() {
    std::cout << "=== Chunked Transfer Tests ===" << std::endl;
    RUN_TEST(payload_arrives_byte_for_byte_across_chunk_boundaries);
    RUN_TEST(empty_payload_makes_empty_file);
    RUN_TEST(fifty_kb_in_512_byte_chunks_statement_count);
    RUN_TEST(failed_chunk_aborts_and_keeps_old_file);
    RUN_TEST(direct_write_when_not_atomic);
    RUN_TEST(plan_rejects_chunks_over_the_line_limit);
    RUN_TEST(every_statement_fits_the_line_limit);
    TEST_SUMMARY();
}
