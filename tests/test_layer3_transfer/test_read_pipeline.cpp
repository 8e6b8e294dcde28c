// tests/test_layer3_transfer/test_read_pipeline.cpp
/**
 * @file test_read_pipeline.cpp
 * @brief Device -> stream pipeline against MemoryBlockDevice: ordering under skewed worker
 *        latency, fail-fast, and the short/empty read rules.
 */
#include "bp_transfer.hpp"
#include "shared_test_helpers.h"
#include "test_transfer_fakes.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <random>
#include <thread>

using namespace blkpipe::transfer;
using namespace blkpipe::tests::helper;
using namespace std::chrono_literals;
using namespace ::testing;

class ReadPipelineTest : public ::testing::Test
{
  protected:
    PipelineOptions options(uint32_t block, size_t workers)
    {
        PipelineOptions opts;
        opts.block_size = block;
        opts.workers = workers;
        opts.progress_interval = 5ms;
        opts.progress_output = progress_.output();
        return opts;
    }

    LineCollector progress_;
};

TEST_F(ReadPipelineTest, CopiesDeviceInOrder)
{
    const auto data = make_pattern(1'000'000, 1);
    MemoryBlockDevice device(data, 65536);
    VectorByteSink sink;

    auto result = run_read_pipeline(options(65536, 4), device, sink);
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(sink.data(), data);
    EXPECT_EQ(result.content().total_bytes, 1'000'000u);
    EXPECT_EQ(result.content().bytes_transferred, 1'000'000u);
    EXPECT_EQ(result.content().chunk_count, 16u);
}

// Later chunks finish first; the output must still be in device order.
TEST_F(ReadPipelineTest, ReverseLatencyKeepsOrder)
{
    constexpr uint32_t kBlock = 1000;
    constexpr uint64_t kChunks = 12;
    const auto data = make_pattern(kBlock * kChunks, 2);
    MemoryBlockDevice device(data, kBlock);
    device.set_delay([](uint64_t idx) { return std::chrono::milliseconds((kChunks - idx) * 3); });
    VectorByteSink sink;

    auto result = run_read_pipeline(options(kBlock, 4), device, sink);
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(sink.data(), data);
    EXPECT_GT(device.max_concurrency(), 1u);
    EXPECT_LE(device.max_concurrency(), 4u);
}

TEST_F(ReadPipelineTest, RandomLatencyKeepsOrder)
{
    constexpr uint32_t kBlock = 4096;
    const auto data = make_pattern(kBlock * 40 + 123, 3);
    MemoryBlockDevice device(data, kBlock);
    std::vector<int> delays(41);
    std::mt19937 rng(7);
    for (auto &d : delays)
        d = static_cast<int>(rng() % 6);
    device.set_delay([delays](uint64_t idx) { return std::chrono::milliseconds(delays[idx]); });
    VectorByteSink sink;

    auto result = run_read_pipeline(options(kBlock, 8), device, sink);
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(sink.data(), data);
    EXPECT_EQ(result.content().chunk_count, 41u);
}

TEST_F(ReadPipelineTest, SingleWorkerIsSequential)
{
    const auto data = make_pattern(10'000, 4);
    MemoryBlockDevice device(data, 1024);
    VectorByteSink sink;

    ASSERT_TRUE(run_read_pipeline(options(1024, 1), device, sink).is_ok());
    EXPECT_EQ(sink.data(), data);
    EXPECT_EQ(device.max_concurrency(), 1u);
}

// Chunk 4 of 10 fails: the transfer stops, nothing past the failed chunk is emitted and
// few chunks beyond it are even attempted.
TEST_F(ReadPipelineTest, ChunkFailureStopsTransfer)
{
    constexpr uint32_t kBlock = 1'000'000;
    constexpr size_t kWorkers = 4;
    const auto data = make_pattern(10'000'000, 5);
    MemoryBlockDevice device(data, kBlock);
    device.fail_chunk(4);
    device.set_delay([](uint64_t idx) { return idx == 4 ? 0ms : 20ms; });
    VectorByteSink sink;

    auto result = run_read_pipeline(options(kBlock, kWorkers), device, sink);
    ASSERT_TRUE(result.is_error());
    const auto &err = result.error();
    EXPECT_EQ(err.kind, TransferErrorKind::ChunkIo);
    ASSERT_TRUE(err.chunk_index.has_value());
    EXPECT_EQ(*err.chunk_index, 4u);
    EXPECT_EQ(err.offset, 4'000'000u);
    EXPECT_EQ(err.sys_errno, EIO);
    EXPECT_THAT(err.describe(), HasSubstr("chunk 4 at offset 4000000: read failed"));

    const auto attempted = device.attempted_chunks();
    const auto beyond = std::count_if(attempted.begin(), attempted.end(),
                                      [](uint64_t idx) { return idx > 4; });
    EXPECT_LE(static_cast<size_t>(beyond), kWorkers);

    ASSERT_LE(sink.data().size(), 4 * static_cast<size_t>(kBlock));
    EXPECT_TRUE(std::equal(sink.data().begin(), sink.data().end(), data.begin()));
}

// The failing chunk is also the slowest one: while it is outstanding the rest of the device
// must not be read ahead of it.
TEST_F(ReadPipelineTest, SlowFailingChunkHoldsBackLaterReads)
{
    constexpr uint32_t kBlock = 1024;
    constexpr size_t kWorkers = 2;
    const auto data = make_pattern(kBlock * 1000, 31);
    MemoryBlockDevice device(data, kBlock);
    device.fail_chunk(4);
    device.set_delay([](uint64_t idx) { return idx == 4 ? 300ms : 0ms; });
    VectorByteSink sink;

    auto result = run_read_pipeline(options(kBlock, kWorkers), device, sink);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, TransferErrorKind::ChunkIo);
    EXPECT_EQ(result.error().chunk_index, 4u);

    const auto attempted = device.attempted_chunks();
    const auto beyond = std::count_if(attempted.begin(), attempted.end(),
                                      [](uint64_t idx) { return idx > 4; });
    EXPECT_LE(static_cast<size_t>(beyond), kWorkers);
    EXPECT_EQ(sink.data().size(), 4u * kBlock);
    EXPECT_TRUE(std::equal(sink.data().begin(), sink.data().end(), data.begin()));
}

// A slow chunk that succeeds: reads started while it is outstanding stay within one chunk per
// worker past it, so the reorder stage never holds more than that.
TEST_F(ReadPipelineTest, SlowChunkLimitsReadAhead)
{
    constexpr uint32_t kBlock = 512;
    constexpr size_t kWorkers = 3;
    constexpr uint64_t kSlow = 2;
    const auto data = make_pattern(kBlock * 300, 32);
    MemoryBlockDevice device(data, kBlock);

    std::atomic<bool> slow_done{false};
    std::atomic<uint64_t> furthest_while_slow{0};
    device.set_delay(
        [&](uint64_t idx)
        {
            if (idx == kSlow)
            {
                std::this_thread::sleep_for(200ms);
                slow_done = true;
                return 0ms;
            }
            if (!slow_done.load())
            {
                uint64_t prev = furthest_while_slow.load();
                while (idx > prev && !furthest_while_slow.compare_exchange_weak(prev, idx))
                {
                }
            }
            return 0ms;
        });
    VectorByteSink sink;

    auto result = run_read_pipeline(options(kBlock, kWorkers), device, sink);
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(sink.data(), data);
    EXPECT_LE(furthest_while_slow.load(), kSlow + kWorkers);
}

TEST_F(ReadPipelineTest, FirstChunkFailureEmitsNothing)
{
    MemoryBlockDevice device(make_pattern(8192, 6), 1024);
    device.fail_chunk(0);
    VectorByteSink sink;

    auto result = run_read_pipeline(options(1024, 2), device, sink);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().chunk_index, 0u);
    EXPECT_TRUE(sink.data().empty());
}

// The device reports 10 chunks but data ends inside chunk 6.
TEST_F(ReadPipelineTest, ShortReadOfInnerChunkFails)
{
    MemoryBlockDevice device(make_pattern(10 * 1024, 7), 1024);
    device.truncate_reads_at(6 * 1024 + 100);
    VectorByteSink sink;

    auto result = run_read_pipeline(options(1024, 1), device, sink);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, TransferErrorKind::ShortRead);
    EXPECT_EQ(result.error().chunk_index, 6u);
    EXPECT_THAT(result.error().detail, HasSubstr("short read: 100 of 1024 bytes"));
    EXPECT_EQ(sink.data().size(), 6u * 1024);
}

TEST_F(ReadPipelineTest, ReadPastDataIsEmptyReadError)
{
    MemoryBlockDevice device(make_pattern(4 * 1024, 8), 1024);
    device.truncate_reads_at(2 * 1024);
    VectorByteSink sink;

    auto result = run_read_pipeline(options(1024, 1), device, sink);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, TransferErrorKind::EmptyRead);
    EXPECT_EQ(result.error().chunk_index, 2u);
}

// A short final chunk is accepted: the device ended early by a few bytes.
TEST_F(ReadPipelineTest, ShortFinalChunkIsAccepted)
{
    const auto data = make_pattern(3 * 1024 + 512, 9);
    MemoryBlockDevice device(data, 1024);
    device.truncate_reads_at(3 * 1024 + 200);
    VectorByteSink sink;

    auto result = run_read_pipeline(options(1024, 2), device, sink);
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(sink.data().size(), 3u * 1024 + 200);
    EXPECT_TRUE(std::equal(sink.data().begin(), sink.data().end(), data.begin()));
    EXPECT_EQ(result.content().bytes_transferred, 3u * 1024 + 200);
}

TEST_F(ReadPipelineTest, OutputFailureIsReported)
{
    MemoryBlockDevice device(make_pattern(8 * 1024, 10), 1024);
    VectorByteSink sink(3 * 1024);

    auto result = run_read_pipeline(options(1024, 4), device, sink);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, TransferErrorKind::OutputStream);
    EXPECT_EQ(result.error().chunk_index, 3u);
    EXPECT_EQ(result.error().offset, 3u * 1024);
    EXPECT_EQ(result.error().sys_errno, EPIPE);
    EXPECT_EQ(sink.data().size(), 3u * 1024);
}

TEST_F(ReadPipelineTest, EmptyDeviceSucceedsWithNoOutput)
{
    MemoryBlockDevice device(size_t{0}, 1024);
    VectorByteSink sink;

    auto result = run_read_pipeline(options(1024, 4), device, sink);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(sink.data().empty());
    EXPECT_EQ(result.content().chunk_count, 0u);
    EXPECT_EQ(sink.write_calls(), 0u);
    EXPECT_THAT(progress_.text(), EndsWith("READ progress: 0/0 bytes (100.00%)\n\n"));
}

TEST_F(ReadPipelineTest, InvalidOptionsAreRejected)
{
    MemoryBlockDevice device(size_t{1024}, 1024);
    VectorByteSink sink;

    auto zero_block = run_read_pipeline(options(0, 4), device, sink);
    ASSERT_TRUE(zero_block.is_error());
    EXPECT_EQ(zero_block.error().kind, TransferErrorKind::Setup);

    auto zero_workers = run_read_pipeline(options(1024, 0), device, sink);
    ASSERT_TRUE(zero_workers.is_error());
    EXPECT_EQ(zero_workers.error().kind, TransferErrorKind::Setup);
    EXPECT_TRUE(device.attempted_chunks().empty());
}
