#pragma once
/**
 * @file pipeline.hpp
 * @brief The two transfer pipelines: device to stream (read) and stream to device (write).
 *
 * Read:  ChunkSequencer -> WorkerPool (pread) -> ReorderBuffer -> ByteSink
 * Write: ByteSource -> WorkerPool (pwrite at index * block_size)
 *
 * Both are fail-fast. The first failure sets the stop flag, unstarted work is dropped, work
 * already running is allowed to finish and its outcome discarded, and the failure comes back as
 * a TransferError naming the chunk. Nothing already emitted or written is rolled back.
 *
 * The Logger lifecycle module must be running.
 */
#include "transfer/byte_stream.hpp"
#include "transfer/progress_reporter.hpp"

#include <chrono>

namespace blkpipe::transfer
{

inline constexpr uint32_t kDefaultBlockSize = 65536;
inline constexpr size_t kDefaultWorkers = 4;
inline constexpr std::chrono::milliseconds kDefaultProgressInterval{1000};

struct PipelineOptions
{
    uint32_t block_size{kDefaultBlockSize};
    size_t workers{kDefaultWorkers};
    std::chrono::milliseconds progress_interval{kDefaultProgressInterval};
    bool progress{true};
    /// Write path only: fdatasync the device after the last write.
    bool sync{true};
    /// Progress line destination; stderr when empty.
    ProgressReporter::Output progress_output;
};

/**
 * @brief Stream the whole of @p device to @p sink in ascending offset order.
 * @return The summary, or the first error. Bytes before the failing chunk may have been emitted.
 */
BLKPIPE_TRANSFER_EXPORT TransferResult run_read_pipeline(const PipelineOptions &options,
                                                         BlockDevice &device, ByteSink &sink);

/**
 * @brief Write @p source to @p device, chunk i at offset i * block_size, until the source ends.
 *
 * Input shorter than the device leaves the tail of the device untouched. Input longer than
 * the device fails with CapacityExceeded.
 */
BLKPIPE_TRANSFER_EXPORT TransferResult run_write_pipeline(const PipelineOptions &options,
                                                          BlockDevice &device,
                                                          ByteSource &source);

} // namespace blkpipe::transfer
