/**
 * @file read_pipeline.cpp
 * @brief Device -> stream transfer.
 *
 * Threads:
 *  - feeder:   walks the ChunkSequencer and submits descriptors to the pool, then closes it.
 *              Before each submit it waits for the chunk to enter the dispatch window, which
 *              spans workers + 1 indices from the oldest chunk not yet written to the sink.
 *  - workers:  one pread per descriptor; the result (or a tagged error) goes to `results`.
 *  - caller:   pops results, feeds the ReorderBuffer, writes ready chunks to the sink and
 *              slides the window. This is the only thread that touches the ReorderBuffer and
 *              the only one that advances the byte counter.
 *
 * The window keeps the ReorderBuffer at no more than `workers` held chunks while one chunk is
 * slow, and it bounds how far past a failing chunk any read was started.
 */
#include "pipeline_internals.hpp"

#include <thread>

namespace blkpipe::transfer
{

namespace
{
ReadResult read_chunk(BlockDevice &device, const ChunkDescriptor &chunk, bool final_chunk)
{
    ReadResult result;
    result.index = chunk.index;
    result.offset = chunk.offset;
    try
    {
        result.payload.resize(chunk.length);
        auto n = device.read_at(chunk.offset, result.payload);
        if (n.is_error())
        {
            result.error = TransferError::at_chunk(TransferErrorKind::ChunkIo, chunk.index,
                                                   chunk.offset, "read failed",
                                                   n.error().value());
            result.payload.clear();
            return result;
        }
        const size_t got = n.content();
        if (got == 0)
        {
            result.error = TransferError::at_chunk(
                TransferErrorKind::EmptyRead, chunk.index, chunk.offset,
                fmt::format("read returned no data (expected {} bytes)", chunk.length));
            result.payload.clear();
            return result;
        }
        if (got < chunk.length)
        {
            if (!final_chunk)
            {
                result.error = TransferError::at_chunk(
                    TransferErrorKind::ShortRead, chunk.index, chunk.offset,
                    fmt::format("short read: {} of {} bytes", got, chunk.length));
                result.payload.clear();
                return result;
            }
            LOGGER_WARN("Final chunk {} at offset {}: device ended after {} of {} bytes.",
                        chunk.index, chunk.offset, got, chunk.length);
            result.payload.resize(got);
        }
        LOGGER_TRACE("Read chunk {} at offset {} ({} bytes).", chunk.index, chunk.offset, got);
    }
    catch (const std::exception &e)
    {
        result.payload.clear();
        result.error = TransferError::at_chunk(TransferErrorKind::ChunkIo, chunk.index,
                                               chunk.offset, e.what());
    }
    return result;
}
} // namespace

TransferResult run_read_pipeline(const PipelineOptions &options, BlockDevice &device,
                                 ByteSink &sink)
{
    if (auto bad = detail::check_options(options))
    {
        return TransferResult::error(std::move(*bad));
    }

    const uint64_t start_ns = platform::monotonic_time_ns();
    const uint64_t total = device.size();
    ChunkSequencer sequencer(total, options.block_size);
    const uint64_t chunk_count = sequencer.chunk_count();

    LOGGER_INFO("READ: {} -> output: {} ({} bytes), {} chunks of {} bytes, {} workers.",
                device.description(), format_tools::human_bytes(total), total, chunk_count,
                options.block_size, options.workers);

    TransferState state(total);
    ProgressReporter reporter("READ", state, options.progress_interval, options.progress_output);
    detail::maybe_start(reporter, options);
    auto reporter_guard = basics::make_scope_guard([&reporter] { reporter.stop(); });

    ChunkWindow window(dispatch_window_width(options.workers));
    BoundedQueue<ReadResult> results(options.workers);
    WorkerPool<ChunkDescriptor> pool(
        "read", options.workers,
        [&](ChunkDescriptor &&chunk)
        {
            // Leaving without posting a result must not leave the feeder parked in acquire().
            auto close_window = basics::make_scope_guard([&window] { window.close(); });
            if (state.stop_requested())
            {
                return;
            }
            ReadResult result = read_chunk(device, chunk, chunk.index + 1 == chunk_count);
            if (result.error.has_value())
            {
                state.request_stop();
            }
            // A closed queue means the coordinator already gave up; the result is dropped.
            (void)results.push(std::move(result));
            close_window.dismiss();
        });

    std::thread feeder(
        [&]
        {
            while (auto chunk = sequencer.next())
            {
                if (state.stop_requested() || !window.acquire(chunk->index) ||
                    !pool.submit(*chunk))
                {
                    break;
                }
            }
            pool.close();
            pool.join();
            results.close();
        });
    auto feeder_guard = basics::make_scope_guard(
        [&]
        {
            state.request_stop();
            window.close();
            pool.cancel();
            results.close_and_clear();
            feeder.join();
        });

    std::optional<TransferError> failure;
    ReorderBuffer reorder;
    while (!failure && !reorder.is_done(chunk_count))
    {
        auto result = results.pop();
        if (!result)
        {
            failure = TransferError::setup(fmt::format(
                "worker pool stopped before chunk {} was read", reorder.expected_index()));
            if (auto ex = pool.failure())
            {
                try
                {
                    std::rethrow_exception(ex);
                }
                catch (const std::exception &e)
                {
                    failure->detail += fmt::format(": {}", e.what());
                }
            }
            break;
        }
        if (result->error.has_value())
        {
            failure = std::move(*result->error);
            break;
        }

        reorder.insert({result->index, result->offset, std::move(result->payload)});
        while (auto ready = reorder.pop_ready())
        {
            if (auto ec = sink.write_all(ready->payload))
            {
                failure = TransferError::at_chunk(TransferErrorKind::OutputStream, ready->index,
                                                  ready->offset, "writing to output failed",
                                                  ec.value());
                break;
            }
            state.add_bytes(ready->payload.size());
            window.release(ready->index);
        }
    }

    if (!failure)
    {
        if (auto ec = sink.flush())
        {
            failure = TransferError::setup("flushing output failed", ec.value());
        }
    }

    if (failure)
    {
        state.request_stop();
        LOGGER_ERROR("READ: {} failed: {}", device.description(), failure->describe());
        return TransferResult::error(std::move(*failure));
    }

    feeder_guard.invoke();
    reporter_guard.invoke();

    auto summary = detail::make_summary(state, chunk_count, start_ns);
    detail::log_completion("READ", device, summary);
    return TransferResult::ok(summary);
}

} // namespace blkpipe::transfer
