/**
 * @file write_pipeline.cpp
 * @brief Stream -> device transfer.
 *
 * The calling thread reads the source one block at a time and submits WriteUnits whose offset
 * is index * block_size. Offsets are fixed before dispatch, so workers may finish in any order
 * and no reordering stage is needed. Workers advance the byte counter after each full write.
 *
 * A unit is only read from the source once its index is inside the dispatch window, which
 * spans workers + 1 indices from the lowest unit not yet written. A slow unit therefore holds
 * back dispatch instead of letting the rest of the input stream past it.
 */
#include "pipeline_internals.hpp"

namespace blkpipe::transfer
{

namespace
{
std::optional<TransferError> write_unit(BlockDevice &device, const WriteUnit &unit)
{
    try
    {
        auto n = device.write_at(unit.offset, unit.payload);
        if (n.is_error())
        {
            return TransferError::at_chunk(TransferErrorKind::ChunkIo, unit.index, unit.offset,
                                           "write failed", n.error().value());
        }
        if (n.content() != unit.payload.size())
        {
            return TransferError::at_chunk(
                TransferErrorKind::ShortWrite, unit.index, unit.offset,
                fmt::format("short write: {} of {} bytes", n.content(), unit.payload.size()));
        }
    }
    catch (const std::exception &e)
    {
        return TransferError::at_chunk(TransferErrorKind::ChunkIo, unit.index, unit.offset,
                                       e.what());
    }
    LOGGER_TRACE("Wrote chunk {} at offset {} ({} bytes).", unit.index, unit.offset,
                 unit.payload.size());
    return std::nullopt;
}
} // namespace

TransferResult run_write_pipeline(const PipelineOptions &options, BlockDevice &device,
                                  ByteSource &source)
{
    if (auto bad = detail::check_options(options))
    {
        return TransferResult::error(std::move(*bad));
    }

    const uint64_t start_ns = platform::monotonic_time_ns();
    const uint64_t total = device.size();
    const uint64_t block = options.block_size;

    LOGGER_INFO("WRITE: input -> {}: capacity {} ({} bytes), blocks of {} bytes, {} workers.",
                device.description(), format_tools::human_bytes(total), total, block,
                options.workers);

    TransferState state(total);
    ProgressReporter reporter("WRITE", state, options.progress_interval, options.progress_output);
    detail::maybe_start(reporter, options);
    auto reporter_guard = basics::make_scope_guard([&reporter] { reporter.stop(); });

    detail::FirstError first_error;
    ChunkWindow window(dispatch_window_width(options.workers));
    WorkerPool<WriteUnit> pool(
        "write", options.workers,
        [&](WriteUnit &&unit)
        {
            // An unwritten unit never leaves the window; wake the submitter instead.
            auto close_window = basics::make_scope_guard([&window] { window.close(); });
            if (state.stop_requested())
            {
                return;
            }
            if (auto err = write_unit(device, unit))
            {
                state.request_stop();
                first_error.record(std::move(*err));
                return;
            }
            state.add_bytes(unit.payload.size());
            close_window.dismiss();
            window.release(unit.index);
        });

    uint64_t index = 0;
    uint64_t submitted = 0;
    while (!state.stop_requested())
    {
        const uint64_t offset = index * block;
        if (!window.acquire(index))
        {
            state.request_stop();
            first_error.record(TransferError::at_chunk(TransferErrorKind::ChunkIo, index, offset,
                                                       "worker pool stopped accepting work"));
            break;
        }
        Payload buffer(block);
        auto n = source.read_full(buffer);
        if (n.is_error())
        {
            state.request_stop();
            first_error.record(TransferError::at_chunk(TransferErrorKind::InputStream, index,
                                                       offset, "reading input failed",
                                                       n.error().value()));
            break;
        }
        const size_t got = n.content();
        if (got == 0)
        {
            break; // clean end of input
        }
        if (offset + got > total)
        {
            state.request_stop();
            first_error.record(TransferError::at_chunk(
                TransferErrorKind::CapacityExceeded, index, offset,
                fmt::format("input exceeds device capacity of {} bytes", total)));
            break;
        }
        buffer.resize(got);
        if (!pool.submit(WriteUnit{index, offset, std::move(buffer)}))
        {
            state.request_stop();
            first_error.record(TransferError::at_chunk(TransferErrorKind::ChunkIo, index, offset,
                                                       "worker pool stopped accepting work"));
            break;
        }
        submitted += got;
        ++index;
        if (got < block)
        {
            break; // truncated final read
        }
    }

    if (state.stop_requested())
    {
        pool.cancel();
    }
    else
    {
        pool.close();
    }
    pool.join();

    std::optional<TransferError> failure = first_error.take();
    if (auto ex = pool.failure())
    {
        try
        {
            std::rethrow_exception(ex);
        }
        catch (const std::exception &e)
        {
            if (!failure)
            {
                failure = TransferError::setup(fmt::format("write worker failed: {}", e.what()));
            }
        }
    }
    if (!failure && state.bytes_done() != submitted)
    {
        BP_PANIC("WRITE: {} bytes submitted but {} written without a reported error.", submitted,
                 state.bytes_done());
    }
    if (!failure && options.sync)
    {
        if (auto ec = device.flush())
        {
            failure = TransferError::setup(
                fmt::format("final sync of '{}' failed", device.description()), ec.value());
        }
    }

    if (failure)
    {
        LOGGER_ERROR("WRITE: {} failed: {}", device.description(), failure->describe());
        return TransferResult::error(std::move(*failure));
    }

    reporter_guard.invoke();
    auto summary = detail::make_summary(state, index, start_ns);
    detail::log_completion("WRITE", device, summary);
    return TransferResult::ok(summary);
}

} // namespace blkpipe::transfer
