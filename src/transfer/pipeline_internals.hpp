#pragma once
// Helpers shared by read_pipeline.cpp and write_pipeline.cpp. Not installed.

#include "bp_transfer.hpp"

#include <optional>
#include <string_view>

namespace blkpipe::transfer::detail
{

/// Reject options the pipelines cannot run with. Config validation catches these earlier.
inline std::optional<TransferError> check_options(const PipelineOptions &options)
{
    if (options.block_size == 0)
    {
        return TransferError::setup("block size must be positive");
    }
    if (options.workers == 0)
    {
        return TransferError::setup("worker count must be positive");
    }
    return std::nullopt;
}

/// Start a reporter if progress is enabled. The caller stops it.
inline void maybe_start(ProgressReporter &reporter, const PipelineOptions &options)
{
    if (options.progress)
    {
        reporter.start();
    }
}

inline TransferSummary make_summary(const TransferState &state, uint64_t chunk_count,
                                    uint64_t start_ns)
{
    TransferSummary summary;
    summary.total_bytes = state.total_bytes();
    summary.bytes_transferred = state.bytes_done();
    summary.chunk_count = chunk_count;
    summary.elapsed = std::chrono::nanoseconds(platform::elapsed_time_ns(start_ns));
    return summary;
}

inline void log_completion(std::string_view label, const BlockDevice &device,
                           const TransferSummary &summary)
{
    LOGGER_INFO("{}: {} complete: {} ({} bytes) in {} chunks, {:.3f}s, {}", label,
                device.description(), format_tools::human_bytes(summary.bytes_transferred),
                summary.bytes_transferred, summary.chunk_count,
                std::chrono::duration<double>(summary.elapsed).count(),
                format_tools::human_rate(summary.bytes_transferred, summary.elapsed));
}

/// First error wins; later ones are only logged.
class FirstError
{
  public:
    /// @return true if @p error became the recorded failure.
    bool record(TransferError error)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_error.has_value())
        {
            LOGGER_DEBUG("Suppressed follow-up failure: {}", error.describe());
            return false;
        }
        m_error = std::move(error);
        return true;
    }

    std::optional<TransferError> take()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::move(m_error);
    }

  private:
    std::mutex m_mutex;
    std::optional<TransferError> m_error;
};

} // namespace blkpipe::transfer::detail
