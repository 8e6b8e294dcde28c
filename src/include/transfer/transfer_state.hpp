#pragma once
/**
 * @file transfer_state.hpp
 * @brief Shared counters of one pipeline run.
 *
 * total_bytes is fixed at construction. bytes_done only grows and never passes total_bytes.
 * stop_requested is the fail-fast flag: set by whoever sees the first failure, read by
 * every worker before it starts a task.
 */
#include "transfer/chunk.hpp"

#include <atomic>
#include <cstdint>

namespace blkpipe::transfer
{

class TransferState
{
  public:
    explicit TransferState(uint64_t total_bytes) noexcept : m_total(total_bytes) {}

    TransferState(const TransferState &) = delete;
    TransferState &operator=(const TransferState &) = delete;

    [[nodiscard]] uint64_t total_bytes() const noexcept { return m_total; }

    [[nodiscard]] uint64_t bytes_done() const noexcept
    {
        return m_done.load(std::memory_order_acquire);
    }

    /// Atomically add @p n transferred bytes. Returns the new total.
    uint64_t add_bytes(uint64_t n)
    {
        const uint64_t now = m_done.fetch_add(n, std::memory_order_acq_rel) + n;
        if (now > m_total)
        {
            BP_PANIC("TransferState: {} bytes transferred exceeds device size {}.", now, m_total);
        }
        return now;
    }

    void request_stop() noexcept { m_stop.store(true, std::memory_order_release); }

    [[nodiscard]] bool stop_requested() const noexcept
    {
        return m_stop.load(std::memory_order_acquire);
    }

  private:
    const uint64_t m_total;
    std::atomic<uint64_t> m_done{0};
    std::atomic<bool> m_stop{false};
};

} // namespace blkpipe::transfer
