#pragma once
/**
 * @file reorder_buffer.hpp
 * @brief Restores ascending index order to chunks that complete out of order.
 *
 * Holds an "expected next index" counter and a map of early arrivals. insert() never emits;
 * the owner drains with pop_ready() until it returns std::nullopt.
 *
 * @code
 * ReorderBuffer reorder;
 * reorder.insert({result.index, result.offset, std::move(result.payload)});
 * while (auto chunk = reorder.pop_ready()) { sink.write_all(chunk->payload); }
 * @endcode
 *
 * Not thread-safe: exactly one stage owns it.
 */
#include "transfer/chunk.hpp"

#include <map>
#include <optional>

namespace blkpipe::transfer
{

struct OrderedChunk
{
    uint64_t index{0};
    uint64_t offset{0};
    Payload payload;
};

class BLKPIPE_TRANSFER_EXPORT ReorderBuffer
{
  public:
    /**
     * @brief Accept a completed chunk.
     *
     * An index below expected_index() or one already held is a duplicate; that is a
     * programming error and panics.
     */
    void insert(OrderedChunk chunk);

    /// The payload for expected_index() if it has arrived; advances the counter.
    [[nodiscard]] std::optional<OrderedChunk> pop_ready();

    [[nodiscard]] uint64_t expected_index() const noexcept { return m_expected; }

    /// Chunks that arrived ahead of expected_index().
    [[nodiscard]] size_t pending_count() const noexcept { return m_pending.size(); }

    [[nodiscard]] uint64_t pending_bytes() const noexcept { return m_pending_bytes; }

    /// True once chunks 0..total_chunks-1 have all been popped.
    [[nodiscard]] bool is_done(uint64_t total_chunks) const noexcept
    {
        return m_expected >= total_chunks;
    }

  private:
    uint64_t m_expected{0};
    uint64_t m_pending_bytes{0};
    std::map<uint64_t, OrderedChunk> m_pending;
};

} // namespace blkpipe::transfer
