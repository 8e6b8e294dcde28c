#pragma once
/**
 * @file chunk_sequencer.hpp
 * @brief Lazy partition of [0, total_size) into fixed-size, strictly ordered chunks.
 */
#include "transfer/chunk.hpp"

#include <optional>

namespace blkpipe::transfer
{

/**
 * @class ChunkSequencer
 * @brief Produces ChunkDescriptors in ascending offset order, once each, then reports the end.
 *
 * Not restartable and not thread-safe: one producer calls next().
 *
 * @code
 * ChunkSequencer seq(10'000'000, 1'000'000);
 * while (auto chunk = seq.next()) { submit(*chunk); }
 * @endcode
 */
class BLKPIPE_TRANSFER_EXPORT ChunkSequencer
{
  public:
    /// @throws std::invalid_argument if block_size is 0.
    ChunkSequencer(uint64_t total_size, uint32_t block_size);

    /// The next chunk, or std::nullopt once [0, total_size) is covered.
    [[nodiscard]] std::optional<ChunkDescriptor> next() noexcept;

    /// ceil(total_size / block_size)
    [[nodiscard]] uint64_t chunk_count() const noexcept { return m_chunk_count; }

    [[nodiscard]] uint64_t total_size() const noexcept { return m_total_size; }
    [[nodiscard]] uint32_t block_size() const noexcept { return m_block_size; }

    /// Number of chunks handed out so far.
    [[nodiscard]] uint64_t produced() const noexcept { return m_next_index; }

    /// Chunk count for a device of @p total_size bytes.
    static uint64_t count_for(uint64_t total_size, uint32_t block_size) noexcept;

  private:
    uint64_t m_total_size;
    uint32_t m_block_size;
    uint64_t m_chunk_count;
    uint64_t m_next_index{0};
    uint64_t m_next_offset{0};
};

} // namespace blkpipe::transfer
