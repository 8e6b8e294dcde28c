#include "bp_transfer.hpp"

#include <stdexcept>

namespace blkpipe::transfer
{

uint64_t ChunkSequencer::count_for(uint64_t total_size, uint32_t block_size) noexcept
{
    if (block_size == 0)
        return 0;
    return total_size / block_size + (total_size % block_size != 0 ? 1 : 0);
}

ChunkSequencer::ChunkSequencer(uint64_t total_size, uint32_t block_size)
    : m_total_size(total_size), m_block_size(block_size),
      m_chunk_count(count_for(total_size, block_size))
{
    if (block_size == 0)
    {
        throw std::invalid_argument("ChunkSequencer: block size must be positive");
    }
}

std::optional<ChunkDescriptor> ChunkSequencer::next() noexcept
{
    if (m_next_offset >= m_total_size)
    {
        return std::nullopt;
    }
    const uint64_t remaining = m_total_size - m_next_offset;
    const auto length = static_cast<uint32_t>(remaining < m_block_size ? remaining : m_block_size);

    ChunkDescriptor chunk{m_next_index, m_next_offset, length};
    ++m_next_index;
    m_next_offset += length;
    return chunk;
}

} // namespace blkpipe::transfer
