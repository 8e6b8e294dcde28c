#include "bp_transfer.hpp"

namespace blkpipe::transfer
{

void ReorderBuffer::insert(OrderedChunk chunk)
{
    const uint64_t index = chunk.index;
    if (index < m_expected)
    {
        BP_PANIC("ReorderBuffer: chunk {} arrived after it was emitted (expected {}).", index,
                 m_expected);
    }
    const size_t bytes = chunk.payload.size();
    const bool inserted = m_pending.emplace(index, std::move(chunk)).second;
    if (!inserted)
    {
        BP_PANIC("ReorderBuffer: chunk {} arrived twice.", index);
    }
    m_pending_bytes += bytes;
}

std::optional<OrderedChunk> ReorderBuffer::pop_ready()
{
    auto it = m_pending.find(m_expected);
    if (it == m_pending.end())
    {
        return std::nullopt;
    }
    OrderedChunk chunk = std::move(it->second);
    m_pending.erase(it);
    m_pending_bytes -= chunk.payload.size();
    ++m_expected;
    return chunk;
}

} // namespace blkpipe::transfer
