#include "bp_transfer.hpp"

#include <cstring>

namespace blkpipe::transfer
{

const char *to_string(TransferErrorKind kind) noexcept
{
    switch (kind)
    {
    case TransferErrorKind::Setup:
        return "Setup";
    case TransferErrorKind::ChunkIo:
        return "ChunkIo";
    case TransferErrorKind::ShortRead:
        return "ShortRead";
    case TransferErrorKind::ShortWrite:
        return "ShortWrite";
    case TransferErrorKind::EmptyRead:
        return "EmptyRead";
    case TransferErrorKind::InputStream:
        return "InputStream";
    case TransferErrorKind::OutputStream:
        return "OutputStream";
    case TransferErrorKind::CapacityExceeded:
        return "CapacityExceeded";
    default:
        return "Unknown";
    }
}

std::string TransferError::describe() const
{
    std::string out;
    if (chunk_index.has_value())
    {
        out = fmt::format("chunk {} at offset {}: ", *chunk_index, offset);
    }
    out += detail;
    if (sys_errno != 0)
    {
        out += fmt::format(": {}", std::strerror(sys_errno));
    }
    return out;
}

} // namespace blkpipe::transfer
