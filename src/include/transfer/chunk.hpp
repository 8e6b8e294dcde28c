#pragma once
/**
 * @file chunk.hpp
 * @brief Units of work and error records shared by the read and write pipelines.
 */
#include "bp_base.hpp"
#include "blkpipe_transfer_export.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blkpipe::transfer
{

using Payload = std::vector<uint8_t>;

/**
 * @brief One contiguous byte range of the device.
 *
 * `index` is dense and zero-based in offset order; `offset + length` never exceeds the device
 * size; `length` equals the block size except for a shorter final chunk.
 */
struct ChunkDescriptor
{
    uint64_t index{0};
    uint64_t offset{0};
    uint32_t length{0};

    bool operator==(const ChunkDescriptor &) const = default;
};

enum class TransferErrorKind
{
    Setup,            ///< device open, size probe, final sync
    ChunkIo,          ///< positioned read or write failed
    ShortRead,        ///< a non-final chunk came back short
    ShortWrite,       ///< a positioned write stored fewer bytes than the payload
    EmptyRead,        ///< a positioned read returned 0 bytes without an error
    InputStream,      ///< the byte source failed (write path)
    OutputStream,     ///< the byte sink failed (read path)
    CapacityExceeded, ///< the input is longer than the device (write path)
};

BLKPIPE_TRANSFER_EXPORT const char *to_string(TransferErrorKind kind) noexcept;

/**
 * @brief A fatal transfer error. The chunk fields are set for chunk-level failures.
 */
struct TransferError
{
    TransferErrorKind kind{TransferErrorKind::Setup};
    std::optional<uint64_t> chunk_index;
    uint64_t offset{0};
    int sys_errno{0};
    std::string detail;

    /// "chunk 4 at offset 4000000: read failed: Input/output error"
    BLKPIPE_TRANSFER_EXPORT std::string describe() const;

    static TransferError setup(std::string detail, int err = 0)
    {
        return TransferError{TransferErrorKind::Setup, std::nullopt, 0, err, std::move(detail)};
    }
    static TransferError at_chunk(TransferErrorKind kind, uint64_t index, uint64_t offset,
                                  std::string detail, int err = 0)
    {
        return TransferError{kind, index, offset, err, std::move(detail)};
    }
};

/// Outcome of one positioned read, sent from a worker to the reorder stage.
struct ReadResult
{
    uint64_t index{0};
    uint64_t offset{0};
    Payload payload;
    std::optional<TransferError> error;
};

/// A block of input bound for a fixed device offset.
struct WriteUnit
{
    uint64_t index{0};
    uint64_t offset{0};
    Payload payload;
};

struct TransferSummary
{
    uint64_t total_bytes{0};
    uint64_t bytes_transferred{0};
    uint64_t chunk_count{0};
    std::chrono::nanoseconds elapsed{0};
};

using TransferResult = Result<TransferSummary, TransferError>;

} // namespace blkpipe::transfer
