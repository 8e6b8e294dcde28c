#pragma once
/**
 * @file byte_stream.hpp
 * @brief Sequential byte source (write path input) and sink (read path output).
 */
#include "transfer/block_device.hpp"

#include <span>
#include <system_error>

namespace blkpipe::transfer
{

class BLKPIPE_TRANSFER_EXPORT ByteSource
{
  public:
    virtual ~ByteSource() = default;

    /**
     * @brief Fill @p buffer, reading until it is full or the stream ends.
     * @return Bytes read. Less than buffer.size() only at end of stream; 0 means the stream
     *         was already at its end.
     */
    virtual IoResult read_full(std::span<uint8_t> buffer) = 0;
};

class BLKPIPE_TRANSFER_EXPORT ByteSink
{
  public:
    virtual ~ByteSink() = default;

    /// Write every byte of @p data or fail.
    virtual std::error_code write_all(std::span<const uint8_t> data) = 0;

    virtual std::error_code flush() = 0;
};

/// ByteSource over a file descriptor it does not own (stdin by default).
class BLKPIPE_TRANSFER_EXPORT FdByteSource final : public ByteSource
{
  public:
    explicit FdByteSource(int fd = 0) noexcept : m_fd(fd) {}
    IoResult read_full(std::span<uint8_t> buffer) override;

  private:
    int m_fd;
};

/// ByteSink over a file descriptor it does not own (stdout by default). Unbuffered.
class BLKPIPE_TRANSFER_EXPORT FdByteSink final : public ByteSink
{
  public:
    explicit FdByteSink(int fd = 1) noexcept : m_fd(fd) {}
    std::error_code write_all(std::span<const uint8_t> data) override;

    /// Nothing is buffered; a pipe or terminal cannot be synced, so this always succeeds.
    std::error_code flush() override { return {}; }

  private:
    int m_fd;
};

} // namespace blkpipe::transfer
