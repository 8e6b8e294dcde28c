#pragma once
/**
 * @file block_device.hpp
 * @brief Positioned I/O over a block device or a regular file, plus the size probe.
 *
 * All access is by explicit offset (pread/pwrite); there is no shared cursor, so any number of
 * workers may use one BlockDevice concurrently as long as their byte ranges do not overlap.
 */
#include "transfer/chunk.hpp"

#include <memory>
#include <span>
#include <string>
#include <system_error>

namespace blkpipe::transfer
{

using IoResult = Result<size_t, std::error_code>;

/**
 * @class BlockDevice
 * @brief Abstract byte-addressed device of fixed size.
 *
 * read_at() returns fewer bytes than requested only when the end of the device is reached;
 * write_at() returns fewer bytes than requested only when the device stops accepting data.
 * Both retry EINTR internally.
 */
class BLKPIPE_TRANSFER_EXPORT BlockDevice
{
  public:
    virtual ~BlockDevice() = default;

    /// Total addressable length in bytes.
    [[nodiscard]] virtual uint64_t size() const noexcept = 0;

    /// Path or other human-readable name, for log lines.
    [[nodiscard]] virtual std::string description() const = 0;

    virtual IoResult read_at(uint64_t offset, std::span<uint8_t> buffer) = 0;
    virtual IoResult write_at(uint64_t offset, std::span<const uint8_t> data) = 0;

    /// Push written data to stable storage.
    virtual std::error_code flush() = 0;
};

enum class OpenMode
{
    Read,
    Write,
};

enum class SizeProbeMethod
{
    BlockIoctl, ///< BLKGETSIZE64
    FileStat,   ///< fstat st_size
};

BLKPIPE_TRANSFER_EXPORT const char *to_string(SizeProbeMethod method) noexcept;

struct DeviceGeometry
{
    uint64_t size{0};
    SizeProbeMethod method{SizeProbeMethod::FileStat};
};

/**
 * @brief Determine the byte length behind @p fd.
 *
 * Asks the kernel for the block device capacity first. If that query is unsupported (a regular
 * file, a platform without it) falls back to fstat. Fails only if both fail; the error is the
 * one reported by fstat.
 */
BLKPIPE_TRANSFER_EXPORT Result<DeviceGeometry, std::error_code> probe_device_size(int fd);

/**
 * @class FileDevice
 * @brief BlockDevice over a POSIX file descriptor.
 *
 * The descriptor is opened once by open() and shared by all workers until destruction.
 */
class BLKPIPE_TRANSFER_EXPORT FileDevice final : public BlockDevice
{
  public:
    /**
     * @brief Open @p path and probe its size.
     *
     * Read opens O_RDONLY, Write opens O_WRONLY. Neither creates nor truncates: a restore
     * target must already exist with its final size.
     * @return A Setup TransferError if the open or both size probes fail.
     */
    static Result<std::unique_ptr<FileDevice>, TransferError> open(const std::string &path,
                                                                   OpenMode mode);

    ~FileDevice() override;

    FileDevice(const FileDevice &) = delete;
    FileDevice &operator=(const FileDevice &) = delete;

    [[nodiscard]] uint64_t size() const noexcept override { return m_geometry.size; }
    [[nodiscard]] std::string description() const override { return m_path; }

    IoResult read_at(uint64_t offset, std::span<uint8_t> buffer) override;
    IoResult write_at(uint64_t offset, std::span<const uint8_t> data) override;
    std::error_code flush() override;

    [[nodiscard]] const DeviceGeometry &geometry() const noexcept { return m_geometry; }
    [[nodiscard]] OpenMode mode() const noexcept { return m_mode; }
    [[nodiscard]] int native_handle() const noexcept { return m_fd; }

  private:
    FileDevice(std::string path, int fd, OpenMode mode, DeviceGeometry geometry);

    std::string m_path;
    int m_fd{-1};
    OpenMode m_mode;
    DeviceGeometry m_geometry;
};

} // namespace blkpipe::transfer
