#include "bp_transfer.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#if defined(BLKPIPE_PLATFORM_LINUX)
#include <linux/fs.h>
#include <sys/ioctl.h>
#endif

namespace blkpipe::transfer
{

namespace
{
std::error_code last_error()
{
    return {errno, std::generic_category()};
}

bool query_block_capacity(int fd, uint64_t &size_out)
{
#if defined(BLKPIPE_PLATFORM_LINUX)
    uint64_t bytes = 0;
    if (::ioctl(fd, BLKGETSIZE64, &bytes) == 0)
    {
        size_out = bytes;
        return true;
    }
    LOGGER_DEBUG("BLKGETSIZE64 on fd {} unsupported: {}", fd, std::strerror(errno));
    return false;
#else
    (void)fd;
    (void)size_out;
    return false;
#endif
}
} // namespace

const char *to_string(SizeProbeMethod method) noexcept
{
    switch (method)
    {
    case SizeProbeMethod::BlockIoctl:
        return "BLKGETSIZE64";
    case SizeProbeMethod::FileStat:
        return "fstat";
    default:
        return "unknown";
    }
}

Result<DeviceGeometry, std::error_code> probe_device_size(int fd)
{
    using R = Result<DeviceGeometry, std::error_code>;

    uint64_t bytes = 0;
    if (query_block_capacity(fd, bytes))
    {
        return R::ok(DeviceGeometry{bytes, SizeProbeMethod::BlockIoctl});
    }

    struct stat st
    {
    };
    if (::fstat(fd, &st) != 0)
    {
        const auto ec = last_error();
        return R::error(ec, ec.value());
    }
    if (st.st_size < 0)
    {
        return R::error(std::make_error_code(std::errc::invalid_argument), EINVAL);
    }
    return R::ok(DeviceGeometry{static_cast<uint64_t>(st.st_size), SizeProbeMethod::FileStat});
}

Result<std::unique_ptr<FileDevice>, TransferError> FileDevice::open(const std::string &path,
                                                                    OpenMode mode)
{
    using R = Result<std::unique_ptr<FileDevice>, TransferError>;

    const int flags = (mode == OpenMode::Read ? O_RDONLY : O_WRONLY) | O_CLOEXEC;
    int fd = -1;
    do
    {
        fd = ::open(path.c_str(), flags);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0)
    {
        const int err = errno;
        return R::error(TransferError::setup(fmt::format("cannot open device '{}'", path), err),
                        err);
    }
    auto fd_guard = basics::make_scope_guard([fd] { ::close(fd); });

    auto geometry = probe_device_size(fd);
    if (geometry.is_error())
    {
        const int err = geometry.error().value();
        return R::error(
            TransferError::setup(fmt::format("cannot determine size of '{}'", path), err), err);
    }

    fd_guard.dismiss();
    return R::ok(std::unique_ptr<FileDevice>(new FileDevice(path, fd, mode, geometry.content())));
}

FileDevice::FileDevice(std::string path, int fd, OpenMode mode, DeviceGeometry geometry)
    : m_path(std::move(path)), m_fd(fd), m_mode(mode), m_geometry(geometry)
{
}

FileDevice::~FileDevice()
{
    if (m_fd >= 0 && ::close(m_fd) != 0)
    {
        LOGGER_WARN("FileDevice '{}': close failed: {}", m_path, std::strerror(errno));
    }
}

IoResult FileDevice::read_at(uint64_t offset, std::span<uint8_t> buffer)
{
    size_t total = 0;
    while (total < buffer.size())
    {
        const ssize_t n = ::pread(m_fd, buffer.data() + total, buffer.size() - total,
                                  static_cast<off_t>(offset + total));
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            const auto ec = last_error();
            return IoResult::error(ec, ec.value());
        }
        if (n == 0)
        {
            break; // end of device
        }
        total += static_cast<size_t>(n);
    }
    return IoResult::ok(total);
}

IoResult FileDevice::write_at(uint64_t offset, std::span<const uint8_t> data)
{
    size_t total = 0;
    while (total < data.size())
    {
        const ssize_t n = ::pwrite(m_fd, data.data() + total, data.size() - total,
                                   static_cast<off_t>(offset + total));
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (errno == ENOSPC && total > 0)
            {
                break;
            }
            const auto ec = last_error();
            return IoResult::error(ec, ec.value());
        }
        if (n == 0)
        {
            break;
        }
        total += static_cast<size_t>(n);
    }
    return IoResult::ok(total);
}

std::error_code FileDevice::flush()
{
#if defined(BLKPIPE_PLATFORM_APPLE)
    const int rc = ::fsync(m_fd);
#else
    const int rc = ::fdatasync(m_fd);
#endif
    if (rc != 0)
    {
        return last_error();
    }
    return {};
}

} // namespace blkpipe::transfer
