#include "bp_transfer.hpp"

#include <cerrno>

#include <unistd.h>

namespace blkpipe::transfer
{

IoResult FdByteSource::read_full(std::span<uint8_t> buffer)
{
    size_t total = 0;
    while (total < buffer.size())
    {
        const ssize_t n = ::read(m_fd, buffer.data() + total, buffer.size() - total);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            const int err = errno;
            return IoResult::error(std::error_code(err, std::generic_category()), err);
        }
        if (n == 0)
        {
            break;
        }
        total += static_cast<size_t>(n);
    }
    return IoResult::ok(total);
}

std::error_code FdByteSink::write_all(std::span<const uint8_t> data)
{
    size_t total = 0;
    while (total < data.size())
    {
        const ssize_t n = ::write(m_fd, data.data() + total, data.size() - total);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return {errno, std::generic_category()};
        }
        total += static_cast<size_t>(n);
    }
    return {};
}

} // namespace blkpipe::transfer
