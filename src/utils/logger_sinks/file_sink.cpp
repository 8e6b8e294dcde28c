#include "bp_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <system_error>

namespace blkpipe::utils
{

FileSink::FileSink(const std::string &path, bool truncate) : m_path(path)
{
    m_file = std::fopen(path.c_str(), truncate ? "w" : "a");
    if (m_file == nullptr)
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("cannot open log file '{}'", path));
    }
}

FileSink::~FileSink()
{
    if (m_file != nullptr)
    {
        std::fclose(m_file);
    }
}

void FileSink::write(const LogMessage &msg)
{
    const std::string line = format_logmsg(msg);
    if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size())
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("write to log file '{}' failed", m_path));
    }
}

void FileSink::flush()
{
    if (std::fflush(m_file) != 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("flush of log file '{}' failed", m_path));
    }
}

std::string FileSink::description() const
{
    return "File: " + m_path;
}

} // namespace blkpipe::utils
