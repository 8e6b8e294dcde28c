#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/format.h>

namespace blkpipe::utils
{

// A single log record, already formatted by the calling thread.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // int so this header does not depend on logger.hpp
    fmt::memory_buffer body;
};

// Abstract interface for a log message destination. Only the logger's worker thread calls it.
// write() and flush() throw std::system_error when the destination fails.
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string(int lvl);
    static std::string format_logmsg(const LogMessage &msg);
};

} // namespace blkpipe::utils
