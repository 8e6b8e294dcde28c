#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>

namespace blkpipe::utils
{

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override
    {
        const std::string line = format_logmsg(msg);
        std::fwrite(line.data(), 1, line.size(), stderr);
    }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

} // namespace blkpipe::utils
