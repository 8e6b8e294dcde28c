#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>
#include <string>

namespace blkpipe::utils
{

class FileSink : public Sink
{
  public:
    /// @throws std::system_error if the file cannot be opened.
    FileSink(const std::string &path, bool truncate);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::string m_path;
    std::FILE *m_file{nullptr};
};

} // namespace blkpipe::utils
