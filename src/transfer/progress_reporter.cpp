#include "bp_transfer.hpp"

#include <cstdio>

namespace blkpipe::transfer
{

namespace
{
void write_to_stderr(std::string_view text)
{
    std::fwrite(text.data(), 1, text.size(), stderr);
    std::fflush(stderr);
}
} // namespace

ProgressReporter::ProgressReporter(std::string label, const TransferState &state,
                                   std::chrono::milliseconds interval, Output output)
    : m_label(std::move(label)), m_state(state),
      m_interval(interval.count() > 0 ? interval : std::chrono::milliseconds(1)),
      m_output(output ? std::move(output) : Output(write_to_stderr))
{
}

ProgressReporter::~ProgressReporter()
{
    stop();
}

std::string ProgressReporter::format_progress_line(std::string_view label, uint64_t done,
                                                   uint64_t total)
{
    const double percent =
        total == 0 ? 100.0 : static_cast<double>(done) / static_cast<double>(total) * 100.0;
    return fmt::format("{} progress: {}/{} bytes ({:.2f}%)", label, done, total, percent);
}

void ProgressReporter::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_started)
    {
        return;
    }
    m_started = true;
    m_thread = std::thread([this] { run(); });
}

void ProgressReporter::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_started || m_finished)
        {
            return;
        }
        m_stopping = true;
        m_finished = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable())
    {
        m_thread.join();
    }
    emit_sample();
    m_output("\n");
}

void ProgressReporter::run()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopping)
    {
        if (m_cv.wait_for(lock, m_interval, [this] { return m_stopping; }))
        {
            break;
        }
        lock.unlock();
        emit_sample();
        lock.lock();
    }
}

void ProgressReporter::emit_sample()
{
    std::string line = format_progress_line(m_label, m_state.bytes_done(), m_state.total_bytes());
    line.push_back('\n');
    m_output(line);
}

} // namespace blkpipe::transfer
