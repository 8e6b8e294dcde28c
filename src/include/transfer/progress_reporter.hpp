#pragma once
/**
 * @file progress_reporter.hpp
 * @brief Periodic progress lines on the status channel.
 *
 * A background thread samples TransferState::bytes_done() once per interval and writes
 *
 *     READ progress: 4000000/10000000 bytes (40.00%)
 *
 * followed by a newline. stop() wakes the thread, writes one last sample and then a blank
 * line. The reporter only reads the atomic counter; it never touches the data path.
 *
 * Lines go to stderr directly, not through the Logger: they are part of the tool's output
 * contract and must keep this exact form.
 */
#include "transfer/transfer_state.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace blkpipe::transfer
{

class BLKPIPE_TRANSFER_EXPORT ProgressReporter
{
  public:
    /// Receives each complete line, including its trailing '\n'.
    using Output = std::function<void(std::string_view)>;

    /**
     * @param label    "READ" or "WRITE".
     * @param state    Must outlive the reporter.
     * @param interval Time between samples.
     * @param output   Defaults to writing to stderr and flushing.
     */
    ProgressReporter(std::string label, const TransferState &state,
                     std::chrono::milliseconds interval, Output output = {});
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter &) = delete;
    ProgressReporter &operator=(const ProgressReporter &) = delete;

    /// Start the sampling thread. Calling start() twice is a no-op.
    void start();

    /// Stop sampling, emit the final line and the blank line. Idempotent.
    void stop();

    /// "<label> progress: <done>/<total> bytes (<pct>%)" without a newline. total 0 is 100.00%.
    static std::string format_progress_line(std::string_view label, uint64_t done, uint64_t total);

  private:
    void run();
    void emit_sample();

    std::string m_label;
    const TransferState &m_state;
    std::chrono::milliseconds m_interval;
    Output m_output;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopping{false};
    bool m_started{false};
    bool m_finished{false};
    std::thread m_thread;
};

} // namespace blkpipe::transfer
