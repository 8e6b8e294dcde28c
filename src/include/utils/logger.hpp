/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-Queue Pattern**
 *
 * 1.  **Non-Blocking API**: `LOGGER_INFO(...)` and friends format the message on the calling
 *     thread into a `fmt::memory_buffer` and push a command onto a queue. Configuration
 *     changes (switching sink, changing the error callback) are commands on the same queue,
 *     so they take effect in program order relative to the messages around them.
 * 2.  **Single Worker Thread**: one background thread is the sole consumer of the queue and
 *     the only thread that touches the active sink. It swaps the whole pending batch out under
 *     the lock and writes it without holding the lock.
 * 3.  **Sink Abstraction**: `Sink` defines write/flush; `ConsoleSink` writes to stderr,
 *     `FileSink` to a file.
 * 4.  **Bounded Queue**: past a soft limit new log messages are dropped; past twice the limit
 *     control commands are rejected too. The number of dropped messages is reported once the
 *     queue has room again.
 * 5.  **Lifecycle**: the logger is started and stopped by the LifecycleManager through
 *     `Logger::GetLifecycleModule()`. Logging before the module is started is a programming
 *     error and panics; logging after shutdown is silently ignored.
 *
 * **Usage**
 *
 * ```cpp
 * LOGGER_INFO("Reading {} ({} bytes)", path, size);
 * Logger::instance().set_level(Logger::Level::L_DEBUG);
 * Logger::instance().set_logfile("/var/log/blkpipe.log");
 * Logger::instance().flush(); // blocks until everything queued so far is written
 * ```
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "blkpipe_utils_export.h"
#include "utils/module_def.hpp"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (256u)
#endif

#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

namespace blkpipe::utils
{

class BLKPIPE_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    /// ModuleDef that starts the worker thread and, on shutdown, drains and stops it.
    static ModuleDef GetLifecycleModule();

    /// True once the lifecycle module has been started (stays true after shutdown).
    static bool lifecycle_initialized() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Sink switches are executed by the worker thread in queue order. These calls wait for
    // the switch and report whether it succeeded.

    /// Switch logging to the console (stderr).
    bool set_console();

    /**
     * @brief Switch logging to a file.
     * @param utf8_path Path to the log file. Parent directories must exist.
     * @param truncate Start from an empty file instead of appending.
     * @return false if the file could not be opened; the previous sink stays active.
     */
    bool set_logfile(const std::string &utf8_path, bool truncate = false);

    /// Blocks until every message queued before this call has reached the sink.
    void flush();

    /// Drains the queue and stops the worker thread. Idempotent.
    void shutdown();

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    Level level() const;

    /// Invoked on the worker thread when the sink fails to write.
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /// Whether a sink switch writes a note into the old and new sink.
    void set_log_sink_messages_enabled(bool enabled);

    /// Messages dropped because the queue was full since the last sink switch.
    size_t dropped_message_count() const;

    /// Parses "trace", "debug", "info", "warning"/"warn", "error", "system".
    static std::optional<Level> parse_level(std::string_view text);

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args> void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    static void lifecycle_startup(const char *arg);
    static void lifecycle_shutdown(const char *arg);

    bool should_log(Level lvl) const noexcept;
    void enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    void enqueue_log(Level lvl, std::string_view body) noexcept;

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace blkpipe::utils

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::blkpipe::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::blkpipe::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::blkpipe::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::blkpipe::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::blkpipe::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::blkpipe::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
