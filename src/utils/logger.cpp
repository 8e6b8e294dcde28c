/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous command-queue Logger.
 *
 * Caller threads build a command (a formatted LogMessage or a control command) and append it
 * to `queue_` under `queue_mutex_`. The worker thread swaps the whole queue into a local
 * batch and executes it in order without holding the lock. Control commands that need an
 * answer carry a promise which the worker fulfils once the command has been executed.
 ******************************************************************************/
#include "bp_service.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

using namespace blkpipe::format_tools;

namespace blkpipe::utils
{

// Represents the lifecycle state of the logger.
enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        BP_PANIC("Logger method '{}' was called before the Logger module was "
                 "initialized via LifecycleManager. Aborting.",
                 function_name);
    }
    return state == LoggerState::Initialized;
}

namespace
{

struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
};

using Command = std::variant<LogMessage, SetSinkCommand, FlushCommand, SetErrorCallbackCommand>;

LogMessage make_system_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = blkpipe::platform::get_pid(),
                      .thread_id = blkpipe::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

void answer(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (p)
    {
        p->set_value(value);
    }
}

} // namespace

struct Logger::Impl
{
    Impl() : sink_(std::make_unique<ConsoleSink>()) {}

    void start_worker();
    void worker_loop();
    void execute(Command &cmd);
    void report_write_error(const std::string &what);
    bool enqueue_command(Command &&cmd);
    void reject(Command &cmd);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::unique_ptr<Sink> sink_;
    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    size_t m_max_queue_size{10000};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> m_log_sink_messages_enabled{true};
    std::atomic<size_t> m_messages_dropped{0};                // reset when reported
    std::atomic<size_t> m_total_dropped_since_sink_switch{0}; // reset on sink switch
};

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

void Logger::Impl::reject(Command &cmd)
{
    if (auto *sink_cmd = std::get_if<SetSinkCommand>(&cmd))
        answer(sink_cmd->promise, false);
    else if (auto *flush_cmd = std::get_if<FlushCommand>(&cmd))
        answer(flush_cmd->promise, false);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject(cmd);
            return false;
        }

        const size_t current = queue_.size();
        const bool is_log = std::holds_alternative<LogMessage>(cmd);
        if (current >= m_max_queue_size * 2 || (is_log && current >= m_max_queue_size))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            m_total_dropped_since_sink_switch.fetch_add(1, std::memory_order_relaxed);
            reject(cmd);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::report_write_error(const std::string &what)
{
    if (error_callback_)
    {
        error_callback_(what);
    }
    else
    {
        BP_DEBUG("Logger sink error with no error callback installed: {}", what);
    }
}

void Logger::Impl::execute(Command &cmd)
{
    if (auto *msg = std::get_if<LogMessage>(&cmd))
    {
        sink_->write(*msg);
        return;
    }
    if (auto *sink_cmd = std::get_if<SetSinkCommand>(&cmd))
    {
        const bool announce = m_log_sink_messages_enabled.load(std::memory_order_relaxed);
        const std::string old_desc = sink_->description();
        if (announce)
        {
            sink_->write(make_system_message(
                Logger::Level::L_SYSTEM,
                make_buffer("Switching log sink to: {}", sink_cmd->new_sink->description())));
        }
        sink_->flush();
        sink_ = std::move(sink_cmd->new_sink);
        m_total_dropped_since_sink_switch.store(0, std::memory_order_relaxed);
        if (announce)
        {
            sink_->write(make_system_message(Logger::Level::L_SYSTEM,
                                             make_buffer("Log sink switched from: {}", old_desc)));
        }
        answer(sink_cmd->promise, true);
        return;
    }
    if (auto *flush_cmd = std::get_if<FlushCommand>(&cmd))
    {
        sink_->flush();
        answer(flush_cmd->promise, true);
        return;
    }
    if (auto *cb_cmd = std::get_if<SetErrorCallbackCommand>(&cmd))
    {
        error_callback_ = std::move(cb_cmd->callback);
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            stopping = shutdown_requested_.load() && local_queue.empty();
        }

        const size_t dropped = m_messages_dropped.exchange(0, std::memory_order_relaxed);
        if (dropped > 0)
        {
            local_queue.insert(local_queue.begin(),
                               make_system_message(Logger::Level::L_WARNING,
                                                   make_buffer("Logger queue overflow: {} messages dropped.",
                                                               dropped)));
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                execute(cmd);
            }
            catch (const std::exception &e)
            {
                report_write_error(fmt::format("Logger worker error: {}", e.what()));
                reject(cmd);
            }
        }
        local_queue.clear();

        if (stopping)
        {
            try
            {
                sink_->flush();
            }
            catch (const std::exception &e)
            {
                report_write_error(fmt::format("Logger final flush failed: {}", e.what()));
            }
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (!logger_is_loggable("Logger::log"))
        return false;
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        pImpl->enqueue_command(make_system_message(lvl, std::move(body)));
    }
    catch (const std::exception &e)
    {
        BP_DEBUG("Logger::enqueue_log failed: {}", e.what());
    }
}

void Logger::enqueue_log(Level lvl, std::string_view body) noexcept
{
    try
    {
        fmt::memory_buffer mb;
        mb.append(body.data(), body.data() + body.size());
        enqueue_log(lvl, std::move(mb));
    }
    catch (const std::exception &e)
    {
        BP_DEBUG("Logger::enqueue_log failed: {}", e.what());
    }
}

bool Logger::set_console()
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path, bool truncate)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;

    std::unique_ptr<Sink> sink;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path, truncate);
    }
    catch (const std::system_error &e)
    {
        LOGGER_ERROR("Logger: {}", e.what());
        return false;
    }

    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::move(sink), promise});
    return future.get();
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!logger_is_loggable("Logger::set_write_error_callback"))
        return;
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb)});
}

void Logger::set_log_sink_messages_enabled(bool enabled)
{
    pImpl->m_log_sink_messages_enabled.store(enabled, std::memory_order_relaxed);
}

size_t Logger::dropped_message_count() const
{
    return pImpl->m_total_dropped_since_sink_switch.load(std::memory_order_relaxed);
}

std::optional<Logger::Level> Logger::parse_level(std::string_view text)
{
    if (text == "trace")
        return Level::L_TRACE;
    if (text == "debug")
        return Level::L_DEBUG;
    if (text == "info")
        return Level::L_INFO;
    if (text == "warning" || text == "warn")
        return Level::L_WARNING;
    if (text == "error")
        return Level::L_ERROR;
    if (text == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

// --- Lifecycle integration ---

void Logger::lifecycle_startup(const char * /*arg*/)
{
    Logger &logger = instance();
    logger.pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void Logger::lifecycle_shutdown(const char * /*arg*/)
{
    LoggerState expected = LoggerState::Initialized;
    // Only the caller that moves the state out of Initialized performs the shutdown.
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        instance().shutdown();
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("blkpipe::utils::Logger");
    module.set_startup(&Logger::lifecycle_startup);
    module.set_shutdown(&Logger::lifecycle_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace blkpipe::utils
