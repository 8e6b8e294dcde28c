#pragma once
/**
 * @file worker_pool.hpp
 * @brief Fixed-size pool of identical workers fed from one bounded FIFO.
 *
 * Each worker pops one task at a time and hands it to the shared handler. There is no
 * work-stealing and no priority. The queue capacity equals the worker count, so submit()
 * blocks as soon as every worker is busy and one task per worker is already waiting.
 *
 * Shutdown paths:
 *  - close():  no more tasks; workers finish the queue and exit.
 *  - cancel(): stop flag set, queued tasks dropped; tasks already running complete.
 *
 * The destructor cancels and joins, so a pool never outlives the data its handler refers to.
 */
#include "bp_service.hpp"
#include "transfer/bounded_queue.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace blkpipe::transfer
{

template <typename Task>
class WorkerPool
{
  public:
    using Handler = std::function<void(Task &&)>;

    /**
     * @param name     Used in log lines only.
     * @param workers  Number of worker threads; also the queue capacity.
     * @param handler  Runs on a worker thread for every task. Must be safe to call concurrently.
     * @throws std::invalid_argument if workers is 0 or handler is empty.
     */
    WorkerPool(std::string name, size_t workers, Handler handler)
        : m_name(std::move(name)), m_queue(workers == 0 ? 1 : workers), m_handler(std::move(handler))
    {
        if (workers == 0)
        {
            throw std::invalid_argument("WorkerPool: worker count must be positive");
        }
        if (!m_handler)
        {
            throw std::invalid_argument("WorkerPool: handler must not be empty");
        }
        m_threads.reserve(workers);
        try
        {
            for (size_t i = 0; i < workers; ++i)
            {
                m_threads.emplace_back([this, i] { worker_loop(i); });
            }
        }
        catch (const std::exception &e)
        {
            // The destructor does not run for a half-built pool; stop the threads we have.
            LOGGER_ERROR("WorkerPool '{}': could only start {} of {} workers: {}", m_name,
                         m_threads.size(), workers, e.what());
            cancel();
            join();
            throw;
        }
        LOGGER_TRACE("WorkerPool '{}': started {} workers.", m_name, workers);
    }

    ~WorkerPool()
    {
        cancel();
        join();
    }

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    /**
     * @brief Queue a task, blocking while the queue is full.
     * @return false if the pool was closed or cancelled; the task is discarded.
     */
    bool submit(Task task)
    {
        if (m_stop.load(std::memory_order_acquire))
        {
            return false;
        }
        return m_queue.push(std::move(task));
    }

    /// Signal end of input. Already queued tasks still run.
    void close() { m_queue.close(); }

    /**
     * @brief Stop starting new tasks and drop everything still queued.
     * @return Number of queued tasks that were dropped.
     */
    size_t cancel()
    {
        m_stop.store(true, std::memory_order_release);
        const size_t dropped = m_queue.close_and_clear();
        if (dropped > 0)
        {
            LOGGER_DEBUG("WorkerPool '{}': dropped {} queued tasks.", m_name, dropped);
        }
        return dropped;
    }

    /// Wait for every worker thread to exit. Idempotent.
    void join()
    {
        std::lock_guard<std::mutex> lock(m_join_mutex);
        for (auto &t : m_threads)
        {
            if (t.joinable())
            {
                t.join();
            }
        }
    }

    [[nodiscard]] bool cancelled() const noexcept { return m_stop.load(std::memory_order_acquire); }
    [[nodiscard]] size_t worker_count() const noexcept { return m_threads.size(); }
    [[nodiscard]] const std::string &name() const noexcept { return m_name; }

    /// The first exception that escaped the handler, if any. Valid after join().
    [[nodiscard]] std::exception_ptr failure() const
    {
        std::lock_guard<std::mutex> lock(m_failure_mutex);
        return m_failure;
    }

  private:
    void worker_loop(size_t worker_id)
    {
        while (auto task = m_queue.pop())
        {
            if (m_stop.load(std::memory_order_acquire))
            {
                break;
            }
            try
            {
                m_handler(std::move(*task));
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("WorkerPool '{}': worker {} handler threw: {}", m_name, worker_id,
                             e.what());
                {
                    std::lock_guard<std::mutex> lock(m_failure_mutex);
                    if (!m_failure)
                    {
                        m_failure = std::current_exception();
                    }
                }
                cancel();
            }
        }
        LOGGER_TRACE("WorkerPool '{}': worker {} exiting.", m_name, worker_id);
    }

    std::string m_name;
    BoundedQueue<Task> m_queue;
    Handler m_handler;
    std::atomic<bool> m_stop{false};
    std::vector<std::thread> m_threads;
    std::mutex m_join_mutex;
    mutable std::mutex m_failure_mutex;
    std::exception_ptr m_failure;
};

} // namespace blkpipe::transfer
