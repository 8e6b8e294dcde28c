#pragma once
/**
 * @file bounded_queue.hpp
 * @brief Blocking FIFO with a fixed capacity and an explicit close.
 *
 * Producers block in push() while the queue is full; consumers block in pop() while it is
 * empty. close() wakes everyone: push() then fails, pop() keeps returning queued items until
 * the queue is drained and then returns std::nullopt. This is the backpressure point between
 * the chunk producer and the workers.
 */
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace blkpipe::transfer
{

template <typename T>
class BoundedQueue
{
  public:
    /// @throws std::invalid_argument if capacity is 0.
    explicit BoundedQueue(size_t capacity) : m_capacity(capacity)
    {
        if (capacity == 0)
        {
            throw std::invalid_argument("BoundedQueue: capacity must be positive");
        }
    }

    BoundedQueue(const BoundedQueue &) = delete;
    BoundedQueue &operator=(const BoundedQueue &) = delete;

    /**
     * @brief Appends an item, blocking while the queue is full.
     * @return false if the queue was closed before the item could be added.
     */
    bool push(T item)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_full.wait(lock, [this] { return m_closed || m_items.size() < m_capacity; });
        if (m_closed)
        {
            return false;
        }
        m_items.push_back(std::move(item));
        lock.unlock();
        m_not_empty.notify_one();
        return true;
    }

    /**
     * @brief Removes the oldest item, blocking while the queue is empty and open.
     * @return std::nullopt once the queue is closed and drained.
     */
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_empty.wait(lock, [this] { return m_closed || !m_items.empty(); });
        if (m_items.empty())
        {
            return std::nullopt;
        }
        T item = std::move(m_items.front());
        m_items.pop_front();
        lock.unlock();
        m_not_full.notify_one();
        return item;
    }

    /// No further pushes are accepted. Items already queued can still be popped.
    void close()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_not_full.notify_all();
        m_not_empty.notify_all();
    }

    /// close() and discard everything still queued. Returns the number of items dropped.
    size_t close_and_clear()
    {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
            dropped = m_items.size();
            m_items.clear();
        }
        m_not_full.notify_all();
        m_not_empty.notify_all();
        return dropped;
    }

    [[nodiscard]] bool closed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    [[nodiscard]] size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return m_capacity; }

  private:
    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_not_full;
    std::condition_variable m_not_empty;
    std::deque<T> m_items;
    bool m_closed{false};
};

} // namespace blkpipe::transfer
