#pragma once
/**
 * @file chunk_window.hpp
 * @brief Sliding dispatch window over chunk indices.
 *
 * `low()` is the lowest index that has not been released yet. acquire(i) blocks until
 * `i < low() + width()`, so no chunk more than `width - 1` places past the oldest unfinished
 * one is ever dispatched, however long that oldest chunk takes. Releases may arrive in any
 * order; `low()` only advances over a contiguous run of released indices.
 *
 * close() wakes every waiter and makes acquire() fail from then on.
 */
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <set>
#include <stdexcept>

namespace blkpipe::transfer
{

class ChunkWindow
{
  public:
    /// @throws std::invalid_argument if width is 0.
    explicit ChunkWindow(uint64_t width) : m_width(width)
    {
        if (width == 0)
        {
            throw std::invalid_argument("ChunkWindow: width must be positive");
        }
    }

    ChunkWindow(const ChunkWindow &) = delete;
    ChunkWindow &operator=(const ChunkWindow &) = delete;

    /**
     * @brief Block until @p index is inside the window.
     * @return false if the window was closed.
     */
    bool acquire(uint64_t index)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_moved.wait(lock, [&] { return m_closed || index < m_low + m_width; });
        return !m_closed;
    }

    /// Mark @p index finished. Releasing an index twice, or one below low(), is a no-op.
    void release(uint64_t index)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (index < m_low)
            {
                return;
            }
            m_done.insert(index);
            while (!m_done.empty() && *m_done.begin() == m_low)
            {
                m_done.erase(m_done.begin());
                ++m_low;
            }
        }
        m_moved.notify_all();
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_moved.notify_all();
    }

    [[nodiscard]] uint64_t low() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_low;
    }

    [[nodiscard]] uint64_t width() const noexcept { return m_width; }

    [[nodiscard]] bool closed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

  private:
    const uint64_t m_width;
    mutable std::mutex m_mutex;
    std::condition_variable m_moved;
    uint64_t m_low{0};
    bool m_closed{false};
    std::set<uint64_t> m_done;
};

/// Window width for a pool of @p workers: the oldest unfinished chunk plus one per worker.
inline uint64_t dispatch_window_width(size_t workers) noexcept
{
    return static_cast<uint64_t>(workers) + 1;
}

} // namespace blkpipe::transfer
