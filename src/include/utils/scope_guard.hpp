#pragma once

#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace blkpipe::basics
{

/**
 * @class ScopeGuard
 * @brief RAII guard that runs a callable when the enclosing scope exits, whether by normal
 *        flow or by an exception.
 *
 * Movable but not copyable. The engine uses it to join helper threads and close queues on
 * every exit path of a pipeline run.
 *
 * @code
 *  std::thread feeder(...);
 *  auto join_feeder = blkpipe::basics::make_scope_guard([&]() { feeder.join(); });
 * @endcode
 *
 * The callable should not throw. The destructor is `noexcept`: a `std::exception` escaping
 * the callable is reported on stderr, anything else terminates the program.
 *
 * Not thread-safe; a guard belongs to one scope on one thread.
 */
// `std::invocable<Callable&>` rather than `std::invocable<Callable>`: the guard invokes its
// stored member as an lvalue, so rvalue-only callables are rejected at make_scope_guard().
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            run();
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// Deactivates the guard; the callable will not run.
    constexpr void dismiss() noexcept { m_active = false; }

    /// Runs the callable now (if still active) and dismisses the guard.
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false; // Must dismiss before invoke to prevent double execution.
            run();
        }
    }

  private:
    void run() noexcept
    {
        try
        {
            std::invoke(m_func);
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "[ScopeGuard] cleanup action threw: %s\n", e.what());
        }
    }

    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Factory for ScopeGuard. The callable is stored by value (decayed); references it
 *        captures must outlive the guard.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace blkpipe::basics
