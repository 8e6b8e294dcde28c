/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for operations that fail in expected ways.
 *
 * - Distinguishes between success (T) and expected failures (E)
 * - Forces explicit error handling at call sites
 * - No implicit conversion to bool
 * - [[nodiscard]] factories and accessors
 *
 * E is usually a small error enum or an error record such as `std::error_code` or
 * `transfer::TransferError`. The optional integer code carries a detail value (an errno,
 * for instance) alongside it.
 */
#pragma once

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace blkpipe
{

/**
 * @class Result
 * @brief Either a success value of type T or an error of type E.
 *
 * @code
 * Result<size_t, std::error_code> r = device.read_at(offset, buf);
 * if (r.is_error()) {
 *     LOGGER_ERROR("read failed: {}", r.error().message());
 *     return;
 * }
 * size_t n = r.content();
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @brief Create a failed Result.
     * @param err The error value.
     * @param code Optional detailed error code (default 0).
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{std::move(err), code};
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, 0}) {}

    // Movable but not copyable, to avoid accidental copies of large values
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /**
     * @brief Access the success value.
     * @throws std::logic_error if Result is in error state.
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    /**
     * @brief Access the error value.
     * @throws std::logic_error if Result is in success state.
     */
    [[nodiscard]] const E &error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_value;
    }

    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

  private:
    struct ErrorData
    {
        E error_value;
        int error_code;
    };

    std::variant<T, ErrorData> m_data;
};

} // namespace blkpipe
