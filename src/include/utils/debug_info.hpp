/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors, and
 *        debug messaging.
 *
 * The functions in `blkpipe::debug` use `fmt` for compile-time format string checks and
 * `std::source_location` for automatic source location reporting.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", blkpipe::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace blkpipe::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * Uses `backtrace` and `backtrace_symbols`, with `dladdr` and `__cxa_demangle` to
 * produce readable frame names. Errors during capture are reported to `stderr`.
 */
BLKPIPE_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Intended for unrecoverable errors (broken internal invariants). Prints the message with
 * the source location, calls `print_stack_trace()` and then `std::abort()`.
 *
 * @param loc The source location where `panic` was called.
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] FATAL ERROR WHILE FORMATTING PANIC MESSAGE: %s\n", e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FATAL ERROR DURING DEBUG_MSG: %s\n", e.what());
        std::fflush(stderr);
    }
}

} // namespace blkpipe::debug

// ---------------- thin macros for convenience --------------

#ifndef BP_LOC_HERE_STR
#define BP_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Calls `blkpipe::debug::panic` with automatic source location.
 * @param fmt The `fmt`-style format string literal.
 */
#ifndef BP_PANIC
#define BP_PANIC(fmt, ...)                                                                         \
    ::blkpipe::debug::panic(std::source_location::current(),                                      \
                            FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Calls `blkpipe::debug::debug_msg`. Compiled out unless
 *        BLKPIPE_ENABLE_DEBUG_MESSAGES is defined.
 */
#ifndef BP_DEBUG
#if defined(BLKPIPE_ENABLE_DEBUG_MESSAGES)
#define BP_DEBUG(fmt, ...) ::blkpipe::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define BP_DEBUG(fmt, ...)                                                                         \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
