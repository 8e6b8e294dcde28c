/**
 * @file debug_info.cpp
 * @brief POSIX stack trace printing for blkpipe::debug::print_stack_trace().
 */
#include "bp_base.hpp"

#include <cstdlib>
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols
#include <string>

namespace
{

// Formats into a stack buffer and writes straight to stderr. Lines longer than the
// buffer are truncated; nothing here allocates on the formatting path.
template <typename... Args>
bool safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        constexpr std::size_t STACK_BUF_SZ = 2048;
        char stack_buf[STACK_BUF_SZ];
        auto result = fmt::format_to_n(stack_buf, STACK_BUF_SZ, fmt_str, std::forward<Args>(args)...);
        const std::size_t needed = static_cast<std::size_t>(result.size);
        const std::size_t have = needed < STACK_BUF_SZ ? needed : STACK_BUF_SZ;
        if (have > 0)
        {
            std::fwrite(stack_buf, 1, have, stderr);
        }
        return true;
    }
    catch (const fmt::format_error &)
    {
        std::fputs("[stack trace: format error]\n", stderr);
        return false;
    }
}

std::string demangle(const char *mangled)
{
    int status = 0;
    char *dem = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status == 0 && dem)
    {
        std::string out(dem);
        std::free(dem);
        return out;
    }
    return mangled;
}

} // namespace

namespace blkpipe::debug
{

void print_stack_trace() noexcept
{
    try
    {
        constexpr int kMaxFrames = 200;
        void *callstack[kMaxFrames];
        int nframes = backtrace(callstack, kMaxFrames);
        if (nframes <= 0)
        {
            safe_format_to_stderr("  [No stack frames available]\n");
            return;
        }

        char **symbols = backtrace_symbols(callstack, nframes);
        auto free_symbols = blkpipe::basics::make_scope_guard([&symbols]() { std::free(symbols); });

        safe_format_to_stderr("Stack Trace (most recent call first):\n");
        for (int i = 0; i < nframes; ++i)
        {
            const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            safe_format_to_stderr("  #{:02}  {:#018x}  ", i, static_cast<unsigned long long>(addr));

            Dl_info dlinfo;
            if (dladdr(callstack[i], &dlinfo) && dlinfo.dli_sname)
            {
                const auto saddr = reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
                safe_format_to_stderr("{} + {:#x}", demangle(dlinfo.dli_sname),
                                      static_cast<unsigned long long>(addr - saddr));
            }
            else if (symbols && symbols[i])
            {
                safe_format_to_stderr("{}", symbols[i]);
            }
            else
            {
                safe_format_to_stderr("[unknown]");
            }
            safe_format_to_stderr("\n");
        }
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[stack trace unavailable: %s]\n", e.what());
    }
}

} // namespace blkpipe::debug
