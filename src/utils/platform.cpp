/**
 * @file platform.cpp
 * @brief Implementations of the core OS-specific utilities declared in bp_platform.hpp.
 *
 * Process and thread IDs, the monotonic clock and package version information. The
 * thread ID uses the most specific API each POSIX flavour offers.
 */
#include "bp_base.hpp"
#include "blkpipe_version.h"

#include <chrono>
#include <functional>
#include <thread>

#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#if defined(BLKPIPE_PLATFORM_APPLE)
#include <pthread.h>
#endif

namespace blkpipe::platform
{

uint64_t get_pid()
{
    return static_cast<uint64_t>(getpid());
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Suitable for logging: `pthread_threadid_np` on macOS, `syscall(SYS_gettid)` on
 *          Linux, a hash of `std::thread::id` elsewhere.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(BLKPIPE_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(BLKPIPE_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

const char *get_version_string() noexcept
{
    return BLKPIPE_VERSION_STRING;
}

} // namespace blkpipe::platform
