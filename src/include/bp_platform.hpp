#pragma once
/**
 * @file bp_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (BLKPIPE_PLATFORM_LINUX, BLKPIPE_IS_POSIX, etc.) should include
 * this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_APPLE)

#define BLKPIPE_PLATFORM_APPLE 1
#undef BLKPIPE_PLATFORM_LINUX
#undef BLKPIPE_PLATFORM_FREEBSD

#elif defined(PLATFORM_FREEBSD)

#define BLKPIPE_PLATFORM_FREEBSD 1
#undef BLKPIPE_PLATFORM_APPLE
#undef BLKPIPE_PLATFORM_LINUX

#elif defined(PLATFORM_LINUX)

#define BLKPIPE_PLATFORM_LINUX 1
#undef BLKPIPE_PLATFORM_APPLE
#undef BLKPIPE_PLATFORM_FREEBSD

#else
// Fallback detection
#if defined(__APPLE__) && defined(__MACH__)
#define BLKPIPE_PLATFORM_APPLE 1
#undef BLKPIPE_PLATFORM_LINUX
#undef BLKPIPE_PLATFORM_FREEBSD

#elif defined(__FreeBSD__)
#define BLKPIPE_PLATFORM_FREEBSD 1
#undef BLKPIPE_PLATFORM_APPLE
#undef BLKPIPE_PLATFORM_LINUX

#elif defined(__linux__)
#define BLKPIPE_PLATFORM_LINUX 1
#undef BLKPIPE_PLATFORM_APPLE
#undef BLKPIPE_PLATFORM_FREEBSD

#else
#define BLKPIPE_PLATFORM_UNKNOWN 1
#undef BLKPIPE_PLATFORM_FREEBSD
#undef BLKPIPE_PLATFORM_APPLE
#undef BLKPIPE_PLATFORM_LINUX
#endif
#endif

// Convenience boolean for source code usage:
#if defined(BLKPIPE_PLATFORM_APPLE) || defined(BLKPIPE_PLATFORM_FREEBSD) ||                      \
    defined(BLKPIPE_PLATFORM_LINUX)
#define BLKPIPE_IS_POSIX 1
#else
#undef BLKPIPE_IS_POSIX
#endif

#if !defined(BLKPIPE_IS_POSIX)
#error "blkpipe needs positioned I/O (pread/pwrite) and is only supported on POSIX platforms."
#endif

// --- Require C++20 or later --------------------------------------------------
// The codebase uses std::source_location, concepts and designated initializers.
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif

#include "blkpipe_utils_export.h"

namespace blkpipe::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
BLKPIPE_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the current process ID.
 * @return The PID of the calling process.
 */
BLKPIPE_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @return Nanoseconds since an unspecified epoch. Use for deltas only.
 */
BLKPIPE_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Nanoseconds elapsed since @p start_ns (a value from monotonic_time_ns()).
 * @return 0 if start_ns lies in the future.
 */
BLKPIPE_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

/**
 * @brief Returns the version string of the package ("major.minor.rolling").
 */
BLKPIPE_UTILS_EXPORT const char *get_version_string() noexcept;

} // namespace blkpipe::platform
