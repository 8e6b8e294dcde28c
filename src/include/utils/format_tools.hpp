// Tools for formatting strings
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "blkpipe_utils_export.h"

namespace blkpipe::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
BLKPIPE_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Renders a byte count with a binary unit suffix, e.g. "64.00 MiB".
 * @details Values below 1 KiB are printed as an exact count ("512 B").
 */
BLKPIPE_UTILS_EXPORT std::string human_bytes(uint64_t bytes);

/**
 * @brief Renders a transfer rate for @p bytes moved in @p elapsed, e.g. "212.40 MiB/s".
 * @details A zero duration yields "n/a".
 */
BLKPIPE_UTILS_EXPORT std::string human_rate(uint64_t bytes, std::chrono::nanoseconds elapsed);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 * @tparam Args Argument types for the format string.
 * @param fmt_str The `fmt`-style format string.
 * @param args The arguments to format.
 * @return A `fmt::memory_buffer` containing the formatted result.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128); // small reserve to avoid many reallocs
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 * @param file_path A string_view of the full path.
 * @return A string_view of just the filename portion of the path.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    if (last_slash == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_slash + 1);
}

} // namespace blkpipe::format_tools
