// format_tools.cpp
#include "bp_base.hpp"

#include <array>

namespace blkpipe::format_tools
{

// Formatted local time with microsecond resolution. fmt's sub-second chrono support
// differs between releases, so the fraction is computed and appended manually.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string human_bytes(uint64_t bytes)
{
    static constexpr std::array<const char *, 6> kUnits = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    if (bytes < 1024)
    {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size())
    {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, kUnits[unit]);
}

std::string human_rate(uint64_t bytes, std::chrono::nanoseconds elapsed)
{
    if (elapsed.count() <= 0)
    {
        return "n/a";
    }
    const double seconds = std::chrono::duration<double>(elapsed).count();
    const auto per_second = static_cast<uint64_t>(static_cast<double>(bytes) / seconds);
    return human_bytes(per_second) + "/s";
}

} // namespace blkpipe::format_tools
