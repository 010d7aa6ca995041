#pragma once

#include <chrono>
#include <ctime>
#include <string>

// Returns local date in format of @p format (format like in strftime(3)), if
// @p curr_time >= 0 uses @p curr_time, otherwise uses the current time
std::string localdate(const char* format, time_t curr_time = -1);

// Returns local date in format of "%Y-%m-%d %H:%M:%S" (see strftime(3))
inline std::string localdate_str(time_t curr_time = -1) {
    return localdate("%Y-%m-%d %H:%M:%S", curr_time);
}

constexpr timespec to_timespec(std::chrono::nanoseconds dur) noexcept {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(dur);
    return {static_cast<time_t>(secs.count()), static_cast<long>((dur - secs).count())};
}

constexpr std::chrono::nanoseconds to_nanoseconds(const timespec& ts) noexcept {
    return std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
}

constexpr timespec operator-(const timespec& a, const timespec& b) noexcept {
    return to_timespec(to_nanoseconds(a) - to_nanoseconds(b));
}

constexpr bool operator==(const timespec& a, const timespec& b) noexcept {
    return a.tv_sec == b.tv_sec and a.tv_nsec == b.tv_nsec;
}

// Formats @p dur as seconds with @p precision digits after the dot, truncating
std::string to_seconds_str(std::chrono::nanoseconds dur, unsigned precision = 3);
