#pragma once

#include <chrono>
#include <fmt/chrono.h>

using Clock = std::chrono::system_clock;
using Time = Clock::time_point;
using Millis = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;
using Minutes = std::chrono::minutes;

inline auto formatted_time(const Time time) { return fmt::format("{:%Y-%m-%d %H:%M:%S}Z", fmt::gmtime(time)); }

// Whole milliseconds from one instant to another, negative if |to| precedes |from|.
inline long ms_between(const Time from, const Time to) {
    return std::chrono::duration_cast<Millis>(to - from).count();
}
