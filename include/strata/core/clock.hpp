#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace strata {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Source of "now"; injected so expiry and restore timing are testable
 */
using ClockFn = std::function<TimePoint()>;

inline TimePoint system_now() { return Clock::now(); }

inline ClockFn system_clock_fn() { return &system_now; }

/// ISO-8601 UTC rendering used in log lines
std::string format_time(TimePoint tp);

} // namespace strata
