#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace registry::util {

/*
  Time utilities. The clock source is injected everywhere through NowFn.

  Registry timestamps are nanoseconds since the Unix epoch.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injected into components that compare against the current time.
using NowFn = std::function<uint64_t()>;

constexpr uint64_t kNanosPerSecond = 1'000'000'000ULL;
constexpr uint64_t kNanosPerDay    = 86'400ULL * kNanosPerSecond;

TimePoint Now();

uint64_t ToUnixNanos(TimePoint tp);

uint64_t NowNanos();

NowFn SystemClock();

} // namespace registry::util
