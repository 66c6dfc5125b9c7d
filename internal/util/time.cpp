#include "time.hpp"

namespace registry::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixNanos(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count());
}

uint64_t NowNanos() {
  return ToUnixNanos(Now());
}

NowFn SystemClock() {
  return [] { return NowNanos(); };
}

} // namespace registry::util
