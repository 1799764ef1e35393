#pragma once

#include <time.h>

#include <cerrno>
#include <cstdint>
#include <system_error>

namespace zerobench {
namespace timing {

inline uint64_t timespec_to_ns(const struct timespec *ts) {
  return uint64_t(ts->tv_sec) * 1000000000ull + uint64_t(ts->tv_nsec);
}

/// Monotonic clock reading in nanoseconds.
inline uint64_t now_ns() {
  struct timespec ts;
  if (clock_gettime(CLOCK_MONOTONIC, &ts) < 0) {
    throw std::system_error(errno, std::system_category(), "clock_gettime");
  }
  return timespec_to_ns(&ts);
}

inline uint64_t time_diff(uint64_t start_ns, uint64_t end_ns) {
  return end_ns > start_ns ? end_ns - start_ns : 0;
}

}  // namespace timing
}  // namespace zerobench
