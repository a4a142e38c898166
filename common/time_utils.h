#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace Common {

// Monotonic nanoseconds, for measuring durations
inline uint64_t getNanosSinceEpoch() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

// Wall clock nanoseconds, for log line timestamps
inline uint64_t getWallClockNanos() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

/// Local time as YYYYmmdd_HHMMSS, used for log file names
inline auto formatFileTimestamp(char* buffer, size_t len) noexcept -> bool {
  const auto now = std::chrono::system_clock::now();
  const auto time_t_now = std::chrono::system_clock::to_time_t(now);
  struct tm local_tm{};
  if (!localtime_r(&time_t_now, &local_tm)) {
    return false;
  }
  return std::strftime(buffer, len, "%Y%m%d_%H%M%S", &local_tm) > 0;
}

inline double nanosToMillis(uint64_t nanos) noexcept {
  return static_cast<double>(nanos) / 1'000'000.0;
}

} // namespace Common
