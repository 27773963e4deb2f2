#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace Common {

// Nanoseconds from CLOCK_MONOTONIC, for measuring durations
inline uint64_t getNanosSinceEpoch() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

// Nanoseconds from CLOCK_REALTIME for wall clock
inline uint64_t getWallClockNanos() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

/// Format a wall clock time as ISO-8601 UTC with millisecond precision,
/// e.g. "2026-10-18T09:14:03.125Z". Returns false if the buffer is too small.
inline bool formatIso8601(uint64_t wall_nanos, char* buffer, size_t size) noexcept {
  const time_t secs = static_cast<time_t>(wall_nanos / 1'000'000'000ULL);
  const unsigned millis = static_cast<unsigned>((wall_nanos / 1'000'000ULL) % 1000ULL);

  struct tm tm_utc;
  if (!gmtime_r(&secs, &tm_utc)) return false;

  char date_part[32];
  if (strftime(date_part, sizeof(date_part), "%Y-%m-%dT%H:%M:%S", &tm_utc) == 0) return false;

  const int len = snprintf(buffer, size, "%s.%03uZ", date_part, millis);
  return len > 0 && static_cast<size_t>(len) < size;
}

// Compact local timestamp for file names: 20261018_091403
inline bool formatFileStamp(char* buffer, size_t size) noexcept {
  const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  struct tm tm_local;
  if (!localtime_r(&now, &tm_local)) return false;
  return strftime(buffer, size, "%Y%m%d_%H%M%S", &tm_local) != 0;
}

} // namespace Common
