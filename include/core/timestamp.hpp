#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace ov_bench::core {

inline std::uint64_t monotonic_timestamp_now_ns() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

// 2024-05-01T12:30:00.250Z
inline std::string format_utc_iso8601(const std::uint64_t unix_ms) {
  const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000ULL);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32]{};
  const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
  std::string out(buffer, written);

  char millis[8]{};
  std::snprintf(millis, sizeof(millis), ".%03u", static_cast<unsigned>(unix_ms % 1000ULL));
  out += millis;
  out += 'Z';
  return out;
}

}  // namespace ov_bench::core
