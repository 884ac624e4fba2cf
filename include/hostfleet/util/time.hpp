#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <string>

namespace hostfleet {

using TimePoint = std::chrono::system_clock::time_point;

// Wall-clock source for every timeout and timestamp in the fleet. Injected so
// timeouts can be driven deterministically.
class Clock {
public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual auto now() const -> TimePoint = 0;
};

class SystemClock final : public Clock {
public:
  [[nodiscard]] auto now() const -> TimePoint override {
    return std::chrono::system_clock::now();
  }
};

[[nodiscard]] inline auto system_clock() -> const Clock & {
  static const SystemClock instance;
  return instance;
}

namespace util {

// Formats time point to local timestamp (YYYY-MM-DD HH:MM:SS)
[[nodiscard]] inline auto format_local_timestamp(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return "-";
  }
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

[[nodiscard]] inline auto format_elapsed(TimePoint since, TimePoint now)
    -> std::string {
  if (since == TimePoint{}) {
    return "-";
  }
  auto dur =
      std::chrono::duration_cast<std::chrono::seconds>(now - since).count();
  if (dur < 0)
    dur = 0;
  if (dur < 60)
    return std::format("{}s", dur);
  if (dur < 3600)
    return std::format("{}m {}s", dur / 60, dur % 60);
  return std::format("{}h {}m", dur / 3600, (dur % 3600) / 60);
}

[[nodiscard]] inline auto to_unix_seconds(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::seconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_unix_seconds(std::int64_t secs) -> TimePoint {
  return TimePoint{std::chrono::seconds{secs}};
}

[[nodiscard]] inline auto to_system_time(std::filesystem::file_time_type ft)
    -> TimePoint {
  return std::chrono::clock_cast<std::chrono::system_clock>(ft);
}

[[nodiscard]] inline auto to_file_time(TimePoint tp)
    -> std::filesystem::file_time_type {
  return std::chrono::clock_cast<std::chrono::file_clock>(tp);
}

} // namespace util

} // namespace hostfleet
