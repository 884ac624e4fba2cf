#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>

namespace hostfleet::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

// Synchronous line logger. Manager and instances each run a single event
// loop, so lines are formatted and flushed in the calling thread.
class Logger {
  Level level_{Level::Info};
  FILE *output_{stderr};
  FILE *file_{nullptr};
  bool color_{false};
  std::string tag_{"hostfleet"};
  std::string buffer_;

  auto refresh_color() noexcept -> void {
    const int fd = ::fileno(output_);
    color_ = fd >= 0 && ::isatty(fd) != 0;
  }

public:
  Logger() { refresh_color(); }
  ~Logger() {
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto set_level(Level level) noexcept -> void { level_ = level; }

  [[nodiscard]] auto level() const noexcept -> Level { return level_; }

  auto set_tag(std::string_view tag) -> void { tag_ = tag; }

  [[nodiscard]] auto tag() const noexcept -> std::string_view { return tag_; }

  auto set_output_stderr() noexcept -> void {
    output_ = stderr;
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
    refresh_color();
  }

  auto set_output_file(std::string_view path) -> bool {
    if (path.empty()) {
      set_output_stderr();
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f)
      return false;
    std::setvbuf(f, nullptr, _IOLBF, 0);
    if (file_)
      std::fclose(file_);
    file_ = f;
    output_ = f;
    refresh_color();
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_)
      return;

    const auto time = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    buffer_.clear();
    if (color_) {
      std::format_to(std::back_inserter(buffer_),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] ", time,
                     level_color(level), level_name(level), "\o{33}[0m", tag_);
    } else {
      std::format_to(std::back_inserter(buffer_),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] ", time,
                     level_name(level), tag_);
    }
    std::format_to(std::back_inserter(buffer_), fmt,
                   std::forward<Args>(args)...);
    buffer_.push_back('\n');
    std::fwrite(buffer_.data(), 1, buffer_.size(), output_);
    std::fflush(output_);
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  const auto *it = std::ranges::find(level_names, name);
  auto level = (it != level_names.end())
                   ? static_cast<Level>(std::distance(level_names.begin(), it))
                   : Level::Info;
  logger().set_level(level);
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto set_tag(std::string_view tag) -> void { logger().set_tag(tag); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace hostfleet::log
