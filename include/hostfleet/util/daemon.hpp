#pragma once

#include "hostfleet/core/error.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace hostfleet {

// Exclusive advisory lock held on a file for the lifetime of the guard. The
// file is created if needed and left in place on release.
class FileLockGuard {
public:
  FileLockGuard() = default;
  ~FileLockGuard();

  FileLockGuard(const FileLockGuard &) = delete;
  auto operator=(const FileLockGuard &) -> FileLockGuard & = delete;
  FileLockGuard(FileLockGuard &&other) noexcept;
  auto operator=(FileLockGuard &&other) noexcept -> FileLockGuard &;

  // Fails with LockFailed when another process holds the lock.
  [[nodiscard]] static auto try_acquire(std::string_view path)
      -> Result<FileLockGuard>;
  [[nodiscard]] static auto acquire(std::string_view path)
      -> Result<FileLockGuard>;

  [[nodiscard]] auto owns() const noexcept -> bool { return owns_; }
  [[nodiscard]] auto path() const noexcept -> const std::string & {
    return path_;
  }

  auto release() noexcept -> void;

private:
  std::string path_;
  std::unique_ptr<void, void (*)(void *)> lock_{nullptr, nullptr};
  bool owns_{false};

  explicit FileLockGuard(std::string path,
                         std::unique_ptr<void, void (*)(void *)> lock) noexcept;
  [[nodiscard]] static auto lock_file(std::string_view path, bool blocking)
      -> Result<FileLockGuard>;
};

[[nodiscard]] auto daemonize() -> Result<void>;
[[nodiscard]] auto current_pid() -> std::int64_t;
[[nodiscard]] auto is_process_alive(std::int64_t pid) -> bool;
[[nodiscard]] auto send_signal(std::int64_t pid, int signal_no) -> Result<void>;

} // namespace hostfleet
