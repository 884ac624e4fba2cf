#include "hostfleet/util/daemon.hpp"

#include "hostfleet/util/log.hpp"

#include <boost/filesystem.hpp>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/file_lock.hpp>

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace hostfleet {

namespace {
auto delete_file_lock(void *ptr) -> void {
  delete static_cast<boost::interprocess::file_lock *>(ptr);
}

auto ensure_parent_directory(std::string_view path) -> Result<void> {
  boost::system::error_code ec;
  const boost::filesystem::path p{std::string(path)};
  const auto parent = p.parent_path();
  if (parent.empty()) {
    return ok();
  }
  if (!boost::filesystem::exists(parent, ec)) {
    boost::filesystem::create_directories(parent, ec);
    if (ec) {
      return fail(std::error_code(ec.value(), std::system_category()));
    }
  }
  return ok();
}
} // namespace

FileLockGuard::FileLockGuard(
    std::string path, std::unique_ptr<void, void (*)(void *)> lock) noexcept
    : path_(std::move(path)), lock_(std::move(lock)), owns_(true) {}

FileLockGuard::~FileLockGuard() { release(); }

FileLockGuard::FileLockGuard(FileLockGuard &&other) noexcept
    : path_(std::move(other.path_)), lock_(std::move(other.lock_)),
      owns_(other.owns_) {
  other.owns_ = false;
}

auto FileLockGuard::operator=(FileLockGuard &&other) noexcept
    -> FileLockGuard & {
  if (this == &other) {
    return *this;
  }
  release();
  path_ = std::move(other.path_);
  lock_ = std::move(other.lock_);
  owns_ = other.owns_;
  other.owns_ = false;
  return *this;
}

auto FileLockGuard::try_acquire(std::string_view path)
    -> Result<FileLockGuard> {
  return lock_file(path, false);
}

auto FileLockGuard::acquire(std::string_view path) -> Result<FileLockGuard> {
  return lock_file(path, true);
}

auto FileLockGuard::lock_file(std::string_view path, bool blocking)
    -> Result<FileLockGuard> {
  if (path.empty()) {
    return fail(Error::InvalidArgument);
  }

  if (auto r = ensure_parent_directory(path); !r) {
    return fail(r.error());
  }
  {
    std::ofstream touch(std::string(path), std::ios::app);
    if (!touch.is_open()) {
      log::error("Unable to open lock file {}", path);
      return fail(Error::FileOpenFailed);
    }
  }

  try {
    auto *raw_lock =
        new boost::interprocess::file_lock(std::string(path).c_str());
    std::unique_ptr<void, void (*)(void *)> lock(raw_lock, delete_file_lock);
    if (blocking) {
      raw_lock->lock();
    } else if (!raw_lock->try_lock()) {
      return fail(Error::LockFailed);
    }
    return ok(FileLockGuard(std::string(path), std::move(lock)));
  } catch (const boost::interprocess::interprocess_exception &e) {
    log::error("Unable to lock file {}: {}", path, e.what());
    return fail(Error::LockFailed);
  }
}

auto FileLockGuard::release() noexcept -> void {
  if (!owns_) {
    return;
  }
  owns_ = false;

  if (lock_) {
    auto *raw = static_cast<boost::interprocess::file_lock *>(lock_.get());
    try {
      raw->unlock();
    } catch (const boost::interprocess::interprocess_exception &e) {
      log::warn("Unable to unlock file {}: {}", path_, e.what());
    }
  }
  lock_.reset();
}

auto daemonize() -> Result<void> {
  return sys_check(fork())
      .and_then([](pid_t pid) -> Result<void> {
        if (pid > 0)
          _Exit(0);
        return ok();
      })
      .and_then([]() { return sys_check(setsid()); })
      .and_then([](auto) { return sys_check(fork()); })
      .and_then([](pid_t pid) -> Result<void> {
        if (pid > 0)
          _Exit(0);
        return ok();
      })
      .and_then([]() { return sys_check(chdir("/")); })
      .and_then([](auto) -> Result<void> {
        umask(0022);
        (void)close(STDIN_FILENO);
        (void)close(STDOUT_FILENO);
        (void)close(STDERR_FILENO);
        return ok();
      });
}

auto current_pid() -> std::int64_t {
  return static_cast<std::int64_t>(::getpid());
}

auto is_process_alive(std::int64_t pid) -> bool {
  if (pid <= 0) {
    return false;
  }
  if (::kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

auto send_signal(std::int64_t pid, int signal_no) -> Result<void> {
  if (pid <= 0) {
    return fail(Error::InvalidArgument);
  }
  if (::kill(static_cast<pid_t>(pid), signal_no) != 0) {
    return fail(std::error_code(errno, std::system_category()));
  }
  return ok();
}

} // namespace hostfleet
