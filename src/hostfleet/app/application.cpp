#include "hostfleet/app/application.hpp"

#include "hostfleet/config/config.hpp"
#include "hostfleet/util/daemon.hpp"
#include "hostfleet/util/log.hpp"
#include "hostfleet/util/time.hpp"

#include <boost/asio/redirect_error.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <sys/wait.h>
#include <unistd.h>

namespace hostfleet {

namespace {

[[nodiscard]] auto self_executable() -> std::string {
  std::error_code ec;
  auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
  return ec ? std::string("/proc/self/exe") : path.string();
}

} // namespace

Application::Application(FleetConfig config, RunOptions options)
    : config_(std::move(config)), options_(std::move(options)),
      role_(detect_role(options_.macros)), signals_(io_), tick_timer_(io_),
      launcher_(io_) {
  std::signal(SIGPIPE, SIG_IGN);
}

Application::~Application() { stop(exit_code_); }

auto Application::spawn_settings() const -> SpawnSettings {
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  return SpawnSettings{
      .executable = config_.fleet.instance_executable.empty()
                        ? self_executable()
                        : config_.fleet.instance_executable,
      .config_path = options_.config_file,
      .working_dir = ec ? std::string(".") : cwd.string(),
      .base_macros = options_.macros,
  };
}

auto Application::init_manager() -> Result<void> {
  log::set_tag("manager");
  manager_ = std::make_unique<FleetManager>(config_, lobby_, launcher_,
                                            system_clock(), spawn_settings());
  return manager_->start();
}

auto Application::init_worker() -> Result<void> {
  auto identity = WorkerIdentity::from_macros(options_.macros, config_);
  if (!identity) {
    return fail(identity.error());
  }
  log::set_tag(identity->lobby_login);
  worker_store_ =
      std::make_unique<PidRecordStore>(config_.pid_dir(), system_clock());
  worker_ = std::make_unique<InstanceWorker>(
      config_, *worker_store_, lobby_, system_clock(), std::move(*identity),
      [this](std::string_view reason) {
        log::info("Exiting: {}", reason);
        stop(0);
      });
  return worker_->start(options_.context);
}

auto Application::init() -> Result<void> {
  auto r = role_ == Role::Manager ? init_manager() : init_worker();
  if (!r) {
    return r;
  }

  lobby_.set_event_handler(
      [this](const LobbyEvent &event) { on_lobby_event(event); });
  lobby_.set_close_handler([this]() { stop(exit_code_); });
  if (auto started = lobby_.start(io_, options_.lobby_fd); !started) {
    return started;
  }

  signals_.add(SIGINT);
  signals_.add(SIGTERM);
  signals_.add(SIGHUP);
  signals_.add(SIGCHLD);
  if (role_ == Role::Worker) {
    signals_.add(SIGUSR1);
  }
  wait_signal();

  co_spawn(io_, tick_loop(), detached);
  log::info("Running in {} mode", to_string_view(role_));
  return ok();
}

auto Application::run() -> int {
  io_.run();
  return exit_code_;
}

auto Application::stop(int exit_code) noexcept -> void {
  if (stopped_) {
    return;
  }
  stopped_ = true;
  exit_code_ = exit_code;

  if (manager_) {
    manager_->shutdown();
  }
  if (worker_ && worker_->claimed()) {
    if (auto r = worker_->unload(UnloadReason::Exit); !r) {
      log::error("Failed to record instance exit: {}", r.error().message());
    }
  }
  lobby_.stop();
  boost::system::error_code ec;
  signals_.cancel(ec);
  tick_timer_.cancel();
  io_.stop();
}

auto Application::tick_loop() -> task<void> {
  const auto interval =
      std::chrono::milliseconds(config_.fleet.tick_interval_ms);
  while (!stopped_) {
    tick_timer_.expires_after(interval);
    boost::system::error_code ec;
    co_await tick_timer_.async_wait(
        boost::asio::redirect_error(use_awaitable, ec));
    if (ec == boost::asio::error::operation_aborted || stopped_) {
      co_return;
    }
    if (manager_) {
      manager_->tick();
    } else if (worker_) {
      worker_->tick();
    }
  }
}

auto Application::wait_signal() -> void {
  signals_.async_wait(
      [this](const boost::system::error_code &ec, int signal_no) {
        if (ec) {
          return;
        }
        on_signal(signal_no);
        if (!stopped_) {
          wait_signal();
        }
      });
}

auto Application::on_signal(int signal_no) -> void {
  switch (signal_no) {
  case SIGINT:
  case SIGTERM:
    log::info("Received signal {}, shutting down", signal_no);
    stop(0);
    break;
  case SIGHUP:
    if (manager_) {
      reload_manager_config();
    } else {
      restart_worker();
    }
    break;
  case SIGUSR1:
    reload_worker();
    break;
  case SIGCHLD:
    reap_children();
    break;
  default:
    break;
  }
}

auto Application::on_lobby_event(const LobbyEvent &event) -> void {
  if (manager_) {
    if (auto r = manager_->handle_event(event); !r) {
      log::error("Unable to initialize fleet data: {}", r.error().message());
      stop(1);
    }
  } else if (worker_) {
    worker_->handle(event);
  }
}

auto Application::reload_manager_config() -> void {
  log::info("Reloading configuration from {}", options_.config_file);
  auto next = ConfigLoader::load_from_file(options_.config_file);
  if (!next) {
    log::error("Configuration reload failed: {}", next.error().message());
    return;
  }
  if (auto r = manager_->reload(std::move(*next)); !r) {
    log::warn("Configuration not applied: {}", r.error().message());
  }
}

auto Application::reload_worker() -> void {
  if (!worker_) {
    return;
  }
  if (auto r = worker_->unload(UnloadReason::Reload); !r) {
    log::error("Unable to reload instance: {}", r.error().message());
    return;
  }
  if (auto next = ConfigLoader::load_from_file(options_.config_file)) {
    config_ = std::move(*next);
  } else {
    log::warn("Keeping previous configuration: {}", next.error().message());
  }
  if (auto r = worker_->start(StartContext::Reload); !r) {
    log::error("Unable to restart instance logic after reload");
    stopped_ = true;
    exit_code_ = 1;
    io_.stop();
  }
}

auto Application::restart_worker() -> void {
  log::info("Restarting instance process");
  if (auto r = worker_->unload(UnloadReason::Restart); !r) {
    log::error("Unable to restart instance: {}", r.error().message());
    return;
  }
  std::vector<char *> argv;
  argv.reserve(options_.argv.size() + 1);
  for (auto &arg : options_.argv) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  ::execv("/proc/self/exe", argv.data());
  log::error("Failed to re-execute instance process: {}",
             std::strerror(errno));
  // The record is already marked restarting; the manager times it out.
  stopped_ = true;
  exit_code_ = 1;
  io_.stop();
}

auto Application::reap_children() -> void {
  int status = 0;
  pid_t pid = 0;
  while ((pid = ::waitpid(-1, &status, WNOHANG)) > 0) {
    if (WIFEXITED(status)) {
      log::debug("Child process {} exited with status {}", pid,
                 WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
      log::debug("Child process {} killed by signal {}", pid,
                 WTERMSIG(status));
    }
  }
}

} // namespace hostfleet
