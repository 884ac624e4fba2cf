#pragma once

#include "hostfleet/config/conf_macros.hpp"
#include "hostfleet/config/fleet_config.hpp"
#include "hostfleet/core/coroutine.hpp"
#include "hostfleet/core/error.hpp"
#include "hostfleet/fleet/bootstrap.hpp"
#include "hostfleet/fleet/manager.hpp"
#include "hostfleet/fleet/pid_record.hpp"
#include "hostfleet/fleet/worker.hpp"
#include "hostfleet/launcher/process_launcher.hpp"
#include "hostfleet/lobby/console_lobby.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <memory>
#include <string>
#include <vector>

namespace hostfleet {

struct RunOptions {
  // Absolute path, also handed to spawned instances.
  std::string config_file;
  MacroMap macros;
  // Original command line, replayed when a worker restarts.
  std::vector<std::string> argv;
  StartContext context{StartContext::Autoload};
  int lobby_fd{0};
};

// One process of the fleet, manager or worker depending on its macros, with
// its event loop, signals and lobby bridge.
class Application {
public:
  Application(FleetConfig config, RunOptions options);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto init() -> Result<void>;
  // Runs until a stop signal, a worker exit or the end of lobby input.
  // Returns the process exit code.
  [[nodiscard]] auto run() -> int;
  auto stop(int exit_code = 0) noexcept -> void;

  [[nodiscard]] auto role() const noexcept -> Role { return role_; }

private:
  FleetConfig config_;
  RunOptions options_;
  Role role_;

  boost::asio::io_context io_;
  boost::asio::signal_set signals_;
  boost::asio::steady_timer tick_timer_;
  ConsoleLobby lobby_;
  DetachedProcessLauncher launcher_;

  std::unique_ptr<FleetManager> manager_;
  std::unique_ptr<PidRecordStore> worker_store_;
  std::unique_ptr<InstanceWorker> worker_;

  int exit_code_{0};
  bool stopped_{false};

  [[nodiscard]] auto init_manager() -> Result<void>;
  [[nodiscard]] auto init_worker() -> Result<void>;
  [[nodiscard]] auto spawn_settings() const -> SpawnSettings;

  auto tick_loop() -> task<void>;
  auto wait_signal() -> void;
  auto on_signal(int signal_no) -> void;
  auto on_lobby_event(const LobbyEvent &event) -> void;

  auto reload_manager_config() -> void;
  auto reload_worker() -> void;
  auto restart_worker() -> void;
  auto reap_children() -> void;
};

} // namespace hostfleet
