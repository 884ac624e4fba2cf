#pragma once

#include "hostfleet/config/fleet_config.hpp"
#include "hostfleet/core/error.hpp"
#include "hostfleet/fleet/account_registry.hpp"
#include "hostfleet/fleet/admission.hpp"
#include "hostfleet/fleet/commands.hpp"
#include "hostfleet/fleet/fleet_index.hpp"
#include "hostfleet/fleet/liveness.hpp"
#include "hostfleet/fleet/pid_record.hpp"
#include "hostfleet/fleet/presence.hpp"
#include "hostfleet/fleet/provisioner.hpp"
#include "hostfleet/launcher/process_launcher.hpp"
#include "hostfleet/lobby/lobby.hpp"
#include "hostfleet/util/daemon.hpp"
#include "hostfleet/util/time.hpp"

namespace hostfleet {

// Fleet manager: owns the instance index and drives detection, provisioning,
// pruning and lobby commands from a single event loop.
class FleetManager {
public:
  FleetManager(FleetConfig config, LobbyView &lobby,
               InstanceLauncher &launcher, const Clock &clock,
               SpawnSettings spawn, LivenessDetector::AliveProbe probe = {});

  FleetManager(const FleetManager &) = delete;
  auto operator=(const FleetManager &) -> FleetManager & = delete;

  // Creates the PID directory, takes the fleet-wide lock (LockFailed when
  // another manager runs on the same directory), loads the account registry
  // and rebuilds the index if the lobby is already connected.
  [[nodiscard]] auto start() -> Result<void>;

  // Rebuilds the index from the PID directory and the lobby, then
  // provisions. Ambiguous fleet state is an error.
  [[nodiscard]] auto rebuild() -> Result<void>;

  // Detection first, then provisioning and pruning. Requires a connected
  // lobby and a rebuilt index.
  auto tick() -> void;

  // Errors are fatal: only a failed rebuild on reconnection produces one.
  [[nodiscard]] auto handle_event(const LobbyEvent &event) -> Result<void>;

  // Applies a new configuration if it validates and keeps the same PID
  // directory and manager name.
  [[nodiscard]] auto reload(FleetConfig config) -> Result<void>;

  auto shutdown() -> void;

  [[nodiscard]] auto config() const noexcept -> const FleetConfig & {
    return config_;
  }
  [[nodiscard]] auto index() const noexcept -> const FleetIndex & {
    return index_;
  }
  [[nodiscard]] auto store() const noexcept -> const PidRecordStore & {
    return store_;
  }
  [[nodiscard]] auto accounts() const noexcept -> const AccountRegistry & {
    return accounts_;
  }
  [[nodiscard]] auto ready() const noexcept -> bool { return ready_; }
  [[nodiscard]] auto commands() noexcept -> CommandHandler & {
    return commands_;
  }

private:
  FleetConfig config_;
  LobbyView &lobby_;
  const Clock &clock_;
  PidRecordStore store_;
  FleetIndex index_;
  AccountRegistry accounts_;
  Admission admission_;
  LivenessDetector detector_;
  Provisioner provisioner_;
  PresenceTracker presence_;
  CommandHandler commands_;
  FileLockGuard manager_lock_;
  bool accounts_loaded_{false};
  bool ready_{false};

  [[nodiscard]] auto load_instance(int number, FleetIndex &rebuilt)
      -> Result<void>;
  auto cross_check_presence(FleetIndex &rebuilt) const -> void;
  auto run_command(const LobbyEvent &event) -> void;
};

} // namespace hostfleet
