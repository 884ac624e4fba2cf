#pragma once

#include "hostfleet/config/conf_macros.hpp"
#include "hostfleet/config/fleet_config.hpp"
#include "hostfleet/core/error.hpp"
#include "hostfleet/fleet/account_registry.hpp"
#include "hostfleet/fleet/fleet_index.hpp"
#include "hostfleet/fleet/pid_record.hpp"
#include "hostfleet/launcher/process_launcher.hpp"
#include "hostfleet/lobby/lobby.hpp"
#include "hostfleet/util/time.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace hostfleet {

struct Rejection {
  Error code{Error::InvalidArgument};
  std::string message;
};

struct LaunchedInstance {
  int number{0};
  std::string name;
  std::string cluster;
  // Empty for public instances.
  std::string password;
};

// How a new worker process is started: the executable, the configuration
// file it reloads, and the manager macros it inherits.
struct SpawnSettings {
  std::string executable;
  std::string config_path;
  std::string working_dir;
  MacroMap base_macros;
};

// Validates, names and materializes new instances.
class Admission {
public:
  Admission(const FleetConfig &config, const PidRecordStore &store,
            FleetIndex &index, LobbyView &lobby, InstanceLauncher &launcher,
            AccountRegistry &accounts, const Clock &clock,
            SpawnSettings spawn);

  // Quota checks for a private instance, in user-facing order.
  [[nodiscard]] auto check_private(std::string_view cluster,
                                   std::string_view owner) const
      -> std::optional<Rejection>;

  // Creates the instance directory, the launched record and the worker
  // process, then tracks the instance as launched/offline. `owner` is
  // kPublicOwner for the public pool. A private instance without password
  // gets a generated one.
  [[nodiscard]] auto launch(std::string_view cluster, std::string_view owner,
                            std::optional<std::string> password = {})
      -> Result<LaunchedInstance>;

  [[nodiscard]] auto instance_macros(const LaunchedInstance &instance,
                                     const ClusterConfig &preset,
                                     const MacroMap &placeholders,
                                     bool is_private) const -> MacroMap;

  [[nodiscard]] static auto generate_password() -> std::string;

private:
  const FleetConfig &config_;
  const PidRecordStore &store_;
  FleetIndex &index_;
  LobbyView &lobby_;
  InstanceLauncher &launcher_;
  AccountRegistry &accounts_;
  const Clock &clock_;
  SpawnSettings spawn_;

  [[nodiscard]] auto prepare_directory(const std::filesystem::path &dir) const
      -> Result<void>;
  [[nodiscard]] auto write_launched_record(int number,
                                           const PidRecord &record) const
      -> Result<void>;
  auto discard_launched_record(int number) const -> void;
  auto request_bot_account(const std::string &name,
                           const ClusterConfig &preset) -> void;
};

} // namespace hostfleet
