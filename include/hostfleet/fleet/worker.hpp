#pragma once

#include "hostfleet/config/fleet_config.hpp"
#include "hostfleet/core/error.hpp"
#include "hostfleet/fleet/bootstrap.hpp"
#include "hostfleet/fleet/pid_record.hpp"
#include "hostfleet/lobby/lobby.hpp"
#include "hostfleet/util/enum.hpp"
#include "hostfleet/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace hostfleet {

// How the worker came up: a fresh process, or a reload of the worker logic
// inside a running process.
enum class StartContext : std::uint8_t { Autoload, Load, Reload };
BOOST_DESCRIBE_ENUM(StartContext, Autoload, Load, Reload)
HOSTFLEET_DEFINE_ENUM_SERDE(StartContext)

enum class UnloadReason : std::uint8_t { Reload, Unload, Restart, Exit };
BOOST_DESCRIBE_ENUM(UnloadReason, Reload, Unload, Restart, Exit)
HOSTFLEET_DEFINE_ENUM_SERDE(UnloadReason)

// Instance side of the fleet protocol: validates and claims the record left
// by the manager, tracks idleness, and exits when idle for too long.
class InstanceWorker {
public:
  using ExitCallback = std::move_only_function<void(std::string_view reason)>;

  InstanceWorker(const FleetConfig &config, const PidRecordStore &store,
                 LobbyView &lobby, const Clock &clock,
                 WorkerIdentity identity, ExitCallback on_exit);

  [[nodiscard]] auto start(StartContext context) -> Result<void>;

  auto handle(const LobbyEvent &event) -> void;

  // Idle timeouts; a no-op while the instance is busy.
  auto tick() -> void;

  // Renames the running record for the next start context, or to the
  // exiting marker.
  [[nodiscard]] auto unload(UnloadReason reason) -> Result<void>;

  [[nodiscard]] auto identity() const noexcept -> const WorkerIdentity & {
    return identity_;
  }
  [[nodiscard]] auto idle_since() const noexcept
      -> std::optional<TimePoint> {
    return idle_since_;
  }
  [[nodiscard]] auto orphan_since() const noexcept
      -> std::optional<TimePoint> {
    return orphan_since_;
  }
  [[nodiscard]] auto is_idle() const noexcept -> bool {
    return idle_since_.has_value();
  }
  // True between a successful start and the next successful unload.
  [[nodiscard]] auto claimed() const noexcept -> bool { return claimed_; }

private:
  const FleetConfig &config_;
  const PidRecordStore &store_;
  LobbyView &lobby_;
  const Clock &clock_;
  WorkerIdentity identity_;
  ExitCallback on_exit_;

  std::optional<TimePoint> idle_since_;
  std::optional<TimePoint> orphan_since_;
  bool in_game_{false};
  bool claimed_{false};

  [[nodiscard]] auto check_record(StartContext context,
                                  const StoredRecord &stored) const
      -> Result<void>;
  [[nodiscard]] auto battle_in_use() const -> bool;
  [[nodiscard]] auto manager_online() const -> bool;
  auto exit(std::string_view reason) -> void;
};

} // namespace hostfleet
