#pragma once

#include "hostfleet/config/fleet_config.hpp"
#include "hostfleet/fleet/account_registry.hpp"
#include "hostfleet/fleet/fleet_index.hpp"
#include "hostfleet/fleet/liveness.hpp"
#include "hostfleet/lobby/lobby.hpp"
#include "hostfleet/util/string_hash.hpp"
#include "hostfleet/util/time.hpp"

#include <ankerl/unordered_dense.h>

#include <string>
#include <vector>

namespace hostfleet {

// Derives instance presence from lobby events on the manager side.
class PresenceTracker {
public:
  PresenceTracker(const FleetConfig &config, FleetIndex &index,
                  LobbyView &lobby, LivenessDetector &detector,
                  AccountRegistry &accounts, const Clock &clock);

  // Applies one lobby event. Returns the clusters whose public pool lost a
  // spare or an instance and must be provisioned.
  [[nodiscard]] auto handle(const LobbyEvent &event)
      -> std::vector<std::string>;

  // Forgets bot-mode requests, on lobby reconnection.
  auto reset() -> void { bot_mode_sent_.clear(); }

private:
  const FleetConfig &config_;
  FleetIndex &index_;
  LobbyView &lobby_;
  LivenessDetector &detector_;
  AccountRegistry &accounts_;
  const Clock &clock_;
  ankerl::unordered_dense::set<std::string, StringHash, StringEqual>
      bot_mode_sent_;

  [[nodiscard]] auto find_number(std::string_view name) const -> int;
  [[nodiscard]] auto battle_is_empty(std::string_view founder) const -> bool;

  auto on_user_online(int number) -> void;
  auto on_user_offline(int number) -> std::vector<std::string>;
  auto on_joined_battle(int number) -> std::vector<std::string>;
  auto on_left_battle(int number) -> void;
  auto on_battle_closing(int number) -> void;
  auto on_status_changed(int number) -> std::vector<std::string>;
  auto mark_in_use(Instance &inst) -> std::vector<std::string>;
};

} // namespace hostfleet
