#include "hostfleet/fleet/presence.hpp"

#include "hostfleet/util/log.hpp"

namespace hostfleet {

PresenceTracker::PresenceTracker(const FleetConfig &config, FleetIndex &index,
                                 LobbyView &lobby, LivenessDetector &detector,
                                 AccountRegistry &accounts, const Clock &clock)
    : config_(config), index_(index), lobby_(lobby), detector_(detector),
      accounts_(accounts), clock_(clock) {}

auto PresenceTracker::find_number(std::string_view name) const -> int {
  const auto *inst = index_.find_by_name(name);
  return inst == nullptr ? -1 : inst->number;
}

auto PresenceTracker::battle_is_empty(std::string_view founder) const
    -> bool {
  const auto size = lobby_.hosted_battle_size(founder);
  return !size || *size <= 1;
}

auto PresenceTracker::handle(const LobbyEvent &event)
    -> std::vector<std::string> {
  const bool battle_event = event.kind == LobbyEventKind::JoinedBattle ||
                            event.kind == LobbyEventKind::LeftBattle ||
                            event.kind == LobbyEventKind::BattleClosing;
  const int number = find_number(battle_event ? event.founder : event.user);
  if (number < 0) {
    return {};
  }

  switch (event.kind) {
  case LobbyEventKind::UserOnline:
    on_user_online(number);
    return {};
  case LobbyEventKind::UserOffline:
    return on_user_offline(number);
  case LobbyEventKind::JoinedBattle:
    return on_joined_battle(number);
  case LobbyEventKind::LeftBattle:
    on_left_battle(number);
    return {};
  case LobbyEventKind::BattleClosing:
    on_battle_closing(number);
    return {};
  case LobbyEventKind::StatusChanged:
    return on_status_changed(number);
  default:
    return {};
  }
}

auto PresenceTracker::on_user_online(int number) -> void {
  const auto now = clock_.now();
  const std::string name = index_.find(number)->name;
  accounts_.mark_seen(name, now);
  index_.set_presence(number, PresenceState::Spare, now);
  if (auto state = detector_.refresh(number); !state) {
    log::debug("Instance {} ({}) came online without a readable PID file",
               number, name);
  }
}

auto PresenceTracker::on_user_offline(int number)
    -> std::vector<std::string> {
  const auto *inst = index_.find(number);
  const std::string cluster = inst->cluster;
  const bool is_public = inst->is_public();
  index_.set_presence(number, PresenceState::Offline, clock_.now());

  auto state = detector_.refresh(number);
  if (state && is_public &&
      (*state == LifecycleState::Exiting ||
       *state == LifecycleState::Crashed)) {
    return {cluster};
  }
  return {};
}

auto PresenceTracker::mark_in_use(Instance &inst) -> std::vector<std::string> {
  index_.set_presence(inst.number, PresenceState::InUse, clock_.now());
  if (inst.is_public()) {
    return {inst.cluster};
  }
  return {};
}

auto PresenceTracker::on_joined_battle(int number)
    -> std::vector<std::string> {
  auto *inst = index_.find(number);
  if (inst->presence != PresenceState::Spare) {
    return {};
  }
  return mark_in_use(*inst);
}

auto PresenceTracker::on_left_battle(int number) -> void {
  const auto *inst = index_.find(number);
  if (!battle_is_empty(inst->name) || lobby_.is_in_game(inst->name)) {
    return;
  }
  index_.set_presence(number, PresenceState::Spare, clock_.now());
}

auto PresenceTracker::on_battle_closing(int number) -> void {
  const auto *inst = index_.find(number);
  if (lobby_.is_in_game(inst->name) ||
      inst->presence == PresenceState::Spare) {
    return;
  }
  index_.set_presence(number, PresenceState::Spare, clock_.now());
}

auto PresenceTracker::on_status_changed(int number)
    -> std::vector<std::string> {
  auto *inst = index_.find(number);
  const auto &manager = config_.fleet.manager_name;
  if (!lobby_.is_bot(inst->name) && !bot_mode_sent_.contains(inst->name) &&
      lobby_.has_moderator_access(manager)) {
    lobby_.set_bot_mode(inst->name, true);
    bot_mode_sent_.insert(inst->name);
  }

  const bool in_game = lobby_.is_in_game(inst->name);
  if (inst->presence == PresenceState::Spare && in_game) {
    return mark_in_use(*inst);
  }
  if (inst->presence == PresenceState::InUse && !in_game &&
      battle_is_empty(inst->name)) {
    index_.set_presence(number, PresenceState::Spare, clock_.now());
  }
  return {};
}

} // namespace hostfleet
