#include "hostfleet/fleet/worker.hpp"

#include "hostfleet/core/constants.hpp"
#include "hostfleet/util/daemon.hpp"
#include "hostfleet/util/log.hpp"

#include <boost/algorithm/string/join.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace hostfleet {

namespace {

[[nodiscard]] auto expected_kinds(StartContext context)
    -> std::vector<RecordKind> {
  switch (context) {
  case StartContext::Autoload:
    return {RecordKind::Launched, RecordKind::Restarting};
  case StartContext::Load:
    return {RecordKind::Unloaded, RecordKind::Reloading};
  case StartContext::Reload:
    return {RecordKind::Reloading};
  }
  return {};
}

} // namespace

InstanceWorker::InstanceWorker(const FleetConfig &config,
                               const PidRecordStore &store, LobbyView &lobby,
                               const Clock &clock, WorkerIdentity identity,
                               ExitCallback on_exit)
    : config_(config), store_(store), lobby_(lobby), clock_(clock),
      identity_(std::move(identity)), on_exit_(std::move(on_exit)) {}

auto InstanceWorker::battle_in_use() const -> bool {
  const auto size = lobby_.hosted_battle_size(identity_.lobby_login);
  return size && *size > 1;
}

auto InstanceWorker::manager_online() const -> bool {
  return lobby_.is_connected() && lobby_.is_online(identity_.manager_name);
}

auto InstanceWorker::check_record(StartContext context,
                                  const StoredRecord &stored) const
    -> Result<void> {
  if (std::ranges::find(expected_kinds(context), stored.kind) ==
      expected_kinds(context).end()) {
    log::error("Unexpected {} PID file found when starting instance {} "
               "({} start)",
               to_string_view(stored.kind), identity_.instance_number,
               to_string_view(context));
    return fail(Error::InvalidState);
  }

  const auto &record = stored.record;
  std::vector<std::string> fields;
  if (record.manager_name != identity_.manager_name)
    fields.emplace_back("managerName");
  if (record.instance_number != identity_.instance_number)
    fields.emplace_back("instanceNumber");
  if (record.cluster_number != identity_.cluster_number)
    fields.emplace_back("clusterInstanceNumber");
  if (record.owner != identity_.owner)
    fields.emplace_back("ownerName");
  if (record.cluster != identity_.cluster)
    fields.emplace_back("clusterPreset");
  if (record.instance_name != identity_.lobby_login)
    fields.emplace_back("instanceName");
  if (record.pid && *record.pid != current_pid())
    fields.emplace_back("processId");
  if (!fields.empty()) {
    log::error("Inconsistent data found in PID file for following field{}: {}",
               fields.size() > 1 ? "s" : "",
               boost::algorithm::join(fields, ", "));
    return fail(Error::RecordInconsistent);
  }
  return ok();
}

auto InstanceWorker::start(StartContext context) -> Result<void> {
  const int number = identity_.instance_number;
  if (auto r = store_.ensure_dir(); !r) {
    return fail(r.error());
  }
  if (store_.consume_exiting_marker(number)) {
    log::debug("Removed stale exiting marker of instance {}", number);
  }

  auto lock = store_.acquire_lock(number, LockMode::Blocking);
  if (!lock) {
    return fail(lock.error());
  }
  auto stored = store_.read_record(*lock);
  if (!stored) {
    log::error("Unable to initialize instance data from PID file");
    return fail(stored.error());
  }
  if (!*stored) {
    log::error("No PID file found for instance {}", number);
    return fail(Error::NotFound);
  }
  if (auto r = check_record(context, **stored); !r) {
    return r;
  }

  const auto from = (*stored)->kind;
  if (auto r = store_.transition(*lock, from, RecordKind::Running); !r) {
    return r;
  }
  if (context == StartContext::Autoload) {
    auto record = (*stored)->record;
    record.pid = current_pid();
    if (auto r = store_.write_record(*lock, RecordKind::Running, record); !r) {
      log::error("Unable to write new PID file for instance {}", number);
      return r;
    }
  }
  lock->release();
  claimed_ = true;

  const auto now = clock_.now();
  in_game_ = lobby_.is_in_game(identity_.lobby_login);
  if (battle_in_use() || in_game_) {
    idle_since_.reset();
  } else {
    idle_since_ = now;
  }
  if (manager_online()) {
    orphan_since_.reset();
  } else {
    orphan_since_ = now;
  }
  log::info("Instance {} ({}) started [{}]", number, identity_.lobby_login,
            to_string_view(context));
  return ok();
}

auto InstanceWorker::exit(std::string_view reason) -> void {
  if (on_exit_) {
    on_exit_(reason);
  }
}

auto InstanceWorker::handle(const LobbyEvent &event) -> void {
  const auto now = clock_.now();
  const auto &self = identity_.lobby_login;
  switch (event.kind) {
  case LobbyEventKind::Connected:
    if (manager_online()) {
      orphan_since_.reset();
    }
    break;
  case LobbyEventKind::Disconnected:
    if (!orphan_since_) {
      orphan_since_ = now;
    }
    if (!idle_since_ && !in_game_) {
      idle_since_ = now;
    }
    break;
  case LobbyEventKind::UserOnline:
    if (event.user == identity_.manager_name) {
      orphan_since_.reset();
    }
    break;
  case LobbyEventKind::UserOffline:
    if (event.user == identity_.manager_name) {
      orphan_since_ = now;
    }
    break;
  case LobbyEventKind::JoinedBattle:
    if (event.founder == self) {
      idle_since_.reset();
    }
    break;
  case LobbyEventKind::LeftBattle:
    if (event.founder == self && !battle_in_use() && !in_game_) {
      idle_since_ = now;
    }
    break;
  case LobbyEventKind::BattleClosed:
    if (event.founder == self && !idle_since_ && !in_game_) {
      idle_since_ = now;
    }
    break;
  case LobbyEventKind::StatusChanged:
    if (event.user != self) {
      break;
    }
    in_game_ = lobby_.is_in_game(self);
    if (in_game_) {
      idle_since_.reset();
    } else if (!idle_since_ && !battle_in_use()) {
      idle_since_ = now;
    }
    break;
  case LobbyEventKind::PrivateMessage:
    if (event.user == identity_.manager_name &&
        event.text == kQuitIfIdleMessage && idle_since_) {
      log::info("Exit requested by fleet manager while idle");
      exit("requested by cluster manager");
    }
    break;
  default:
    break;
  }
}

auto InstanceWorker::tick() -> void {
  if (!idle_since_) {
    return;
  }
  const auto now = clock_.now();
  const auto &fleet = config_.fleet;
  if (fleet.orphan_instance_timeout.count() != 0 && orphan_since_ &&
      now - *orphan_since_ > fleet.orphan_instance_timeout) {
    orphan_since_ = now;
    log::warn("Timeout for idle orphan instance, exiting");
    exit("cluster manager is offline");
    return;
  }
  if (!identity_.is_private()) {
    return;
  }
  const auto idle_for = now - *idle_since_;
  if (idle_for > fleet.remove_private_instance_delay) {
    idle_since_ = now;
    log::info("Timeout for idle private instance, exiting");
    exit("private instance is idle");
  } else if (lobby_.is_connected() && !lobby_.is_online(identity_.owner) &&
             idle_for >= timing::kOwnerOfflineGrace) {
    idle_since_ = now;
    log::info("Owner of private instance is offline, exiting");
    exit("private instance owner is offline");
  }
}

auto InstanceWorker::unload(UnloadReason reason) -> Result<void> {
  const int number = identity_.instance_number;
  if (!claimed_) {
    log::error("Unable to rename PID file when unloading: instance {} was "
               "not started by this process",
               number);
    return fail(Error::InvalidState);
  }
  auto lock = store_.acquire_lock(number, LockMode::Blocking);
  if (!lock) {
    log::error("Unable to rename PID file when unloading: failed to acquire "
               "lock");
    return fail(lock.error());
  }
  if (!lock->kind()) {
    log::error("Unable to rename PID file when unloading: PID file does not "
               "exist");
    return fail(Error::NotFound);
  }
  if (*lock->kind() != RecordKind::Running) {
    log::error("Unable to rename PID file when unloading: unexpected file "
               "found \"{}\"",
               PidRecordStore::record_file_name(number, *lock->kind()));
    return fail(Error::InvalidState);
  }

  Result<void> result;
  switch (reason) {
  case UnloadReason::Exit:
    result = store_.mark_exiting(*lock);
    break;
  case UnloadReason::Reload:
    result =
        store_.transition(*lock, RecordKind::Running, RecordKind::Reloading);
    break;
  case UnloadReason::Unload:
    result =
        store_.transition(*lock, RecordKind::Running, RecordKind::Unloaded);
    break;
  case UnloadReason::Restart:
    result =
        store_.transition(*lock, RecordKind::Running, RecordKind::Restarting);
    break;
  }
  if (result) {
    claimed_ = false;
    log::info("Instance {} unloaded [{}]", number, to_string_view(reason));
  }
  return result;
}

} // namespace hostfleet
