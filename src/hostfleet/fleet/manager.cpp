#include "hostfleet/fleet/manager.hpp"

#include "hostfleet/config/config.hpp"
#include "hostfleet/core/constants.hpp"
#include "hostfleet/util/log.hpp"

namespace hostfleet {

FleetManager::FleetManager(FleetConfig config, LobbyView &lobby,
                           InstanceLauncher &launcher, const Clock &clock,
                           SpawnSettings spawn,
                           LivenessDetector::AliveProbe probe)
    : config_(std::move(config)), lobby_(lobby), clock_(clock),
      store_(config_.pid_dir(), clock),
      accounts_(config_.pid_dir() / kAccountRegistryFile),
      admission_(config_, store_, index_, lobby, launcher, accounts_, clock,
                 std::move(spawn)),
      detector_(config_, store_, index_, clock, std::move(probe)),
      provisioner_(config_, index_, lobby, admission_, clock),
      presence_(config_, index_, lobby, detector_, accounts_, clock),
      commands_(config_, index_, admission_) {}

auto FleetManager::start() -> Result<void> {
  if (auto r = store_.ensure_dir(); !r) {
    return r;
  }
  const auto lock_file = (store_.dir() / kManagerLockFile).string();
  auto lock = FileLockGuard::try_acquire(lock_file);
  if (!lock) {
    log::error("Another manager instance is running in same directory ({})",
               store_.dir().string());
    return fail(lock.error());
  }
  manager_lock_ = std::move(*lock);

  if (auto r = accounts_.load(); !r) {
    log::error("Unable to load existing accounts data from file \"{}\"",
               accounts_.file().string());
    return r;
  }
  accounts_loaded_ = true;
  log::info("Fleet manager {} started on {}", config_.fleet.manager_name,
            store_.dir().string());
  if (lobby_.is_connected()) {
    return rebuild();
  }
  return ok();
}

auto FleetManager::load_instance(int number, FleetIndex &rebuilt)
    -> Result<void> {
  auto lock = store_.acquire_lock(number, LockMode::Blocking);
  if (!lock) {
    log::warn("Skipping instance {}: unable to lock its PID file", number);
    return ok();
  }
  auto stored = store_.read_record(*lock);
  if (!stored) {
    log::warn("Skipping instance {}: unable to load its PID file", number);
    return ok();
  }
  if (!*stored) {
    return ok();
  }
  const auto &[record, kind, since] = **stored;
  const auto lifecycle = to_lifecycle(kind);
  const auto &fleet = config_.fleet;

  if (is_starting(lifecycle)) {
    if (fleet.starting_instance_timeout.count() != 0 &&
        clock_.now() - since >= fleet.starting_instance_timeout) {
      log::warn("Instance {} ({}) failed to start, removing obsolete PID file",
                number, record.instance_name);
      if (auto r = store_.remove_record(*lock); !r) {
        log::error("Unable to remove obsolete PID file of instance {}",
                   number);
      }
      return ok();
    }
  } else if (!record.pid || !detector_.is_alive(*record.pid)) {
    log::warn("Instance {} ({}) exited unexpectedly, removing obsolete PID "
              "file",
              number, record.instance_name);
    if (auto r = store_.remove_record(*lock); !r) {
      log::error("Unable to remove obsolete PID file of instance {}", number);
    }
    return ok();
  }

  if (record.instance_number != number) {
    log::error("Inconsistency detected for PID file of instance {}", number);
    return fail(Error::RecordInconsistent);
  }
  if (record.manager_name != fleet.manager_name) {
    log::error("Wrong manager name in PID file of instance {} (expected "
               "\"{}\", got \"{}\")",
               number, fleet.manager_name, record.manager_name);
    return fail(Error::RecordInconsistent);
  }
  if (const auto *other = rebuilt.find_by_name(record.instance_name)) {
    log::error("Duplicate PID file for instanceName \"{}\" (instance numbers "
               "{} and {})",
               record.instance_name, other->number, number);
    return fail(Error::RecordInconsistent);
  }
  if (record.owner != kPublicOwner) {
    if (const auto *other = rebuilt.find_by_owner(record.owner)) {
      log::error("Duplicate PID file for ownerName \"{}\" (instance numbers "
                 "{} and {})",
                 record.owner, other->number, number);
      return fail(Error::RecordInconsistent);
    }
  }
  const auto &members = rebuilt.cluster_members(record.cluster);
  if (auto it = members.find(record.cluster_number); it != members.end()) {
    log::error("Duplicate PID file for clusterPreset \"{}\" and "
               "clusterInstanceNumber {} (instance numbers {} and {})",
               record.cluster, record.cluster_number, it->second, number);
    return fail(Error::RecordInconsistent);
  }
  lock->release();

  if (!config_.is_configured_cluster(record.cluster)) {
    log::warn("PID file found for unmanaged cluster \"{}\" ({})",
              record.cluster,
              PidRecordStore::record_file_name(number, kind));
  }
  return rebuilt.insert(Instance{
      .number = number,
      .name = record.instance_name,
      .cluster = record.cluster,
      .cluster_number = record.cluster_number,
      .owner = record.owner,
      .pid = record.pid,
      .lifecycle = lifecycle,
      .lifecycle_since = since,
      .presence = PresenceState::Offline,
      .presence_since = {},
  });
}

auto FleetManager::cross_check_presence(FleetIndex &rebuilt) const -> void {
  const auto now = clock_.now();
  for (const auto &[number, inst] : rebuilt.instances()) {
    auto presence = PresenceState::Offline;
    if (lobby_.is_online(inst.name)) {
      const auto size = lobby_.hosted_battle_size(inst.name);
      presence = size && *size > 1 ? PresenceState::InUse
                                   : PresenceState::Spare;
    }
    rebuilt.set_presence(number, presence, now);
  }
}

auto FleetManager::rebuild() -> Result<void> {
  auto numbers = store_.list_instance_numbers();
  if (!numbers) {
    log::error("Unable to open PID directory \"{}\"", store_.dir().string());
    return fail(numbers.error());
  }

  FleetIndex rebuilt;
  for (const int number : *numbers) {
    if (auto r = load_instance(number, rebuilt); !r) {
      log::error("Unable to initialize fleet data from PID directory");
      return r;
    }
  }
  cross_check_presence(rebuilt);

  index_ = std::move(rebuilt);
  presence_.reset();
  ready_ = true;
  log::info("Fleet index rebuilt with {} instance(s)", index_.size());
  provisioner_.provision_all();
  return ok();
}

auto FleetManager::tick() -> void {
  if (!ready_ || !lobby_.is_connected()) {
    return;
  }
  auto report = detector_.sweep();
  for (const auto &cluster : report.impacted) {
    provisioner_.provision(cluster);
  }
  // Catch up on clusters whose provisioning failed earlier.
  provisioner_.provision_all();
  provisioner_.prune();
}

auto FleetManager::run_command(const LobbyEvent &event) -> void {
  auto reply = commands_.execute(event.user, event.text);
  if (!reply) {
    return;
  }
  for (const auto &line : reply->lines) {
    lobby_.send_private(event.user, line);
  }
}

auto FleetManager::handle_event(const LobbyEvent &event) -> Result<void> {
  switch (event.kind) {
  case LobbyEventKind::Connected:
    return rebuild();
  case LobbyEventKind::Disconnected:
    log::warn("Lobby connection lost, fleet reconciliation suspended");
    return ok();
  case LobbyEventKind::Command:
    if (ready_) {
      run_command(event);
    }
    return ok();
  case LobbyEventKind::PrivateMessage:
    return ok();
  default:
    break;
  }
  if (!ready_) {
    return ok();
  }
  for (const auto &cluster : presence_.handle(event)) {
    provisioner_.provision(cluster);
  }
  return ok();
}

auto FleetManager::reload(FleetConfig config) -> Result<void> {
  const auto report = ConfigLoader::validate(config);
  for (const auto &warning : report.warnings) {
    log::warn("{}", warning);
  }
  if (!report.valid()) {
    for (const auto &error : report.errors) {
      log::error("{}", error);
    }
    log::error("Configuration reload rejected, keeping current settings");
    return fail(Error::ConfigInvalid);
  }
  if (config.fleet.var_dir != config_.fleet.var_dir ||
      config.fleet.manager_name != config_.fleet.manager_name) {
    log::error("Changing var_dir or manager_name requires a manager restart");
    return fail(Error::InvalidArgument);
  }

  config_ = std::move(config);
  log::set_level(config_.fleet.log_level);
  log::info("Configuration reloaded");
  if (ready_) {
    provisioner_.provision_all();
  }
  return ok();
}

auto FleetManager::shutdown() -> void {
  // A manager that never owned the directory must not touch its registry.
  if (manager_lock_.owns() && accounts_loaded_) {
    if (auto r = accounts_.save(); !r) {
      log::error("Unable to store existing accounts data in file \"{}\"",
                 accounts_.file().string());
    }
  }
  accounts_loaded_ = false;
  manager_lock_.release();
  ready_ = false;
  log::info("Fleet manager stopped");
}

} // namespace hostfleet
