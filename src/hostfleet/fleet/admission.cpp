#include "hostfleet/fleet/admission.hpp"

#include "hostfleet/core/constants.hpp"
#include "hostfleet/fleet/instance_name.hpp"
#include "hostfleet/util/log.hpp"

#include <algorithm>
#include <format>
#include <random>
#include <string>

namespace hostfleet {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kPasswordAlphabet =
    "abcdefghjkmnpqrstuvwxyz123456789";
constexpr std::size_t kPasswordLength = 4;

[[nodiscard]] auto count_private_in_cluster(const FleetIndex &index,
                                            std::string_view cluster)
    -> std::size_t {
  std::size_t count = 0;
  for (const auto &[cluster_number, number] : index.cluster_members(cluster)) {
    if (const auto *inst = index.find(number); inst && !inst->is_public()) {
      ++count;
    }
  }
  return count;
}

auto init_archive_cache(const fs::path &source, const fs::path &target,
                        bool share) -> void {
  std::error_code ec;
  if (!fs::is_directory(source, ec) || fs::exists(target, ec)) {
    return;
  }
  if (share) {
    fs::create_directory_symlink(fs::absolute(source, ec), target, ec);
    if (ec) {
      log::warn("Failed to create symbolic link \"{}\" to directory \"{}\" to "
                "initialize instance archive cache ({})",
                target.string(), source.string(), ec.message());
    }
    return;
  }
  fs::copy(source, target,
           fs::copy_options::recursive | fs::copy_options::skip_symlinks, ec);
  if (ec) {
    log::warn("Failed to copy cache data from \"{}\" to \"{}\" to initialize "
              "instance archive cache ({})",
              source.string(), target.string(), ec.message());
  }
}

} // namespace

Admission::Admission(const FleetConfig &config, const PidRecordStore &store,
                     FleetIndex &index, LobbyView &lobby,
                     InstanceLauncher &launcher, AccountRegistry &accounts,
                     const Clock &clock, SpawnSettings spawn)
    : config_(config), store_(store), index_(index), lobby_(lobby),
      launcher_(launcher), accounts_(accounts), clock_(clock),
      spawn_(std::move(spawn)) {}

auto Admission::check_private(std::string_view cluster,
                              std::string_view owner) const
    -> std::optional<Rejection> {
  const auto *preset = config_.find_preset(cluster);
  if (!config_.is_configured_cluster(cluster) || preset == nullptr) {
    return Rejection{Error::ConfigInvalid,
                     std::format("Invalid cluster \"{}\" (use !listClusters to "
                                 "list available clusters)",
                                 cluster)};
  }
  if (const auto *existing = index_.find_by_owner(owner)) {
    return Rejection{
        Error::AlreadyExists,
        std::format("There is already a private host created for you: {} "
                    "(only one private host is allowed by user)",
                    existing->name)};
  }
  if (preset->max_instances_in_cluster != 0 &&
      index_.cluster_size(cluster) >=
          static_cast<std::size_t>(preset->max_instances_in_cluster)) {
    return Rejection{
        Error::QuotaExceeded,
        std::format("Unable to create a new host in {} cluster: the maximum "
                    "number of instances is reached for this cluster",
                    cluster)};
  }
  if (preset->max_instances_in_cluster_private != 0 &&
      count_private_in_cluster(index_, cluster) >=
          static_cast<std::size_t>(preset->max_instances_in_cluster_private)) {
    return Rejection{
        Error::QuotaExceeded,
        std::format("Unable to create a new private host in {} cluster: the "
                    "maximum number of private instances is reached for this "
                    "cluster",
                    cluster)};
  }
  const auto &fleet = config_.fleet;
  if (index_.size() >= static_cast<std::size_t>(fleet.max_instances)) {
    return Rejection{Error::QuotaExceeded,
                     "Unable to create a new host: the maximum number of "
                     "instances is reached"};
  }
  if (fleet.max_instances_private != 0 &&
      index_.private_count() >=
          static_cast<std::size_t>(fleet.max_instances_private)) {
    return Rejection{Error::QuotaExceeded,
                     "Unable to create a new private host: the maximum number "
                     "of private instances is reached"};
  }
  return std::nullopt;
}

auto Admission::generate_password() -> std::string {
  static thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> dist(0,
                                                  kPasswordAlphabet.size() - 1);
  std::string out;
  out.reserve(kPasswordLength);
  for (std::size_t i = 0; i < kPasswordLength; ++i) {
    out.push_back(kPasswordAlphabet[dist(rng)]);
  }
  return out;
}

auto Admission::prepare_directory(const fs::path &dir) const -> Result<void> {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    log::error("Unable to start new instance, failed to create new instance "
               "directory \"{}\": {}",
               dir.string(), ec.message());
    return fail(Error::FileOpenFailed);
  }

  const fs::path source_dir(config_.fleet.instance_dir);
  init_archive_cache(source_dir / "cache", dir / "cache",
                     config_.fleet.share_archive_cache);

  for (const auto &file : config_.fleet.shared_data_files) {
    const auto source = source_dir / file;
    const auto target = dir / file;
    if (!fs::is_regular_file(source, ec) || fs::exists(target, ec)) {
      continue;
    }
    fs::copy_file(source, target, ec);
    if (ec) {
      log::error("Unable to start new instance, failed to copy instance data "
                 "file \"{}\" from \"{}\" to \"{}\": {}",
                 file, source_dir.string(), dir.string(), ec.message());
      return fail(Error::FileOpenFailed);
    }
  }

  fs::create_directories(dir / "log", ec);
  if (ec) {
    log::error("Unable to start new instance, failed to create new log "
               "directory \"{}\": {}",
               (dir / "log").string(), ec.message());
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

auto Admission::write_launched_record(int number,
                                      const PidRecord &record) const
    -> Result<void> {
  auto lock = store_.acquire_lock(number, LockMode::Blocking);
  if (!lock) {
    return fail(lock.error());
  }
  if (lock->kind()) {
    log::error("Unable to start new instance {} ({}), a PID file already "
               "exists: {}",
               number, record.instance_name,
               PidRecordStore::record_file_name(number, *lock->kind()));
    return fail(Error::AlreadyExists);
  }
  if (auto r = store_.write_record(*lock, RecordKind::Launched, record); !r) {
    log::error("Unable to start new instance, failed to create new PID file "
               "for instance {}",
               number);
    return fail(r.error());
  }
  if (store_.consume_exiting_marker(number)) {
    log::debug("Removed stale exiting marker of instance {}", number);
  }
  return ok();
}

auto Admission::discard_launched_record(int number) const -> void {
  auto lock = store_.acquire_lock(number, LockMode::Blocking);
  if (!lock) {
    return;
  }
  if (lock->kind() == RecordKind::Launched) {
    if (auto r = store_.remove_record(*lock); !r) {
      log::error("Unable to remove PID file of instance {} after failed "
                 "start",
                 number);
    }
  }
}

auto Admission::request_bot_account(const std::string &name,
                                    const ClusterConfig &preset) -> void {
  const auto &manager = config_.fleet.manager_name;
  if (config_.fleet.auto_register < 1 || !lobby_.is_connected() ||
      !lobby_.has_moderator_access(manager) ||
      !preset.lobby_password.empty() || accounts_.contains(name)) {
    return;
  }
  lobby_.create_bot_account(name, manager);
  accounts_.mark_requested(name);
  log::info("Requested creation of bot account \"{}\"", name);
}

auto Admission::instance_macros(const LaunchedInstance &instance,
                                const ClusterConfig &preset,
                                const MacroMap &placeholders,
                                bool is_private) const -> MacroMap {
  MacroMap macros = spawn_.base_macros;
  for (const auto &[key, value] : placeholders) {
    macros.insert_or_assign(key, value);
  }

  // Validated at configuration load.
  auto overloads = parse_macro_string(preset.conf_macros).value_or(MacroMap{});
  auto specific =
      parse_macro_string(is_private ? preset.conf_macros_private
                                    : preset.conf_macros_public)
          .value_or(MacroMap{});
  for (auto &[key, value] : specific) {
    overloads.insert_or_assign(key, std::move(value));
  }
  for (auto &[key, value] : overloads) {
    value = expand_placeholders(value, macros);
  }

  const auto &fleet = config_.fleet;
  macros.insert_or_assign(std::string(macro::kLobbyLogin), instance.name);
  macros.insert_or_assign(std::string(macro::kDefaultPreset),
                          instance.cluster);
  macros.insert_or_assign(
      std::string(macro::kGamePort),
      std::to_string(fleet.base_game_port + instance.number));
  macros.insert_or_assign(
      std::string(macro::kAutoHostPort),
      std::to_string(fleet.base_auto_host_port + instance.number));
  macros.insert_or_assign(
      std::string(macro::kInstanceDir),
      (fs::path(kPidDirName) / instance.name).string());
  macros.insert_or_assign(std::string(macro::kLogDir), "log");
  if (is_private) {
    macros.insert_or_assign(std::string(macro::kPassword), instance.password);
  }
  if (!preset.lobby_password.empty()) {
    macros.insert_or_assign(std::string(macro::kLobbyPassword),
                            preset.lobby_password);
  }

  for (auto &[key, value] : overloads) {
    macros.insert_or_assign(key, std::move(value));
  }
  return macros;
}

auto Admission::launch(std::string_view cluster, std::string_view owner,
                       std::optional<std::string> password)
    -> Result<LaunchedInstance> {
  const auto *preset = config_.find_preset(cluster);
  if (preset == nullptr) {
    log::error("Unable to start new instance, unknown cluster \"{}\"",
               cluster);
    return fail(Error::ConfigInvalid);
  }
  const bool is_private = owner != kPublicOwner;

  LaunchedInstance launched;
  launched.number = index_.next_free_number();
  launched.cluster = std::string(cluster);
  const int cluster_number = index_.next_free_cluster_number(cluster);

  auto placeholders = naming_placeholders(NamingInputs{
      .instance_number = launched.number,
      .cluster_number = cluster_number,
      .cluster = cluster,
      .manager_name = config_.fleet.manager_name,
      .owner = owner,
      .max_instances = config_.fleet.max_instances,
      .max_instances_in_cluster = preset->max_instances_in_cluster,
  });
  launched.name = render_instance_name(preset->name_template, placeholders);
  placeholders.insert_or_assign(std::string(macro::kInstanceName),
                                launched.name);

  if (!is_valid_instance_name(launched.name)) {
    log::error("Unable to start new instance, invalid instance name: {}",
               launched.name);
    return fail(Error::InvalidArgument);
  }
  if (index_.find_by_name(launched.name) != nullptr) {
    log::error("Unable to start new instance, duplicate instance name: {}",
               launched.name);
    return fail(Error::AlreadyExists);
  }
  if (lobby_.is_connected() && lobby_.is_online(launched.name)) {
    log::error("Unable to start new instance, instance \"{}\" is already "
               "online",
               launched.name);
    return fail(Error::AlreadyExists);
  }

  if (auto r = prepare_directory(store_.dir() / launched.name); !r) {
    return fail(r.error());
  }

  const PidRecord record{
      .manager_name = config_.fleet.manager_name,
      .instance_number = launched.number,
      .instance_name = launched.name,
      .cluster = launched.cluster,
      .cluster_number = cluster_number,
      .owner = std::string(owner),
      .pid = std::nullopt,
  };
  if (auto r = write_launched_record(launched.number, record); !r) {
    return fail(r.error());
  }

  request_bot_account(launched.name, *preset);

  if (is_private) {
    launched.password =
        password && !password->empty() ? *password : generate_password();
  }

  const auto macros =
      instance_macros(launched, *preset, placeholders, is_private);
  LaunchRequest request{
      .executable = spawn_.executable,
      .args = {"run", "-c", spawn_.config_path},
      .working_dir = spawn_.working_dir,
      .inherit_console = config_.fleet.create_new_consoles,
  };
  for (const auto &[key, value] : macros) {
    request.args.push_back(std::format("{}={}", key, value));
  }

  auto pid = launcher_.launch(request);
  if (!pid) {
    log::error("Unable to create detached process to start new instance {} "
               "({})",
               launched.number, launched.name);
    discard_launched_record(launched.number);
    return fail(Error::SpawnFailed);
  }

  const auto now = clock_.now();
  auto inserted = index_.insert(Instance{
      .number = launched.number,
      .name = launched.name,
      .cluster = launched.cluster,
      .cluster_number = cluster_number,
      .owner = std::string(owner),
      .pid = std::nullopt,
      .lifecycle = LifecycleState::Launched,
      .lifecycle_since = now,
      .presence = PresenceState::Offline,
      .presence_since = now,
  });
  if (!inserted) {
    log::error("Unable to track new instance {} ({})", launched.number,
               launched.name);
    return fail(inserted.error());
  }
  log::debug("Instance {} ({}) spawned with pid {}", launched.number,
             launched.name, *pid);
  return ok(std::move(launched));
}

} // namespace hostfleet
