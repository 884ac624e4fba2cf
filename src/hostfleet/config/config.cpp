#include "hostfleet/config/config.hpp"
#include "hostfleet/config/conf_macros.hpp"
#include "hostfleet/config/toml_util.hpp"

#include "hostfleet/core/error.hpp"
#include "hostfleet/util/log.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <map>
#include <string>
#include <string_view>

namespace hostfleet {
namespace detail {

struct FleetToml {
  std::string manager_name{"FleetManager"};
  std::string var_dir{"var"};
  std::string instance_dir{"."};
  int max_instances{10};
  int max_instances_public{0};
  int max_instances_private{0};
  int base_game_port{8452};
  int base_auto_host_port{9452};
  int manager_auto_host_port{8451};
  int starting_instance_timeout{120};
  int offline_instance_timeout{60};
  int orphan_instance_timeout{600};
  int remove_spare_instance_delay{300};
  int remove_private_instance_delay{900};
  std::vector<std::string> clusters;
  std::string default_preset{"default"};
  int auto_register{0};
  bool share_archive_cache{false};
  bool sequential_unitsync{false};
  std::vector<std::string> shared_data_files{"mapHashes.dat", "userData.dat"};
  std::string instance_executable;
  bool create_new_consoles{false};
  int tick_interval_ms{1000};
  std::string log_level{"info"};
  std::string log_file;
};

// -1 and empty strings mean "inherit from the default preset".
struct ClusterToml {
  std::string name;
  std::string description;
  int target_spares{-1};
  int max_instances_in_cluster{-1};
  int max_instances_in_cluster_public{-1};
  int max_instances_in_cluster_private{-1};
  std::string name_template;
  std::string lobby_password;
  std::string conf_macros;
  std::string conf_macros_public;
  std::string conf_macros_private;
};

struct FleetFileToml {
  FleetToml fleet{};
  std::vector<ClusterToml> cluster;
};

} // namespace detail
} // namespace hostfleet

namespace glz {
template <> struct meta<hostfleet::detail::FleetToml> {
  using T = hostfleet::detail::FleetToml;
  static constexpr auto value = object(
      "manager_name", &T::manager_name, "var_dir", &T::var_dir,
      "instance_dir", &T::instance_dir, "max_instances", &T::max_instances,
      "max_instances_public", &T::max_instances_public,
      "max_instances_private", &T::max_instances_private, "base_game_port",
      &T::base_game_port, "base_auto_host_port", &T::base_auto_host_port,
      "manager_auto_host_port", &T::manager_auto_host_port,
      "starting_instance_timeout", &T::starting_instance_timeout,
      "offline_instance_timeout", &T::offline_instance_timeout,
      "orphan_instance_timeout", &T::orphan_instance_timeout,
      "remove_spare_instance_delay", &T::remove_spare_instance_delay,
      "remove_private_instance_delay", &T::remove_private_instance_delay,
      "clusters", &T::clusters, "default_preset", &T::default_preset,
      "auto_register", &T::auto_register, "share_archive_cache",
      &T::share_archive_cache, "sequential_unitsync", &T::sequential_unitsync,
      "shared_data_files", &T::shared_data_files, "instance_executable",
      &T::instance_executable, "create_new_consoles", &T::create_new_consoles,
      "tick_interval_ms", &T::tick_interval_ms, "log_level", &T::log_level,
      "log_file", &T::log_file);
};

template <> struct meta<hostfleet::detail::ClusterToml> {
  using T = hostfleet::detail::ClusterToml;
  static constexpr auto value = object(
      "name", &T::name, "description", &T::description, "target_spares",
      &T::target_spares, "max_instances_in_cluster",
      &T::max_instances_in_cluster, "max_instances_in_cluster_public",
      &T::max_instances_in_cluster_public, "max_instances_in_cluster_private",
      &T::max_instances_in_cluster_private, "name_template",
      &T::name_template, "lobby_password", &T::lobby_password, "conf_macros",
      &T::conf_macros, "conf_macros_public", &T::conf_macros_public,
      "conf_macros_private", &T::conf_macros_private);
};

template <> struct meta<hostfleet::detail::FleetFileToml> {
  using T = hostfleet::detail::FleetFileToml;
  static constexpr auto value =
      object("fleet", &T::fleet, "cluster", &T::cluster);
};
} // namespace glz

namespace hostfleet {
namespace {

constexpr std::array kInstanceScopedPlaceholders = {
    std::string_view{"InstNb"}, std::string_view{"InstNb2"},
    std::string_view{"InstNb3"}, std::string_view{"InstNb0"},
    std::string_view{"PresetName"}};

[[nodiscard]] auto inherit_int(int value, int fallback, int builtin) -> int {
  if (value >= 0)
    return value;
  if (fallback >= 0)
    return fallback;
  return builtin;
}

[[nodiscard]] auto inherit_str(const std::string &value,
                               const std::string &fallback,
                               const std::string &builtin) -> std::string {
  if (!value.empty())
    return value;
  if (!fallback.empty())
    return fallback;
  return builtin;
}

[[nodiscard]] auto resolve_preset(const detail::ClusterToml &raw,
                                  const detail::ClusterToml &base)
    -> ClusterConfig {
  const ClusterConfig builtin{};
  ClusterConfig out;
  out.name = raw.name;
  out.description = raw.description;
  out.target_spares =
      inherit_int(raw.target_spares, base.target_spares, builtin.target_spares);
  out.max_instances_in_cluster =
      inherit_int(raw.max_instances_in_cluster, base.max_instances_in_cluster,
                  builtin.max_instances_in_cluster);
  out.max_instances_in_cluster_public = inherit_int(
      raw.max_instances_in_cluster_public, base.max_instances_in_cluster_public,
      builtin.max_instances_in_cluster_public);
  out.max_instances_in_cluster_private =
      inherit_int(raw.max_instances_in_cluster_private,
                  base.max_instances_in_cluster_private,
                  builtin.max_instances_in_cluster_private);
  out.name_template = inherit_str(raw.name_template, base.name_template,
                                  builtin.name_template);
  out.lobby_password = inherit_str(raw.lobby_password, base.lobby_password,
                                   builtin.lobby_password);
  out.conf_macros =
      inherit_str(raw.conf_macros, base.conf_macros, builtin.conf_macros);
  out.conf_macros_public = inherit_str(
      raw.conf_macros_public, base.conf_macros_public,
      builtin.conf_macros_public);
  out.conf_macros_private = inherit_str(
      raw.conf_macros_private, base.conf_macros_private,
      builtin.conf_macros_private);
  return out;
}

auto apply_env_overrides(FleetSettings &fleet) -> void {
  if (const char *v = std::getenv("HOSTFLEET_MANAGER_NAME"); v != nullptr) {
    fleet.manager_name = v;
  }
  if (const char *v = std::getenv("HOSTFLEET_VAR_DIR"); v != nullptr) {
    fleet.var_dir = v;
  }
  if (const char *v = std::getenv("HOSTFLEET_INSTANCE_DIR"); v != nullptr) {
    fleet.instance_dir = v;
  }
  if (const char *v = std::getenv("HOSTFLEET_INSTANCE_EXECUTABLE");
      v != nullptr) {
    fleet.instance_executable = v;
  }
  if (const char *v = std::getenv("HOSTFLEET_MAX_INSTANCES"); v != nullptr) {
    fleet.max_instances = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("HOSTFLEET_TICK_INTERVAL_MS");
      v != nullptr) {
    fleet.tick_interval_ms = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("HOSTFLEET_LOG_LEVEL"); v != nullptr) {
    fleet.log_level = v;
  }
  if (const char *v = std::getenv("HOSTFLEET_LOG_FILE"); v != nullptr) {
    fleet.log_file = v;
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<FleetConfig> {
  auto raw_result = toml_util::parse_toml<detail::FleetFileToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  FleetConfig cfg{};
  auto &f = cfg.fleet;
  f.manager_name = std::move(raw.fleet.manager_name);
  f.var_dir = std::move(raw.fleet.var_dir);
  f.instance_dir = std::move(raw.fleet.instance_dir);
  f.max_instances = raw.fleet.max_instances;
  f.max_instances_public = raw.fleet.max_instances_public;
  f.max_instances_private = raw.fleet.max_instances_private;
  f.starting_instance_timeout =
      std::chrono::seconds(raw.fleet.starting_instance_timeout);
  f.offline_instance_timeout =
      std::chrono::seconds(raw.fleet.offline_instance_timeout);
  f.orphan_instance_timeout =
      std::chrono::seconds(raw.fleet.orphan_instance_timeout);
  f.remove_spare_instance_delay =
      std::chrono::seconds(raw.fleet.remove_spare_instance_delay);
  f.remove_private_instance_delay =
      std::chrono::seconds(raw.fleet.remove_private_instance_delay);
  f.clusters = std::move(raw.fleet.clusters);
  f.default_preset = std::move(raw.fleet.default_preset);
  f.auto_register = raw.fleet.auto_register;
  f.share_archive_cache = raw.fleet.share_archive_cache;
  f.sequential_unitsync = raw.fleet.sequential_unitsync;
  f.shared_data_files = std::move(raw.fleet.shared_data_files);
  f.instance_executable = std::move(raw.fleet.instance_executable);
  f.create_new_consoles = raw.fleet.create_new_consoles;
  f.tick_interval_ms = raw.fleet.tick_interval_ms;
  f.log_level = std::move(raw.fleet.log_level);
  f.log_file = std::move(raw.fleet.log_file);

  for (auto [port, target] :
       {std::pair{raw.fleet.base_game_port, &f.base_game_port},
        std::pair{raw.fleet.base_auto_host_port, &f.base_auto_host_port},
        std::pair{raw.fleet.manager_auto_host_port,
                  &f.manager_auto_host_port}}) {
    if (port <= 0 || port > 65535) {
      log::error("Invalid port value in configuration: {}", port);
      return fail(Error::ConfigInvalid);
    }
    *target = static_cast<std::uint16_t>(port);
  }

  apply_env_overrides(f);

  const detail::ClusterToml *base = nullptr;
  for (const auto &preset : raw.cluster) {
    if (preset.name == f.default_preset) {
      base = &preset;
      break;
    }
  }
  const detail::ClusterToml empty_base{};
  cfg.presets.reserve(raw.cluster.size());
  for (const auto &preset : raw.cluster) {
    cfg.presets.push_back(resolve_preset(preset, base ? *base : empty_base));
  }
  return ok(std::move(cfg));
}

auto check_ports(const FleetSettings &f, ConfigReport &report) -> void {
  const int game = f.base_game_port;
  const int autohost = f.base_auto_host_port;
  const int manager = f.manager_auto_host_port;
  if (f.max_instances > std::abs(game - autohost)) {
    report.errors.push_back(std::format(
        "Incompatible values for max_instances ({}), base_game_port ({}) and "
        "base_auto_host_port ({}): not enough ports between {} and {} to "
        "allow {} instances",
        f.max_instances, game, autohost, game, autohost, f.max_instances));
    return;
  }
  const bool game_is_high = game > autohost;
  const int high_port = game_is_high ? game : autohost;
  if (f.max_instances > 65536 - high_port) {
    report.errors.push_back(std::format(
        "Incompatible values for max_instances ({}) and {} ({}): not enough "
        "valid ports above {} to allow {} instances",
        f.max_instances,
        game_is_high ? "base_game_port" : "base_auto_host_port", high_port,
        high_port, f.max_instances));
    return;
  }
  if (manager >= game && manager < game + f.max_instances) {
    report.errors.push_back(std::format(
        "Incompatible values for manager_auto_host_port ({}), base_game_port "
        "({}) and max_instances ({}): the manager port is inside the port "
        "range used by instances",
        manager, game, f.max_instances));
  }
  if (manager >= autohost && manager < autohost + f.max_instances) {
    report.errors.push_back(std::format(
        "Incompatible values for manager_auto_host_port ({}), "
        "base_auto_host_port ({}) and max_instances ({}): the manager port is "
        "inside the port range used by instances",
        manager, autohost, f.max_instances));
  }
}

} // namespace

auto ConfigLoader::validate(const FleetConfig &config) -> ConfigReport {
  ConfigReport report;
  const auto &f = config.fleet;

  if (f.manager_name.empty()) {
    report.errors.emplace_back("manager_name cannot be empty");
  }
  if (f.max_instances <= 0) {
    report.errors.emplace_back("max_instances must be a non-zero integer");
  }
  if (f.max_instances_public < 0 || f.max_instances_private < 0) {
    report.errors.emplace_back(
        "max_instances_public and max_instances_private cannot be negative");
  }
  if (f.remove_private_instance_delay.count() <= 0) {
    report.errors.emplace_back(
        "remove_private_instance_delay must be a non-zero integer");
  }
  for (auto [key, value] :
       {std::pair{"starting_instance_timeout", f.starting_instance_timeout},
        std::pair{"offline_instance_timeout", f.offline_instance_timeout},
        std::pair{"orphan_instance_timeout", f.orphan_instance_timeout},
        std::pair{"remove_spare_instance_delay",
                  f.remove_spare_instance_delay}}) {
    if (value.count() < 0) {
      report.errors.push_back(std::format("{} cannot be negative", key));
    }
  }
  if (f.auto_register < 0 || f.auto_register > 2) {
    report.errors.push_back(
        std::format("auto_register must be 0, 1 or 2 (got {})",
                    f.auto_register));
  }
  if (f.tick_interval_ms <= 0) {
    report.errors.emplace_back("tick_interval_ms must be positive");
  }

  ankerl::unordered_dense::set<std::string> preset_names;
  for (const auto &preset : config.presets) {
    if (preset.name.empty()) {
      report.errors.emplace_back("Cluster preset without name");
      continue;
    }
    if (!preset_names.insert(preset.name).second) {
      report.errors.push_back(
          std::format("Duplicate cluster preset: {}", preset.name));
    }
    if (preset.target_spares < 0 || preset.max_instances_in_cluster < 0 ||
        preset.max_instances_in_cluster_public < 0 ||
        preset.max_instances_in_cluster_private < 0) {
      report.errors.push_back(std::format(
          "Cluster preset \"{}\": negative values are not allowed",
          preset.name));
    }
    for (auto [setting, text] :
         {std::pair{"conf_macros", &preset.conf_macros},
          std::pair{"conf_macros_public", &preset.conf_macros_public},
          std::pair{"conf_macros_private", &preset.conf_macros_private}}) {
      if (!parse_macro_string(*text)) {
        report.errors.push_back(std::format(
            "Invalid configuration macro definition (preset \"{}\", setting "
            "\"{}\"): {}",
            preset.name, setting, *text));
      }
    }
  }
  if (config.find_preset(f.default_preset) == nullptr) {
    report.errors.push_back(std::format(
        "Default preset \"{}\" is not defined", f.default_preset));
  }

  std::vector<std::string> invalid_clusters;
  std::map<std::string, std::vector<std::string>> templates;
  for (const auto &cluster : config.cluster_names()) {
    const auto *preset = config.find_preset(cluster);
    if (preset == nullptr) {
      invalid_clusters.push_back(cluster);
      continue;
    }
    const bool instance_scoped = std::ranges::any_of(
        kInstanceScopedPlaceholders, [&](std::string_view placeholder) {
          return contains_placeholder(preset->name_template, placeholder);
        });
    if (!instance_scoped) {
      templates[preset->name_template].push_back(cluster);
    }
  }
  if (!invalid_clusters.empty()) {
    report.errors.push_back(std::format(
        "Invalid value for \"clusters\" setting (undefined preset{}: {})",
        invalid_clusters.size() > 1 ? "s" : "",
        boost::algorithm::join(invalid_clusters, ", ")));
  }
  std::vector<std::string> conflicts;
  for (const auto &[tmpl, clusters] : templates) {
    if (clusters.size() > 1) {
      conflicts.push_back(
          std::format("({})", boost::algorithm::join(clusters, ",")));
    }
  }
  if (!conflicts.empty()) {
    report.errors.push_back(
        std::format("Conflicting name templates found for following "
                    "clusters: {}",
                    boost::algorithm::join(conflicts, " ")));
  }

  if (f.max_instances > 0) {
    check_ports(f, report);
  }

  if (f.share_archive_cache && !f.sequential_unitsync) {
    report.warnings.emplace_back(
        "Archive cache data are shared but unitsync sequential mode is "
        "disabled, this can lead to race conditions and cache data "
        "corruption");
  }
  return report;
}

auto ConfigLoader::parse_file(std::string_view path) -> Result<FleetConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("Unable to read configuration file {}", path);
    return fail(text.error());
  }
  auto cfg = parse_string(*text);
  if (cfg) {
    // Relative directories follow the configuration file, not the working
    // directory, which changes when the process daemonizes.
    const auto base = std::filesystem::absolute(std::string(path)).parent_path();
    for (auto *dir : {&cfg->fleet.var_dir, &cfg->fleet.instance_dir}) {
      if (std::filesystem::path p{*dir}; p.is_relative()) {
        *dir = std::filesystem::weakly_canonical(base / p).string();
      }
    }
  }
  return cfg;
}

auto ConfigLoader::parse_string(std::string_view toml_str)
    -> Result<FleetConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML fleet configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

namespace {

auto checked(Result<FleetConfig> cfg) -> Result<FleetConfig> {
  if (!cfg) {
    return cfg;
  }
  const auto report = ConfigLoader::validate(*cfg);
  for (const auto &warning : report.warnings) {
    log::warn("{}", warning);
  }
  if (!report.valid()) {
    for (const auto &error : report.errors) {
      log::error("{}", error);
    }
    return fail(Error::ConfigInvalid);
  }
  return cfg;
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<FleetConfig> {
  return checked(parse_file(path));
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<FleetConfig> {
  return checked(parse_string(toml_str));
}

} // namespace hostfleet
