#pragma once

#include "hostfleet/core/constants.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace hostfleet {

// Per-cluster (preset) settings. A cap of 0 means unlimited.
struct ClusterConfig {
  std::string name;
  std::string description;
  int target_spares{1};
  int max_instances_in_cluster{0};
  int max_instances_in_cluster_public{0};
  int max_instances_in_cluster_private{0};
  std::string name_template{"%PresetName%"};
  std::string lobby_password;
  std::string conf_macros;
  std::string conf_macros_public;
  std::string conf_macros_private;

  auto operator==(const ClusterConfig &) const -> bool = default;
};

struct FleetSettings {
  std::string manager_name{"FleetManager"};
  std::string var_dir{"var"};
  std::string instance_dir{"."};
  int max_instances{10};
  int max_instances_public{0};
  int max_instances_private{0};
  std::uint16_t base_game_port{8452};
  std::uint16_t base_auto_host_port{9452};
  std::uint16_t manager_auto_host_port{8451};
  std::chrono::seconds starting_instance_timeout{120};
  std::chrono::seconds offline_instance_timeout{60};
  std::chrono::seconds orphan_instance_timeout{600};
  std::chrono::seconds remove_spare_instance_delay{300};
  std::chrono::seconds remove_private_instance_delay{900};
  std::vector<std::string> clusters;
  std::string default_preset{"default"};
  int auto_register{0};
  bool share_archive_cache{false};
  bool sequential_unitsync{false};
  std::vector<std::string> shared_data_files{"mapHashes.dat", "userData.dat"};
  std::string instance_executable;
  // Instances get a console of their own: they keep the manager's stdio
  // instead of having it discarded.
  bool create_new_consoles{false};
  int tick_interval_ms{1000};
  std::string log_level{"info"};
  std::string log_file;

  auto operator==(const FleetSettings &) const -> bool = default;
};

struct FleetConfig {
  FleetSettings fleet;
  std::vector<ClusterConfig> presets;

  auto operator==(const FleetConfig &) const -> bool = default;

  // Clusters managed by the fleet, in configuration order. The first one is
  // the default target of privateHost.
  [[nodiscard]] auto cluster_names() const -> std::vector<std::string> {
    if (!fleet.clusters.empty()) {
      return fleet.clusters;
    }
    return {fleet.default_preset};
  }

  [[nodiscard]] auto default_cluster() const -> std::string {
    return fleet.clusters.empty() ? fleet.default_preset
                                  : fleet.clusters.front();
  }

  [[nodiscard]] auto is_configured_cluster(std::string_view name) const
      -> bool {
    const auto names = cluster_names();
    return std::ranges::find(names, name) != names.end();
  }

  [[nodiscard]] auto find_preset(std::string_view name) const
      -> const ClusterConfig * {
    auto it = std::ranges::find(presets, name, &ClusterConfig::name);
    return it == presets.end() ? nullptr : &*it;
  }

  [[nodiscard]] auto pid_dir() const -> std::filesystem::path {
    return std::filesystem::path(fleet.var_dir) / kPidDirName;
  }
};

} // namespace hostfleet
