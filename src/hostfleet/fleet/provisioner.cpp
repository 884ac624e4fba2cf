#include "hostfleet/fleet/provisioner.hpp"

#include "hostfleet/core/constants.hpp"
#include "hostfleet/util/log.hpp"

#include <algorithm>
#include <iterator>

namespace hostfleet {

Provisioner::Provisioner(const FleetConfig &config, FleetIndex &index,
                         LobbyView &lobby, Admission &admission,
                         const Clock &clock)
    : config_(config), index_(index), lobby_(lobby), admission_(admission),
      clock_(clock) {}

auto Provisioner::public_counts(std::string_view cluster) const
    -> PresenceCounts {
  PresenceCounts counts;
  for (const auto &[cluster_number, number] : index_.cluster_members(cluster)) {
    const auto *inst = index_.find(number);
    if (inst == nullptr || !inst->is_public()) {
      continue;
    }
    switch (inst->presence) {
    case PresenceState::Offline:
      ++counts.offline;
      break;
    case PresenceState::Spare:
      ++counts.spare;
      break;
    case PresenceState::InUse:
      ++counts.in_use;
      break;
    case PresenceState::Stuck:
      ++counts.stuck;
      break;
    }
  }
  return counts;
}

auto Provisioner::can_start_public(const ClusterConfig &preset,
                                   std::string_view cluster,
                                   const PresenceCounts &counts) const
    -> bool {
  const auto &fleet = config_.fleet;
  const auto cap = [](int limit, std::size_t current) {
    return limit == 0 || current < static_cast<std::size_t>(limit);
  };
  return counts.spare + counts.offline <
             static_cast<std::size_t>(std::max(preset.target_spares, 0)) &&
         cap(preset.max_instances_in_cluster, index_.cluster_size(cluster)) &&
         cap(preset.max_instances_in_cluster_public, counts.total()) &&
         index_.size() < static_cast<std::size_t>(fleet.max_instances) &&
         cap(fleet.max_instances_public, index_.public_count());
}

auto Provisioner::provision(std::string_view cluster) -> std::size_t {
  if (!config_.is_configured_cluster(cluster)) {
    return 0;
  }
  const auto *preset = config_.find_preset(cluster);
  if (preset == nullptr) {
    return 0;
  }

  auto counts = public_counts(cluster);
  log::trace("Cluster {} public instance counts before start instance loop: "
             "spare={}, inUse={}, offline={}, stuckOffline={}",
             cluster, counts.spare, counts.in_use, counts.offline,
             counts.stuck);
  std::size_t started = 0;
  while (can_start_public(*preset, cluster, counts)) {
    auto launched = admission_.launch(cluster, kPublicOwner);
    if (!launched) {
      log::error("Failed to start a new public instance in cluster {}",
                 cluster);
      break;
    }
    ++counts.offline;
    ++started;
    log::info("Started a new public instance (#{} - {}) in cluster \"{}\"",
              launched->number, launched->name, cluster);
  }
  log::trace("Cluster {} public instance counts after start instance loop: "
             "spare={}, inUse={}, offline={}, stuckOffline={}",
             cluster, counts.spare, counts.in_use, counts.offline,
             counts.stuck);
  return started;
}

auto Provisioner::provision_all() -> std::size_t {
  std::size_t started = 0;
  for (const auto &cluster : config_.cluster_names()) {
    started += provision(cluster);
  }
  return started;
}

auto Provisioner::prune_configured(std::string_view cluster,
                                   const ClusterConfig &preset, TimePoint now)
    -> std::vector<std::string> {
  const auto delay = config_.fleet.remove_spare_instance_delay;
  if (delay.count() == 0) {
    return {};
  }

  // Old spares, highest cluster-local number first.
  std::vector<const Instance *> old_spares;
  const auto &members = index_.cluster_members(cluster);
  for (auto it = members.rbegin(); it != members.rend(); ++it) {
    const auto *inst = index_.find(it->second);
    if (inst != nullptr && inst->is_public() &&
        inst->presence == PresenceState::Spare &&
        now - inst->presence_since >= delay) {
      old_spares.push_back(inst);
    }
  }

  const auto target =
      static_cast<std::size_t>(std::max(preset.target_spares, 0));
  if (old_spares.size() <= target) {
    return {};
  }
  prune_ts_.insert_or_assign(std::string(cluster), now);

  std::vector<std::string> removed;
  for (std::size_t i = 0; i < old_spares.size() - target; ++i) {
    const auto &name = old_spares[i]->name;
    log::debug("Spare instance pruning for cluster \"{}\" (removing instance "
               "\"{}\")",
               cluster, name);
    lobby_.send_private(name, kQuitIfIdleMessage);
    removed.push_back(name);
  }
  return removed;
}

auto Provisioner::prune_obsolete(std::string_view cluster)
    -> std::vector<std::string> {
  std::vector<std::string> removed;
  for (const auto &[cluster_number, number] : index_.cluster_members(cluster)) {
    const auto *inst = index_.find(number);
    if (inst != nullptr && inst->presence == PresenceState::Spare) {
      removed.push_back(inst->name);
    }
  }
  if (removed.empty()) {
    return removed;
  }
  prune_ts_.insert_or_assign(std::string(cluster), clock_.now());
  for (const auto &name : removed) {
    log::warn("Instance removal for obsolete cluster \"{}\" (removing "
              "instance \"{}\")",
              cluster, name);
    lobby_.send_private(name, kQuitIfIdleMessage);
  }
  return removed;
}

auto Provisioner::prune() -> std::vector<std::string> {
  const auto now = clock_.now();
  std::vector<std::string> removed;
  for (const auto &cluster : index_.clusters()) {
    if (auto it = prune_ts_.find(cluster);
        it != prune_ts_.end() && now - it->second < timing::kPruneInterval) {
      continue;
    }
    const auto *preset = config_.find_preset(cluster);
    auto names = config_.is_configured_cluster(cluster) && preset != nullptr
                     ? prune_configured(cluster, *preset, now)
                     : prune_obsolete(cluster);
    std::ranges::move(names, std::back_inserter(removed));
  }
  return removed;
}

} // namespace hostfleet
