#include "hostfleet/fleet/fleet_index.hpp"

#include "hostfleet/util/log.hpp"

namespace hostfleet {

auto FleetIndex::insert(Instance instance) -> Result<void> {
  if (by_number_.contains(instance.number) ||
      by_name_.contains(instance.name)) {
    return fail(Error::AlreadyExists);
  }
  if (!instance.is_public() && by_owner_.contains(instance.owner)) {
    return fail(Error::AlreadyExists);
  }
  if (auto it = by_cluster_.find(instance.cluster);
      it != by_cluster_.end() && it->second.contains(instance.cluster_number)) {
    return fail(Error::AlreadyExists);
  }

  const int number = instance.number;
  by_name_.emplace(instance.name, number);
  if (!instance.is_public()) {
    by_owner_.emplace(instance.owner, number);
  }
  by_cluster_[instance.cluster].emplace(instance.cluster_number, number);
  by_number_.emplace(number, std::move(instance));
  return ok();
}

auto FleetIndex::erase(int number) -> std::optional<Instance> {
  auto it = by_number_.find(number);
  if (it == by_number_.end()) {
    return std::nullopt;
  }
  Instance removed = std::move(it->second);
  by_number_.erase(it);
  by_name_.erase(removed.name);
  if (!removed.is_public()) {
    by_owner_.erase(removed.owner);
  }
  if (auto cit = by_cluster_.find(removed.cluster); cit != by_cluster_.end()) {
    cit->second.erase(removed.cluster_number);
    if (cit->second.empty()) {
      by_cluster_.erase(cit);
    }
  }
  return removed;
}

auto FleetIndex::clear() -> void {
  by_number_.clear();
  by_name_.clear();
  by_owner_.clear();
  by_cluster_.clear();
}

auto FleetIndex::find(int number) -> Instance * {
  auto it = by_number_.find(number);
  return it == by_number_.end() ? nullptr : &it->second;
}

auto FleetIndex::find(int number) const -> const Instance * {
  auto it = by_number_.find(number);
  return it == by_number_.end() ? nullptr : &it->second;
}

auto FleetIndex::find_by_name(std::string_view name) const
    -> const Instance * {
  auto it = by_name_.find(name);
  return it == by_name_.end() ? nullptr : find(it->second);
}

auto FleetIndex::find_by_owner(std::string_view owner) const
    -> const Instance * {
  auto it = by_owner_.find(owner);
  return it == by_owner_.end() ? nullptr : find(it->second);
}

auto FleetIndex::cluster_members(std::string_view cluster) const
    -> const ClusterMembers & {
  static const ClusterMembers kEmpty;
  auto it = by_cluster_.find(cluster);
  return it == by_cluster_.end() ? kEmpty : it->second;
}

auto FleetIndex::clusters() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(by_cluster_.size());
  for (const auto &[name, members] : by_cluster_) {
    out.push_back(name);
  }
  return out;
}

auto FleetIndex::next_free_number() const -> int {
  int candidate = 0;
  for (const auto &[number, _] : by_number_) {
    if (number != candidate) {
      break;
    }
    ++candidate;
  }
  return candidate;
}

auto FleetIndex::next_free_cluster_number(std::string_view cluster) const
    -> int {
  int candidate = 0;
  for (const auto &[cluster_number, _] : cluster_members(cluster)) {
    if (cluster_number != candidate) {
      break;
    }
    ++candidate;
  }
  return candidate;
}

auto FleetIndex::set_presence(int number, PresenceState state, TimePoint now)
    -> bool {
  auto *inst = find(number);
  if (inst == nullptr) {
    return false;
  }
  log::trace("Instance {} ({}) went from lobby state {} to {}", number,
             inst->name, to_string_view(inst->presence),
             to_string_view(state));
  inst->presence = state;
  inst->presence_since = now;
  return true;
}

auto FleetIndex::set_lifecycle(int number, LifecycleState state,
                               TimePoint since) -> bool {
  auto *inst = find(number);
  if (inst == nullptr) {
    return false;
  }
  if (inst->lifecycle != state || inst->lifecycle_since != since) {
    log::trace("Instance {} ({}) went from state {} to {}", number, inst->name,
               to_string_view(inst->lifecycle), to_string_view(state));
  }
  inst->lifecycle = state;
  inst->lifecycle_since = since;
  return true;
}

} // namespace hostfleet
