#pragma once

#include "hostfleet/core/error.hpp"
#include "hostfleet/fleet/instance.hpp"
#include "hostfleet/util/string_hash.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hostfleet {

// In-memory index of every tracked instance, owned by the manager. All
// secondary maps hold instance numbers and are kept in sync by insert/erase.
class FleetIndex {
public:
  using ClusterMembers = std::map<int, int>; // cluster number -> instance

  // AlreadyExists if the number, name, non-public owner or cluster number is
  // already taken.
  [[nodiscard]] auto insert(Instance instance) -> Result<void>;
  auto erase(int number) -> std::optional<Instance>;
  auto clear() -> void;

  [[nodiscard]] auto find(int number) -> Instance *;
  [[nodiscard]] auto find(int number) const -> const Instance *;
  [[nodiscard]] auto find_by_name(std::string_view name) const
      -> const Instance *;
  [[nodiscard]] auto find_by_owner(std::string_view owner) const
      -> const Instance *;

  [[nodiscard]] auto contains(int number) const -> bool {
    return by_number_.contains(number);
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return by_number_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return by_number_.empty();
  }
  [[nodiscard]] auto private_count() const noexcept -> std::size_t {
    return by_owner_.size();
  }
  [[nodiscard]] auto public_count() const noexcept -> std::size_t {
    return by_number_.size() - by_owner_.size();
  }

  [[nodiscard]] auto instances() const noexcept
      -> const std::map<int, Instance> & {
    return by_number_;
  }
  [[nodiscard]] auto cluster_members(std::string_view cluster) const
      -> const ClusterMembers &;
  [[nodiscard]] auto cluster_size(std::string_view cluster) const
      -> std::size_t {
    return cluster_members(cluster).size();
  }
  // Clusters currently holding at least one instance.
  [[nodiscard]] auto clusters() const -> std::vector<std::string>;

  // Lowest unused numbers, reused once an instance is removed.
  [[nodiscard]] auto next_free_number() const -> int;
  [[nodiscard]] auto next_free_cluster_number(std::string_view cluster) const
      -> int;

  auto set_presence(int number, PresenceState state, TimePoint now) -> bool;
  auto set_lifecycle(int number, LifecycleState state, TimePoint since)
      -> bool;

private:
  std::map<int, Instance> by_number_;
  ankerl::unordered_dense::map<std::string, int, StringHash, StringEqual>
      by_name_;
  ankerl::unordered_dense::map<std::string, int, StringHash, StringEqual>
      by_owner_;
  std::map<std::string, ClusterMembers, std::less<>> by_cluster_;
};

} // namespace hostfleet
