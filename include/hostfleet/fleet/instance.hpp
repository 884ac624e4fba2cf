#pragma once

#include "hostfleet/core/constants.hpp"
#include "hostfleet/util/enum.hpp"
#include "hostfleet/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace hostfleet {

enum class LifecycleState : std::uint8_t {
  Launched,
  Running,
  Restarting,
  Reloading,
  Unloaded,
  Exiting,
  Crashed,
};
BOOST_DESCRIBE_ENUM(LifecycleState, Launched, Running, Restarting, Reloading,
                    Unloaded, Exiting, Crashed)
HOSTFLEET_DEFINE_ENUM_SERDE(LifecycleState)

enum class PresenceState : std::uint8_t { Offline, Spare, InUse, Stuck };
BOOST_DESCRIBE_ENUM(PresenceState, Offline, Spare, InUse, Stuck)
HOSTFLEET_DEFINE_ENUM_SERDE(PresenceState)

// Launched/restarting instances have no process in the lobby yet and are
// subject to the starting timeout.
[[nodiscard]] constexpr auto is_starting(LifecycleState s) noexcept -> bool {
  return s == LifecycleState::Launched || s == LifecycleState::Restarting;
}

[[nodiscard]] constexpr auto is_offline_like(PresenceState s) noexcept
    -> bool {
  return s == PresenceState::Offline || s == PresenceState::Stuck;
}

struct Instance {
  int number{0};
  std::string name;
  std::string cluster;
  int cluster_number{0};
  std::string owner{kPublicOwner};
  std::optional<std::int64_t> pid;
  LifecycleState lifecycle{LifecycleState::Launched};
  TimePoint lifecycle_since{};
  PresenceState presence{PresenceState::Offline};
  TimePoint presence_since{};

  [[nodiscard]] auto is_public() const noexcept -> bool {
    return owner == kPublicOwner;
  }
};

} // namespace hostfleet
