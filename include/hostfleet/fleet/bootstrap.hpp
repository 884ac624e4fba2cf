#pragma once

#include "hostfleet/config/conf_macros.hpp"
#include "hostfleet/config/fleet_config.hpp"
#include "hostfleet/core/error.hpp"
#include "hostfleet/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace hostfleet {

enum class Role : std::uint8_t { Manager, Worker };
BOOST_DESCRIBE_ENUM(Role, Manager, Worker)
HOSTFLEET_DEFINE_ENUM_SERDE(Role)

// A process started without the ManagerName macro manages the fleet; one
// spawned by a manager runs a single instance.
[[nodiscard]] auto detect_role(const MacroMap &macros) -> Role;

// Identity a manager hands to a worker through its launch macros.
struct WorkerIdentity {
  std::string manager_name;
  int instance_number{0};
  int cluster_number{0};
  std::string owner;
  std::string lobby_login;
  std::string cluster;

  [[nodiscard]] auto is_private() const -> bool;

  // ConfigInvalid when a required macro is missing or not a number.
  [[nodiscard]] static auto from_macros(const MacroMap &macros,
                                        const FleetConfig &config)
      -> Result<WorkerIdentity>;
};

} // namespace hostfleet
