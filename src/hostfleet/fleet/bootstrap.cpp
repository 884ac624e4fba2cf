#include "hostfleet/fleet/bootstrap.hpp"

#include "hostfleet/core/constants.hpp"
#include "hostfleet/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <array>

namespace hostfleet {

auto detect_role(const MacroMap &macros) -> Role {
  return macros.contains(macro::kManagerName) ? Role::Worker : Role::Manager;
}

auto WorkerIdentity::is_private() const -> bool {
  return owner != kPublicOwner;
}

auto WorkerIdentity::from_macros(const MacroMap &macros,
                                 const FleetConfig &config)
    -> Result<WorkerIdentity> {
  constexpr std::array kRequired = {macro::kManagerName, macro::kInstNb,
                                    macro::kClustInstNb, macro::kOwnerName};
  for (auto name : kRequired) {
    if (!macros.contains(name)) {
      log::error("Missing configuration macro {} for starting in instance "
                 "mode",
                 name);
      return fail(Error::ConfigInvalid);
    }
  }

  const auto lookup = [&](std::string_view name) -> const std::string & {
    return macros.find(name)->second;
  };

  WorkerIdentity identity;
  identity.manager_name = lookup(macro::kManagerName);
  identity.owner = lookup(macro::kOwnerName);
  try {
    identity.instance_number = boost::lexical_cast<int>(lookup(macro::kInstNb));
    identity.cluster_number =
        boost::lexical_cast<int>(lookup(macro::kClustInstNb));
  } catch (const boost::bad_lexical_cast &) {
    log::error("Invalid instance numbers in configuration macros ({}={}, "
               "{}={})",
               macro::kInstNb, lookup(macro::kInstNb), macro::kClustInstNb,
               lookup(macro::kClustInstNb));
    return fail(Error::ConfigInvalid);
  }

  if (auto it = macros.find(macro::kLobbyLogin); it != macros.end()) {
    identity.lobby_login = it->second;
  } else if (auto name = macros.find(macro::kInstanceName);
             name != macros.end()) {
    identity.lobby_login = name->second;
  } else {
    log::error("Missing lobby login for starting in instance mode");
    return fail(Error::ConfigInvalid);
  }

  if (auto it = macros.find(macro::kDefaultPreset); it != macros.end()) {
    identity.cluster = it->second;
  } else {
    identity.cluster = config.fleet.default_preset;
  }
  return ok(std::move(identity));
}

} // namespace hostfleet
