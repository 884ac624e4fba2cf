#pragma once

#include "hostfleet/config/fleet_config.hpp"
#include "hostfleet/fleet/admission.hpp"
#include "hostfleet/fleet/fleet_index.hpp"
#include "hostfleet/lobby/lobby.hpp"
#include "hostfleet/util/time.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hostfleet {

struct PresenceCounts {
  std::size_t offline{0};
  std::size_t spare{0};
  std::size_t in_use{0};
  std::size_t stuck{0};

  [[nodiscard]] auto total() const noexcept -> std::size_t {
    return offline + spare + in_use + stuck;
  }
};

// Keeps every configured cluster at its spare target and trims surplus
// spares. Instances asked to leave stay tracked until their worker exits.
class Provisioner {
public:
  Provisioner(const FleetConfig &config, FleetIndex &index, LobbyView &lobby,
              Admission &admission, const Clock &clock);

  // Starts public instances until the cluster reaches its spare target or a
  // cap. Returns the number of instances started.
  auto provision(std::string_view cluster) -> std::size_t;
  auto provision_all() -> std::size_t;

  // Sends the quit-if-idle request to surplus spares. Returns the names of
  // the instances asked to leave.
  auto prune() -> std::vector<std::string>;

  [[nodiscard]] auto public_counts(std::string_view cluster) const
      -> PresenceCounts;

private:
  const FleetConfig &config_;
  FleetIndex &index_;
  LobbyView &lobby_;
  Admission &admission_;
  const Clock &clock_;
  std::map<std::string, TimePoint, std::less<>> prune_ts_;

  [[nodiscard]] auto can_start_public(const ClusterConfig &preset,
                                      std::string_view cluster,
                                      const PresenceCounts &counts) const
      -> bool;
  auto prune_configured(std::string_view cluster, const ClusterConfig &preset,
                        TimePoint now) -> std::vector<std::string>;
  auto prune_obsolete(std::string_view cluster) -> std::vector<std::string>;
};

} // namespace hostfleet
