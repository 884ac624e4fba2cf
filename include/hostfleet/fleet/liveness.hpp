#pragma once

#include "hostfleet/config/fleet_config.hpp"
#include "hostfleet/core/error.hpp"
#include "hostfleet/fleet/fleet_index.hpp"
#include "hostfleet/fleet/pid_record.hpp"
#include "hostfleet/util/time.hpp"

#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace hostfleet {

struct SweepReport {
  // Clusters that lost a public instance or have a public instance stuck.
  std::set<std::string, std::less<>> impacted;
  std::vector<int> removed;
  std::vector<int> stuck;

  [[nodiscard]] auto changed() const noexcept -> bool {
    return !impacted.empty();
  }
};

// Reconciles the index with the PID directory and the process table:
// starting timeouts, dead processes, clean exits and stuck offline instances.
class LivenessDetector {
public:
  using AliveProbe = std::move_only_function<bool(std::int64_t) const>;

  LivenessDetector(const FleetConfig &config, const PidRecordStore &store,
                   FleetIndex &index, const Clock &clock,
                   AliveProbe probe = {});

  [[nodiscard]] auto sweep() -> SweepReport;

  // Re-reads the record of a tracked instance under its lock. Returns the
  // stored lifecycle, or Exiting/Crashed when the instance was removed from
  // the index. Errors leave the index untouched.
  [[nodiscard]] auto refresh(int number) -> Result<LifecycleState>;

  [[nodiscard]] auto is_alive(std::int64_t pid) const -> bool {
    return probe_(pid);
  }

private:
  const FleetConfig &config_;
  const PidRecordStore &store_;
  FleetIndex &index_;
  const Clock &clock_;
  AliveProbe probe_;

  [[nodiscard]] auto check_consistency(const Instance &inst,
                                       const PidRecord &record) const
      -> std::vector<std::string>;
};

} // namespace hostfleet
