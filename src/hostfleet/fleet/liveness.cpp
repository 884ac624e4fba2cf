#include "hostfleet/fleet/liveness.hpp"

#include "hostfleet/util/daemon.hpp"
#include "hostfleet/util/log.hpp"

#include <boost/algorithm/string/join.hpp>

#include <ranges>

namespace hostfleet {

namespace {

[[nodiscard]] auto timed_out(std::chrono::seconds timeout, TimePoint since,
                             TimePoint now) -> bool {
  return timeout.count() != 0 && now - since >= timeout;
}

} // namespace

LivenessDetector::LivenessDetector(const FleetConfig &config,
                                   const PidRecordStore &store,
                                   FleetIndex &index, const Clock &clock,
                                   AliveProbe probe)
    : config_(config), store_(store), index_(index), clock_(clock),
      probe_(std::move(probe)) {
  if (!probe_) {
    probe_ = [](std::int64_t pid) { return is_process_alive(pid); };
  }
}

auto LivenessDetector::check_consistency(const Instance &inst,
                                         const PidRecord &record) const
    -> std::vector<std::string> {
  std::vector<std::string> fields;
  if (record.manager_name != config_.fleet.manager_name)
    fields.emplace_back("managerName");
  if (record.instance_number != inst.number)
    fields.emplace_back("instanceNumber");
  if (record.instance_name != inst.name)
    fields.emplace_back("instanceName");
  if (record.cluster != inst.cluster)
    fields.emplace_back("clusterPreset");
  if (record.cluster_number != inst.cluster_number)
    fields.emplace_back("clusterInstanceNumber");
  if (record.owner != inst.owner)
    fields.emplace_back("ownerName");
  return fields;
}

auto LivenessDetector::refresh(int number) -> Result<LifecycleState> {
  const auto *inst = index_.find(number);
  if (inst == nullptr) {
    return fail(Error::NotFound);
  }
  const std::string name = inst->name;

  if (store_.consume_exiting_marker(number)) {
    if (is_offline_like(inst->presence)) {
      log::info("Instance {} ({}) exited", number, name);
    } else {
      log::warn("Instance {} ({}) exited but still appears online", number,
                name);
    }
    index_.erase(number);
    return ok(LifecycleState::Exiting);
  }

  auto lock = store_.acquire_lock(number, LockMode::Blocking);
  if (!lock) {
    log::error("Unable to load instance data from PID file for instance {} "
               "({}): failed to acquire lock",
               number, name);
    return fail(lock.error());
  }
  auto stored = store_.read_record(*lock);
  if (!stored) {
    log::error("Unable to load instance data from PID file for instance {} "
               "({})",
               number, name);
    return fail(stored.error());
  }
  if (!*stored) {
    log::error("Unable to load instance data from PID file for instance {} "
               "({}): PID file not found",
               number, name);
    return fail(Error::NotFound);
  }
  const auto &[record, kind, since] = **stored;

  if (auto fields = check_consistency(*inst, record); !fields.empty()) {
    log::error("Unable to load instance data from PID file for instance {} "
               "({}), inconsistent data found for following field{}: {}",
               number, name, fields.size() > 1 ? "s" : "",
               boost::algorithm::join(fields, ", "));
    return fail(Error::RecordInconsistent);
  }

  const auto lifecycle = to_lifecycle(kind);
  const auto now = clock_.now();
  bool crashed = false;
  if (is_starting(lifecycle)) {
    if (timed_out(config_.fleet.starting_instance_timeout, since, now)) {
      log::warn("Instance {} ({}) failed to start, removing PID file", number,
                name);
      crashed = true;
    }
  } else if (!record.pid || !probe_(*record.pid)) {
    log::warn("Instance {} ({}) exited unexpectedly, removing PID file",
              number, name);
    crashed = true;
  }
  if (crashed) {
    index_.erase(number);
    if (auto r = store_.remove_record(*lock); !r) {
      log::error("Unable to remove PID file of crashed instance {}", number);
    }
    if (auto r = store_.remove_lock_file(*lock); !r) {
      log::debug("Unable to remove lock file of crashed instance {}", number);
    }
    return ok(LifecycleState::Crashed);
  }
  lock->release();

  index_.find(number)->pid = record.pid;
  if (inst->lifecycle != lifecycle || inst->lifecycle_since != since) {
    index_.set_lifecycle(number, lifecycle, since);
  }
  return ok(lifecycle);
}

auto LivenessDetector::sweep() -> SweepReport {
  SweepReport report;
  const auto now = clock_.now();
  const auto &fleet = config_.fleet;

  auto numbers =
      index_.instances() | std::views::keys | std::ranges::to<std::vector>();
  for (const int number : numbers) {
    const auto *inst = index_.find(number);
    if (inst == nullptr) {
      continue;
    }
    const std::string cluster = inst->cluster;
    const std::string name = inst->name;
    const bool is_public = inst->is_public();

    bool check = false;
    std::string_view failure;
    if (store_.has_exiting_marker(number)) {
      check = true;
      failure = "exited";
    } else if (is_starting(inst->lifecycle)) {
      check = timed_out(fleet.starting_instance_timeout,
                        inst->lifecycle_since, now);
      failure = "failed to start";
    } else if (is_offline_like(inst->presence) &&
               !(inst->pid && probe_(*inst->pid))) {
      check = true;
      failure = "exited unexpectedly";
    } else if (inst->presence == PresenceState::Offline &&
               timed_out(fleet.offline_instance_timeout, inst->presence_since,
                         now)) {
      log::warn("Instance {} ({}) is offline for too long, marking it as "
                "stuck",
                number, name);
      index_.set_presence(number, PresenceState::Stuck, now);
      report.stuck.push_back(number);
      if (is_public) {
        report.impacted.insert(cluster);
      }
      continue;
    }
    if (!check) {
      continue;
    }

    auto state = refresh(number);
    if (!state) {
      log::error("Instance {} ({}) {}", number, name, failure);
      index_.erase(number);
    } else if (*state != LifecycleState::Exiting &&
               *state != LifecycleState::Crashed) {
      continue;
    }
    report.removed.push_back(number);
    if (is_public) {
      report.impacted.insert(cluster);
    }
  }
  return report;
}

} // namespace hostfleet
