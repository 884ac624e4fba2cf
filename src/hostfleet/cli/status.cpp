#include "hostfleet/cli/commands.hpp"
#include "hostfleet/cli/formatting.hpp"
#include "hostfleet/config/config.hpp"
#include "hostfleet/fleet/pid_record.hpp"
#include "hostfleet/util/daemon.hpp"
#include "hostfleet/util/json.hpp"
#include "hostfleet/util/log.hpp"
#include "hostfleet/util/text_table.hpp"
#include "hostfleet/util/time.hpp"

#include <cstdint>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <vector>

namespace hostfleet::cli {
namespace {

struct InstanceStatus {
  int number{0};
  std::string name;
  std::string cluster;
  std::string owner;
  std::string state;
  std::optional<std::int64_t> pid;
  bool alive{false};
  std::int64_t since{0};
};

struct FleetStatus {
  std::string manager_name;
  std::string pid_dir;
  bool manager_running{false};
  std::vector<InstanceStatus> instances;
};

// The manager holds its lock for as long as it runs.
auto probe_manager(const PidRecordStore &store) -> bool {
  const auto lock_file = (store.dir() / kManagerLockFile).string();
  auto lock = FileLockGuard::try_acquire(lock_file);
  return !lock && lock.error() == make_error_code(Error::LockFailed);
}

auto read_instance(const PidRecordStore &store, int number)
    -> std::optional<InstanceStatus> {
  auto lock = store.acquire_lock(number, LockMode::Blocking);
  if (!lock) {
    return InstanceStatus{.number = number, .state = "inconsistent"};
  }
  auto stored = store.read_record(*lock);
  if (!stored) {
    return InstanceStatus{.number = number, .state = "corrupt"};
  }
  if (!stored->has_value()) {
    return std::nullopt;
  }
  const auto &[record, kind, since] = **stored;
  return InstanceStatus{
      .number = number,
      .name = record.instance_name,
      .cluster = record.cluster,
      .owner = record.owner,
      .state = enum_to_string(kind),
      .pid = record.pid,
      .alive = record.pid.has_value() && is_process_alive(*record.pid),
      .since = util::to_unix_seconds(since),
  };
}

auto print_table(const FleetStatus &status) -> void {
  std::println("{} {}", fmt::ansi::bold("Fleet manager:"), status.manager_name);
  std::println("{} {}", fmt::ansi::bold("PID directory:"), status.pid_dir);
  std::println("{} {}", fmt::ansi::bold("Manager:      "),
               status.manager_running ? fmt::ansi::green("running")
                                      : fmt::ansi::yellow("not running"));
  std::println("");

  if (status.instances.empty()) {
    std::println("No instance found.");
    return;
  }

  const auto now = system_clock().now();
  util::TextTable table({"#", "Name", "Cluster", "Owner", "State", "PID",
                         "Process", "Since"});
  for (const auto &inst : status.instances) {
    table.add_row({
        std::to_string(inst.number),
        inst.name,
        inst.cluster,
        inst.owner == kPublicOwner ? std::string("-") : inst.owner,
        inst.state,
        inst.pid ? std::to_string(*inst.pid) : std::string("?"),
        inst.pid ? (inst.alive ? "alive" : "dead") : "-",
        inst.since > 0
            ? util::format_elapsed(util::from_unix_seconds(inst.since), now)
            : std::string("-"),
    });
  }
  for (const auto &line : table.render("Instances")) {
    std::println("{}", line);
  }
}

} // namespace

auto cmd_status(const StatusOptions &opts) -> int {
  log::set_output_stderr();
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return 1;
  }
  const auto &config = *config_res;

  PidRecordStore store(config.pid_dir(), system_clock());
  FleetStatus status{.manager_name = config.fleet.manager_name,
                     .pid_dir = store.dir().string()};

  if (std::filesystem::is_directory(store.dir())) {
    status.manager_running = probe_manager(store);
    auto numbers = store.list_instance_numbers();
    if (!numbers) {
      std::println(stderr, "Error: {}", numbers.error().message());
      return 1;
    }
    for (int n : *numbers) {
      auto inst = read_instance(store, n);
      if (!inst) {
        continue;
      }
      if (opts.cluster && inst->cluster != *opts.cluster) {
        continue;
      }
      status.instances.push_back(std::move(*inst));
    }
  }

  if (opts.json) {
    std::println("{}", to_json(status));
  } else {
    print_table(status);
  }
  return 0;
}

} // namespace hostfleet::cli
