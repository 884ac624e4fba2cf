#pragma once

#include "hostfleet/config/fleet_config.hpp"
#include "hostfleet/fleet/account_registry.hpp"
#include "hostfleet/fleet/admission.hpp"
#include "hostfleet/fleet/fleet_index.hpp"
#include "hostfleet/fleet/liveness.hpp"
#include "hostfleet/core/error.hpp"
#include "hostfleet/fleet/pid_record.hpp"
#include "hostfleet/launcher/process_launcher.hpp"
#include "hostfleet/lobby/lobby.hpp"
#include "hostfleet/util/daemon.hpp"
#include "hostfleet/util/time.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace hostfleet::test {

[[nodiscard]] inline auto
make_temp_dir(std::string_view prefix = "hostfleet_test_") -> std::string {
  std::string templ = std::string("/tmp/") + std::string(prefix) + "XXXXXX";
  char *path = ::mkdtemp(templ.data());
  return path ? std::string(path) : "";
}

// Temporary directory removed with everything below it on destruction.
class TempDir {
public:
  TempDir() : path_(make_temp_dir()) {}
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  auto operator=(const TempDir &) -> TempDir & = delete;

  [[nodiscard]] auto path() const -> const std::filesystem::path & {
    return path_;
  }
  [[nodiscard]] auto str() const -> std::string { return path_.string(); }

private:
  std::filesystem::path path_;
};

// Holds an exclusive lock on `path` from a child process, since fcntl locks
// never conflict inside one process. The lock is held until destruction.
class ChildLockHolder {
public:
  explicit ChildLockHolder(const std::string &path) {
    int ready[2];
    int release[2];
    if (::pipe(ready) != 0 || ::pipe(release) != 0) {
      return;
    }
    pid_ = ::fork();
    if (pid_ == 0) {
      ::close(ready[0]);
      ::close(release[1]);
      auto lock = FileLockGuard::acquire(path);
      const char status = lock ? 'y' : 'n';
      (void)!::write(ready[1], &status, 1);
      char buf = 0;
      (void)!::read(release[0], &buf, 1);
      ::_exit(0);
    }
    ::close(ready[1]);
    ::close(release[0]);
    release_fd_ = release[1];
    char status = 'n';
    held_ = ::read(ready[0], &status, 1) == 1 && status == 'y';
    ::close(ready[0]);
  }

  ~ChildLockHolder() {
    if (release_fd_ >= 0) {
      ::close(release_fd_);
    }
    if (pid_ > 0) {
      int status = 0;
      ::waitpid(pid_, &status, 0);
    }
  }

  ChildLockHolder(const ChildLockHolder &) = delete;
  auto operator=(const ChildLockHolder &) -> ChildLockHolder & = delete;

  [[nodiscard]] auto held() const noexcept -> bool { return held_; }
  [[nodiscard]] auto pid() const noexcept -> pid_t { return pid_; }

private:
  pid_t pid_{-1};
  int release_fd_{-1};
  bool held_{false};
};

class ManualClock final : public Clock {
public:
  ManualClock() : now_(std::chrono::seconds{1'700'000'000}) {}

  [[nodiscard]] auto now() const -> TimePoint override { return now_; }

  auto advance(std::chrono::seconds by) -> void { now_ += by; }
  auto set(TimePoint tp) -> void { now_ = tp; }

private:
  TimePoint now_;
};

// Lobby state set directly by tests; actions are recorded.
class FakeLobby final : public LobbyView {
public:
  struct User {
    bool bot{false};
    bool moderator{false};
    bool in_game{false};
  };

  bool connected{true};
  std::map<std::string, User, std::less<>> users;
  std::map<std::string, std::size_t, std::less<>> battles;

  std::vector<std::pair<std::string, std::string>> sent;
  std::vector<std::pair<std::string, std::string>> created_accounts;
  std::vector<std::pair<std::string, bool>> bot_modes;

  auto add_user(std::string name, User user = {}) -> void {
    users.insert_or_assign(std::move(name), user);
  }

  [[nodiscard]] auto messages_to(std::string_view user) const
      -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto &[to, text] : sent) {
      if (to == user) {
        out.push_back(text);
      }
    }
    return out;
  }

  [[nodiscard]] auto is_connected() const -> bool override {
    return connected;
  }
  [[nodiscard]] auto is_online(std::string_view user) const -> bool override {
    return users.contains(user);
  }
  [[nodiscard]] auto is_in_game(std::string_view user) const -> bool override {
    auto it = users.find(user);
    return it != users.end() && it->second.in_game;
  }
  [[nodiscard]] auto is_bot(std::string_view user) const -> bool override {
    auto it = users.find(user);
    return it != users.end() && it->second.bot;
  }
  [[nodiscard]] auto has_moderator_access(std::string_view user) const
      -> bool override {
    auto it = users.find(user);
    return it != users.end() && it->second.moderator;
  }
  [[nodiscard]] auto hosted_battle_size(std::string_view founder) const
      -> std::optional<std::size_t> override {
    auto it = battles.find(founder);
    if (it == battles.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  auto send_private(std::string_view user, std::string_view message)
      -> void override {
    sent.emplace_back(std::string(user), std::string(message));
  }
  auto create_bot_account(std::string_view name, std::string_view creator)
      -> void override {
    created_accounts.emplace_back(std::string(name), std::string(creator));
  }
  auto set_bot_mode(std::string_view user, bool enabled) -> void override {
    bot_modes.emplace_back(std::string(user), enabled);
  }
};

// Records launch requests instead of spawning processes.
class FakeLauncher final : public InstanceLauncher {
public:
  std::vector<LaunchRequest> requests;
  bool fail_next{false};
  std::int64_t next_pid{40000};

  [[nodiscard]] auto launch(const LaunchRequest &request)
      -> Result<std::int64_t> override {
    if (fail_next) {
      fail_next = false;
      return fail(Error::SpawnFailed);
    }
    requests.push_back(request);
    return ok(next_pid++);
  }

  // NAME=value arguments of a recorded request.
  [[nodiscard]] static auto macro(const LaunchRequest &request,
                                  std::string_view name)
      -> std::optional<std::string> {
    const auto prefix = std::string(name) + "=";
    for (const auto &arg : request.args) {
      if (arg.starts_with(prefix)) {
        return arg.substr(prefix.size());
      }
    }
    return std::nullopt;
  }
};

// Liveness probe answering from a fixed set of pids.
struct FakeProcessTable {
  std::set<std::int64_t> alive;

  [[nodiscard]] auto probe() {
    return [this](std::int64_t pid) { return alive.contains(pid); };
  }
};

[[nodiscard]] inline auto make_preset(std::string name, int target_spares = 1)
    -> ClusterConfig {
  ClusterConfig preset;
  preset.name = std::move(name);
  preset.target_spares = target_spares;
  return preset;
}

// Two-cluster fleet ("default" and "ffa") rooted in `var_dir`.
[[nodiscard]] inline auto make_config(const std::filesystem::path &var_dir)
    -> FleetConfig {
  FleetConfig config;
  config.fleet.manager_name = "Manager";
  config.fleet.var_dir = var_dir.string();
  config.fleet.instance_dir = var_dir.string();
  config.fleet.max_instances = 10;
  config.fleet.default_preset = "default";
  config.fleet.clusters = {"default", "ffa"};
  config.presets.push_back(make_preset("default", 1));
  auto ffa = make_preset("ffa", 0);
  ffa.name_template = "FFA";
  ffa.description = "Free for all";
  config.presets.push_back(std::move(ffa));
  config.presets.front().name_template = "Host";
  return config;
}

[[nodiscard]] inline auto make_record(int number, std::string name,
                                      std::string cluster = "default",
                                      int cluster_number = 0,
                                      std::string owner = "*")
    -> PidRecord {
  return PidRecord{
      .manager_name = "Manager",
      .instance_number = number,
      .instance_name = std::move(name),
      .cluster = std::move(cluster),
      .cluster_number = cluster_number,
      .owner = std::move(owner),
      .pid = std::nullopt,
  };
}

// Writes a record through the store, as a manager or worker would.
inline auto put_record(const PidRecordStore &store, RecordKind kind,
                       const PidRecord &record) -> Result<void> {
  auto lock = store.acquire_lock(record.instance_number, LockMode::Blocking);
  if (!lock) {
    return fail(lock.error());
  }
  return store.write_record(*lock, kind, record);
}

inline auto write_file(const std::filesystem::path &path,
                       std::string_view content) -> void {
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

// Manager-side collaborators wired the way FleetManager wires them, with
// fakes at the process and lobby boundaries.
struct FleetHarness {
  TempDir tmp;
  FleetConfig config;
  ManualClock clock;
  FakeLobby lobby;
  FakeLauncher launcher;
  FakeProcessTable processes;
  PidRecordStore store;
  FleetIndex index;
  AccountRegistry accounts;
  Admission admission;
  LivenessDetector detector;

  FleetHarness()
      : config(make_config(tmp.path())), store(config.pid_dir(), clock),
        accounts(config.pid_dir() / "existingAccounts.json"),
        admission(config, store, index, lobby, launcher, accounts, clock,
                  SpawnSettings{.executable = "/usr/bin/hostfleet",
                                .config_path = "/etc/fleet.toml",
                                .working_dir = "/",
                                .base_macros = {}}),
        detector(config, store, index, clock, processes.probe()) {
    lobby.add_user("Manager", {.moderator = true});
    (void)store.ensure_dir();
  }

  // Launches a public instance and simulates its worker reaching running
  // state with `pid`.
  auto start_running(std::string_view cluster, std::int64_t pid,
                     std::string_view owner = kPublicOwner) -> int {
    auto launched = admission.launch(cluster, owner);
    if (!launched) {
      return -1;
    }
    promote(launched->number, pid);
    return launched->number;
  }

  auto promote(int number, std::int64_t pid) -> void {
    auto lock = store.acquire_lock(number, LockMode::Blocking);
    if (!lock) {
      return;
    }
    auto stored = store.read_record(*lock);
    if (!stored || !*stored) {
      return;
    }
    auto record = (*stored)->record;
    record.pid = pid;
    (void)store.transition(*lock, RecordKind::Launched, RecordKind::Running);
    (void)store.write_record(*lock, RecordKind::Running, record);
    processes.alive.insert(pid);
    index.find(number)->pid = pid;
    index.set_lifecycle(number, LifecycleState::Running, clock.now());
  }

  auto set_presence(int number, PresenceState state) -> void {
    index.set_presence(number, state, clock.now());
  }
};

} // namespace hostfleet::test
