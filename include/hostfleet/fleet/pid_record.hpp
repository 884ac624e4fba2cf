#pragma once

#include "hostfleet/core/error.hpp"
#include "hostfleet/fleet/instance.hpp"
#include "hostfleet/util/daemon.hpp"
#include "hostfleet/util/enum.hpp"
#include "hostfleet/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hostfleet {

// Lifecycle kinds that can be stored on disk, encoded as the record file
// suffix ("3.running"). Exiting and crashed are never stored as records.
enum class RecordKind : std::uint8_t {
  Launched,
  Running,
  Restarting,
  Reloading,
  Unloaded,
};
BOOST_DESCRIBE_ENUM(RecordKind, Launched, Running, Restarting, Reloading,
                    Unloaded)
HOSTFLEET_DEFINE_ENUM_SERDE(RecordKind)

[[nodiscard]] constexpr auto to_lifecycle(RecordKind kind) noexcept
    -> LifecycleState {
  switch (kind) {
  case RecordKind::Launched:
    return LifecycleState::Launched;
  case RecordKind::Running:
    return LifecycleState::Running;
  case RecordKind::Restarting:
    return LifecycleState::Restarting;
  case RecordKind::Reloading:
    return LifecycleState::Reloading;
  case RecordKind::Unloaded:
    return LifecycleState::Unloaded;
  }
  return LifecycleState::Crashed;
}

enum class LockMode : std::uint8_t { Blocking, NonBlocking };

struct PidRecord {
  std::string manager_name;
  int instance_number{0};
  std::string instance_name;
  std::string cluster;
  int cluster_number{0};
  std::string owner;
  std::optional<std::int64_t> pid;

  auto operator==(const PidRecord &) const -> bool = default;
};

struct StoredRecord {
  PidRecord record;
  RecordKind kind{RecordKind::Launched};
  TimePoint since{};
};

// Exclusive hold on {n}.lock. While held, `kind` tells which record file (if
// any) existed when the lock was taken; store operations keep it current.
class RecordLock {
public:
  RecordLock() = default;

  [[nodiscard]] auto instance_number() const noexcept -> int {
    return number_;
  }
  [[nodiscard]] auto kind() const noexcept -> std::optional<RecordKind> {
    return kind_;
  }
  [[nodiscard]] auto held() const noexcept -> bool { return guard_.owns(); }

  auto release() noexcept -> void { guard_.release(); }

private:
  friend class PidRecordStore;

  RecordLock(int number, FileLockGuard guard,
             std::optional<RecordKind> kind) noexcept
      : number_(number), guard_(std::move(guard)), kind_(kind) {}

  int number_{-1};
  FileLockGuard guard_;
  std::optional<RecordKind> kind_;
};

// Durable per-instance records in the fleet PID directory. Every mutation
// requires the instance lock, which partitions writers by instance number.
class PidRecordStore {
public:
  PidRecordStore(std::filesystem::path dir, const Clock &clock);

  [[nodiscard]] auto dir() const noexcept -> const std::filesystem::path & {
    return dir_;
  }

  [[nodiscard]] auto ensure_dir() const -> Result<void>;

  // Fails with RecordInconsistent when more than one record file exists.
  [[nodiscard]] auto acquire_lock(int instance_number, LockMode mode) const
      -> Result<RecordLock>;

  // nullopt when no record exists; RecordCorrupt on malformed content.
  [[nodiscard]] auto read_record(const RecordLock &lock) const
      -> Result<std::optional<StoredRecord>>;

  // Fails with AlreadyExists if a record of another kind is present.
  [[nodiscard]] auto write_record(RecordLock &lock, RecordKind kind,
                                  const PidRecord &record) const
      -> Result<void>;

  // Renames the record and refreshes its timestamp. NotFound if the current
  // record is not `from`; AlreadyExists if the destination exists.
  [[nodiscard]] auto transition(RecordLock &lock, RecordKind from,
                                RecordKind to) const -> Result<void>;

  [[nodiscard]] auto remove_record(RecordLock &lock) const -> Result<void>;
  [[nodiscard]] auto remove_lock_file(const RecordLock &lock) const
      -> Result<void>;

  // Moves the running record to the {n}.exiting marker, removing the record
  // in the same step.
  [[nodiscard]] auto mark_exiting(RecordLock &lock) const -> Result<void>;
  [[nodiscard]] auto has_exiting_marker(int instance_number) const -> bool;
  // True if a marker was present and has been deleted.
  [[nodiscard]] auto consume_exiting_marker(int instance_number) const
      -> bool;

  [[nodiscard]] auto list_instance_numbers() const -> Result<std::vector<int>>;

  [[nodiscard]] auto record_path(int instance_number, RecordKind kind) const
      -> std::filesystem::path;
  [[nodiscard]] auto lock_path(int instance_number) const
      -> std::filesystem::path;
  [[nodiscard]] auto exiting_path(int instance_number) const
      -> std::filesystem::path;

  [[nodiscard]] static auto record_file_name(int instance_number,
                                             RecordKind kind) -> std::string;
  [[nodiscard]] static auto parse_record_file_name(std::string_view name)
      -> std::optional<std::pair<int, RecordKind>>;

  [[nodiscard]] static auto serialize(const PidRecord &record) -> std::string;
  [[nodiscard]] static auto parse(std::string_view content, RecordKind kind)
      -> Result<PidRecord>;

private:
  std::filesystem::path dir_;
  const Clock *clock_;

  [[nodiscard]] auto scan_kinds(int instance_number) const
      -> Result<std::vector<RecordKind>>;
  auto touch(const std::filesystem::path &path) const -> void;
};

} // namespace hostfleet
