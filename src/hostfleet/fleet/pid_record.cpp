#include "hostfleet/fleet/pid_record.hpp"

#include "hostfleet/util/log.hpp"

#include <boost/algorithm/string/join.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <format>
#include <fstream>
#include <iterator>
#include <ranges>
#include <set>

namespace hostfleet {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kManagerNameKey = "managerName";
constexpr std::string_view kInstanceNumberKey = "instanceNumber";
constexpr std::string_view kInstanceNameKey = "instanceName";
constexpr std::string_view kClusterKey = "clusterPreset";
constexpr std::string_view kClusterNumberKey = "clusterInstanceNumber";
constexpr std::string_view kOwnerKey = "ownerName";
constexpr std::string_view kPidKey = "processId";

constexpr std::array kRequiredKeys = {kManagerNameKey,  kInstanceNumberKey,
                                      kInstanceNameKey, kClusterKey,
                                      kClusterNumberKey, kOwnerKey};

template <typename T>
[[nodiscard]] auto parse_number(std::string_view text) -> std::optional<T> {
  T value{};
  const auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

[[nodiscard]] auto read_text(const fs::path &path) -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileOpenFailed);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

} // namespace

PidRecordStore::PidRecordStore(std::filesystem::path dir, const Clock &clock)
    : dir_(std::move(dir)), clock_(&clock) {}

auto PidRecordStore::ensure_dir() const -> Result<void> {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    log::error("Unable to create PID directory \"{}\": {}", dir_.string(),
               ec.message());
    return fail(ec);
  }
  return ok();
}

auto PidRecordStore::record_file_name(int instance_number, RecordKind kind)
    -> std::string {
  return std::format("{}.{}", instance_number, to_string_view(kind));
}

auto PidRecordStore::parse_record_file_name(std::string_view name)
    -> std::optional<std::pair<int, RecordKind>> {
  const auto dot = name.find('.');
  if (dot == std::string_view::npos || dot == 0) {
    return std::nullopt;
  }
  const auto digits = name.substr(0, dot);
  if (!std::ranges::all_of(digits, [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  auto number = parse_number<int>(digits);
  auto kind = parse<RecordKind>(name.substr(dot + 1));
  if (!number || !kind) {
    return std::nullopt;
  }
  return std::pair{*number, *kind};
}

auto PidRecordStore::record_path(int instance_number, RecordKind kind) const
    -> std::filesystem::path {
  return dir_ / record_file_name(instance_number, kind);
}

auto PidRecordStore::lock_path(int instance_number) const
    -> std::filesystem::path {
  return dir_ / std::format("{}.lock", instance_number);
}

auto PidRecordStore::exiting_path(int instance_number) const
    -> std::filesystem::path {
  return dir_ / std::format("{}.exiting", instance_number);
}

auto PidRecordStore::scan_kinds(int instance_number) const
    -> Result<std::vector<RecordKind>> {
  std::vector<RecordKind> kinds;
  std::error_code ec;
  fs::directory_iterator it(dir_, ec);
  if (ec) {
    log::error("Unable to open PID directory \"{}\": {}", dir_.string(),
               ec.message());
    return fail(Error::FileOpenFailed);
  }
  for (const auto &entry : it) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    auto parsed = parse_record_file_name(entry.path().filename().string());
    if (parsed && parsed->first == instance_number) {
      kinds.push_back(parsed->second);
    }
  }
  return ok(std::move(kinds));
}

auto PidRecordStore::acquire_lock(int instance_number, LockMode mode) const
    -> Result<RecordLock> {
  const auto path = lock_path(instance_number).string();
  auto guard = mode == LockMode::Blocking ? FileLockGuard::acquire(path)
                                          : FileLockGuard::try_acquire(path);
  if (!guard) {
    log::error("Failed to acquire lock for PID file of instance {}",
               instance_number);
    return fail(guard.error());
  }

  auto kinds = scan_kinds(instance_number);
  if (!kinds) {
    return fail(kinds.error());
  }
  if (kinds->size() > 1) {
    auto names = *kinds | std::views::transform([&](RecordKind k) {
      return record_file_name(instance_number, k);
    });
    log::error("Multiple PID files found for instance {} ({})",
               instance_number,
               boost::algorithm::join(
                   std::vector<std::string>(names.begin(), names.end()),
                   ", "));
    return fail(Error::RecordInconsistent);
  }

  std::optional<RecordKind> kind;
  if (!kinds->empty()) {
    kind = kinds->front();
  }
  return ok(RecordLock(instance_number, std::move(*guard), kind));
}

auto PidRecordStore::serialize(const PidRecord &record) -> std::string {
  std::string out;
  auto line = [&out](std::string_view key, const auto &value) {
    std::format_to(std::back_inserter(out), "{}:{}\n", key, value);
  };
  line(kManagerNameKey, record.manager_name);
  line(kInstanceNumberKey, record.instance_number);
  line(kInstanceNameKey, record.instance_name);
  line(kClusterKey, record.cluster);
  line(kClusterNumberKey, record.cluster_number);
  line(kOwnerKey, record.owner);
  if (record.pid) {
    line(kPidKey, *record.pid);
  }
  return out;
}

auto PidRecordStore::parse(std::string_view content, RecordKind kind)
    -> Result<PidRecord> {
  const bool expects_pid = kind != RecordKind::Launched;
  std::set<std::string_view> seen;
  PidRecord record;

  for (auto part : content | std::views::split('\n')) {
    std::string_view line(part.begin(), part.end());
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (line.empty()) {
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0 ||
        colon + 1 == line.size()) {
      log::error("Invalid line in PID file ({})", line);
      return fail(Error::RecordCorrupt);
    }
    const auto key = line.substr(0, colon);
    const auto value = line.substr(colon + 1);

    const bool known = std::ranges::find(kRequiredKeys, key) !=
                           kRequiredKeys.end() ||
                       (expects_pid && key == kPidKey);
    if (!known) {
      log::error("Invalid data in PID file: {}", key);
      return fail(Error::RecordCorrupt);
    }
    if (!seen.insert(key).second) {
      log::error("Duplicate data in PID file: {}", key);
      return fail(Error::RecordCorrupt);
    }

    if (key == kManagerNameKey) {
      record.manager_name = value;
    } else if (key == kInstanceNameKey) {
      record.instance_name = value;
    } else if (key == kClusterKey) {
      record.cluster = value;
    } else if (key == kOwnerKey) {
      record.owner = value;
    } else {
      bool valid = false;
      if (key == kInstanceNumberKey) {
        auto n = parse_number<int>(value);
        valid = n.has_value() && *n >= 0;
        record.instance_number = n.value_or(0);
      } else if (key == kClusterNumberKey) {
        auto n = parse_number<int>(value);
        valid = n.has_value() && *n >= 0;
        record.cluster_number = n.value_or(0);
      } else {
        auto n = parse_number<std::int64_t>(value);
        valid = n.has_value() && *n > 0;
        record.pid = n;
      }
      if (!valid) {
        log::error("Invalid numeric value in PID file for {}: {}", key,
                   value);
        return fail(Error::RecordCorrupt);
      }
    }
  }

  for (auto key : kRequiredKeys) {
    if (!seen.contains(key)) {
      log::error("Missing data in PID file: {}", key);
      return fail(Error::RecordCorrupt);
    }
  }
  if (expects_pid && !seen.contains(kPidKey)) {
    log::error("Missing data in PID file: {}", kPidKey);
    return fail(Error::RecordCorrupt);
  }
  // A restarting instance gets a new process, the stored pid is stale.
  if (kind == RecordKind::Restarting) {
    record.pid.reset();
  }
  return ok(std::move(record));
}

auto PidRecordStore::read_record(const RecordLock &lock) const
    -> Result<std::optional<StoredRecord>> {
  if (!lock.kind_) {
    return ok(std::optional<StoredRecord>{});
  }
  const auto kind = *lock.kind_;
  const auto path = record_path(lock.number_, kind);
  auto text = read_text(path);
  if (!text) {
    log::error("Unable to open PID file \"{}\" for reading", path.string());
    return fail(text.error());
  }
  auto record = parse(*text, kind);
  if (!record) {
    log::error("Unable to load PID file \"{}\"", path.string());
    return fail(record.error());
  }

  std::error_code ec;
  const auto mtime = fs::last_write_time(path, ec);
  if (ec) {
    log::error("Unable to read timestamp of PID file \"{}\": {}",
               path.string(), ec.message());
    return fail(ec);
  }
  return ok(std::optional<StoredRecord>(StoredRecord{
      .record = std::move(*record),
      .kind = kind,
      .since = util::to_system_time(mtime),
  }));
}

auto PidRecordStore::write_record(RecordLock &lock, RecordKind kind,
                                  const PidRecord &record) const
    -> Result<void> {
  if (lock.kind_ && *lock.kind_ != kind) {
    log::error("Unable to write PID file {}: a {} record already exists",
               record_file_name(lock.number_, kind),
               to_string_view(*lock.kind_));
    return fail(Error::AlreadyExists);
  }
  const auto path = record_path(lock.number_, kind);
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) {
      log::error("Unable to open PID file \"{}\" for writing", tmp.string());
      return fail(Error::FileOpenFailed);
    }
    out << serialize(record);
    out.flush();
    if (!out.good()) {
      log::error("Unable to write PID file \"{}\"", tmp.string());
      return fail(Error::FileOpenFailed);
    }
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    log::error("Unable to rename PID file from \"{}\" to \"{}\": {}",
               tmp.string(), path.string(), ec.message());
    fs::remove(tmp, ec);
    return fail(Error::FileOpenFailed);
  }
  lock.kind_ = kind;
  touch(path);
  return ok();
}

auto PidRecordStore::transition(RecordLock &lock, RecordKind from,
                                RecordKind to) const -> Result<void> {
  if (!lock.kind_ || *lock.kind_ != from) {
    log::error("Unable to rename PID file of instance {}: no {} record",
               lock.number_, to_string_view(from));
    return fail(Error::NotFound);
  }
  const auto src = record_path(lock.number_, from);
  const auto dst = record_path(lock.number_, to);
  std::error_code ec;
  if (from != to) {
    if (fs::exists(dst, ec)) {
      log::error("Unable to rename PID file to \"{}\": destination exists",
                 dst.string());
      return fail(Error::AlreadyExists);
    }
    fs::rename(src, dst, ec);
    if (ec) {
      log::error("Unable to rename PID file from \"{}\" to \"{}\": {}",
                 src.string(), dst.string(), ec.message());
      return fail(ec);
    }
  }
  lock.kind_ = to;
  touch(dst);
  return ok();
}

auto PidRecordStore::remove_record(RecordLock &lock) const -> Result<void> {
  if (!lock.kind_) {
    return ok();
  }
  const auto path = record_path(lock.number_, *lock.kind_);
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    log::error("Unable to remove PID file \"{}\": {}", path.string(),
               ec.message());
    return fail(ec);
  }
  lock.kind_.reset();
  return ok();
}

auto PidRecordStore::remove_lock_file(const RecordLock &lock) const
    -> Result<void> {
  const auto path = lock_path(lock.number_);
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    log::warn("Unable to remove lock file \"{}\": {}", path.string(),
              ec.message());
    return fail(ec);
  }
  return ok();
}

auto PidRecordStore::mark_exiting(RecordLock &lock) const -> Result<void> {
  if (!lock.kind_) {
    log::error("Unable to mark instance {} as exiting: no PID file",
               lock.number_);
    return fail(Error::NotFound);
  }
  const auto src = record_path(lock.number_, *lock.kind_);
  const auto dst = exiting_path(lock.number_);
  std::error_code ec;
  fs::rename(src, dst, ec);
  if (ec) {
    log::error("Unable to rename PID file from \"{}\" to \"{}\": {}",
               src.string(), dst.string(), ec.message());
    return fail(ec);
  }
  lock.kind_.reset();
  return ok();
}

auto PidRecordStore::has_exiting_marker(int instance_number) const -> bool {
  std::error_code ec;
  return fs::is_regular_file(exiting_path(instance_number), ec);
}

auto PidRecordStore::consume_exiting_marker(int instance_number) const
    -> bool {
  std::error_code ec;
  const bool removed = fs::remove(exiting_path(instance_number), ec);
  if (ec) {
    log::warn("Unable to remove exiting marker of instance {}: {}",
              instance_number, ec.message());
  }
  return removed;
}

auto PidRecordStore::list_instance_numbers() const -> Result<std::vector<int>> {
  std::error_code ec;
  fs::directory_iterator it(dir_, ec);
  if (ec) {
    log::error("Unable to open PID directory \"{}\": {}", dir_.string(),
               ec.message());
    return fail(Error::FileOpenFailed);
  }
  std::set<int> numbers;
  for (const auto &entry : it) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    if (auto parsed =
            parse_record_file_name(entry.path().filename().string())) {
      numbers.insert(parsed->first);
    }
  }
  return ok(std::vector<int>(numbers.begin(), numbers.end()));
}

auto PidRecordStore::touch(const std::filesystem::path &path) const -> void {
  std::error_code ec;
  fs::last_write_time(path, util::to_file_time(clock_->now()), ec);
  if (ec) {
    log::warn("Failed to update PID file timestamp \"{}\": {}", path.string(),
              ec.message());
  }
}

} // namespace hostfleet
