#include "hostfleet/fleet/account_registry.hpp"

#include "hostfleet/util/json.hpp"
#include "hostfleet/util/log.hpp"

namespace hostfleet {

auto AccountRegistry::load() -> Result<void> {
  std::error_code ec;
  if (!std::filesystem::exists(file_, ec)) {
    accounts_.clear();
    return ok();
  }
  auto loaded = read_json_file<Accounts>(file_.string());
  if (!loaded) {
    log::error("Unable to load existing accounts data from file \"{}\"",
               file_.string());
    return fail(loaded.error());
  }
  accounts_ = std::move(*loaded);
  log::debug("Loaded {} existing accounts", accounts_.size());
  return ok();
}

auto AccountRegistry::save() const -> Result<void> {
  if (auto r = write_json_file(file_.string(), accounts_); !r) {
    log::error("Unable to store existing accounts data in file \"{}\"",
               file_.string());
    return fail(r.error());
  }
  return ok();
}

auto AccountRegistry::mark_seen(std::string_view name, TimePoint now) -> void {
  accounts_.insert_or_assign(std::string(name), util::to_unix_seconds(now));
}

auto AccountRegistry::mark_requested(std::string_view name) -> void {
  accounts_.insert_or_assign(std::string(name), std::int64_t{-1});
}

} // namespace hostfleet
