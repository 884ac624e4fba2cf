#pragma once

#include "hostfleet/core/error.hpp"
#include "hostfleet/util/time.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace hostfleet {

// Lobby accounts ever used by instances, persisted across manager restarts
// so bot accounts are only requested once per name. Values are the last time
// the account was seen online (unix seconds), or -1 when creation was
// requested but the account was never seen.
class AccountRegistry {
public:
  using Accounts = std::map<std::string, std::int64_t, std::less<>>;

  explicit AccountRegistry(std::filesystem::path file)
      : file_(std::move(file)) {}

  // Missing file means an empty registry.
  [[nodiscard]] auto load() -> Result<void>;
  [[nodiscard]] auto save() const -> Result<void>;

  [[nodiscard]] auto contains(std::string_view name) const -> bool {
    return accounts_.contains(name);
  }
  auto mark_seen(std::string_view name, TimePoint now) -> void;
  auto mark_requested(std::string_view name) -> void;

  [[nodiscard]] auto accounts() const noexcept -> const Accounts & {
    return accounts_;
  }
  [[nodiscard]] auto file() const noexcept -> const std::filesystem::path & {
    return file_;
  }

private:
  std::filesystem::path file_;
  Accounts accounts_;
};

} // namespace hostfleet
