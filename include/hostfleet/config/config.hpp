#pragma once

#include "hostfleet/config/fleet_config.hpp"
#include "hostfleet/core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace hostfleet {

struct ConfigReport {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  [[nodiscard]] auto valid() const noexcept -> bool { return errors.empty(); }
};

class ConfigLoader {
public:
  // Parse, apply HOSTFLEET_* environment overrides, resolve preset
  // inheritance and validate. Validation errors are logged and reported as
  // ConfigInvalid.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<FleetConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<FleetConfig>;

  // Parse and resolve only; callers run validate() themselves.
  [[nodiscard]] static auto parse_file(std::string_view path)
      -> Result<FleetConfig>;
  [[nodiscard]] static auto parse_string(std::string_view toml_str)
      -> Result<FleetConfig>;

  [[nodiscard]] static auto validate(const FleetConfig &config)
      -> ConfigReport;
};

} // namespace hostfleet
