#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hostfleet::cli {

struct RunCommandOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::string context{"autoload"}; // autoload|load|reload
  bool daemon{false};
  int lobby_fd{0};
  std::vector<std::string> macros; // NAME=value
  std::vector<std::string> argv;
};

struct StatusOptions {
  std::string config_file;
  std::optional<std::string> cluster;
  bool json{false};
};

struct ValidateOptions {
  std::string config_file;
  bool json{false};
};

[[nodiscard]] auto cmd_run(const RunCommandOptions &opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions &opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;

} // namespace hostfleet::cli
