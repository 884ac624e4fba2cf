#pragma once

#include "hostfleet/config/fleet_config.hpp"
#include "hostfleet/fleet/admission.hpp"
#include "hostfleet/fleet/fleet_index.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hostfleet {

struct CommandReply {
  bool success{true};
  std::vector<std::string> lines;
};

// Lobby commands served by the manager. Names are case-insensitive and may
// carry a leading '!'.
class CommandHandler {
public:
  CommandHandler(const FleetConfig &config, const FleetIndex &index,
                 Admission &admission);

  // nullopt when the command is not a fleet command.
  [[nodiscard]] auto execute(std::string_view user, std::string_view line)
      -> std::optional<CommandReply>;

  [[nodiscard]] auto private_host(std::string_view user,
                                  std::span<const std::string> args)
      -> CommandReply;
  [[nodiscard]] auto list_clusters() const -> CommandReply;
  [[nodiscard]] auto cluster_config(std::optional<std::string_view> cluster)
      const -> CommandReply;
  [[nodiscard]] auto cluster_status(std::optional<std::string_view> cluster)
      const -> CommandReply;
  [[nodiscard]] auto cluster_stats() const -> CommandReply;
  [[nodiscard]] auto list_instances(std::optional<std::string_view> cluster)
      const -> CommandReply;

private:
  const FleetConfig &config_;
  const FleetIndex &index_;
  Admission &admission_;

  [[nodiscard]] auto invalid_cluster(std::string_view cluster) const
      -> CommandReply;
};

} // namespace hostfleet
