#include "hostfleet/fleet/commands.hpp"

#include "hostfleet/core/constants.hpp"
#include "hostfleet/util/log.hpp"
#include "hostfleet/util/text_table.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>

#include <algorithm>
#include <array>
#include <map>
#include <format>
#include <utility>

namespace hostfleet {

namespace {

[[nodiscard]] auto host_state_label(PresenceState state) -> std::string {
  switch (state) {
  case PresenceState::Spare:
    return "idle";
  case PresenceState::Stuck:
    return "error";
  default:
    return enum_to_string(state);
  }
}

[[nodiscard]] auto with_max(std::size_t count, int max) -> std::string {
  if (max == 0) {
    return std::to_string(count);
  }
  return std::format("{}/{}", count, max);
}

[[nodiscard]] auto reply(std::vector<std::string> lines, bool success = true)
    -> CommandReply {
  return CommandReply{.success = success, .lines = std::move(lines)};
}

[[nodiscard]] auto invalid_syntax(std::string_view command) -> CommandReply {
  return reply({std::format("Invalid {} command usage", command)}, false);
}

[[nodiscard]] auto split_words(std::string_view line)
    -> std::vector<std::string> {
  std::vector<std::string> words;
  boost::algorithm::split(words, line, boost::algorithm::is_any_of(" \t"),
                          boost::algorithm::token_compress_on);
  std::erase_if(words, [](const std::string &w) { return w.empty(); });
  return words;
}

} // namespace

CommandHandler::CommandHandler(const FleetConfig &config,
                               const FleetIndex &index, Admission &admission)
    : config_(config), index_(index), admission_(admission) {}

auto CommandHandler::invalid_cluster(std::string_view cluster) const
    -> CommandReply {
  return reply({std::format("Invalid cluster \"{}\" (use !listClusters to "
                            "list available clusters)",
                            cluster)},
               false);
}

auto CommandHandler::execute(std::string_view user, std::string_view line)
    -> std::optional<CommandReply> {
  if (line.starts_with('!')) {
    line.remove_prefix(1);
  }
  auto words = split_words(line);
  if (words.empty()) {
    return std::nullopt;
  }
  const std::string name = words.front();
  const std::span<const std::string> args(words.begin() + 1, words.end());
  const auto optional_arg =
      [&]() -> std::optional<std::string_view> {
    if (args.empty()) {
      return std::nullopt;
    }
    return args.front();
  };
  const auto is = [&](std::string_view command) {
    return boost::algorithm::iequals(name, command);
  };

  if (is("privateHost")) {
    if (args.size() > 2) {
      return invalid_syntax("privateHost");
    }
    return private_host(user, args);
  }
  if (is("listClusters")) {
    if (!args.empty()) {
      return invalid_syntax("listClusters");
    }
    return list_clusters();
  }
  if (is("clusterConfig")) {
    if (args.size() > 1) {
      return invalid_syntax("clusterConfig");
    }
    return cluster_config(optional_arg());
  }
  if (is("clusterStatus")) {
    if (args.size() > 1) {
      return invalid_syntax("clusterStatus");
    }
    return cluster_status(optional_arg());
  }
  if (is("clusterStats")) {
    if (!args.empty()) {
      return invalid_syntax("clusterStats");
    }
    return cluster_stats();
  }
  if (is("listInstances")) {
    if (args.size() > 1) {
      return invalid_syntax("listInstances");
    }
    return list_instances(optional_arg());
  }
  return std::nullopt;
}

auto CommandHandler::private_host(std::string_view user,
                                  std::span<const std::string> args)
    -> CommandReply {
  const std::string cluster =
      args.empty() ? config_.default_cluster() : args[0];
  std::optional<std::string> password;
  if (args.size() > 1) {
    password = args[1];
  }

  if (auto rejection = admission_.check_private(cluster, user)) {
    return reply({std::move(rejection->message)}, false);
  }

  auto launched = admission_.launch(cluster, user, std::move(password));
  if (!launched) {
    log::error("Failed to start a new private instance in cluster {} (user "
               "\"{}\")",
               cluster, user);
    return reply({std::format("Failed to start a new private instance in "
                              "cluster {} (internal error)",
                              cluster)},
                 false);
  }
  log::info("Started a new private instance (#{} - {}) in cluster \"{}\" "
            "(owner \"{}\")",
            launched->number, launched->name, cluster, user);
  return reply({std::format("Starting a new private instance in {} cluster "
                            "(name={}, password={})",
                            cluster, launched->name, launched->password)});
}

auto CommandHandler::list_clusters() const -> CommandReply {
  auto clusters = config_.cluster_names();
  const auto default_cluster = config_.default_cluster();
  std::ranges::sort(clusters);

  std::vector<std::string> lines{"********** AutoHost clusters **********"};
  for (const auto &cluster : clusters) {
    std::string entry = "  " + cluster;
    if (const auto *preset = config_.find_preset(cluster);
        preset != nullptr && !preset->description.empty()) {
      entry += std::format(" ({})", preset->description);
    }
    if (cluster == default_cluster) {
      entry += " *** DEFAULT ***";
    }
    lines.push_back(std::move(entry));
  }
  return reply(std::move(lines));
}

auto CommandHandler::cluster_config(
    std::optional<std::string_view> cluster) const -> CommandReply {
  util::TextTable table({"Setting", "Value"});
  if (cluster) {
    const auto *preset = config_.find_preset(*cluster);
    if (!config_.is_configured_cluster(*cluster) || preset == nullptr) {
      return invalid_cluster(*cluster);
    }
    table.add_row({"confMacros", preset->conf_macros});
    table.add_row({"confMacrosPrivate", preset->conf_macros_private});
    table.add_row({"confMacrosPublic", preset->conf_macros_public});
    table.add_row({"maxInstancesInCluster",
                   std::to_string(preset->max_instances_in_cluster)});
    table.add_row({"maxInstancesInClusterPrivate",
                   std::to_string(preset->max_instances_in_cluster_private)});
    table.add_row({"maxInstancesInClusterPublic",
                   std::to_string(preset->max_instances_in_cluster_public)});
    table.add_row({"nameTemplate", preset->name_template});
    table.add_row({"targetSpares", std::to_string(preset->target_spares)});
    return reply(table.render(std::format("{} cluster configuration",
                                          *cluster)));
  }

  const auto &fleet = config_.fleet;
  table.add_row({"autoRegister", std::to_string(fleet.auto_register)});
  table.add_row(
      {"baseAutoHostPort", std::to_string(fleet.base_auto_host_port)});
  table.add_row({"baseGamePort", std::to_string(fleet.base_game_port)});
  table.add_row({"clusters", boost::algorithm::join(fleet.clusters, ",")});
  table.add_row({"maxInstances", std::to_string(fleet.max_instances)});
  table.add_row(
      {"maxInstancesPrivate", std::to_string(fleet.max_instances_private)});
  table.add_row(
      {"maxInstancesPublic", std::to_string(fleet.max_instances_public)});
  table.add_row({"offlineInstanceTimeout",
                 std::to_string(fleet.offline_instance_timeout.count())});
  table.add_row({"orphanInstanceTimeout",
                 std::to_string(fleet.orphan_instance_timeout.count())});
  table.add_row({"removePrivateInstanceDelay",
                 std::to_string(fleet.remove_private_instance_delay.count())});
  table.add_row({"removeSpareInstanceDelay",
                 std::to_string(fleet.remove_spare_instance_delay.count())});
  table.add_row(
      {"shareArchiveCache", fleet.share_archive_cache ? "1" : "0"});
  table.add_row({"startingInstanceTimeout",
                 std::to_string(fleet.starting_instance_timeout.count())});
  return reply(table.render("ClusterManager configuration"));
}

auto CommandHandler::cluster_status(
    std::optional<std::string_view> cluster) const -> CommandReply {
  std::vector<int> selected;
  std::array<int, 3> max_values{};
  std::string title;
  if (cluster) {
    const auto *preset = config_.find_preset(*cluster);
    if (!config_.is_configured_cluster(*cluster) || preset == nullptr) {
      return invalid_cluster(*cluster);
    }
    for (const auto &[cluster_number, number] :
         index_.cluster_members(*cluster)) {
      selected.push_back(number);
    }
    max_values = {preset->max_instances_in_cluster_public,
                  preset->max_instances_in_cluster_private,
                  preset->max_instances_in_cluster};
    title = std::format("Status for cluster: {}", *cluster);
  } else {
    for (const auto &[number, inst] : index_.instances()) {
      selected.push_back(number);
    }
    const auto &fleet = config_.fleet;
    max_values = {fleet.max_instances_public, fleet.max_instances_private,
                  fleet.max_instances};
    title = "Global cluster status";
  }

  struct StatusCounts {
    std::size_t in_use{0};
    std::size_t idle{0};
    std::size_t offline{0};
    std::size_t error{0};
    std::size_t total{0};

    auto add(PresenceState state) -> void {
      switch (state) {
      case PresenceState::InUse:
        ++in_use;
        break;
      case PresenceState::Spare:
        ++idle;
        break;
      case PresenceState::Offline:
        ++offline;
        break;
      case PresenceState::Stuck:
        ++error;
        break;
      }
      ++total;
    }
  };
  std::array<StatusCounts, 3> counts{};
  for (const int number : selected) {
    const auto *inst = index_.find(number);
    if (inst == nullptr) {
      continue;
    }
    counts[inst->is_public() ? 0 : 1].add(inst->presence);
    counts[2].add(inst->presence);
  }

  constexpr std::array<std::string_view, 3> kTypes{"public", "private",
                                                   "-total-"};
  util::TextTable table(
      {"type", "inUse", "idle", "offline", "error", "total"});
  for (std::size_t i = 0; i < counts.size(); ++i) {
    const auto &c = counts[i];
    table.add_row({std::string(kTypes[i]), std::to_string(c.in_use),
                   std::to_string(c.idle), std::to_string(c.offline),
                   std::to_string(c.error), with_max(c.total, max_values[i])});
  }
  return reply(table.render(title));
}

auto CommandHandler::cluster_stats() const -> CommandReply {
  struct Stats {
    std::size_t public_count{0};
    std::size_t private_count{0};
  };
  std::map<std::string, Stats, std::less<>> per_cluster;
  for (const auto &cluster : config_.cluster_names()) {
    per_cluster.try_emplace(cluster);
  }
  Stats total;
  for (const auto &[number, inst] : index_.instances()) {
    auto &stats = per_cluster[inst.cluster];
    if (inst.is_public()) {
      ++stats.public_count;
      ++total.public_count;
    } else {
      ++stats.private_count;
      ++total.private_count;
    }
  }

  util::TextTable table({"cluster", "public", "private", "total"});
  for (const auto &[cluster, stats] : per_cluster) {
    const auto *preset = config_.find_preset(cluster);
    const ClusterConfig limits = preset != nullptr ? *preset : ClusterConfig{};
    table.add_row(
        {cluster,
         with_max(stats.public_count, limits.max_instances_in_cluster_public),
         with_max(stats.private_count,
                  limits.max_instances_in_cluster_private),
         with_max(stats.public_count + stats.private_count,
                  limits.max_instances_in_cluster)});
  }
  const auto &fleet = config_.fleet;
  table.add_row({"-total-",
                 with_max(total.public_count, fleet.max_instances_public),
                 with_max(total.private_count, fleet.max_instances_private),
                 with_max(total.public_count + total.private_count,
                          fleet.max_instances)});
  return reply(table.render("Cluster statistics"));
}

auto CommandHandler::list_instances(
    std::optional<std::string_view> cluster) const -> CommandReply {
  const auto pid_label = [](const Instance &inst) {
    return inst.pid ? std::to_string(*inst.pid) : std::string("?");
  };

  if (cluster) {
    if (!config_.is_configured_cluster(*cluster)) {
      return invalid_cluster(*cluster);
    }
    util::TextTable table({"clustInstNb", "instName", "instNb", "owner",
                           "hostState", "instState", "PID"});
    for (const auto &[cluster_number, number] :
         index_.cluster_members(*cluster)) {
      const auto *inst = index_.find(number);
      if (inst == nullptr) {
        continue;
      }
      table.add_row({std::to_string(cluster_number), inst->name,
                     std::to_string(number), inst->owner,
                     host_state_label(inst->presence),
                     std::string(to_string_view(inst->lifecycle)),
                     pid_label(*inst)});
    }
    if (table.empty()) {
      return reply({std::format("No instance found for cluster: {}",
                                *cluster)});
    }
    return reply(
        table.render(std::format("Instances list for cluster: {}", *cluster)));
  }

  util::TextTable table({"instNb", "instName", "cluster", "clustInstNb",
                         "owner", "hostState", "instState", "PID"});
  for (const auto &[number, inst] : index_.instances()) {
    table.add_row({std::to_string(number), inst.name, inst.cluster,
                   std::to_string(inst.cluster_number), inst.owner,
                   host_state_label(inst.presence),
                   std::string(to_string_view(inst.lifecycle)),
                   pid_label(inst)});
  }
  if (table.empty()) {
    return reply({"No instance found."});
  }
  return reply(table.render("Global cluster instances list"));
}

} // namespace hostfleet
