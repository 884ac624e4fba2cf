#include "hostfleet/config/config.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>

using namespace hostfleet;
using namespace hostfleet::test;

namespace {

constexpr std::string_view kBaseToml = R"(
[fleet]
manager_name = "Manager"
var_dir = "/tmp/hostfleet-var"
max_instances = 20
clusters = ["default", "teams"]
default_preset = "default"
remove_spare_instance_delay = 120

[[cluster]]
name = "default"
description = "Default cluster"
target_spares = 2
max_instances_in_cluster = 8
name_template = "Host"
conf_macros = "hSet:maxPlayers=16"

[[cluster]]
name = "teams"
name_template = "Teams"
target_spares = 0
)";

auto has_error_containing(const ConfigReport &report, std::string_view text)
    -> bool {
  return std::ranges::any_of(report.errors, [&](const std::string &e) {
    return e.find(text) != std::string::npos;
  });
}

} // namespace

TEST(ConfigTest, FleetDefaults) {
  FleetSettings fleet;
  EXPECT_EQ(fleet.var_dir, "var");
  EXPECT_EQ(fleet.max_instances, 10);
  EXPECT_EQ(fleet.base_game_port, 8452);
  EXPECT_EQ(fleet.base_auto_host_port, 9452);
  EXPECT_EQ(fleet.starting_instance_timeout, std::chrono::seconds(120));
  EXPECT_EQ(fleet.tick_interval_ms, 1000);
  EXPECT_EQ(fleet.log_level, "info");
}

TEST(ConfigTest, LoadFromTomlString) {
  auto result = ConfigLoader::load_from_string(kBaseToml);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_EQ(result->fleet.manager_name, "Manager");
  EXPECT_EQ(result->fleet.max_instances, 20);
  EXPECT_EQ(result->fleet.remove_spare_instance_delay,
            std::chrono::seconds(120));
  EXPECT_EQ(result->cluster_names(),
            (std::vector<std::string>{"default", "teams"}));
  EXPECT_EQ(result->default_cluster(), "default");
  EXPECT_EQ(result->pid_dir(),
            std::filesystem::path("/tmp/hostfleet-var") / "ClusterManager");

  const auto *def = result->find_preset("default");
  ASSERT_NE(def, nullptr);
  EXPECT_EQ(def->target_spares, 2);
  EXPECT_EQ(def->description, "Default cluster");
}

TEST(ConfigTest, PresetsInheritFromDefaultPreset) {
  auto result = ConfigLoader::load_from_string(kBaseToml);
  ASSERT_TRUE(result.has_value());
  const auto *teams = result->find_preset("teams");
  ASSERT_NE(teams, nullptr);
  EXPECT_EQ(teams->target_spares, 0);
  EXPECT_EQ(teams->max_instances_in_cluster, 8);
  EXPECT_EQ(teams->conf_macros, "hSet:maxPlayers=16");
  EXPECT_EQ(teams->name_template, "Teams");
}

TEST(ConfigTest, ClustersDefaultToDefaultPreset) {
  FleetConfig config;
  config.fleet.default_preset = "main";
  EXPECT_EQ(config.cluster_names(), (std::vector<std::string>{"main"}));
  EXPECT_TRUE(config.is_configured_cluster("main"));
  EXPECT_FALSE(config.is_configured_cluster("other"));
}

TEST(ConfigTest, InvalidTomlIsParseError) {
  auto result = ConfigLoader::load_from_string("[fleet\nmax_instances = ");
  ASSERT_FALSE(result.has_value());
}

TEST(ConfigTest, UndefinedClusterPresetIsRejected) {
  TempDir tmp;
  auto config = make_config(tmp.path());
  config.fleet.clusters.push_back("missing");
  const auto report = ConfigLoader::validate(config);
  EXPECT_FALSE(report.valid());
  EXPECT_TRUE(has_error_containing(report, "undefined preset: missing"));
}

TEST(ConfigTest, ConflictingNameTemplatesAreRejected) {
  TempDir tmp;
  auto config = make_config(tmp.path());
  config.presets[1].name_template = "Host";
  const auto report = ConfigLoader::validate(config);
  EXPECT_TRUE(has_error_containing(report, "Conflicting name templates"));

  // Instance-scoped templates never collide.
  config.presets[0].name_template = "Host%InstNb%";
  config.presets[1].name_template = "Host%InstNb%";
  EXPECT_TRUE(ConfigLoader::validate(config).valid());
}

TEST(ConfigTest, PortRangeMustFitInstances) {
  TempDir tmp;
  auto config = make_config(tmp.path());
  config.fleet.base_game_port = 9000;
  config.fleet.base_auto_host_port = 9005;
  EXPECT_TRUE(has_error_containing(ConfigLoader::validate(config),
                                   "not enough ports"));

  config = make_config(tmp.path());
  config.fleet.manager_auto_host_port = config.fleet.base_game_port + 3;
  EXPECT_TRUE(has_error_containing(ConfigLoader::validate(config),
                                   "manager port is inside"));
}

TEST(ConfigTest, InvalidMacroStringIsRejected) {
  TempDir tmp;
  auto config = make_config(tmp.path());
  config.presets[0].conf_macros_private = "novalue";
  EXPECT_TRUE(has_error_containing(ConfigLoader::validate(config),
                                   "Invalid configuration macro definition"));
}

TEST(ConfigTest, NumericLimits) {
  TempDir tmp;
  auto config = make_config(tmp.path());
  config.fleet.max_instances = 0;
  config.fleet.auto_register = 3;
  config.fleet.remove_private_instance_delay = std::chrono::seconds(0);
  const auto report = ConfigLoader::validate(config);
  EXPECT_TRUE(has_error_containing(report, "max_instances must be"));
  EXPECT_TRUE(has_error_containing(report, "auto_register"));
  EXPECT_TRUE(has_error_containing(report, "remove_private_instance_delay"));
}

TEST(ConfigTest, SharedCacheWithoutSequentialUnitsyncWarns) {
  TempDir tmp;
  auto config = make_config(tmp.path());
  config.fleet.share_archive_cache = true;
  const auto report = ConfigLoader::validate(config);
  EXPECT_TRUE(report.valid());
  EXPECT_EQ(report.warnings.size(), 1u);
}

TEST(ConfigTest, LoadFromFileResolvesRelativeDirectories) {
  TempDir tmp;
  const auto path = tmp.path() / "fleet.toml";
  write_file(path, R"(
[fleet]
var_dir = "state"

[[cluster]]
name = "default"
)");
  auto result = ConfigLoader::load_from_file(path.string());
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(std::filesystem::path(result->fleet.var_dir),
            std::filesystem::weakly_canonical(tmp.path() / "state"));
}

TEST(ConfigTest, MissingFileFails) {
  auto result = ConfigLoader::load_from_file("/nonexistent/fleet.toml");
  ASSERT_FALSE(result.has_value());
}

TEST(ConfigTest, ParseFileSkipsValidation) {
  TempDir tmp;
  const auto path = tmp.path() / "fleet.toml";
  write_file(path, R"(
[fleet]
default_preset = "nope"
)");
  EXPECT_FALSE(ConfigLoader::load_from_file(path.string()).has_value());
  auto parsed = ConfigLoader::parse_file(path.string());
  ASSERT_TRUE(parsed.has_value());
  EXPECT_FALSE(ConfigLoader::validate(*parsed).valid());
}
