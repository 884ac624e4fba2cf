#include "hostfleet/cli/commands.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <format>

using namespace hostfleet;
using namespace hostfleet::cli;
using namespace hostfleet::test;

namespace {

auto write_config(const TempDir &tmp, std::string_view extra = {})
    -> std::string {
  const auto path = tmp.path() / "fleet.toml";
  write_file(path, std::format(R"(
[fleet]
manager_name = "Manager"
var_dir = "{}"
clusters = ["default"]
{}
[[cluster]]
name = "default"
name_template = "Host"
target_spares = 1
)",
                               tmp.str(), extra));
  return path.string();
}

} // namespace

TEST(CLITest, RunOptionsDefaults) {
  RunCommandOptions opts;
  EXPECT_TRUE(opts.config_file.empty());
  EXPECT_FALSE(opts.log_file.has_value());
  EXPECT_FALSE(opts.log_level.has_value());
  EXPECT_EQ(opts.context, "autoload");
  EXPECT_FALSE(opts.daemon);
  EXPECT_EQ(opts.lobby_fd, 0);
  EXPECT_TRUE(opts.macros.empty());
}

TEST(CLITest, StatusValidateOptionsDefaults) {
  StatusOptions status;
  EXPECT_TRUE(status.config_file.empty());
  EXPECT_FALSE(status.cluster.has_value());
  EXPECT_FALSE(status.json);

  ValidateOptions validate;
  EXPECT_TRUE(validate.config_file.empty());
  EXPECT_FALSE(validate.json);
}

TEST(CLITest, ValidateExitCodes) {
  TempDir tmp;
  EXPECT_EQ(cmd_validate({.config_file = write_config(tmp), .json = false}),
            0);
  EXPECT_EQ(cmd_validate({.config_file = write_config(tmp), .json = true}), 0);

  const auto invalid = write_config(tmp, "max_instances = 0");
  EXPECT_EQ(cmd_validate({.config_file = invalid, .json = false}), 1);
  EXPECT_EQ(cmd_validate({.config_file = invalid, .json = true}), 1);

  EXPECT_EQ(cmd_validate({.config_file = (tmp.path() / "missing.toml").string(),
                          .json = false}),
            1);
}

TEST(CLITest, StatusOnFreshFleet) {
  TempDir tmp;
  EXPECT_EQ(cmd_status({.config_file = write_config(tmp),
                        .cluster = std::nullopt,
                        .json = false}),
            0);
}

TEST(CLITest, StatusListsRecords) {
  TempDir tmp;
  const auto config_file = write_config(tmp);
  const auto config = make_config(tmp.path());
  ManualClock clock;
  PidRecordStore store(config.pid_dir(), clock);
  ASSERT_TRUE(store.ensure_dir().has_value());
  auto record = make_record(0, "Host0");
  record.pid = current_pid();
  ASSERT_TRUE(put_record(store, RecordKind::Running, record).has_value());
  write_file(config.pid_dir() /
                 PidRecordStore::record_file_name(1, RecordKind::Launched),
             "garbage");

  EXPECT_EQ(cmd_status({.config_file = config_file,
                        .cluster = std::nullopt,
                        .json = true}),
            0);
  EXPECT_EQ(cmd_status({.config_file = config_file,
                        .cluster = std::string("default"),
                        .json = false}),
            0);
}

TEST(CLITest, StatusNeedsValidConfig) {
  TempDir tmp;
  EXPECT_EQ(cmd_status({.config_file = write_config(tmp, "max_instances = 0"),
                        .cluster = std::nullopt,
                        .json = false}),
            1);
}
