#include "hostfleet/fleet/admission.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <filesystem>

using namespace hostfleet;
using namespace hostfleet::test;

namespace {

class AdmissionTest : public ::testing::Test {
protected:
  FleetHarness h;

  auto read_launched(int number) -> std::optional<PidRecord> {
    auto lock = h.store.acquire_lock(number, LockMode::Blocking);
    if (!lock || lock->kind() != RecordKind::Launched) {
      return std::nullopt;
    }
    auto stored = h.store.read_record(*lock);
    if (!stored || !*stored) {
      return std::nullopt;
    }
    return (*stored)->record;
  }
};

} // namespace

TEST_F(AdmissionTest, LaunchPublicInstance) {
  auto launched = h.admission.launch("default", kPublicOwner);
  ASSERT_TRUE(launched.has_value()) << launched.error().message();
  EXPECT_EQ(launched->number, 0);
  EXPECT_EQ(launched->name, "Host0");
  EXPECT_TRUE(launched->password.empty());

  auto record = read_launched(0);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->manager_name, "Manager");
  EXPECT_EQ(record->instance_name, "Host0");
  EXPECT_EQ(record->cluster, "default");
  EXPECT_EQ(record->cluster_number, 0);
  EXPECT_EQ(record->owner, "*");
  EXPECT_FALSE(record->pid.has_value());

  EXPECT_TRUE(std::filesystem::is_directory(h.store.dir() / "Host0" / "log"));

  const auto *inst = h.index.find(0);
  ASSERT_NE(inst, nullptr);
  EXPECT_EQ(inst->lifecycle, LifecycleState::Launched);
  EXPECT_EQ(inst->presence, PresenceState::Offline);
  EXPECT_EQ(inst->lifecycle_since, h.clock.now());
  EXPECT_TRUE(inst->is_public());
}

TEST_F(AdmissionTest, LaunchRequestCarriesInstanceMacros) {
  ASSERT_TRUE(h.admission.launch("ffa", kPublicOwner).has_value());
  ASSERT_EQ(h.launcher.requests.size(), 1u);
  const auto &request = h.launcher.requests.front();
  EXPECT_EQ(request.executable, "/usr/bin/hostfleet");
  ASSERT_GE(request.args.size(), 3u);
  EXPECT_EQ(request.args[0], "run");
  EXPECT_EQ(request.args[1], "-c");
  EXPECT_EQ(request.args[2], "/etc/fleet.toml");

  const auto macro = [&](std::string_view name) {
    return FakeLauncher::macro(request, name).value_or("<missing>");
  };
  EXPECT_EQ(macro("ManagerName"), "Manager");
  EXPECT_EQ(macro("InstNb"), "0");
  EXPECT_EQ(macro("ClustInstNb"), "0");
  EXPECT_EQ(macro("OwnerName"), "*");
  EXPECT_EQ(macro("InstanceName"), "FFA0");
  EXPECT_EQ(macro("set:lobbyLogin"), "FFA0");
  EXPECT_EQ(macro("set:defaultPreset"), "ffa");
  EXPECT_EQ(macro("hSet:port"), "8452");
  EXPECT_EQ(macro("set:autoHostPort"), "9452");
  EXPECT_EQ(macro("set:instanceDir"), "ClusterManager/FFA0");
  EXPECT_EQ(macro("set:logDir"), "log");
  EXPECT_FALSE(FakeLauncher::macro(request, "hSet:password").has_value());
  EXPECT_FALSE(FakeLauncher::macro(request, "set:lobbyPassword").has_value());
}

TEST_F(AdmissionTest, NumbersAreReusedAfterRemoval) {
  ASSERT_TRUE(h.admission.launch("default", kPublicOwner).has_value());
  auto second = h.admission.launch("default", kPublicOwner);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->number, 1);
  EXPECT_EQ(second->name, "Host1");

  h.index.erase(0);
  auto lock = h.store.acquire_lock(0, LockMode::Blocking);
  ASSERT_TRUE(lock.has_value());
  ASSERT_TRUE(h.store.remove_record(*lock).has_value());
  lock->release();

  auto third = h.admission.launch("ffa", kPublicOwner);
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(third->number, 0);
  EXPECT_EQ(third->name, "FFA0");
}

TEST_F(AdmissionTest, PrivateInstanceGetsPassword) {
  auto launched = h.admission.launch("default", "alice");
  ASSERT_TRUE(launched.has_value());
  EXPECT_EQ(launched->password.size(), 4u);
  EXPECT_TRUE(std::ranges::all_of(launched->password, [](char c) {
    return std::string_view("abcdefghjkmnpqrstuvwxyz123456789").find(c) !=
           std::string_view::npos;
  }));
  EXPECT_EQ(FakeLauncher::macro(h.launcher.requests.back(), "hSet:password"),
            launched->password);
  EXPECT_EQ(FakeLauncher::macro(h.launcher.requests.back(), "OwnerName"),
            "alice");

  auto chosen = h.admission.launch("ffa", "bob", "secret");
  ASSERT_TRUE(chosen.has_value());
  EXPECT_EQ(chosen->password, "secret");
  EXPECT_EQ(h.index.find_by_owner("bob")->name, "FFA0");
}

TEST_F(AdmissionTest, PresetMacrosOverrideGeneratedOnes) {
  h.config.presets[0].conf_macros = "hSet:port=1234 set:motd=%InstanceName%";
  h.config.presets[0].conf_macros_private = "set:motd=private";
  h.config.presets[0].lobby_password = "pw";

  ASSERT_TRUE(h.admission.launch("default", kPublicOwner).has_value());
  const auto &pub = h.launcher.requests.back();
  EXPECT_EQ(FakeLauncher::macro(pub, "hSet:port"), "1234");
  EXPECT_EQ(FakeLauncher::macro(pub, "set:motd"), "Host0");
  EXPECT_EQ(FakeLauncher::macro(pub, "set:lobbyPassword"), "pw");

  ASSERT_TRUE(h.admission.launch("default", "carol").has_value());
  EXPECT_EQ(FakeLauncher::macro(h.launcher.requests.back(), "set:motd"),
            "private");
}

TEST_F(AdmissionTest, SpawnFailureDiscardsRecord) {
  h.launcher.fail_next = true;
  auto launched = h.admission.launch("default", kPublicOwner);
  ASSERT_FALSE(launched.has_value());
  EXPECT_EQ(launched.error(), make_error_code(Error::SpawnFailed));
  EXPECT_TRUE(h.index.empty());
  EXPECT_FALSE(std::filesystem::exists(
      h.store.record_path(0, RecordKind::Launched)));
}

TEST_F(AdmissionTest, NameAlreadyOnlineIsRejected) {
  h.lobby.add_user("Host0");
  auto launched = h.admission.launch("default", kPublicOwner);
  ASSERT_FALSE(launched.has_value());
  EXPECT_EQ(launched.error(), make_error_code(Error::AlreadyExists));
  EXPECT_TRUE(h.launcher.requests.empty());
}

TEST_F(AdmissionTest, InvalidNameIsRejected) {
  h.config.presets[1].name_template = "bad name";
  auto launched = h.admission.launch("ffa", kPublicOwner);
  ASSERT_FALSE(launched.has_value());
  EXPECT_EQ(launched.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(AdmissionTest, ExistingRecordBlocksLaunch) {
  ASSERT_TRUE(put_record(h.store, RecordKind::Unloaded,
                         [] {
                           auto r = make_record(0, "Other0");
                           r.pid = 1;
                           return r;
                         }())
                  .has_value());
  auto launched = h.admission.launch("default", kPublicOwner);
  ASSERT_FALSE(launched.has_value());
  EXPECT_EQ(launched.error(), make_error_code(Error::AlreadyExists));
}

TEST_F(AdmissionTest, StaleExitingMarkerIsConsumed) {
  write_file(h.store.exiting_path(0), "");
  ASSERT_TRUE(h.admission.launch("default", kPublicOwner).has_value());
  EXPECT_FALSE(h.store.has_exiting_marker(0));
}

TEST_F(AdmissionTest, SharedDataAndCacheAreCopied) {
  const auto source = std::filesystem::path(h.config.fleet.instance_dir);
  write_file(source / "mapHashes.dat", "hashes");
  std::filesystem::create_directories(source / "cache" / "maps");
  write_file(source / "cache" / "maps" / "a.sd7", "map");

  ASSERT_TRUE(h.admission.launch("default", kPublicOwner).has_value());
  const auto dir = h.store.dir() / "Host0";
  EXPECT_TRUE(std::filesystem::is_regular_file(dir / "mapHashes.dat"));
  EXPECT_FALSE(std::filesystem::exists(dir / "userData.dat"));
  EXPECT_TRUE(std::filesystem::is_regular_file(dir / "cache" / "maps" /
                                               "a.sd7"));
  EXPECT_FALSE(std::filesystem::is_symlink(dir / "cache"));
}

TEST_F(AdmissionTest, SharedArchiveCacheIsLinked) {
  h.config.fleet.share_archive_cache = true;
  const auto source = std::filesystem::path(h.config.fleet.instance_dir);
  std::filesystem::create_directories(source / "cache");

  ASSERT_TRUE(h.admission.launch("default", kPublicOwner).has_value());
  EXPECT_TRUE(std::filesystem::is_symlink(h.store.dir() / "Host0" / "cache"));
}

TEST_F(AdmissionTest, BotAccountRequestedOnce) {
  h.config.fleet.auto_register = 1;
  ASSERT_TRUE(h.admission.launch("default", kPublicOwner).has_value());
  ASSERT_EQ(h.lobby.created_accounts.size(), 1u);
  EXPECT_EQ(h.lobby.created_accounts[0].first, "Host0");
  EXPECT_EQ(h.lobby.created_accounts[0].second, "Manager");
  EXPECT_EQ(h.accounts.accounts().at("Host0"), -1);

  h.index.erase(0);
  {
    auto lock = h.store.acquire_lock(0, LockMode::Blocking);
    ASSERT_TRUE(lock.has_value());
    ASSERT_TRUE(h.store.remove_record(*lock).has_value());
  }
  ASSERT_TRUE(h.admission.launch("default", kPublicOwner).has_value());
  EXPECT_EQ(h.lobby.created_accounts.size(), 1u);
}

TEST_F(AdmissionTest, NoBotAccountWithoutModeratorAccess) {
  h.config.fleet.auto_register = 1;
  h.lobby.users["Manager"].moderator = false;
  ASSERT_TRUE(h.admission.launch("default", kPublicOwner).has_value());
  EXPECT_TRUE(h.lobby.created_accounts.empty());
}

TEST_F(AdmissionTest, PrivateQuotaChecksInOrder) {
  auto rejection = h.admission.check_private("nope", "alice");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->code, Error::ConfigInvalid);
  EXPECT_NE(rejection->message.find("Invalid cluster \"nope\""),
            std::string::npos);

  ASSERT_TRUE(h.admission.launch("default", "alice").has_value());
  rejection = h.admission.check_private("ffa", "alice");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->code, Error::AlreadyExists);
  EXPECT_NE(rejection->message.find("Host0"), std::string::npos);

  h.config.presets[0].max_instances_in_cluster = 1;
  rejection = h.admission.check_private("default", "bob");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->code, Error::QuotaExceeded);
  EXPECT_NE(rejection->message.find("maximum number of instances is reached "
                                    "for this cluster"),
            std::string::npos);

  h.config.presets[0].max_instances_in_cluster = 0;
  h.config.presets[0].max_instances_in_cluster_private = 1;
  rejection = h.admission.check_private("default", "bob");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_NE(rejection->message.find("private instances is reached for this "
                                    "cluster"),
            std::string::npos);

  h.config.fleet.max_instances_private = 1;
  rejection = h.admission.check_private("ffa", "bob");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->message,
            "Unable to create a new private host: the maximum number of "
            "private instances is reached");

  h.config.fleet.max_instances = 1;
  rejection = h.admission.check_private("ffa", "bob");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->message, "Unable to create a new host: the maximum "
                                "number of instances is reached");

  h.config.fleet.max_instances = 10;
  h.config.fleet.max_instances_private = 0;
  EXPECT_FALSE(h.admission.check_private("ffa", "bob").has_value());
}

TEST(AdmissionPasswordTest, GeneratedPasswordsAvoidAmbiguousCharacters) {
  for (int i = 0; i < 50; ++i) {
    const auto password = Admission::generate_password();
    ASSERT_EQ(password.size(), 4u);
    EXPECT_EQ(password.find_first_of("ilo0"), std::string::npos);
  }
}
