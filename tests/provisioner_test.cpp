#include "hostfleet/fleet/provisioner.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>

using namespace hostfleet;
using namespace hostfleet::test;

namespace {

class ProvisionerTest : public ::testing::Test {
protected:
  FleetHarness h;
  Provisioner provisioner{h.config, h.index, h.lobby, h.admission, h.clock};

  void SetUp() override {
    h.config.presets[0].target_spares = 2;
    h.config.presets[1].target_spares = 1;
    h.config.fleet.remove_spare_instance_delay = std::chrono::seconds(60);
  }

  auto quit_requests() const -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto &[user, text] : h.lobby.sent) {
      if (text == kQuitIfIdleMessage) {
        out.push_back(user);
      }
    }
    return out;
  }
};

} // namespace

TEST_F(ProvisionerTest, StartsUpToSpareTarget) {
  EXPECT_EQ(provisioner.provision("default"), 2u);
  EXPECT_EQ(h.index.cluster_size("default"), 2u);
  // Starting instances count towards the target.
  EXPECT_EQ(provisioner.provision("default"), 0u);

  auto counts = provisioner.public_counts("default");
  EXPECT_EQ(counts.offline, 2u);
  EXPECT_EQ(counts.total(), 2u);
}

TEST_F(ProvisionerTest, ProvisionAllCoversConfiguredClusters) {
  EXPECT_EQ(provisioner.provision_all(), 3u);
  EXPECT_EQ(h.index.cluster_size("default"), 2u);
  EXPECT_EQ(h.index.cluster_size("ffa"), 1u);
  EXPECT_EQ(provisioner.provision("unknown"), 0u);
}

TEST_F(ProvisionerTest, InUseInstancesDoNotCount) {
  ASSERT_EQ(provisioner.provision("ffa"), 1u);
  h.set_presence(0, PresenceState::InUse);
  EXPECT_EQ(provisioner.provision("ffa"), 1u);
  EXPECT_EQ(h.index.cluster_size("ffa"), 2u);
}

TEST_F(ProvisionerTest, StuckInstancesDoNotCount) {
  ASSERT_EQ(provisioner.provision("ffa"), 1u);
  h.set_presence(0, PresenceState::Stuck);
  EXPECT_EQ(provisioner.provision("ffa"), 1u);
}

TEST_F(ProvisionerTest, RespectsCaps) {
  h.config.presets[0].target_spares = 5;
  h.config.presets[0].max_instances_in_cluster = 3;
  EXPECT_EQ(provisioner.provision("default"), 3u);

  h.config.presets[1].target_spares = 5;
  h.config.presets[1].max_instances_in_cluster_public = 2;
  EXPECT_EQ(provisioner.provision("ffa"), 2u);

  h.config.presets[1].max_instances_in_cluster_public = 0;
  h.config.fleet.max_instances_public = 6;
  EXPECT_EQ(provisioner.provision("ffa"), 1u);
  EXPECT_EQ(h.index.size(), 6u);

  h.config.fleet.max_instances_public = 0;
  h.config.fleet.max_instances = 7;
  EXPECT_EQ(provisioner.provision("ffa"), 1u);
  EXPECT_EQ(h.index.size(), 7u);
}

TEST_F(ProvisionerTest, PrivateInstancesLeavePublicTargetAlone) {
  ASSERT_TRUE(h.admission.launch("ffa", "alice").has_value());
  EXPECT_EQ(provisioner.provision("ffa"), 1u);
  EXPECT_EQ(provisioner.public_counts("ffa").total(), 1u);
}

TEST_F(ProvisionerTest, StopsOnFirstFailure) {
  h.launcher.fail_next = true;
  EXPECT_EQ(provisioner.provision("default"), 0u);
  EXPECT_TRUE(h.index.empty());
  // Next round retries.
  EXPECT_EQ(provisioner.provision("default"), 2u);
}

TEST_F(ProvisionerTest, PrunesOnlyOldSurplusSpares) {
  h.config.presets[0].target_spares = 1;
  ASSERT_EQ(provisioner.provision("default"), 1u);
  h.config.presets[0].target_spares = 3;
  ASSERT_EQ(provisioner.provision("default"), 2u);
  h.config.presets[0].target_spares = 1;
  for (int n : {0, 1, 2}) {
    h.set_presence(n, PresenceState::Spare);
  }

  h.clock.advance(std::chrono::seconds(59));
  EXPECT_TRUE(provisioner.prune().empty());

  h.clock.advance(std::chrono::seconds(1));
  const auto removed = provisioner.prune();
  // Highest cluster numbers go first.
  EXPECT_EQ(removed, (std::vector<std::string>{"Host2", "Host1"}));
  EXPECT_EQ(quit_requests(), removed);
}

TEST_F(ProvisionerTest, RecentSparesAreKept) {
  h.config.presets[0].target_spares = 1;
  ASSERT_EQ(provisioner.provision("default"), 1u);
  h.set_presence(0, PresenceState::Spare);
  h.clock.advance(std::chrono::seconds(120));
  h.config.presets[0].target_spares = 2;
  ASSERT_EQ(provisioner.provision("default"), 1u);
  h.set_presence(1, PresenceState::Spare);
  h.config.presets[0].target_spares = 0;

  // Only instance 0 is old enough; one old spare over a target of zero.
  EXPECT_EQ(provisioner.prune(), std::vector<std::string>{"Host0"});
}

TEST_F(ProvisionerTest, PruneIsRateLimitedPerCluster) {
  ASSERT_EQ(provisioner.provision("ffa"), 1u);
  h.set_presence(0, PresenceState::Spare);
  h.config.presets[1].target_spares = 0;
  h.clock.advance(std::chrono::seconds(60));

  EXPECT_EQ(provisioner.prune().size(), 1u);
  h.clock.advance(std::chrono::seconds(4));
  EXPECT_TRUE(provisioner.prune().empty());
  h.clock.advance(std::chrono::seconds(1));
  EXPECT_EQ(provisioner.prune().size(), 1u);
}

TEST_F(ProvisionerTest, ZeroDelayDisablesPruning) {
  ASSERT_EQ(provisioner.provision("ffa"), 1u);
  h.set_presence(0, PresenceState::Spare);
  h.config.presets[1].target_spares = 0;
  h.config.fleet.remove_spare_instance_delay = std::chrono::seconds(0);
  h.clock.advance(std::chrono::hours(1));
  EXPECT_TRUE(provisioner.prune().empty());
}

TEST_F(ProvisionerTest, ObsoleteClusterSparesAreRemoved) {
  ASSERT_EQ(provisioner.provision("ffa"), 1u);
  ASSERT_TRUE(h.admission.launch("ffa", "alice").has_value());
  h.set_presence(0, PresenceState::Spare);
  h.set_presence(1, PresenceState::Spare);
  h.config.fleet.clusters = {"default"};

  auto removed = provisioner.prune();
  std::ranges::sort(removed);
  EXPECT_EQ(removed, (std::vector<std::string>{"FFA0", "FFA1"}));
  EXPECT_EQ(provisioner.provision("ffa"), 0u);
}
