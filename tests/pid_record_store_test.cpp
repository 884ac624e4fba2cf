#include "hostfleet/fleet/pid_record.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <filesystem>

using namespace hostfleet;
using namespace hostfleet::test;

namespace {

class PidRecordStoreTest : public ::testing::Test {
protected:
  TempDir tmp;
  ManualClock clock;
  PidRecordStore store{tmp.path() / "ClusterManager", clock};

  void SetUp() override { ASSERT_TRUE(store.ensure_dir().has_value()); }
};

} // namespace

TEST(PidRecordFormatTest, FileNamesCarryKindSuffix) {
  EXPECT_EQ(PidRecordStore::record_file_name(3, RecordKind::Running),
            "3.running");
  EXPECT_EQ(PidRecordStore::record_file_name(12, RecordKind::Launched),
            "12.launched");

  auto parsed = PidRecordStore::parse_record_file_name("7.restarting");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->first, 7);
  EXPECT_EQ(parsed->second, RecordKind::Restarting);

  EXPECT_FALSE(PidRecordStore::parse_record_file_name("7.lock"));
  EXPECT_FALSE(PidRecordStore::parse_record_file_name("7.exiting"));
  EXPECT_FALSE(PidRecordStore::parse_record_file_name("7.Running"));
  EXPECT_FALSE(PidRecordStore::parse_record_file_name("x.running"));
  EXPECT_FALSE(PidRecordStore::parse_record_file_name("7.running.tmp"));
}

TEST(PidRecordFormatTest, SerializeAndParseRunningRecord) {
  auto record = make_record(2, "Host2", "default", 1);
  record.pid = 4242;
  const auto text = PidRecordStore::serialize(record);
  EXPECT_NE(text.find("managerName:Manager\n"), std::string::npos);
  EXPECT_NE(text.find("processId:4242\n"), std::string::npos);

  auto parsed = PidRecordStore::parse(text, RecordKind::Running);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, record);
}

TEST(PidRecordFormatTest, LaunchedRecordRejectsProcessId) {
  auto record = make_record(2, "Host2");
  record.pid = 10;
  auto parsed = PidRecordStore::parse(PidRecordStore::serialize(record),
                                      RecordKind::Launched);
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error(), make_error_code(Error::RecordCorrupt));
}

TEST(PidRecordFormatTest, RunningRecordRequiresProcessId) {
  auto parsed = PidRecordStore::parse(
      PidRecordStore::serialize(make_record(1, "Host1")), RecordKind::Running);
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error(), make_error_code(Error::RecordCorrupt));
}

TEST(PidRecordFormatTest, RestartingRecordDropsStalePid) {
  auto record = make_record(1, "Host1");
  record.pid = 99;
  auto parsed = PidRecordStore::parse(PidRecordStore::serialize(record),
                                      RecordKind::Restarting);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_FALSE(parsed->pid.has_value());
}

TEST(PidRecordFormatTest, MalformedContentIsCorrupt) {
  const auto base = PidRecordStore::serialize(make_record(1, "Host1"));
  for (const std::string text :
       {base + "unknownKey:1\n", base + "ownerName:bob\n",
        std::string("managerName:Manager\n"), base + "garbage\n",
        std::string("managerName:Manager\ninstanceNumber:-1\n"
                    "instanceName:A1\nclusterPreset:default\n"
                    "clusterInstanceNumber:0\nownerName:*\n")}) {
    auto parsed = PidRecordStore::parse(text, RecordKind::Launched);
    EXPECT_FALSE(parsed.has_value()) << text;
  }
}

TEST_F(PidRecordStoreTest, WriteReadRoundTripUsesClockTimestamp) {
  const auto record = make_record(0, "Host0");
  ASSERT_TRUE(put_record(store, RecordKind::Launched, record).has_value());
  EXPECT_TRUE(std::filesystem::exists(
      store.record_path(0, RecordKind::Launched)));

  auto lock = store.acquire_lock(0, LockMode::Blocking);
  ASSERT_TRUE(lock.has_value());
  EXPECT_EQ(lock->kind(), RecordKind::Launched);
  auto stored = store.read_record(*lock);
  ASSERT_TRUE(stored.has_value());
  ASSERT_TRUE(stored->has_value());
  EXPECT_EQ((*stored)->record, record);
  EXPECT_EQ((*stored)->kind, RecordKind::Launched);
  EXPECT_EQ(std::chrono::floor<std::chrono::seconds>((*stored)->since),
            std::chrono::floor<std::chrono::seconds>(clock.now()));
}

TEST_F(PidRecordStoreTest, MissingRecordReadsAsEmpty) {
  auto lock = store.acquire_lock(5, LockMode::Blocking);
  ASSERT_TRUE(lock.has_value());
  EXPECT_FALSE(lock->kind().has_value());
  auto stored = store.read_record(*lock);
  ASSERT_TRUE(stored.has_value());
  EXPECT_FALSE(stored->has_value());
}

TEST_F(PidRecordStoreTest, WriteRefusesSecondKind) {
  ASSERT_TRUE(
      put_record(store, RecordKind::Launched, make_record(1, "Host1")).has_value());
  auto record = make_record(1, "Host1");
  record.pid = 12;
  auto r = put_record(store, RecordKind::Running, record);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::AlreadyExists));
}

TEST_F(PidRecordStoreTest, TwoRecordFilesAreInconsistent) {
  write_file(store.record_path(4, RecordKind::Launched),
             PidRecordStore::serialize(make_record(4, "Host4")));
  write_file(store.record_path(4, RecordKind::Unloaded), "x");
  auto lock = store.acquire_lock(4, LockMode::Blocking);
  ASSERT_FALSE(lock.has_value());
  EXPECT_EQ(lock.error(), make_error_code(Error::RecordInconsistent));
}

TEST_F(PidRecordStoreTest, TransitionRenamesAndTouches) {
  ASSERT_TRUE(
      put_record(store, RecordKind::Launched, make_record(1, "Host1")).has_value());
  clock.advance(std::chrono::seconds(30));

  auto lock = store.acquire_lock(1, LockMode::Blocking);
  ASSERT_TRUE(lock.has_value());
  ASSERT_TRUE(store.transition(*lock, RecordKind::Launched,
                               RecordKind::Restarting)
                  .has_value());
  EXPECT_EQ(lock->kind(), RecordKind::Restarting);
  EXPECT_FALSE(std::filesystem::exists(
      store.record_path(1, RecordKind::Launched)));
  EXPECT_TRUE(std::filesystem::exists(
      store.record_path(1, RecordKind::Restarting)));

  auto stored = store.read_record(*lock);
  ASSERT_TRUE(stored && *stored);
  EXPECT_EQ(std::chrono::floor<std::chrono::seconds>((*stored)->since),
            std::chrono::floor<std::chrono::seconds>(clock.now()));

  auto wrong = store.transition(*lock, RecordKind::Running,
                                RecordKind::Unloaded);
  ASSERT_FALSE(wrong.has_value());
  EXPECT_EQ(wrong.error(), make_error_code(Error::NotFound));
}

TEST_F(PidRecordStoreTest, ExitingMarkerReplacesRecord) {
  auto record = make_record(2, "Host2");
  record.pid = 77;
  ASSERT_TRUE(put_record(store, RecordKind::Running, record).has_value());

  {
    auto lock = store.acquire_lock(2, LockMode::Blocking);
    ASSERT_TRUE(lock.has_value());
    ASSERT_TRUE(store.mark_exiting(*lock).has_value());
    EXPECT_FALSE(lock->kind().has_value());
  }
  EXPECT_TRUE(store.has_exiting_marker(2));
  EXPECT_FALSE(std::filesystem::exists(
      store.record_path(2, RecordKind::Running)));

  auto numbers = store.list_instance_numbers();
  ASSERT_TRUE(numbers.has_value());
  EXPECT_TRUE(numbers->empty());

  EXPECT_TRUE(store.consume_exiting_marker(2));
  EXPECT_FALSE(store.consume_exiting_marker(2));
  EXPECT_FALSE(store.has_exiting_marker(2));
}

TEST_F(PidRecordStoreTest, ListInstanceNumbersIgnoresOtherFiles) {
  ASSERT_TRUE(
      put_record(store, RecordKind::Launched, make_record(3, "Host3")).has_value());
  auto running = make_record(1, "Host1");
  running.pid = 5;
  ASSERT_TRUE(put_record(store, RecordKind::Running, running).has_value());
  write_file(store.dir() / "existingAccounts.json", "{}");
  write_file(store.dir() / "notes.txt", "");

  auto numbers = store.list_instance_numbers();
  ASSERT_TRUE(numbers.has_value());
  EXPECT_EQ(*numbers, (std::vector<int>{1, 3}));
}

TEST_F(PidRecordStoreTest, RemoveRecordAndLockFile) {
  ASSERT_TRUE(
      put_record(store, RecordKind::Launched, make_record(6, "Host6")).has_value());
  auto lock = store.acquire_lock(6, LockMode::Blocking);
  ASSERT_TRUE(lock.has_value());
  ASSERT_TRUE(store.remove_record(*lock).has_value());
  EXPECT_FALSE(lock->kind().has_value());
  ASSERT_TRUE(store.remove_lock_file(*lock).has_value());
  EXPECT_FALSE(std::filesystem::exists(store.lock_path(6)));
  // Removing again is a no-op.
  EXPECT_TRUE(store.remove_record(*lock).has_value());
}
