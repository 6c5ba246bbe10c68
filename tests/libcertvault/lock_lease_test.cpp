#include "certvault/lock_lease.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>

#include <gtest/gtest.h>

namespace certvault {
namespace {

using std::chrono::milliseconds;

bool WaitFor(const std::function<bool()>& condition,
             milliseconds timeout = milliseconds(3000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(milliseconds(5));
  }
  return condition();
}

LeaseSchedule FastSchedule() {
  LeaseSchedule schedule;
  schedule.intervals = {milliseconds(10), milliseconds(20)};
  schedule.max_interval = milliseconds(30);
  schedule.obtain_timeout = milliseconds(5000);
  return schedule;
}

std::shared_ptr<storage::Storage> StorageWithoutLeases() {
  storage::StorageConfig config;
  config.backend = storage::StorageBackend::File;
  config.file_root = "/nonexistent/certvault-lease-test";
  return storage::CreateStorage(config);
}

}  // namespace

TEST(LeaseScheduleTest, FirstAttemptUsesFirstIntervalPlusObtainTimeout) {
  const auto& schedule = DefaultLeaseSchedule();
  EXPECT_EQ(LeaseDurationForAttempt(schedule, 0),
            std::chrono::minutes(1) + std::chrono::seconds(90));
}

TEST(LeaseScheduleTest, AttemptsPastTheTableUseMaxInterval) {
  const auto& schedule = DefaultLeaseSchedule();
  ASSERT_EQ(schedule.intervals.size(), 23u);
  EXPECT_EQ(LeaseDurationForAttempt(schedule, 22),
            std::chrono::hours(6) + std::chrono::seconds(90));
  EXPECT_EQ(LeaseDurationForAttempt(schedule, 23),
            std::chrono::hours(24 * 30) + std::chrono::seconds(90));
  EXPECT_EQ(LeaseDurationForAttempt(schedule, 999),
            std::chrono::hours(24 * 30) + std::chrono::seconds(90));
  EXPECT_EQ(LeaseDurationForAttempt(schedule, -1),
            std::chrono::hours(24 * 30) + std::chrono::seconds(90));
}

TEST(LeaseScheduleTest, IntervalsNeverShrink) {
  const auto& schedule = DefaultLeaseSchedule();
  for (std::size_t i = 1; i < schedule.intervals.size(); ++i) {
    EXPECT_GE(schedule.intervals[i], schedule.intervals[i - 1]);
  }
  EXPECT_GE(schedule.max_interval, schedule.intervals.back());
}

TEST(RenewLockLeaseTest, NoopWithoutLeaseCapability) {
  auto storage = StorageWithoutLeases();
  EXPECT_FALSE(RenewLockLease(Context{}, *storage, "issue_cert_example.com", 0));
}

TEST(RenewLockLeaseTest, ExtendsHeldLease) {
  storage::InMemoryStorage storage;
  storage.AcquireLock("issue_cert_example.com", milliseconds(100));

  const auto before = std::chrono::steady_clock::now();
  EXPECT_TRUE(RenewLockLease(Context{}, storage, "issue_cert_example.com", 0));
  const auto expiry = storage.LeaseExpiry("issue_cert_example.com");
  ASSERT_TRUE(expiry.has_value());
  EXPECT_GE(*expiry, before + std::chrono::seconds(150));
}

TEST(RenewLockLeaseTest, SurfacesRenewalFailure) {
  storage::InMemoryStorage storage;
  try {
    RenewLockLease(Context{}, storage, "issue_cert_example.com", 3);
    FAIL() << "expected LockLeaseError";
  } catch (const LockLeaseError& ex) {
    EXPECT_EQ(ex.lock_key(), "issue_cert_example.com");
    EXPECT_EQ(ex.cause(), storage::StorageError::Kind::NotFound);
  }
}

TEST(LockLeaseKeeperTest, RenewsUntilStopped) {
  auto storage = std::make_shared<storage::InMemoryStorage>();
  storage->AcquireLock("lock", milliseconds(1000));

  LockLeaseKeeper keeper(storage, "lock", FastSchedule());
  keeper.Start(Context{});
  EXPECT_TRUE(keeper.IsRunning());
  ASSERT_TRUE(WaitFor([&] { return keeper.renewals() >= 4; }));

  keeper.Stop();
  EXPECT_FALSE(keeper.IsRunning());
  const int renewals = keeper.renewals();
  std::this_thread::sleep_for(milliseconds(100));
  EXPECT_EQ(keeper.renewals(), renewals);
  EXPECT_FALSE(keeper.failure().has_value());
}

TEST(LockLeaseKeeperTest, StopsWhenCallerContextIsCancelled) {
  auto storage = std::make_shared<storage::InMemoryStorage>();
  storage->AcquireLock("lock", milliseconds(1000));
  std::stop_source source;

  LockLeaseKeeper keeper(storage, "lock", FastSchedule());
  keeper.Start(Context(source.get_token()));
  ASSERT_TRUE(WaitFor([&] { return keeper.renewals() >= 1; }));

  source.request_stop();
  EXPECT_TRUE(WaitFor([&] { return !keeper.IsRunning(); }));
}

TEST(LockLeaseKeeperTest, StopsAndReportsOnFailure) {
  auto storage = std::make_shared<storage::InMemoryStorage>();
  std::atomic<int> callbacks{0};
  std::string reported_key;

  LockLeaseKeeper keeper(storage, "lock", FastSchedule());
  keeper.Start(Context{}, [&](const LockLeaseError& ex) {
    reported_key = ex.lock_key();
    callbacks.fetch_add(1);
  });

  ASSERT_TRUE(WaitFor([&] { return !keeper.IsRunning(); }));
  keeper.Stop();
  EXPECT_EQ(callbacks.load(), 1);
  EXPECT_EQ(reported_key, "lock");
  EXPECT_EQ(keeper.renewals(), 0);
  ASSERT_TRUE(keeper.failure().has_value());
  EXPECT_NE(keeper.failure()->find("lock"), std::string::npos);
}

TEST(LockLeaseKeeperTest, EndsQuietlyWithoutLeaseCapability) {
  std::atomic<int> callbacks{0};
  LockLeaseKeeper keeper(StorageWithoutLeases(), "lock", FastSchedule());
  keeper.Start(Context{}, [&](const LockLeaseError&) { callbacks.fetch_add(1); });

  ASSERT_TRUE(WaitFor([&] { return !keeper.IsRunning(); }));
  EXPECT_EQ(callbacks.load(), 0);
  EXPECT_FALSE(keeper.failure().has_value());
}

TEST(LockLeaseKeeperTest, DestructionStopsRenewal) {
  auto storage = std::make_shared<storage::InMemoryStorage>();
  storage->AcquireLock("lock", milliseconds(1000));
  {
    LockLeaseKeeper keeper(storage, "lock", FastSchedule());
    keeper.Start(Context{});
    ASSERT_TRUE(WaitFor([&] { return keeper.renewals() >= 1; }));
  }
  const auto expiry = storage->LeaseExpiry("lock");
  std::this_thread::sleep_for(milliseconds(100));
  EXPECT_EQ(storage->LeaseExpiry("lock"), expiry);
}

TEST(LockLeaseKeeperTest, RejectsMissingArguments) {
  EXPECT_THROW(LockLeaseKeeper(nullptr, "lock"), std::invalid_argument);
  EXPECT_THROW(
      LockLeaseKeeper(std::make_shared<storage::InMemoryStorage>(), ""),
      std::invalid_argument);
}

}  // namespace certvault
