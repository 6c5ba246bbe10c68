#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "certvault/context.h"
#include "certvault/log.h"
#include "certvault/storage/storage.h"

namespace certvault {

struct LeaseSchedule {
  // Wait before renewal attempt i+1; grows with i.
  std::vector<std::chrono::milliseconds> intervals;
  // Used once the attempt number runs past intervals.
  std::chrono::milliseconds max_interval{0};
  // Expected duration of the guarded certificate operation.
  std::chrono::milliseconds obtain_timeout{0};
};

const LeaseSchedule& DefaultLeaseSchedule();

std::chrono::milliseconds RetryIntervalForAttempt(const LeaseSchedule& schedule,
                                                  int attempt);
// Retry interval for the attempt plus the obtain timeout, so a lease never
// lapses before the next renewal is due.
std::chrono::milliseconds LeaseDurationForAttempt(const LeaseSchedule& schedule,
                                                  int attempt);

class LockLeaseError : public std::runtime_error {
 public:
  LockLeaseError(std::string lock_key, storage::StorageError::Kind cause,
                 const std::string& message);

  const std::string& lock_key() const noexcept { return lock_key_; }
  storage::StorageError::Kind cause() const noexcept { return cause_; }

 private:
  std::string lock_key_;
  storage::StorageError::Kind cause_;
};

// Returns false without doing anything when the backend has no lease
// capability. Throws LockLeaseError when renewal fails.
bool RenewLockLease(const Context& ctx, storage::Storage& storage,
                    const std::string& lock_key, int attempt,
                    const LeaseSchedule& schedule = DefaultLeaseSchedule());

using LeaseFailureCallback = std::function<void(const LockLeaseError&)>;

// Keeps one lease alive for the lifetime of a critical section. Renews
// immediately on Start, then after each attempt's retry interval, until
// Stop, destruction, the caller's context ends, or a renewal fails.
class LockLeaseKeeper {
 public:
  LockLeaseKeeper(std::shared_ptr<storage::Storage> storage,
                  std::string lock_key,
                  LeaseSchedule schedule = DefaultLeaseSchedule(),
                  Logger logger = {});
  ~LockLeaseKeeper();

  LockLeaseKeeper(const LockLeaseKeeper&) = delete;
  LockLeaseKeeper& operator=(const LockLeaseKeeper&) = delete;

  void Start(const Context& ctx, LeaseFailureCallback on_failure = {});
  void Stop();
  bool IsRunning() const;

  int renewals() const { return renewals_.load(); }
  std::optional<std::string> failure() const;

 private:
  void RenewLoop(std::stop_token stop_token,
                 std::optional<Context::Clock::time_point> deadline,
                 LeaseFailureCallback on_failure);
  bool SleepWithStop(std::stop_token stop_token,
                     std::optional<Context::Clock::time_point> deadline,
                     std::chrono::milliseconds wait);

  std::shared_ptr<storage::Storage> storage_;
  std::string lock_key_;
  LeaseSchedule schedule_;
  Logger logger_;

  std::jthread worker_;
  std::optional<std::stop_callback<std::function<void()>>> caller_stop_;
  std::atomic<bool> running_{false};
  std::atomic<int> renewals_{0};
  mutable std::mutex failure_mutex_;
  std::optional<std::string> failure_;
};

}  // namespace certvault
