#include "certvault/lock_lease.h"

#include <algorithm>

namespace certvault {
namespace {

using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;

LeaseSchedule BuildDefaultSchedule() {
  LeaseSchedule schedule;
  for (const minutes interval :
       {minutes(1), minutes(2), minutes(2), minutes(5), minutes(10),
        minutes(10), minutes(10), minutes(20), minutes(20), minutes(20),
        minutes(20), minutes(30), minutes(30), minutes(30), minutes(30),
        minutes(60), minutes(60), minutes(60), minutes(120), minutes(120),
        minutes(180), minutes(180), minutes(360)}) {
    schedule.intervals.push_back(interval);
  }
  schedule.max_interval = hours(24 * 30);
  schedule.obtain_timeout = seconds(90);
  return schedule;
}

}  // namespace

const LeaseSchedule& DefaultLeaseSchedule() {
  static const LeaseSchedule schedule = BuildDefaultSchedule();
  return schedule;
}

std::chrono::milliseconds RetryIntervalForAttempt(const LeaseSchedule& schedule,
                                                  int attempt) {
  if (attempt >= 0 &&
      static_cast<std::size_t>(attempt) < schedule.intervals.size()) {
    return schedule.intervals[static_cast<std::size_t>(attempt)];
  }
  return schedule.max_interval;
}

std::chrono::milliseconds LeaseDurationForAttempt(const LeaseSchedule& schedule,
                                                  int attempt) {
  return RetryIntervalForAttempt(schedule, attempt) + schedule.obtain_timeout;
}

LockLeaseError::LockLeaseError(std::string lock_key,
                               storage::StorageError::Kind cause,
                               const std::string& message)
    : std::runtime_error(message), lock_key_(std::move(lock_key)), cause_(cause) {}

bool RenewLockLease(const Context& ctx, storage::Storage& storage,
                    const std::string& lock_key, int attempt,
                    const LeaseSchedule& schedule) {
  auto* renewer = dynamic_cast<storage::LockLeaseStorage*>(&storage);
  if (renewer == nullptr) {
    return false;
  }
  try {
    renewer->RenewLockLease(ctx, lock_key,
                            LeaseDurationForAttempt(schedule, attempt));
  } catch (const storage::StorageError& ex) {
    throw LockLeaseError(lock_key, ex.kind(),
                         "renewing lease on " + lock_key + ": " + ex.what());
  }
  return true;
}

LockLeaseKeeper::LockLeaseKeeper(std::shared_ptr<storage::Storage> storage,
                                 std::string lock_key,
                                 LeaseSchedule schedule,
                                 Logger logger)
    : storage_(std::move(storage)),
      lock_key_(std::move(lock_key)),
      schedule_(std::move(schedule)),
      logger_(std::move(logger)) {
  if (!storage_) {
    throw std::invalid_argument("lock lease keeper requires storage");
  }
  if (lock_key_.empty()) {
    throw std::invalid_argument("lock key is required");
  }
}

LockLeaseKeeper::~LockLeaseKeeper() { Stop(); }

void LockLeaseKeeper::Start(const Context& ctx,
                            LeaseFailureCallback on_failure) {
  Stop();
  {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    failure_.reset();
  }
  renewals_.store(0);
  running_.store(true);
  worker_ = std::jthread(
      [this, deadline = ctx.deadline(), on_failure = std::move(on_failure)](
          std::stop_token token) { RenewLoop(token, deadline, on_failure); });
  caller_stop_.emplace(ctx.stop_token(),
                       [source = worker_.get_stop_source()]() mutable {
                         source.request_stop();
                       });
}

void LockLeaseKeeper::Stop() {
  caller_stop_.reset();
  if (worker_.joinable()) {
    worker_.request_stop();
    worker_.join();
  }
  running_.store(false);
}

bool LockLeaseKeeper::IsRunning() const { return running_.load(); }

std::optional<std::string> LockLeaseKeeper::failure() const {
  std::lock_guard<std::mutex> lock(failure_mutex_);
  return failure_;
}

bool LockLeaseKeeper::SleepWithStop(
    std::stop_token stop_token,
    std::optional<Context::Clock::time_point> deadline,
    std::chrono::milliseconds wait) {
  const auto chunk = std::chrono::milliseconds(25);
  std::chrono::milliseconds remaining = wait;
  while (remaining.count() > 0) {
    if (stop_token.stop_requested() ||
        (deadline.has_value() && Context::Clock::now() >= *deadline)) {
      return false;
    }
    const auto current = std::min(remaining, chunk);
    std::this_thread::sleep_for(current);
    remaining -= current;
  }
  return !stop_token.stop_requested();
}

void LockLeaseKeeper::RenewLoop(
    std::stop_token stop_token,
    std::optional<Context::Clock::time_point> deadline,
    LeaseFailureCallback on_failure) {
  for (int attempt = 0; !stop_token.stop_requested(); ++attempt) {
    const Context call_ctx(stop_token, deadline);
    if (call_ctx.Done()) {
      break;
    }
    try {
      if (!RenewLockLease(call_ctx, *storage_, lock_key_, attempt, schedule_)) {
        logger_.Debug("storage does not support lock lease renewal",
                      {{"lock", lock_key_}});
        break;
      }
      renewals_.fetch_add(1);
    } catch (const LockLeaseError& ex) {
      if (ex.cause() == storage::StorageError::Kind::Cancelled) {
        break;
      }
      logger_.Error("lock lease renewal failed",
                    {{"lock", lock_key_},
                     {"attempt", std::to_string(attempt)},
                     {"error", ex.what()}});
      {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        failure_ = ex.what();
      }
      if (on_failure) {
        on_failure(ex);
      }
      break;
    }
    if (!SleepWithStop(stop_token, deadline,
                       RetryIntervalForAttempt(schedule_, attempt))) {
      break;
    }
  }
  running_.store(false);
}

}  // namespace certvault
