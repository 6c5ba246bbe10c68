#include "certvault/storage/storage.h"

#include <set>

namespace certvault::storage {
namespace {

bool HasPrefix(const std::string& value, const std::string& prefix) {
  return value.size() > prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

std::string FolderPrefix(const std::string& prefix) {
  if (prefix.empty() || prefix.back() == '/') {
    return prefix;
  }
  return prefix + "/";
}

}  // namespace

std::string InMemoryStorage::Load(const Context& ctx, const std::string& key) {
  ctx.ThrowIfDone();
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = values_.find(key);
  if (it == values_.end()) {
    throw StorageError(StorageError::Kind::NotFound, "key not found: " + key);
  }
  return it->second;
}

void InMemoryStorage::Store(const Context& ctx, const std::string& key,
                            const std::string& value) {
  ctx.ThrowIfDone();
  if (key.empty()) {
    throw StorageError(StorageError::Kind::InvalidArgument, "key is required");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  values_[key] = value;
}

bool InMemoryStorage::Exists(const Context& ctx, const std::string& key) {
  if (ctx.Done()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return values_.count(key) > 0 || HasChildrenLocked(key);
}

void InMemoryStorage::Delete(const Context& ctx, const std::string& key) {
  ctx.ThrowIfDone();
  std::lock_guard<std::mutex> lock(mutex_);
  if (values_.erase(key) > 0) {
    return;
  }
  if (HasChildrenLocked(key)) {
    throw StorageError(StorageError::Kind::Unavailable,
                       "folder is not empty: " + key);
  }
  throw StorageError(StorageError::Kind::NotFound, "key not found: " + key);
}

std::vector<std::string> InMemoryStorage::List(const Context& ctx,
                                               const std::string& prefix,
                                               bool recursive) {
  ctx.ThrowIfDone();
  const std::string folder = FolderPrefix(prefix);
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> keys;
  for (const auto& entry : values_) {
    if (!HasPrefix(entry.first, folder)) {
      continue;
    }
    if (recursive) {
      keys.insert(entry.first);
      continue;
    }
    const auto slash = entry.first.find('/', folder.size());
    keys.insert(entry.first.substr(0, slash));
  }
  if (keys.empty()) {
    throw StorageError(StorageError::Kind::NotFound,
                       "prefix not found: " + prefix);
  }
  return {keys.begin(), keys.end()};
}

void InMemoryStorage::RenewLockLease(const Context& ctx,
                                     const std::string& lock_key,
                                     std::chrono::milliseconds lease_duration) {
  ctx.ThrowIfDone();
  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = leases_.find(lock_key);
  if (it == leases_.end() || it->second <= now) {
    throw StorageError(StorageError::Kind::NotFound,
                       "lock is not held: " + lock_key);
  }
  it->second = now + lease_duration;
}

void InMemoryStorage::AcquireLock(const std::string& lock_key,
                                  std::chrono::milliseconds lease_duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  leases_[lock_key] = std::chrono::steady_clock::now() + lease_duration;
}

std::optional<std::chrono::steady_clock::time_point>
InMemoryStorage::LeaseExpiry(const std::string& lock_key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = leases_.find(lock_key);
  if (it == leases_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryStorage::HasChildrenLocked(const std::string& prefix) const {
  const std::string folder = FolderPrefix(prefix);
  for (const auto& entry : values_) {
    if (HasPrefix(entry.first, folder)) {
      return true;
    }
  }
  return false;
}

}  // namespace certvault::storage
