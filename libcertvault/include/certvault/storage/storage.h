#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "certvault/context.h"

namespace certvault::storage {

class StorageError : public std::runtime_error {
 public:
  enum class Kind {
    NotFound,
    Unavailable,
    Cancelled,
    InvalidArgument,
  };

  StorageError(Kind kind, const std::string& message);

  Kind kind() const noexcept { return kind_; }

 private:
  Kind kind_;
};

// Key/value capability shared by cooperating processes. Keys are
// "/"-separated paths; a key prefix behaves like a folder.
class Storage {
 public:
  virtual ~Storage() = default;

  virtual std::string Load(const Context& ctx, const std::string& key) = 0;
  virtual void Store(const Context& ctx, const std::string& key,
                     const std::string& value) = 0;
  // False once ctx is done. Throws StorageError when the backend cannot
  // answer.
  virtual bool Exists(const Context& ctx, const std::string& key) = 0;
  virtual void Delete(const Context& ctx, const std::string& key) = 0;
  virtual std::vector<std::string> List(const Context& ctx,
                                        const std::string& prefix,
                                        bool recursive) = 0;
};

// Optional capability: extend a lock held in the backend.
class LockLeaseStorage {
 public:
  virtual ~LockLeaseStorage() = default;

  virtual void RenewLockLease(const Context& ctx, const std::string& lock_key,
                              std::chrono::milliseconds lease_duration) = 0;
};

enum class StorageBackend {
  InMemory,
  File,
  Redis,
};

struct StorageConfig {
  StorageBackend backend = StorageBackend::InMemory;
  std::string file_root;
  std::string redis_uri;
  std::string redis_namespace = "certvault";
};

class InMemoryStorage final : public Storage, public LockLeaseStorage {
 public:
  std::string Load(const Context& ctx, const std::string& key) override;
  void Store(const Context& ctx, const std::string& key,
             const std::string& value) override;
  bool Exists(const Context& ctx, const std::string& key) override;
  void Delete(const Context& ctx, const std::string& key) override;
  std::vector<std::string> List(const Context& ctx, const std::string& prefix,
                                bool recursive) override;
  void RenewLockLease(const Context& ctx, const std::string& lock_key,
                      std::chrono::milliseconds lease_duration) override;

  // Registers a held lock so that its lease can be renewed.
  void AcquireLock(const std::string& lock_key,
                   std::chrono::milliseconds lease_duration);
  std::optional<std::chrono::steady_clock::time_point> LeaseExpiry(
      const std::string& lock_key) const;

 private:
  bool HasChildrenLocked(const std::string& prefix) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> values_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point>
      leases_;
};

std::shared_ptr<Storage> CreateStorage(const StorageConfig& config);

}  // namespace certvault::storage
