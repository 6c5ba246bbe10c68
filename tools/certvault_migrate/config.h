#pragma once

#include <string>

#include "certvault/log.h"
#include "certvault/storage/storage.h"

namespace certvault::migrate {

struct MigrateConfig {
  storage::StorageConfig storage;
  std::string issuer_key;
  LogLevel log_level = LogLevel::Info;
};

MigrateConfig LoadConfig();

// memory:, file:///path, a bare filesystem path, redis:// or rediss://.
storage::StorageConfig ParseStorageUri(const std::string& uri,
                                       const std::string& redis_namespace);

}  // namespace certvault::migrate
