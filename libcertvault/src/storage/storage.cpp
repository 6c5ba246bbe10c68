#include "certvault/storage/storage.h"

#include "backends.h"

namespace certvault::storage {

StorageError::StorageError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

std::shared_ptr<Storage> CreateStorage(const StorageConfig& config) {
  switch (config.backend) {
    case StorageBackend::InMemory:
      return std::make_shared<InMemoryStorage>();
    case StorageBackend::File:
      if (config.file_root.empty()) {
        throw StorageError(StorageError::Kind::InvalidArgument,
                           "file storage root is required");
      }
      return CreateFileStorage(config.file_root);
    case StorageBackend::Redis:
      if (config.redis_uri.empty()) {
        throw StorageError(StorageError::Kind::InvalidArgument,
                           "redis URI is required");
      }
      return CreateRedisStorage(config.redis_uri, config.redis_namespace);
  }
  throw StorageError(StorageError::Kind::InvalidArgument,
                     "unsupported backend");
}

}  // namespace certvault::storage
