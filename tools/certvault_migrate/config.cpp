#include "config.h"

#include <cstdlib>
#include <stdexcept>

namespace certvault::migrate {

namespace {

std::string GetEnvOrEmpty(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

}  // namespace

storage::StorageConfig ParseStorageUri(const std::string& uri,
                                       const std::string& redis_namespace) {
  storage::StorageConfig config;
  if (uri == "memory:") {
    config.backend = storage::StorageBackend::InMemory;
    return config;
  }
  if (StartsWith(uri, "redis://") || StartsWith(uri, "rediss://")) {
    config.backend = storage::StorageBackend::Redis;
    config.redis_uri = uri;
    config.redis_namespace = redis_namespace;
    return config;
  }
  if (StartsWith(uri, "file://")) {
    config.backend = storage::StorageBackend::File;
    config.file_root = uri.substr(std::string("file://").size());
  } else if (uri.find("://") != std::string::npos) {
    throw std::runtime_error("unsupported storage URI scheme: " + uri);
  } else {
    config.backend = storage::StorageBackend::File;
    config.file_root = uri;
  }
  if (config.file_root.empty()) {
    throw std::runtime_error("file storage URI requires a path");
  }
  return config;
}

MigrateConfig LoadConfig() {
  MigrateConfig config;
  const auto storage_uri = GetEnvOrEmpty("CERTVAULT_STORAGE_URI");
  config.issuer_key = GetEnvOrEmpty("CERTVAULT_ISSUER_KEY");

  std::string redis_namespace = GetEnvOrEmpty("CERTVAULT_REDIS_NAMESPACE");
  if (redis_namespace.empty()) {
    redis_namespace = "certvault";
  }
  config.log_level = ParseLogLevel(GetEnvOrEmpty("CERTVAULT_LOG_LEVEL"));

  if (storage_uri.empty()) {
    throw std::runtime_error("CERTVAULT_STORAGE_URI is required");
  }
  if (config.issuer_key.empty()) {
    throw std::runtime_error("CERTVAULT_ISSUER_KEY is required");
  }
  config.storage = ParseStorageUri(storage_uri, redis_namespace);
  return config;
}

}  // namespace certvault::migrate
