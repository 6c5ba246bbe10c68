#include "config.h"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

namespace certvault::migrate {
namespace {

class ScopedEnv {
 public:
  ScopedEnv(const char* key, const std::string& value) : key_(key) {
    const char* existing = std::getenv(key);
    if (existing) {
      had_value_ = true;
      old_value_ = existing;
    }
    setenv(key, value.c_str(), 1);
  }

  ScopedEnv(const char* key, std::nullptr_t) : key_(key) {
    const char* existing = std::getenv(key);
    if (existing) {
      had_value_ = true;
      old_value_ = existing;
    }
    unsetenv(key);
  }

  ~ScopedEnv() {
    if (had_value_) {
      setenv(key_.c_str(), old_value_.c_str(), 1);
    } else {
      unsetenv(key_.c_str());
    }
  }

 private:
  std::string key_;
  bool had_value_ = false;
  std::string old_value_;
};

}  // namespace

TEST(ConfigTest, LoadConfigRequiresStorageUri) {
  ScopedEnv uri("CERTVAULT_STORAGE_URI", nullptr);
  ScopedEnv issuer("CERTVAULT_ISSUER_KEY", "acme-directory");

  EXPECT_THROW(LoadConfig(), std::runtime_error);
}

TEST(ConfigTest, LoadConfigRequiresIssuerKey) {
  ScopedEnv uri("CERTVAULT_STORAGE_URI", "memory:");
  ScopedEnv issuer("CERTVAULT_ISSUER_KEY", nullptr);

  EXPECT_THROW(LoadConfig(), std::runtime_error);
}

TEST(ConfigTest, LoadConfigAppliesDefaults) {
  ScopedEnv uri("CERTVAULT_STORAGE_URI", "redis://cache.internal:6379/1");
  ScopedEnv issuer("CERTVAULT_ISSUER_KEY", "acme-directory");
  ScopedEnv level("CERTVAULT_LOG_LEVEL", nullptr);
  ScopedEnv ns("CERTVAULT_REDIS_NAMESPACE", nullptr);

  const auto config = LoadConfig();
  EXPECT_EQ(config.issuer_key, "acme-directory");
  EXPECT_EQ(config.log_level, LogLevel::Info);
  EXPECT_EQ(config.storage.backend, storage::StorageBackend::Redis);
  EXPECT_EQ(config.storage.redis_uri, "redis://cache.internal:6379/1");
  EXPECT_EQ(config.storage.redis_namespace, "certvault");
}

TEST(ConfigTest, LoadConfigReadsOverrides) {
  ScopedEnv uri("CERTVAULT_STORAGE_URI", "rediss://cache.internal?verify_peer=false");
  ScopedEnv issuer("CERTVAULT_ISSUER_KEY", "acme-directory");
  ScopedEnv level("CERTVAULT_LOG_LEVEL", "debug");
  ScopedEnv ns("CERTVAULT_REDIS_NAMESPACE", "edge");

  const auto config = LoadConfig();
  EXPECT_EQ(config.log_level, LogLevel::Debug);
  EXPECT_EQ(config.storage.redis_namespace, "edge");
}

TEST(ConfigTest, ParsesFileUris) {
  const auto explicit_file = ParseStorageUri("file:///var/lib/certvault", "ns");
  EXPECT_EQ(explicit_file.backend, storage::StorageBackend::File);
  EXPECT_EQ(explicit_file.file_root, "/var/lib/certvault");

  const auto bare = ParseStorageUri("./data", "ns");
  EXPECT_EQ(bare.backend, storage::StorageBackend::File);
  EXPECT_EQ(bare.file_root, "./data");
}

TEST(ConfigTest, ParsesMemoryUri) {
  EXPECT_EQ(ParseStorageUri("memory:", "ns").backend,
            storage::StorageBackend::InMemory);
}

TEST(ConfigTest, RejectsUnknownSchemesAndEmptyPaths) {
  EXPECT_THROW(ParseStorageUri("s3://bucket/certs", "ns"), std::runtime_error);
  EXPECT_THROW(ParseStorageUri("file://", "ns"), std::runtime_error);
}

}  // namespace certvault::migrate
