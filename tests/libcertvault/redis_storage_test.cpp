#include "certvault/storage/storage.h"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace certvault::storage {
namespace {

std::string RandomSuffix() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<std::uint64_t> dist;
  return std::to_string(dist(gen));
}

StorageError::Kind KindOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const StorageError& ex) {
    return ex.kind();
  }
  ADD_FAILURE() << "expected StorageError";
  return StorageError::Kind::Unavailable;
}

TEST(RedisStorageTest, RequiresUriAndNamespace) {
  StorageConfig config;
  config.backend = StorageBackend::Redis;
  EXPECT_EQ(KindOf([&] { CreateStorage(config); }),
            StorageError::Kind::InvalidArgument);

  config.redis_uri = "redis://127.0.0.1:6379/0";
  config.redis_namespace.clear();
  EXPECT_EQ(KindOf([&] { CreateStorage(config); }),
            StorageError::Kind::InvalidArgument);
}

TEST(RedisStorageTest, RedissWithoutCaFailsClosed) {
  StorageConfig config;
  config.backend = StorageBackend::Redis;
  config.redis_uri = "rediss://127.0.0.1:6379/0";
  EXPECT_THROW(CreateStorage(config), StorageError);
}

TEST(RedisStorageTest, ContractAgainstExternalEndpoint) {
  const char* uri = std::getenv("CERTVAULT_TEST_REDIS_URI");
  const bool endpoint_required = []() {
    const char* flag = std::getenv("CERTVAULT_REQUIRE_REDIS_ENDPOINT");
    return flag && std::string(flag) == "1";
  }();

  if (!uri || uri[0] == '\0') {
    if (endpoint_required) {
      FAIL() << "CERTVAULT_TEST_REDIS_URI must be set when "
                "CERTVAULT_REQUIRE_REDIS_ENDPOINT=1";
    }
    GTEST_SKIP() << "CERTVAULT_TEST_REDIS_URI is not set";
  }

  StorageConfig config;
  config.backend = StorageBackend::Redis;
  config.redis_uri = uri;
  config.redis_namespace = "certvault-test-" + RandomSuffix();
  auto storage = CreateStorage(config);
  const Context ctx;

  const std::string cert = "certificates/ca/example.com/example.com.crt";
  const std::string key = "certificates/ca/example.com/example.com.key";
  storage->Store(ctx, cert, "certificate");
  storage->Store(ctx, key, "private key");

  EXPECT_EQ(storage->Load(ctx, cert), "certificate");
  EXPECT_TRUE(storage->Exists(ctx, cert));
  EXPECT_TRUE(storage->Exists(ctx, "certificates/ca"));
  EXPECT_FALSE(storage->Exists(ctx, "certificates/other"));
  EXPECT_EQ(KindOf([&] { storage->Load(ctx, "certificates/missing.crt"); }),
            StorageError::Kind::NotFound);

  EXPECT_EQ(storage->List(ctx, "certificates/ca", false),
            std::vector<std::string>{"certificates/ca/example.com"});
  EXPECT_EQ(storage->List(ctx, "certificates/ca", true),
            (std::vector<std::string>{cert, key}));
  EXPECT_EQ(KindOf([&] { storage->List(ctx, "certificates/other", true); }),
            StorageError::Kind::NotFound);

  EXPECT_EQ(KindOf([&] { storage->Delete(ctx, "certificates/ca/example.com"); }),
            StorageError::Kind::Unavailable);

  auto* leases = dynamic_cast<LockLeaseStorage*>(storage.get());
  ASSERT_NE(leases, nullptr);
  const std::string lock = "locks/example.com.lock";
  storage->Store(ctx, lock, "held");
  leases->RenewLockLease(ctx, lock, std::chrono::seconds(30));
  storage->Delete(ctx, lock);
  EXPECT_EQ(KindOf([&] {
              leases->RenewLockLease(ctx, lock, std::chrono::seconds(30));
            }),
            StorageError::Kind::NotFound);

  storage->Delete(ctx, cert);
  storage->Delete(ctx, key);
  EXPECT_FALSE(storage->Exists(ctx, "certificates/ca/example.com"));
  EXPECT_EQ(KindOf([&] { storage->Delete(ctx, cert); }),
            StorageError::Kind::NotFound);
}

}  // namespace
}  // namespace certvault::storage
