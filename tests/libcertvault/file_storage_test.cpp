#include "certvault/storage/storage.h"

#include <chrono>
#include <filesystem>
#include <string>

#include <gtest/gtest.h>

namespace certvault::storage {
namespace {

std::string TempPath(const std::string& name) {
  const auto base = std::filesystem::temp_directory_path();
  const auto stamp = std::to_string(
      std::chrono::steady_clock::now().time_since_epoch().count());
  return (base / (name + "_" + stamp)).string();
}

class FileStorageTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = TempPath("certvault_file_storage");
    StorageConfig config;
    config.backend = StorageBackend::File;
    config.file_root = root_;
    storage_ = CreateStorage(config);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  std::string root_;
  std::shared_ptr<Storage> storage_;
  const Context ctx_;
};

}  // namespace

TEST_F(FileStorageTest, StoreCreatesOwnerOnlyFile) {
  storage_->Store(ctx_, "certificates/ca/example.com/example.com.key", "key");

  const auto path = std::filesystem::path(root_) /
                    "certificates/ca/example.com/example.com.key";
  ASSERT_TRUE(std::filesystem::exists(path));
  const auto perms = std::filesystem::status(path).permissions();
  EXPECT_EQ(perms & std::filesystem::perms::group_all,
            std::filesystem::perms::none);
  EXPECT_EQ(perms & std::filesystem::perms::others_all,
            std::filesystem::perms::none);
  EXPECT_EQ(storage_->Load(ctx_, "certificates/ca/example.com/example.com.key"),
            "key");
}

TEST_F(FileStorageTest, OverwriteReplacesContent) {
  storage_->Store(ctx_, "a/b", "first");
  storage_->Store(ctx_, "a/b", "second");
  EXPECT_EQ(storage_->Load(ctx_, "a/b"), "second");
  EXPECT_EQ(storage_->List(ctx_, "a", false),
            (std::vector<std::string>{"a/b"}));
}

TEST_F(FileStorageTest, MissingKeysAreNotFound) {
  try {
    storage_->Load(ctx_, "nope");
    FAIL() << "expected NotFound";
  } catch (const StorageError& ex) {
    EXPECT_EQ(ex.kind(), StorageError::Kind::NotFound);
  }
  try {
    storage_->Delete(ctx_, "nope");
    FAIL() << "expected NotFound";
  } catch (const StorageError& ex) {
    EXPECT_EQ(ex.kind(), StorageError::Kind::NotFound);
  }
  EXPECT_FALSE(storage_->Exists(ctx_, "nope"));
}

TEST_F(FileStorageTest, ListsChildrenAndRecursively) {
  storage_->Store(ctx_, "certs/x/x.crt", "1");
  storage_->Store(ctx_, "certs/x/x.key", "2");
  storage_->Store(ctx_, "certs/y/y.crt", "3");

  EXPECT_TRUE(storage_->Exists(ctx_, "certs/x"));
  EXPECT_EQ(storage_->List(ctx_, "certs", false),
            (std::vector<std::string>{"certs/x", "certs/y"}));
  EXPECT_EQ(storage_->List(ctx_, "certs", true),
            (std::vector<std::string>{"certs/x/x.crt", "certs/x/x.key",
                                      "certs/y/y.crt"}));
}

TEST_F(FileStorageTest, DeletesEmptyFolderOnly) {
  storage_->Store(ctx_, "certs/x/x.crt", "1");
  EXPECT_THROW(storage_->Delete(ctx_, "certs/x"), StorageError);

  storage_->Delete(ctx_, "certs/x/x.crt");
  storage_->Delete(ctx_, "certs/x");
  EXPECT_FALSE(storage_->Exists(ctx_, "certs/x"));
}

TEST_F(FileStorageTest, HasNoLeaseCapability) {
  EXPECT_EQ(dynamic_cast<LockLeaseStorage*>(storage_.get()), nullptr);
}

}  // namespace certvault::storage
