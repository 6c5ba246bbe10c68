#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <system_error>

#include "backends.h"

namespace certvault::storage {
namespace {

std::string TempSuffix() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::ostringstream os;
  os << ".tmp-" << std::hex << rng();
  return os.str();
}

class FileStorage final : public Storage {
 public:
  explicit FileStorage(std::filesystem::path root) : root_(std::move(root)) {}

  std::string Load(const Context& ctx, const std::string& key) override {
    ctx.ThrowIfDone();
    const auto path = PathFor(key);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      throw StorageError(StorageError::Kind::NotFound, "key not found: " + key);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) {
      throw StorageError(StorageError::Kind::Unavailable,
                         "failed to open " + path.string());
    }
    std::string value((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
    if (in.bad()) {
      throw StorageError(StorageError::Kind::Unavailable,
                         "failed to read " + path.string());
    }
    return value;
  }

  void Store(const Context& ctx, const std::string& key,
             const std::string& value) override {
    ctx.ThrowIfDone();
    const auto path = PathFor(key);
    const std::filesystem::path parent = path.parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        throw StorageError(StorageError::Kind::Unavailable,
                           "failed to create directory " + parent.string() +
                               ": " + ec.message());
      }
    }

    const std::filesystem::path temp_path = path.string() + TempSuffix();
    {
      std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
      if (!out.good()) {
        throw StorageError(StorageError::Kind::Unavailable,
                           "failed to open temp file for " + key);
      }
      out.write(value.data(), static_cast<std::streamsize>(value.size()));
      if (!out.good()) {
        throw StorageError(StorageError::Kind::Unavailable,
                           "failed to write temp file for " + key);
      }
    }

    std::error_code perm_ec;
    std::filesystem::permissions(
        temp_path,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, perm_ec);
    if (perm_ec) {
      std::filesystem::remove(temp_path, perm_ec);
      throw StorageError(StorageError::Kind::Unavailable,
                         "failed to set permissions for " + key);
    }

    std::error_code rename_ec;
    std::filesystem::rename(temp_path, path, rename_ec);
    if (rename_ec) {
      std::error_code cleanup_ec;
      std::filesystem::remove(temp_path, cleanup_ec);
      throw StorageError(StorageError::Kind::Unavailable,
                         "failed to move temp file for " + key + ": " +
                             rename_ec.message());
    }
  }

  bool Exists(const Context& ctx, const std::string& key) override {
    if (ctx.Done()) {
      return false;
    }
    std::error_code ec;
    return std::filesystem::exists(PathFor(key), ec);
  }

  void Delete(const Context& ctx, const std::string& key) override {
    ctx.ThrowIfDone();
    std::error_code ec;
    const bool removed = std::filesystem::remove(PathFor(key), ec);
    if (ec) {
      throw StorageError(StorageError::Kind::Unavailable,
                         "failed to delete " + key + ": " + ec.message());
    }
    if (!removed) {
      throw StorageError(StorageError::Kind::NotFound, "key not found: " + key);
    }
  }

  std::vector<std::string> List(const Context& ctx, const std::string& prefix,
                                bool recursive) override {
    ctx.ThrowIfDone();
    const auto dir = PathFor(prefix);
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
      throw StorageError(StorageError::Kind::NotFound,
                         "prefix not found: " + prefix);
    }

    std::vector<std::string> keys;
    if (recursive) {
      for (auto it = std::filesystem::recursive_directory_iterator(dir, ec);
           !ec && it != std::filesystem::recursive_directory_iterator();
           it.increment(ec)) {
        if (it->is_regular_file()) {
          keys.push_back(KeyFor(it->path()));
        }
      }
    } else {
      for (auto it = std::filesystem::directory_iterator(dir, ec);
           !ec && it != std::filesystem::directory_iterator();
           it.increment(ec)) {
        keys.push_back(KeyFor(it->path()));
      }
    }
    if (ec) {
      throw StorageError(StorageError::Kind::Unavailable,
                         "failed to list " + prefix + ": " + ec.message());
    }
    std::sort(keys.begin(), keys.end());
    return keys;
  }

 private:
  std::filesystem::path PathFor(const std::string& key) const {
    return root_ / std::filesystem::path(key).relative_path();
  }

  std::string KeyFor(const std::filesystem::path& path) const {
    return std::filesystem::path(path).lexically_relative(root_).generic_string();
  }

  std::filesystem::path root_;
};

}  // namespace

std::shared_ptr<Storage> CreateFileStorage(std::string root) {
  return std::make_shared<FileStorage>(std::filesystem::path(std::move(root)));
}

}  // namespace certvault::storage
