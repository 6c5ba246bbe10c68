#include <chrono>
#include <iterator>
#include <set>

#include "backends.h"
#include "certvault/storage/redis_uri.h"

#if !defined(CERTVAULT_DISABLE_REDIS)
#include <sw/redis++/redis++.h>
#endif

namespace certvault::storage {
namespace {

#if !defined(CERTVAULT_DISABLE_REDIS)

constexpr long long kScanBatch = 256;

constexpr std::chrono::milliseconds kConnectTimeout{500};
constexpr std::chrono::milliseconds kSocketTimeout{2000};

[[noreturn]] void TlsUnsupported(const std::string& what) {
  throw StorageError(StorageError::Kind::Unavailable,
                     "Redis TLS " + what + " is not supported by this client build");
}

void ApplyTls(const RedisConnectionConfig& config,
              sw::redis::ConnectionOptions* options) {
#if defined(SEWENEW_REDISPLUSPLUS_NO_TLS_H)
  (void)config;
  (void)options;
  TlsUnsupported("connection");
#else
  auto& tls = options->tls;
  tls.enabled = true;
  tls.cacert = config.tls_ca_cert_path;
  tls.cacertdir = config.tls_ca_cert_dir;
  tls.cert = config.tls_cert_path;
  tls.key = config.tls_key_path;
  tls.sni = config.tls_sni.empty() ? config.host : config.tls_sni;
#if defined(REDIS_PLUS_PLUS_TLS_VERIFY_MODE)
  tls.verify_mode =
      config.tls_verify_peer ? REDIS_SSL_VERIFY_PEER : REDIS_SSL_VERIFY_NONE;
#else
  if (!config.tls_verify_peer) {
    TlsUnsupported("verify_peer=false");
  }
#endif
#endif
}

sw::redis::ConnectionOptions OptionsFromUri(const std::string& uri) {
  const RedisConnectionConfig config = ParseRedisConnectionConfig(uri);
  sw::redis::ConnectionOptions options;
  options.host = config.host;
  options.port = config.port;
  options.db = config.db;
  if (!config.username.empty()) {
    options.user = config.username;
  }
  if (!config.password.empty()) {
    options.password = config.password;
  }
  options.connect_timeout = kConnectTimeout;
  options.socket_timeout = kSocketTimeout;
  if (config.use_tls) {
    ApplyTls(config, &options);
  }
  return options;
}

std::string EscapeGlob(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    if (ch == '*' || ch == '?' || ch == '[' || ch == ']' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

class RedisStorage final : public Storage, public LockLeaseStorage {
 public:
  RedisStorage(std::string uri, std::string key_namespace)
      : key_namespace_(std::move(key_namespace)),
        redis_(OptionsFromUri(uri)) {}

  std::string Load(const Context& ctx, const std::string& key) override {
    ctx.ThrowIfDone();
    try {
      auto value = redis_.get(FullKey(key));
      if (!value.has_value()) {
        throw StorageError(StorageError::Kind::NotFound,
                           "key not found: " + key);
      }
      return std::move(*value);
    } catch (const sw::redis::Error& ex) {
      throw StorageError(StorageError::Kind::Unavailable,
                         "loading " + key + ": " + ex.what());
    }
  }

  void Store(const Context& ctx, const std::string& key,
             const std::string& value) override {
    ctx.ThrowIfDone();
    try {
      redis_.set(FullKey(key), value);
    } catch (const sw::redis::Error& ex) {
      throw StorageError(StorageError::Kind::Unavailable,
                         "storing " + key + ": " + ex.what());
    }
  }

  bool Exists(const Context& ctx, const std::string& key) override {
    if (ctx.Done()) {
      return false;
    }
    try {
      if (redis_.exists(FullKey(key)) > 0) {
        return true;
      }
      return !ScanChildren(ctx, key, true).empty();
    } catch (const sw::redis::Error& ex) {
      throw StorageError(StorageError::Kind::Unavailable,
                         "checking " + key + ": " + ex.what());
    }
  }

  void Delete(const Context& ctx, const std::string& key) override {
    ctx.ThrowIfDone();
    try {
      if (redis_.del(FullKey(key)) > 0) {
        return;
      }
      if (!ScanChildren(ctx, key, true).empty()) {
        throw StorageError(StorageError::Kind::Unavailable,
                           "folder is not empty: " + key);
      }
    } catch (const sw::redis::Error& ex) {
      throw StorageError(StorageError::Kind::Unavailable,
                         "deleting " + key + ": " + ex.what());
    }
    throw StorageError(StorageError::Kind::NotFound, "key not found: " + key);
  }

  std::vector<std::string> List(const Context& ctx, const std::string& prefix,
                                bool recursive) override {
    ctx.ThrowIfDone();
    std::vector<std::string> children;
    try {
      children = ScanChildren(ctx, prefix, false);
    } catch (const sw::redis::Error& ex) {
      throw StorageError(StorageError::Kind::Unavailable,
                         "listing " + prefix + ": " + ex.what());
    }
    if (children.empty()) {
      throw StorageError(StorageError::Kind::NotFound,
                         "prefix not found: " + prefix);
    }

    const std::string folder = Folder(prefix);
    std::set<std::string> keys;
    for (const auto& child : children) {
      if (recursive) {
        keys.insert(child);
        continue;
      }
      keys.insert(child.substr(0, child.find('/', folder.size())));
    }
    return {keys.begin(), keys.end()};
  }

  void RenewLockLease(const Context& ctx, const std::string& lock_key,
                      std::chrono::milliseconds lease_duration) override {
    ctx.ThrowIfDone();
    bool renewed = false;
    try {
      renewed = redis_.pexpire(FullKey(lock_key), lease_duration);
    } catch (const sw::redis::Error& ex) {
      throw StorageError(StorageError::Kind::Unavailable,
                         "renewing lease on " + lock_key + ": " + ex.what());
    }
    if (!renewed) {
      throw StorageError(StorageError::Kind::NotFound,
                         "lock is not held: " + lock_key);
    }
  }

 private:
  std::string FullKey(const std::string& key) const {
    return key_namespace_ + "/" + key;
  }

  static std::string Folder(const std::string& prefix) {
    if (prefix.empty() || prefix.back() == '/') {
      return prefix;
    }
    return prefix + "/";
  }

  // Returns storage keys (namespace stripped) below prefix.
  std::vector<std::string> ScanChildren(const Context& ctx,
                                        const std::string& prefix,
                                        bool first_only) {
    const std::string pattern = EscapeGlob(FullKey(Folder(prefix))) + "*";
    const std::size_t strip = key_namespace_.size() + 1;
    std::vector<std::string> found;
    long long cursor = 0;
    do {
      ctx.ThrowIfDone();
      std::vector<std::string> batch;
      cursor = redis_.scan(cursor, pattern, kScanBatch,
                           std::back_inserter(batch));
      for (auto& full_key : batch) {
        found.push_back(full_key.substr(strip));
      }
      if (first_only && !found.empty()) {
        break;
      }
    } while (cursor != 0);
    return found;
  }

  std::string key_namespace_;
  sw::redis::Redis redis_;
};

#else

class RedisStorage final : public Storage {
 public:
  RedisStorage(std::string /*uri*/, std::string /*key_namespace*/) {
    throw StorageError(StorageError::Kind::Unavailable,
                       "Redis support is disabled");
  }

  std::string Load(const Context&, const std::string&) override {
    throw StorageError(StorageError::Kind::Unavailable,
                       "Redis support is disabled");
  }
  void Store(const Context&, const std::string&, const std::string&) override {
    throw StorageError(StorageError::Kind::Unavailable,
                       "Redis support is disabled");
  }
  bool Exists(const Context&, const std::string&) override {
    throw StorageError(StorageError::Kind::Unavailable,
                       "Redis support is disabled");
  }
  void Delete(const Context&, const std::string&) override {
    throw StorageError(StorageError::Kind::Unavailable,
                       "Redis support is disabled");
  }
  std::vector<std::string> List(const Context&, const std::string&,
                                bool) override {
    throw StorageError(StorageError::Kind::Unavailable,
                       "Redis support is disabled");
  }
};

#endif

}  // namespace

std::shared_ptr<Storage> CreateRedisStorage(std::string uri,
                                            std::string key_namespace) {
  if (key_namespace.empty()) {
    throw StorageError(StorageError::Kind::InvalidArgument,
                       "redis key namespace is required");
  }
  return std::make_shared<RedisStorage>(std::move(uri),
                                        std::move(key_namespace));
}

}  // namespace certvault::storage
