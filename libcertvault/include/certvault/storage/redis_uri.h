#pragma once

#include <string>

namespace certvault::storage {

struct RedisConnectionConfig {
  std::string host;
  int port = 6379;
  int db = 0;
  std::string username;
  std::string password;
  bool use_tls = false;
  bool tls_verify_peer = true;
  std::string tls_ca_cert_path;
  std::string tls_ca_cert_dir;
  std::string tls_cert_path;
  std::string tls_key_path;
  std::string tls_sni;
};

// Parses redis://[user:password@]host[:port][/db][?options] and the
// rediss:// TLS variant. Throws StorageError(InvalidArgument).
RedisConnectionConfig ParseRedisConnectionConfig(const std::string& uri);

}  // namespace certvault::storage
