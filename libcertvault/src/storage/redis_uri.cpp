#include "certvault/storage/redis_uri.h"

#include <array>
#include <charconv>
#include <limits>
#include <string_view>
#include <utility>

#include "certvault/storage/storage.h"

namespace certvault::storage {
namespace {

using Field = std::string RedisConnectionConfig::*;

struct PathOption {
  std::string_view name;
  Field field;
};

constexpr std::array<PathOption, 5> kPathOptions = {{
    {"cacert", &RedisConnectionConfig::tls_ca_cert_path},
    {"cacertdir", &RedisConnectionConfig::tls_ca_cert_dir},
    {"cert", &RedisConnectionConfig::tls_cert_path},
    {"key", &RedisConnectionConfig::tls_key_path},
    {"sni", &RedisConnectionConfig::tls_sni},
}};

[[noreturn]] void Invalid(std::string_view uri_part, std::string_view problem) {
  throw StorageError(StorageError::Kind::InvalidArgument,
                     "Redis URI " + std::string(uri_part) + " " +
                         std::string(problem));
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  const auto lower = [](char ch) {
    return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch - 'A' + 'a') : ch;
  };
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (lower(a[i]) != lower(b[i])) {
      return false;
    }
  }
  return true;
}

// Splits value at the first (or last) separator. The second half is empty
// and `found` false when the separator is absent.
std::pair<std::string_view, std::string_view> Split(std::string_view value,
                                                    char separator,
                                                    bool last = false,
                                                    bool* found = nullptr) {
  const std::size_t pos = last ? value.rfind(separator) : value.find(separator);
  if (found != nullptr) {
    *found = pos != std::string_view::npos;
  }
  if (pos == std::string_view::npos) {
    return {value, {}};
  }
  return {value.substr(0, pos), value.substr(pos + 1)};
}

int ParseNumber(std::string_view text, std::string_view what, int min, int max) {
  int value = 0;
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc() || ptr != end) {
    Invalid(what, "is not a number");
  }
  if (value < min || value > max) {
    Invalid(what, "is out of range");
  }
  return value;
}

void ParseHostPort(std::string_view hostport, RedisConnectionConfig* config) {
  std::string_view port;
  bool has_port = false;
  if (!hostport.empty() && hostport.front() == '[') {
    bool closed = false;
    auto [host, rest] = Split(hostport.substr(1), ']', false, &closed);
    if (!closed) {
      Invalid("host", "has an unterminated IPv6 literal");
    }
    if (!rest.empty() && rest.front() != ':') {
      Invalid("port", "must follow the IPv6 literal after ':'");
    }
    config->host = std::string(host);
    has_port = !rest.empty();
    port = has_port ? rest.substr(1) : rest;
  } else {
    auto [host, tail] = Split(hostport, ':', true, &has_port);
    config->host = std::string(host);
    port = tail;
  }
  if (config->host.empty()) {
    Invalid("host", "is empty");
  }
  if (has_port) {
    config->port = ParseNumber(port, "port", 1, 65535);
  }
}

void ApplyOption(std::string_view name, std::string_view value,
                 RedisConnectionConfig* config) {
  if (name.empty()) {
    Invalid("query", "contains an empty option name");
  }
  for (const auto& option : kPathOptions) {
    if (option.name == name) {
      config->*option.field = std::string(value);
      return;
    }
  }
  if (name != "verify_peer") {
    Invalid("option", std::string(name) + " is not supported");
  }
  for (std::string_view yes : {"1", "true", "yes"}) {
    if (EqualsIgnoreCase(value, yes)) {
      config->tls_verify_peer = true;
      return;
    }
  }
  for (std::string_view no : {"0", "false", "no"}) {
    if (EqualsIgnoreCase(value, no)) {
      config->tls_verify_peer = false;
      return;
    }
  }
  Invalid("option verify_peer", "must be a boolean");
}

}  // namespace

RedisConnectionConfig ParseRedisConnectionConfig(const std::string& uri) {
  std::string_view rest(uri);
  const std::size_t scheme_end = rest.find("://");
  if (scheme_end == std::string_view::npos) {
    Invalid("scheme", "is missing");
  }

  RedisConnectionConfig config;
  const std::string_view scheme = rest.substr(0, scheme_end);
  if (EqualsIgnoreCase(scheme, "rediss")) {
    config.use_tls = true;
  } else if (!EqualsIgnoreCase(scheme, "redis")) {
    Invalid("scheme", "must be redis or rediss");
  }
  rest.remove_prefix(scheme_end + 3);

  auto [location, query] = Split(rest, '?');
  auto [authority, db] = Split(location, '/');
  if (!db.empty()) {
    config.db = ParseNumber(db, "db", 0, std::numeric_limits<int>::max());
  }

  bool has_credentials = false;
  auto [credentials, hostport] = Split(authority, '@', true, &has_credentials);
  if (!has_credentials) {
    hostport = credentials;
  } else {
    bool has_user = false;
    auto [user, password] = Split(credentials, ':', false, &has_user);
    config.username = has_user ? std::string(user) : std::string();
    config.password = std::string(has_user ? password : user);
  }
  ParseHostPort(hostport, &config);

  while (!query.empty()) {
    auto [pair, next] = Split(query, '&');
    if (!pair.empty()) {
      auto [name, value] = Split(pair, '=');
      ApplyOption(name, value, &config);
    }
    query = next;
  }

  const bool any_tls_option =
      !config.tls_verify_peer || !config.tls_ca_cert_path.empty() ||
      !config.tls_ca_cert_dir.empty() || !config.tls_cert_path.empty() ||
      !config.tls_key_path.empty() || !config.tls_sni.empty();
  if (!config.use_tls && any_tls_option) {
    Invalid("options", "for TLS require the rediss scheme");
  }
  if (config.use_tls && config.tls_verify_peer &&
      config.tls_ca_cert_path.empty() && config.tls_ca_cert_dir.empty()) {
    Invalid("options", "need cacert or cacertdir to verify the server");
  }
  if (config.tls_cert_path.empty() != config.tls_key_path.empty()) {
    Invalid("options", "cert and key must be given together");
  }
  return config;
}

}  // namespace certvault::storage
