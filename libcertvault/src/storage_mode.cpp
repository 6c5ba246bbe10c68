#include "certvault/storage_mode.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>

namespace certvault {
namespace {

constexpr std::uint32_t kFnvOffsetBasis = 2166136261u;
constexpr std::uint32_t kFnvPrime = 16777619u;

std::string GetEnvOrEmpty(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

// Malformed or out-of-range values yield zero.
int ParseIntOrZero(const std::string& value) {
  int parsed = 0;
  const char* begin = value.data();
  const char* end = value.data() + value.size();
  if (begin != end && *begin == '+') {
    ++begin;
  }
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return 0;
  }
  return parsed;
}

}  // namespace

std::string_view ToString(StorageMode mode) {
  switch (mode) {
    case StorageMode::Legacy:
      return "legacy";
    case StorageMode::Transition:
      return "transition";
    case StorageMode::Bundle:
      return "bundle";
  }
  return "legacy";
}

std::optional<StorageMode> ParseStorageMode(std::string_view value) {
  std::string normalized(value);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (normalized == "legacy") {
    return StorageMode::Legacy;
  }
  if (normalized == "transition") {
    return StorageMode::Transition;
  }
  if (normalized == "bundle") {
    return StorageMode::Bundle;
  }
  return std::nullopt;
}

StorageModeConfig StorageModeConfigFromEnv() {
  StorageModeConfig config;
  config.mode = ParseStorageMode(GetEnvOrEmpty(kStorageModeEnv))
                    .value_or(StorageMode::Legacy);
  config.rollout_percent =
      ParseIntOrZero(GetEnvOrEmpty(kStorageModeRolloutPercentEnv));
  return config;
}

std::uint32_t Fnv1a32(std::string_view data) {
  std::uint32_t hash = kFnvOffsetBasis;
  for (const unsigned char ch : data) {
    hash ^= ch;
    hash *= kFnvPrime;
  }
  return hash;
}

int RolloutBucketForDomain(std::string_view domain) {
  return static_cast<int>(Fnv1a32(domain) % 100u);
}

StorageMode StorageModeForDomain(const StorageModeConfig& config,
                                 std::string_view domain) {
  switch (config.mode) {
    case StorageMode::Bundle:
      return StorageMode::Bundle;
    case StorageMode::Legacy:
      return StorageMode::Legacy;
    case StorageMode::Transition:
      return RolloutBucketForDomain(domain) < config.rollout_percent
                 ? StorageMode::Transition
                 : StorageMode::Legacy;
  }
  return StorageMode::Legacy;
}

}  // namespace certvault
