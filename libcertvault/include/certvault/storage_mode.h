#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace certvault {

inline constexpr const char* kStorageModeEnv = "CERTVAULT_STORAGE_MODE";
inline constexpr const char* kStorageModeRolloutPercentEnv =
    "CERTVAULT_STORAGE_MODE_ROLLOUT_PERCENT";

// legacy:     three keys per certificate (.crt, .key, .json).
// transition: writes bundle and legacy, reads bundle with legacy fallback.
// bundle:     writes only the bundle, reads bundle with legacy fallback.
enum class StorageMode {
  Legacy,
  Transition,
  Bundle,
};

std::string_view ToString(StorageMode mode);

// Case-insensitive; nullopt for anything unrecognized.
std::optional<StorageMode> ParseStorageMode(std::string_view value);

// Process-wide selection resolved once at startup. rollout_percent only
// applies when mode is Transition.
struct StorageModeConfig {
  StorageMode mode = StorageMode::Legacy;
  int rollout_percent = 0;
};

StorageModeConfig StorageModeConfigFromEnv();

// FNV-1a 32-bit.
std::uint32_t Fnv1a32(std::string_view data);

// Deterministic position of a domain in [0, 100).
int RolloutBucketForDomain(std::string_view domain);

StorageMode StorageModeForDomain(const StorageModeConfig& config,
                                 std::string_view domain);

}  // namespace certvault
