#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "certvault/bundle.h"
#include "certvault/certificate.h"
#include "certvault/context.h"
#include "certvault/log.h"
#include "certvault/storage/storage.h"
#include "certvault/storage_mode.h"

namespace certvault {

enum class MigrateOutcome {
  Migrated,
  AlreadyMigrated,
};

struct MigrationSummary {
  int migrated = 0;
  int skipped = 0;
  int failed = 0;
};

// Receives the current issuer data and returns its replacement. Throwing
// aborts the update before anything is written. Issuer data read back from
// storage is compact JSON with object keys sorted, so it equals what was
// saved as a JSON value but not necessarily byte for byte.
using MetadataUpdate = std::function<std::string(const std::string&)>;

// Reads and writes certificate resources in the legacy three-key format, the
// single-key bundle format, or both, depending on the storage mode resolved
// for each domain.
//
// Legacy writes are three independent key writes and are not atomic. A
// failed Save leaves at most a torn legacy resource, which Exists reports as
// absent; callers retry Save until it succeeds (at-least-once).
class CertStore {
 public:
  // Resolves the mode per domain from config (rollout applies).
  CertStore(std::shared_ptr<storage::Storage> storage,
            StorageModeConfig config,
            Logger logger = {});
  // Uses mode for every domain.
  CertStore(std::shared_ptr<storage::Storage> storage,
            StorageMode mode,
            Logger logger = {});

  void Save(const Context& ctx, const std::string& issuer_key,
            const CertificateResource& resource);
  CertificateResource Load(const Context& ctx, const std::string& issuer_key,
                           const std::string& domain);
  bool Exists(const Context& ctx, const std::string& issuer_key,
              const std::string& domain);
  void Delete(const Context& ctx, const std::string& issuer_key,
              const std::string& domain);
  void UpdateMetadata(const Context& ctx, const std::string& issuer_key,
                      const std::string& domain, const MetadataUpdate& update);
  std::string LoadPrivateKey(const Context& ctx, const std::string& issuer_key,
                             const std::string& domain);
  // Parks the private key next to the certificate with a ".compromised"
  // suffix and deletes the certificate, so the next issuance mints a new
  // key. Irreversible.
  void MoveCompromisedKey(const Context& ctx, const std::string& issuer_key,
                          const std::string& domain);

  // Converts one legacy resource to a bundle regardless of the configured
  // mode. Throws CertStoreError(NotFound) when there is nothing to migrate.
  MigrateOutcome Migrate(const Context& ctx, const std::string& issuer_key,
                         const std::string& domain);
  MigrationSummary MigrateAll(const Context& ctx, const std::string& issuer_key);

  StorageMode ModeForDomain(std::string_view normalized_domain) const;

 private:
  void SaveBundle(const Context& ctx, const std::string& issuer_key,
                  const std::string& name, const CertificateResource& resource);
  void SaveLegacy(const Context& ctx, const std::string& issuer_key,
                  const std::string& name, const CertificateResource& resource);
  std::optional<CertificateBundle> TryLoadBundle(const Context& ctx,
                                                 const std::string& issuer_key,
                                                 const std::string& name);
  CertificateResource LoadLegacy(const Context& ctx,
                                 const std::string& issuer_key,
                                 const std::string& name);
  bool LegacyExists(const Context& ctx, const std::string& issuer_key,
                    const std::string& name);
  void DeleteLegacyFiles(const Context& ctx, const std::string& issuer_key,
                         const std::string& name);

  std::string LoadKey(const Context& ctx, const std::string& key,
                      std::string_view what);
  void StoreKey(const Context& ctx, const std::string& key,
                const std::string& value, std::string_view what);

  std::shared_ptr<storage::Storage> storage_;
  StorageModeConfig config_;
  std::optional<StorageMode> fixed_mode_;
  Logger logger_;
};

}  // namespace certvault
