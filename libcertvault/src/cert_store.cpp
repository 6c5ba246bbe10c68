#include "certvault/cert_store.h"

#include <array>
#include <chrono>
#include <utility>
#include <vector>

#include "certvault/domain_name.h"
#include "certvault/storage_keys.h"

namespace certvault {
namespace {

using storage::StorageError;

// What a storage mode does on each path. Every mode-dependent branch in
// CertStore reads one of these flags.
struct ModeBehavior {
  bool read_bundle_first = false;
  bool write_bundle = false;
  bool write_legacy = false;
  bool clean_legacy_after_write = false;
  bool park_beside_bundle = false;
};

ModeBehavior BehaviorFor(StorageMode mode) {
  switch (mode) {
    case StorageMode::Legacy:
      return {false, false, true, false, false};
    case StorageMode::Transition:
      return {true, true, true, false, true};
    case StorageMode::Bundle:
      return {true, true, false, true, true};
  }
  return {false, false, true, false, false};
}

CertStoreError::Kind KindFor(StorageError::Kind kind) {
  switch (kind) {
    case StorageError::Kind::NotFound:
      return CertStoreError::Kind::NotFound;
    case StorageError::Kind::Cancelled:
      return CertStoreError::Kind::Cancelled;
    case StorageError::Kind::InvalidArgument:
      return CertStoreError::Kind::InvalidArgument;
    case StorageError::Kind::Unavailable:
      return CertStoreError::Kind::Backend;
  }
  return CertStoreError::Kind::Backend;
}

CertStoreError Wrap(const StorageError& ex, std::string_view what) {
  return CertStoreError(KindFor(ex.kind()),
                        std::string(what) + ": " + ex.what());
}

CertStoreError Wrap(const CertStoreError& ex, std::string_view what) {
  return CertStoreError(ex.kind(), std::string(what) + ": " + ex.what());
}

std::array<std::string, 3> LegacyKeys(const std::string& issuer_key,
                                      const std::string& name) {
  return {keys::SitePrivateKey(issuer_key, name),
          keys::SiteCert(issuer_key, name), keys::SiteMeta(issuer_key, name)};
}

void ThrowIfCancelled(const Context& ctx) {
  if (ctx.Done()) {
    throw CertStoreError(CertStoreError::Kind::Cancelled, "operation cancelled");
  }
}

bool KeyExists(storage::Storage& storage, const Context& ctx,
               const std::string& key) {
  ThrowIfCancelled(ctx);
  try {
    return storage.Exists(ctx, key);
  } catch (const StorageError& ex) {
    throw Wrap(ex, "checking " + key);
  }
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

CertStore::CertStore(std::shared_ptr<storage::Storage> storage,
                     StorageModeConfig config,
                     Logger logger)
    : storage_(std::move(storage)),
      config_(config),
      logger_(std::move(logger)) {
  if (!storage_) {
    throw CertStoreError(CertStoreError::Kind::InvalidArgument,
                         "storage is required");
  }
}

CertStore::CertStore(std::shared_ptr<storage::Storage> storage,
                     StorageMode mode,
                     Logger logger)
    : storage_(std::move(storage)),
      config_{mode, 100},
      fixed_mode_(mode),
      logger_(std::move(logger)) {
  if (!storage_) {
    throw CertStoreError(CertStoreError::Kind::InvalidArgument,
                         "storage is required");
  }
}

StorageMode CertStore::ModeForDomain(std::string_view normalized_domain) const {
  if (fixed_mode_.has_value()) {
    return *fixed_mode_;
  }
  return StorageModeForDomain(config_, normalized_domain);
}

void CertStore::Save(const Context& ctx, const std::string& issuer_key,
                     const CertificateResource& resource) {
  const std::string names_key = resource.NamesKey();
  if (names_key.empty()) {
    throw CertStoreError(CertStoreError::Kind::InvalidArgument,
                         "certificate resource has no SANs");
  }
  const std::string name = ToAsciiDomain(names_key);
  const ModeBehavior behavior = BehaviorFor(ModeForDomain(name));

  // The bundle goes first: if it fails nothing else is written, and once it
  // exists it is what bundle-first readers see.
  if (behavior.write_bundle) {
    SaveBundle(ctx, issuer_key, name, resource);
  }
  if (behavior.write_legacy) {
    SaveLegacy(ctx, issuer_key, name, resource);
  }
  if (behavior.clean_legacy_after_write) {
    DeleteLegacyFiles(ctx, issuer_key, name);
  }
}

CertificateResource CertStore::Load(const Context& ctx,
                                    const std::string& issuer_key,
                                    const std::string& domain) {
  const std::string name = ToAsciiDomain(domain);
  if (BehaviorFor(ModeForDomain(name)).read_bundle_first) {
    auto bundle = TryLoadBundle(ctx, issuer_key, name);
    if (bundle.has_value()) {
      return ResourceFromBundle(std::move(*bundle), issuer_key);
    }
  }
  return LoadLegacy(ctx, issuer_key, name);
}

bool CertStore::Exists(const Context& ctx, const std::string& issuer_key,
                       const std::string& domain) {
  std::string name;
  try {
    name = ToAsciiDomain(domain);
  } catch (const CertStoreError&) {
    return false;
  }
  try {
    if (BehaviorFor(ModeForDomain(name)).read_bundle_first &&
        KeyExists(*storage_, ctx, keys::SiteBundle(issuer_key, name))) {
      return true;
    }
    return LegacyExists(ctx, issuer_key, name);
  } catch (const CertStoreError& ex) {
    logger_.Warn("existence check failed",
                 {{"domain", domain}, {"error", ex.what()}});
    return false;
  }
}

void CertStore::Delete(const Context& ctx, const std::string& issuer_key,
                       const std::string& domain) {
  const std::string name = ToAsciiDomain(domain);
  ThrowIfCancelled(ctx);
  std::vector<std::string> failures;

  // Both encodings are removed whatever the current mode; the resource may
  // have been written under another one.
  const auto legacy = LegacyKeys(issuer_key, name);
  std::vector<std::string> targets{keys::SiteBundle(issuer_key, name)};
  targets.insert(targets.end(), legacy.begin(), legacy.end());
  for (const auto& key : targets) {
    try {
      storage_->Delete(ctx, key);
    } catch (const StorageError& ex) {
      if (ex.kind() == StorageError::Kind::NotFound) {
        continue;
      }
      if (ex.kind() == StorageError::Kind::Cancelled) {
        throw Wrap(ex, "deleting " + key);
      }
      failures.push_back("deleting " + key + ": " + ex.what());
    }
  }

  const std::string site_prefix = keys::CertsSitePrefix(issuer_key, name);
  try {
    storage_->Delete(ctx, site_prefix);
  } catch (const StorageError& ex) {
    if (ex.kind() == StorageError::Kind::Cancelled) {
      throw Wrap(ex, "deleting " + site_prefix);
    }
    if (ex.kind() != StorageError::Kind::NotFound) {
      logger_.Debug("could not delete site folder",
                    {{"path", site_prefix}, {"error", ex.what()}});
    }
  }

  if (!failures.empty()) {
    std::string joined;
    for (const auto& failure : failures) {
      if (!joined.empty()) {
        joined += "; ";
      }
      joined += failure;
    }
    throw CertStoreError(CertStoreError::Kind::Backend, joined);
  }
}

void CertStore::UpdateMetadata(const Context& ctx,
                               const std::string& issuer_key,
                               const std::string& domain,
                               const MetadataUpdate& update) {
  const std::string name = ToAsciiDomain(domain);
  CertificateResource resource;
  try {
    resource = Load(ctx, issuer_key, name);
  } catch (const CertStoreError& ex) {
    throw Wrap(ex, "loading certificate for metadata update");
  }
  resource.issuer_data = update(resource.issuer_data);
  Save(ctx, issuer_key, resource);
}

std::string CertStore::LoadPrivateKey(const Context& ctx,
                                      const std::string& issuer_key,
                                      const std::string& domain) {
  const std::string name = ToAsciiDomain(domain);
  if (BehaviorFor(ModeForDomain(name)).read_bundle_first) {
    auto bundle = TryLoadBundle(ctx, issuer_key, name);
    if (bundle.has_value()) {
      return std::move(bundle->private_key_pem);
    }
  }
  return LoadKey(ctx, keys::SitePrivateKey(issuer_key, name), "loading private key");
}

void CertStore::MoveCompromisedKey(const Context& ctx,
                                   const std::string& issuer_key,
                                   const std::string& domain) {
  const std::string name = ToAsciiDomain(domain);
  std::string private_key;
  try {
    private_key = LoadPrivateKey(ctx, issuer_key, name);
  } catch (const CertStoreError& ex) {
    throw Wrap(ex, "loading private key");
  }

  const std::string compromised_key =
      (BehaviorFor(ModeForDomain(name)).park_beside_bundle
           ? keys::SiteBundle(issuer_key, name)
           : keys::SitePrivateKey(issuer_key, name)) +
      std::string(keys::kCompromisedSuffix);
  StoreKey(ctx, compromised_key, private_key, "storing compromised key");

  try {
    Delete(ctx, issuer_key, name);
  } catch (const CertStoreError& ex) {
    throw Wrap(ex, "deleting certificate with compromised key");
  }

  logger_.Info("moved compromised private key",
               {{"domain", domain},
                {"issuer", issuer_key},
                {"compromised_path", compromised_key}});
}

MigrateOutcome CertStore::Migrate(const Context& ctx,
                                  const std::string& issuer_key,
                                  const std::string& domain) {
  const std::string name = ToAsciiDomain(domain);
  ThrowIfCancelled(ctx);
  if (KeyExists(*storage_, ctx, keys::SiteBundle(issuer_key, name))) {
    return MigrateOutcome::AlreadyMigrated;
  }
  const std::string cert_key = keys::SiteCert(issuer_key, name);
  if (!KeyExists(*storage_, ctx, cert_key)) {
    throw CertStoreError(CertStoreError::Kind::NotFound,
                         "no legacy certificate at " + cert_key);
  }

  CertificateResource resource;
  try {
    resource = LoadLegacy(ctx, issuer_key, name);
  } catch (const CertStoreError& ex) {
    throw Wrap(ex, "loading legacy certificate");
  }
  try {
    SaveBundle(ctx, issuer_key, name, resource);
  } catch (const CertStoreError& ex) {
    throw Wrap(ex, "saving as bundle");
  }
  DeleteLegacyFiles(ctx, issuer_key, name);

  logger_.Info("migrated certificate to bundle format",
               {{"domain", domain}, {"issuer", issuer_key}});
  return MigrateOutcome::Migrated;
}

MigrationSummary CertStore::MigrateAll(const Context& ctx,
                                       const std::string& issuer_key) {
  const std::string prefix = keys::CertsPrefix(issuer_key);
  std::vector<std::string> items;
  try {
    items = storage_->List(ctx, prefix, false);
  } catch (const StorageError& ex) {
    if (ex.kind() == StorageError::Kind::NotFound) {
      return {};
    }
    throw Wrap(ex, "listing certificates");
  }

  MigrationSummary summary;
  for (const auto& item : items) {
    ThrowIfCancelled(ctx);
    if (EndsWith(item, keys::kBundleSuffix)) {
      ++summary.skipped;
      continue;
    }
    const std::size_t slash = item.rfind('/');
    const std::string domain =
        slash == std::string::npos ? item : item.substr(slash + 1);

    try {
      if (Migrate(ctx, issuer_key, domain) == MigrateOutcome::AlreadyMigrated) {
        ++summary.skipped;
      } else {
        ++summary.migrated;
      }
    } catch (const CertStoreError& ex) {
      if (ex.kind() == CertStoreError::Kind::Cancelled) {
        throw;
      }
      if (ex.kind() == CertStoreError::Kind::NotFound) {
        ++summary.skipped;
        continue;
      }
      logger_.Error("failed to migrate certificate",
                    {{"domain", domain}, {"error", ex.what()}});
      ++summary.failed;
    }
  }

  logger_.Info("migration complete",
               {{"issuer", issuer_key},
                {"migrated", std::to_string(summary.migrated)},
                {"skipped", std::to_string(summary.skipped)},
                {"failed", std::to_string(summary.failed)}});
  return summary;
}

void CertStore::SaveBundle(const Context& ctx, const std::string& issuer_key,
                           const std::string& name,
                           const CertificateResource& resource) {
  CertificateBundle bundle = BundleFromResource(resource);
  bundle.updated_at = std::chrono::system_clock::now();

  const std::string bundle_key = keys::SiteBundle(issuer_key, name);
  try {
    bundle.created_at = DecodeBundle(storage_->Load(ctx, bundle_key)).created_at;
  } catch (const StorageError& ex) {
    if (ex.kind() != StorageError::Kind::NotFound) {
      throw Wrap(ex, "loading existing certificate bundle");
    }
  } catch (const CertStoreError& ex) {
    if (ex.kind() != CertStoreError::Kind::Decode) {
      throw;
    }
  }
  if (bundle.created_at == std::chrono::system_clock::time_point{}) {
    bundle.created_at = bundle.updated_at;
  }

  StoreKey(ctx, bundle_key, EncodeBundle(bundle), "storing certificate bundle");
}

void CertStore::SaveLegacy(const Context& ctx, const std::string& issuer_key,
                           const std::string& name,
                           const CertificateResource& resource) {
  const std::array<std::pair<std::string, std::string>, 3> writes = {{
      {keys::SitePrivateKey(issuer_key, name), resource.private_key_pem},
      {keys::SiteCert(issuer_key, name), resource.certificate_pem},
      {keys::SiteMeta(issuer_key, name), EncodeLegacyMetadata(resource)},
  }};

  for (std::size_t i = 0; i < writes.size(); ++i) {
    try {
      storage_->Store(ctx, writes[i].first, writes[i].second);
    } catch (const StorageError& ex) {
      // Best-effort rollback of this call's earlier writes.
      for (std::size_t j = i; j-- > 0;) {
        try {
          storage_->Delete(ctx, writes[j].first);
        } catch (const StorageError& cleanup) {
          logger_.Debug("could not roll back legacy write",
                        {{"key", writes[j].first}, {"error", cleanup.what()}});
        }
      }
      throw CertStoreError(ex.kind() == StorageError::Kind::Cancelled
                               ? CertStoreError::Kind::Cancelled
                               : CertStoreError::Kind::PartialWrite,
                           "storing " + writes[i].first + ": " + ex.what());
    }
  }
}

std::optional<CertificateBundle> CertStore::TryLoadBundle(
    const Context& ctx, const std::string& issuer_key,
    const std::string& name) {
  const std::string bundle_key = keys::SiteBundle(issuer_key, name);
  std::string data;
  try {
    data = storage_->Load(ctx, bundle_key);
  } catch (const StorageError& ex) {
    if (ex.kind() == StorageError::Kind::NotFound) {
      return std::nullopt;
    }
    throw Wrap(ex, "loading certificate bundle " + bundle_key);
  }

  try {
    CertificateBundle bundle = DecodeBundle(data);
    if (bundle.version > kBundleVersion) {
      logger_.Warn("bundle version is newer than supported",
                   {{"key", bundle_key},
                    {"bundle_version", std::to_string(bundle.version)},
                    {"supported_version", std::to_string(kBundleVersion)}});
    }
    return bundle;
  } catch (const CertStoreError& ex) {
    if (ex.kind() != CertStoreError::Kind::Decode) {
      throw;
    }
    logger_.Warn("unreadable certificate bundle, using legacy format",
                 {{"key", bundle_key}, {"error", ex.what()}});
    return std::nullopt;
  }
}

CertificateResource CertStore::LoadLegacy(const Context& ctx,
                                          const std::string& issuer_key,
                                          const std::string& name) {
  CertificateResource resource;
  resource.issuer_key = issuer_key;
  resource.private_key_pem =
      LoadKey(ctx, keys::SitePrivateKey(issuer_key, name), "loading private key");
  resource.certificate_pem =
      LoadKey(ctx, keys::SiteCert(issuer_key, name), "loading certificate");
  const std::string meta_key = keys::SiteMeta(issuer_key, name);
  const std::string metadata = LoadKey(ctx, meta_key, "loading metadata");
  try {
    DecodeLegacyMetadata(metadata, &resource);
  } catch (const CertStoreError& ex) {
    throw Wrap(ex, meta_key);
  }
  return resource;
}

bool CertStore::LegacyExists(const Context& ctx, const std::string& issuer_key,
                             const std::string& name) {
  for (const auto& key : LegacyKeys(issuer_key, name)) {
    if (!KeyExists(*storage_, ctx, key)) {
      return false;
    }
  }
  return true;
}

void CertStore::DeleteLegacyFiles(const Context& ctx,
                                  const std::string& issuer_key,
                                  const std::string& name) {
  for (const auto& key : LegacyKeys(issuer_key, name)) {
    try {
      storage_->Delete(ctx, key);
      logger_.Debug("deleted legacy file", {{"key", key}});
    } catch (const StorageError& ex) {
      if (ex.kind() != StorageError::Kind::NotFound) {
        logger_.Debug("could not delete legacy file",
                      {{"key", key}, {"error", ex.what()}});
      }
    }
  }
}

std::string CertStore::LoadKey(const Context& ctx, const std::string& key,
                               std::string_view what) {
  try {
    return storage_->Load(ctx, key);
  } catch (const StorageError& ex) {
    throw Wrap(ex, std::string(what) + " " + key);
  }
}

void CertStore::StoreKey(const Context& ctx, const std::string& key,
                         const std::string& value, std::string_view what) {
  try {
    storage_->Store(ctx, key, value);
  } catch (const StorageError& ex) {
    throw Wrap(ex, std::string(what) + " " + key);
  }
}

}  // namespace certvault
