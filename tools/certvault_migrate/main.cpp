#include <exception>
#include <iostream>

#include "certvault/cert_store.h"
#include "certvault/context.h"
#include "certvault/log.h"
#include "certvault/storage/storage.h"
#include "certvault/storage_mode.h"

#include "config.h"

int main() {
  try {
    const auto config = certvault::migrate::LoadConfig();
    certvault::Logger logger(
        certvault::JsonLineLogHandler("certvault-migrate", std::cout),
        config.log_level);

    auto storage = certvault::storage::CreateStorage(config.storage);
    certvault::CertStore store(storage, certvault::StorageModeConfigFromEnv(),
                               logger);

    const certvault::Context ctx;
    const auto summary = store.MigrateAll(ctx, config.issuer_key);
    if (summary.failed > 0) {
      std::cerr << "Migration finished with " << summary.failed
                << " failed domain(s)\n";
      return 1;
    }
  } catch (const std::exception& ex) {
    std::cerr << "certvault-migrate failed: " << ex.what() << "\n";
    return 1;
  }

  return 0;
}
