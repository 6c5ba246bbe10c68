#include "certvault/context.h"

#include "certvault/storage/storage.h"

namespace certvault {

Context Context::WithTimeout(std::chrono::milliseconds timeout,
                             std::stop_token stop_token) {
  return Context(std::move(stop_token), Clock::now() + timeout);
}

bool Context::Done() const {
  if (stop_token_.stop_requested()) {
    return true;
  }
  return deadline_.has_value() && Clock::now() >= *deadline_;
}

void Context::ThrowIfDone() const {
  if (stop_token_.stop_requested()) {
    throw storage::StorageError(storage::StorageError::Kind::Cancelled,
                                "operation cancelled");
  }
  if (deadline_.has_value() && Clock::now() >= *deadline_) {
    throw storage::StorageError(storage::StorageError::Kind::Cancelled,
                                "operation deadline exceeded");
  }
}

}  // namespace certvault
