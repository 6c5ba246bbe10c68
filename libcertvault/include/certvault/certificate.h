#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace certvault {

class CertStoreError : public std::runtime_error {
 public:
  enum class Kind {
    NotFound,
    Decode,
    PartialWrite,
    Normalization,
    Backend,
    Cancelled,
    InvalidArgument,
  };

  CertStoreError(Kind kind, const std::string& message);

  Kind kind() const noexcept { return kind_; }

 private:
  Kind kind_;
};

// Certificate material for one name set. PEM blobs and issuer data are
// opaque to this library.
struct CertificateResource {
  std::vector<std::string> sans;
  std::string certificate_pem;
  std::string private_key_pem;
  // JSON text owned by the issuer; empty when absent. Loads return it in
  // compact form with sorted object keys.
  std::string issuer_data;
  // Derived from the storage location on load; never serialized.
  std::string issuer_key;

  // SANs sorted and comma-joined, truncated to kMaxNamesKeyLength.
  std::string NamesKey() const;
};

inline constexpr std::size_t kMaxNamesKeyLength = 1024;

}  // namespace certvault
