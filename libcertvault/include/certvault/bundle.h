#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "certvault/certificate.h"

namespace certvault {

// Highest bundle format revision this build writes and fully understands.
inline constexpr int kBundleVersion = 1;

// Single-key encoding of a certificate resource. Later versions may only add
// fields; readers ignore what they do not recognize.
struct CertificateBundle {
  int version = kBundleVersion;
  std::vector<std::string> sans;
  std::string certificate_pem;
  std::string private_key_pem;
  std::string issuer_data;
  // The epoch value means "unset" and is omitted from the encoding.
  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point updated_at{};
};

CertificateBundle BundleFromResource(const CertificateResource& resource);
CertificateResource ResourceFromBundle(CertificateBundle bundle,
                                       std::string issuer_key);

// Throw CertStoreError(InvalidArgument) when issuer_data is not JSON and
// CertStoreError(Decode) on malformed input.
std::string EncodeBundle(const CertificateBundle& bundle);
CertificateBundle DecodeBundle(std::string_view data);

// Legacy ".json" object: sans and issuer_data only.
std::string EncodeLegacyMetadata(const CertificateResource& resource);
void DecodeLegacyMetadata(std::string_view data, CertificateResource* resource);

std::string FormatTimestamp(std::chrono::system_clock::time_point time);
std::optional<std::chrono::system_clock::time_point> ParseTimestamp(
    std::string_view value);

}  // namespace certvault
