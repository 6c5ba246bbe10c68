#pragma once

#include <string>
#include <string_view>

namespace certvault::keys {

inline constexpr std::string_view kCertificatesPrefix = "certificates";
inline constexpr std::string_view kBundleSuffix = ".bundle.json";
inline constexpr std::string_view kCompromisedSuffix = ".compromised";

// Lowercases, trims and strips everything that is unsafe in a path
// component. Wildcards become "wildcard_".
std::string Safe(std::string_view value);

std::string CertsPrefix(std::string_view issuer_key);
std::string CertsSitePrefix(std::string_view issuer_key, std::string_view domain);
std::string SiteCert(std::string_view issuer_key, std::string_view domain);
std::string SitePrivateKey(std::string_view issuer_key, std::string_view domain);
std::string SiteMeta(std::string_view issuer_key, std::string_view domain);
std::string SiteBundle(std::string_view issuer_key, std::string_view domain);

}  // namespace certvault::keys
