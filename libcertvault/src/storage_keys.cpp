#include "certvault/storage_keys.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace certvault::keys {
namespace {

bool IsSafeChar(unsigned char ch) {
  return std::isalnum(ch) || ch == '_' || ch == '@' || ch == '.' || ch == '-';
}

std::string Trim(std::string_view value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  while (!value.empty() && is_space(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && is_space(value.back())) {
    value.remove_suffix(1);
  }
  return std::string(value);
}

std::string SiteFile(std::string_view issuer_key, std::string_view domain,
                     std::string_view extension) {
  return CertsSitePrefix(issuer_key, domain) + "/" + Safe(domain) +
         std::string(extension);
}

}  // namespace

std::string Safe(std::string_view value) {
  std::string lowered = Trim(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

  static constexpr std::array<std::pair<std::string_view, std::string_view>, 5>
      kReplacements = {{
          {" ", "_"},
          {"+", "_plus_"},
          {"*", "wildcard_"},
          {":", "-"},
          {"..", ""},
      }};

  // Single left-to-right pass; the first matching pattern wins at each
  // position.
  std::string replaced;
  replaced.reserve(lowered.size());
  std::size_t pos = 0;
  while (pos < lowered.size()) {
    bool matched = false;
    for (const auto& [from, to] : kReplacements) {
      if (lowered.compare(pos, from.size(), from) == 0) {
        replaced.append(to);
        pos += from.size();
        matched = true;
        break;
      }
    }
    if (!matched) {
      replaced.push_back(lowered[pos]);
      ++pos;
    }
  }

  std::string safe;
  safe.reserve(replaced.size());
  for (const unsigned char ch : replaced) {
    if (IsSafeChar(ch)) {
      safe.push_back(static_cast<char>(ch));
    }
  }
  return safe;
}

std::string CertsPrefix(std::string_view issuer_key) {
  return std::string(kCertificatesPrefix) + "/" + Safe(issuer_key);
}

std::string CertsSitePrefix(std::string_view issuer_key, std::string_view domain) {
  return CertsPrefix(issuer_key) + "/" + Safe(domain);
}

std::string SiteCert(std::string_view issuer_key, std::string_view domain) {
  return SiteFile(issuer_key, domain, ".crt");
}

std::string SitePrivateKey(std::string_view issuer_key, std::string_view domain) {
  return SiteFile(issuer_key, domain, ".key");
}

std::string SiteMeta(std::string_view issuer_key, std::string_view domain) {
  return SiteFile(issuer_key, domain, ".json");
}

std::string SiteBundle(std::string_view issuer_key, std::string_view domain) {
  return SiteFile(issuer_key, domain, kBundleSuffix);
}

}  // namespace certvault::keys
