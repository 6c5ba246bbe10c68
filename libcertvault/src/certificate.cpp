#include "certvault/certificate.h"

#include <algorithm>
#include <string_view>

namespace certvault {

CertStoreError::CertStoreError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

std::string CertificateResource::NamesKey() const {
  std::vector<std::string> sorted = sans;
  std::sort(sorted.begin(), sorted.end());

  std::string result;
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    if (i > 0) {
      result.push_back(',');
    }
    result.append(sorted[i]);
  }

  if (result.size() > kMaxNamesKeyLength) {
    constexpr std::string_view kTrunc = "_trunc";
    result.resize(kMaxNamesKeyLength - kTrunc.size());
    result.append(kTrunc);
  }
  return result;
}

}  // namespace certvault
