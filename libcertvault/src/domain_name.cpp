#include "certvault/domain_name.h"

#include <algorithm>
#include <cstdlib>
#include <memory>

#include <idn2.h>

#include "certvault/certificate.h"

namespace certvault {
namespace {

bool IsAscii(std::string_view value) {
  return std::all_of(value.begin(), value.end(), [](char ch) {
    return static_cast<unsigned char>(ch) < 0x80;
  });
}

std::string LabelToAscii(std::string_view domain, std::string_view label) {
  const std::string input(label);
  char* output = nullptr;
  const int rc = idn2_to_ascii_8z(input.c_str(), &output,
                                  IDN2_NFC_INPUT | IDN2_NONTRANSITIONAL);
  std::unique_ptr<char, decltype(&idn2_free)> owned(output, &idn2_free);
  if (rc != IDN2_OK || owned == nullptr) {
    throw CertStoreError(CertStoreError::Kind::Normalization,
                         "converting '" + std::string(domain) +
                             "' to ASCII: " + idn2_strerror(rc));
  }
  return std::string(owned.get());
}

}  // namespace

std::string ToAsciiDomain(std::string_view domain) {
  if (IsAscii(domain)) {
    return std::string(domain);
  }

  std::string result;
  result.reserve(domain.size() + 8);
  std::size_t start = 0;
  while (true) {
    const std::size_t sep = domain.find_first_of(".,", start);
    const std::string_view label = domain.substr(
        start, sep == std::string_view::npos ? std::string_view::npos
                                             : sep - start);
    if (IsAscii(label)) {
      result.append(label);
    } else {
      result.append(LabelToAscii(domain, label));
    }
    if (sep == std::string_view::npos) {
      break;
    }
    result.push_back(domain[sep]);
    start = sep + 1;
  }
  return result;
}

}  // namespace certvault
