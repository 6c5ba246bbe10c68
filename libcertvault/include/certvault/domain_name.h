#pragma once

#include <string>
#include <string_view>

namespace certvault {

// Converts each non-ASCII label to its IDNA A-label ("xn--..."). ASCII
// labels, wildcards included, are returned unchanged. Commas separate names
// in a comma-joined names key and are kept. Throws
// CertStoreError(Normalization).
std::string ToAsciiDomain(std::string_view domain);

}  // namespace certvault
