#include "certvault/bundle.h"

#include <cctype>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>

#include <json/json.h>
#include <sodium.h>

namespace certvault {
namespace {

constexpr const char* kVersionField = "version";
constexpr const char* kSansField = "sans";
constexpr const char* kCertificateField = "certificate_pem";
constexpr const char* kPrivateKeyField = "private_key_pem";
constexpr const char* kIssuerDataField = "issuer_data";
constexpr const char* kCreatedAtField = "created_at";
constexpr const char* kUpdatedAtField = "updated_at";

[[noreturn]] void DecodeFailure(const std::string& what) {
  throw CertStoreError(CertStoreError::Kind::Decode, what);
}

void EnsureSodiumInitialized() {
  static std::once_flag once;
  static int init_result = -1;
  std::call_once(once, []() { init_result = sodium_init(); });
  if (init_result < 0) {
    throw CertStoreError(CertStoreError::Kind::InvalidArgument,
                         "failed to initialize libsodium");
  }
}

std::string EncodeBase64(std::string_view data) {
  EnsureSodiumInitialized();
  const std::size_t out_size =
      sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
  std::string out(out_size, '\0');
  sodium_bin2base64(out.data(), out.size(),
                    reinterpret_cast<const unsigned char*>(data.data()),
                    data.size(), sodium_base64_VARIANT_ORIGINAL);
  out.resize(std::strlen(out.c_str()));
  return out;
}

std::string DecodeBase64(const std::string& encoded, const char* field) {
  if (encoded.empty()) {
    return {};
  }
  EnsureSodiumInitialized();
  std::string out(encoded.size(), '\0');
  std::size_t out_len = 0;
  if (sodium_base642bin(reinterpret_cast<unsigned char*>(out.data()),
                        out.size(), encoded.data(), encoded.size(), nullptr,
                        &out_len, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0) {
    DecodeFailure(std::string("invalid base64 in ") + field);
  }
  out.resize(out_len);
  return out;
}

Json::Value ParseJson(std::string_view data, const char* what) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(data.data(), data.data() + data.size(), &root, &errors)) {
    DecodeFailure(std::string("decoding ") + what + ": " + errors);
  }
  return root;
}

std::string WriteJson(const Json::Value& value, const char* indentation) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = indentation;
  return Json::writeString(builder, value);
}

Json::Value IssuerDataToJson(const std::string& issuer_data) {
  try {
    return ParseJson(issuer_data, "issuer data");
  } catch (const CertStoreError& ex) {
    throw CertStoreError(CertStoreError::Kind::InvalidArgument,
                         std::string("encoding ") + ex.what());
  }
}

void PutSans(const std::vector<std::string>& sans, Json::Value* root) {
  if (sans.empty()) {
    return;
  }
  Json::Value array(Json::arrayValue);
  for (const auto& san : sans) {
    array.append(san);
  }
  (*root)[kSansField] = std::move(array);
}

void PutIssuerData(const std::string& issuer_data, Json::Value* root) {
  if (issuer_data.empty()) {
    return;
  }
  (*root)[kIssuerDataField] = IssuerDataToJson(issuer_data);
}

std::vector<std::string> ReadSans(const Json::Value& root) {
  std::vector<std::string> sans;
  const Json::Value& value = root[kSansField];
  if (value.isNull()) {
    return sans;
  }
  if (!value.isArray()) {
    DecodeFailure("sans must be an array");
  }
  for (const auto& entry : value) {
    if (!entry.isString()) {
      DecodeFailure("sans entries must be strings");
    }
    sans.push_back(entry.asString());
  }
  return sans;
}

std::string ReadIssuerData(const Json::Value& root) {
  const Json::Value& value = root[kIssuerDataField];
  if (value.isNull()) {
    return {};
  }
  return WriteJson(value, "");
}

std::string ReadBytes(const Json::Value& root, const char* field) {
  const Json::Value& value = root[field];
  if (value.isNull()) {
    return {};
  }
  if (!value.isString()) {
    DecodeFailure(std::string(field) + " must be a base64 string");
  }
  return DecodeBase64(value.asString(), field);
}

std::chrono::system_clock::time_point ReadTimestamp(const Json::Value& root,
                                                    const char* field) {
  const Json::Value& value = root[field];
  if (value.isNull()) {
    return {};
  }
  if (!value.isString()) {
    DecodeFailure(std::string(field) + " must be a timestamp string");
  }
  const auto parsed = ParseTimestamp(value.asString());
  if (!parsed.has_value()) {
    DecodeFailure(std::string(field) + " is not an RFC 3339 timestamp");
  }
  return *parsed;
}

const Json::Value& RequireObject(const Json::Value& root, const char* what) {
  if (!root.isObject()) {
    DecodeFailure(std::string(what) + " must be a JSON object");
  }
  return root;
}

}  // namespace

CertificateBundle BundleFromResource(const CertificateResource& resource) {
  CertificateBundle bundle;
  bundle.sans = resource.sans;
  bundle.certificate_pem = resource.certificate_pem;
  bundle.private_key_pem = resource.private_key_pem;
  bundle.issuer_data = resource.issuer_data;
  return bundle;
}

CertificateResource ResourceFromBundle(CertificateBundle bundle,
                                       std::string issuer_key) {
  CertificateResource resource;
  resource.sans = std::move(bundle.sans);
  resource.certificate_pem = std::move(bundle.certificate_pem);
  resource.private_key_pem = std::move(bundle.private_key_pem);
  resource.issuer_data = std::move(bundle.issuer_data);
  resource.issuer_key = std::move(issuer_key);
  return resource;
}

std::string EncodeBundle(const CertificateBundle& bundle) {
  Json::Value root(Json::objectValue);
  root[kVersionField] = bundle.version;
  PutSans(bundle.sans, &root);
  root[kCertificateField] = EncodeBase64(bundle.certificate_pem);
  root[kPrivateKeyField] = EncodeBase64(bundle.private_key_pem);
  PutIssuerData(bundle.issuer_data, &root);
  if (bundle.created_at != std::chrono::system_clock::time_point{}) {
    root[kCreatedAtField] = FormatTimestamp(bundle.created_at);
  }
  if (bundle.updated_at != std::chrono::system_clock::time_point{}) {
    root[kUpdatedAtField] = FormatTimestamp(bundle.updated_at);
  }
  return WriteJson(root, "\t");
}

CertificateBundle DecodeBundle(std::string_view data) {
  const Json::Value root =
      RequireObject(ParseJson(data, "certificate bundle"), "certificate bundle");

  CertificateBundle bundle;
  const Json::Value& version = root[kVersionField];
  if (version.isNull()) {
    bundle.version = 0;
  } else if (version.isInt()) {
    bundle.version = version.asInt();
  } else {
    DecodeFailure("version must be an integer");
  }
  bundle.sans = ReadSans(root);
  bundle.certificate_pem = ReadBytes(root, kCertificateField);
  bundle.private_key_pem = ReadBytes(root, kPrivateKeyField);
  bundle.issuer_data = ReadIssuerData(root);
  bundle.created_at = ReadTimestamp(root, kCreatedAtField);
  bundle.updated_at = ReadTimestamp(root, kUpdatedAtField);
  return bundle;
}

std::string EncodeLegacyMetadata(const CertificateResource& resource) {
  Json::Value root(Json::objectValue);
  PutSans(resource.sans, &root);
  PutIssuerData(resource.issuer_data, &root);
  return WriteJson(root, "\t");
}

void DecodeLegacyMetadata(std::string_view data, CertificateResource* resource) {
  const Json::Value root = RequireObject(
      ParseJson(data, "certificate metadata"), "certificate metadata");
  resource->sans = ReadSans(root);
  resource->issuer_data = ReadIssuerData(root);
}

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(time);
  const auto nanos =
      std::chrono::duration_cast<std::chrono::nanoseconds>(time - seconds)
          .count();
  const std::time_t tt = std::chrono::system_clock::to_time_t(seconds);
  std::tm tm{};
  gmtime_r(&tt, &tm);

  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (nanos > 0) {
    std::ostringstream frac;
    frac << std::setw(9) << std::setfill('0') << nanos;
    std::string digits = frac.str();
    while (!digits.empty() && digits.back() == '0') {
      digits.pop_back();
    }
    os << '.' << digits;
  }
  os << 'Z';
  return os.str();
}

std::optional<std::chrono::system_clock::time_point> ParseTimestamp(
    std::string_view value) {
  std::tm tm{};
  std::istringstream in{std::string(value)};
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  std::int64_t nanos = 0;
  if (in.peek() == '.') {
    in.get();
    int digits = 0;
    while (std::isdigit(in.peek())) {
      const int digit = in.get() - '0';
      if (digits < 9) {
        nanos = nanos * 10 + digit;
        ++digits;
      }
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 9; ++digits) {
      nanos *= 10;
    }
  }

  int offset_minutes = 0;
  const int zone = in.get();
  if (zone == 'Z' || zone == 'z') {
    offset_minutes = 0;
  } else if (zone == '+' || zone == '-') {
    int hours = 0;
    int minutes = 0;
    char colon = 0;
    in >> std::setw(2) >> hours >> colon >> std::setw(2) >> minutes;
    if (in.fail() || colon != ':') {
      return std::nullopt;
    }
    offset_minutes = (hours * 60 + minutes) * (zone == '-' ? -1 : 1);
  } else {
    return std::nullopt;
  }
  if (in.peek() != std::char_traits<char>::eof()) {
    return std::nullopt;
  }

  const std::time_t tt = timegm(&tm);
  return std::chrono::system_clock::from_time_t(tt) -
         std::chrono::minutes(offset_minutes) +
         std::chrono::duration_cast<std::chrono::system_clock::duration>(
             std::chrono::nanoseconds(nanos));
}

}  // namespace certvault
