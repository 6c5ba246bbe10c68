#include "certvault/log.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>

namespace certvault {
namespace {

std::string UtcTimestampNow() {
  const auto now = std::chrono::system_clock::now();
  const auto tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return os.str();
}

}  // namespace

Logger::Logger(LogHandler handler, LogLevel min_level)
    : handler_(std::move(handler)), min_level_(min_level) {}

bool Logger::Enabled(LogLevel level) const {
  return handler_ && static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Log(LogLevel level, std::string_view message,
                 const LogFields& fields) const {
  if (!Enabled(level)) {
    return;
  }
  handler_(level, message, fields);
}

std::string JsonEscape(std::string_view value) {
  std::ostringstream stream;
  stream << std::hex << std::uppercase;
  for (const unsigned char ch : value) {
    switch (ch) {
      case '\"':
        stream << "\\\"";
        break;
      case '\\':
        stream << "\\\\";
        break;
      case '\b':
        stream << "\\b";
        break;
      case '\f':
        stream << "\\f";
        break;
      case '\n':
        stream << "\\n";
        break;
      case '\r':
        stream << "\\r";
        break;
      case '\t':
        stream << "\\t";
        break;
      default:
        if (ch < 0x20) {
          stream << "\\u" << std::setw(4) << std::setfill('0')
                 << static_cast<int>(ch);
          stream << std::setfill(' ');
        } else {
          stream << static_cast<char>(ch);
        }
        break;
    }
  }
  return stream.str();
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Error:
      return "error";
  }
  return "info";
}

LogLevel ParseLogLevel(std::string_view value) {
  std::string normalized(value);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

LogHandler JsonLineLogHandler(std::string component, std::ostream& out) {
  auto mutex = std::make_shared<std::mutex>();
  return [component = std::move(component), &out, mutex](
             LogLevel level, std::string_view message,
             const LogFields& fields) {
    std::ostringstream line;
    line << "{\"timestamp\":\"" << UtcTimestampNow() << "\""
         << ",\"component\":\"" << JsonEscape(component) << "\""
         << ",\"level\":\"" << ToString(level) << "\""
         << ",\"message\":\"" << JsonEscape(message) << "\"";
    for (const auto& field : fields) {
      line << ",\"" << JsonEscape(field.key) << "\":\""
           << JsonEscape(field.value) << "\"";
    }
    line << "}\n";
    std::lock_guard<std::mutex> lock(*mutex);
    out << line.str();
    out.flush();
  };
}

}  // namespace certvault
