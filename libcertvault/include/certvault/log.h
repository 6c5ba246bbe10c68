#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace certvault {

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
};

struct LogField {
  std::string key;
  std::string value;
};

using LogFields = std::vector<LogField>;
using LogHandler =
    std::function<void(LogLevel, std::string_view, const LogFields&)>;

class Logger {
 public:
  Logger() = default;
  explicit Logger(LogHandler handler, LogLevel min_level = LogLevel::Info);

  bool Enabled(LogLevel level) const;
  void Log(LogLevel level, std::string_view message,
           const LogFields& fields = {}) const;

  void Debug(std::string_view message, const LogFields& fields = {}) const {
    Log(LogLevel::Debug, message, fields);
  }
  void Info(std::string_view message, const LogFields& fields = {}) const {
    Log(LogLevel::Info, message, fields);
  }
  void Warn(std::string_view message, const LogFields& fields = {}) const {
    Log(LogLevel::Warn, message, fields);
  }
  void Error(std::string_view message, const LogFields& fields = {}) const {
    Log(LogLevel::Error, message, fields);
  }

 private:
  LogHandler handler_;
  LogLevel min_level_ = LogLevel::Info;
};

std::string JsonEscape(std::string_view value);
std::string_view ToString(LogLevel level);
LogLevel ParseLogLevel(std::string_view value);

// One JSON object per line, serialized across threads.
LogHandler JsonLineLogHandler(std::string component, std::ostream& out);

}  // namespace certvault
