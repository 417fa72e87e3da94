#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace vera::runtime::config {
class RuntimeConfig;
}

namespace vera::observability {

/*
  Structured logging over spdlog.

  Lines read "<message> key=value ...". While a RequestLogScope is alive on
  the calling thread every line also carries request_id, so handler logs can
  be matched to the access line and to the x-amzn-RequestId the client saw.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// Level, pattern and trace context come from VERA_LOG_* variables first,
// then from the logging section of the configuration.
void InitializeLogging(const vera::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Whether access-log lines go out at info instead of debug.
bool AccessLogEnabled();

class RequestLogScope {
 public:
  explicit RequestLogScope(std::string request_id);
  ~RequestLogScope();

  RequestLogScope(const RequestLogScope&)            = delete;
  RequestLogScope& operator=(const RequestLogScope&) = delete;

 private:
  std::string previous_;
};

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace vera::observability

#define VERA_LOG_DEBUG(message, ...) ::vera::observability::LogDebug((message), ##__VA_ARGS__)
#define VERA_LOG_INFO(message, ...) ::vera::observability::LogInfo((message), ##__VA_ARGS__)
#define VERA_LOG_WARN(message, ...) ::vera::observability::LogWarn((message), ##__VA_ARGS__)
#define VERA_LOG_ERROR(message, ...) ::vera::observability::LogError((message), ##__VA_ARGS__)
