#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace vera::observability {
namespace {

constexpr const char* kLoggerName     = "vera";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_include_trace_context{false};
std::atomic<bool> g_access_log{false};

thread_local std::string t_request_id;

std::string FromEnv(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) return value;
  return configured.empty() ? fallback : configured;
}

// Values with spaces, quotes or '=' are quoted so lines stay splittable.
void AppendField(std::string& line, std::string_view key, const std::string& value) {
  line.push_back(' ');
  line.append(key);
  line.push_back('=');
  if (!value.empty() && value.find_first_of(" \t\"=") == std::string::npos) {
    line.append(value);
    return;
  }
  std::ostringstream quoted;
  quoted << std::quoted(value);
  line.append(quoted.str());
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) return;

  const auto context = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent())->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(line, "trace_id", HexId(trace_bytes, 16));
  AppendField(line, "span_id", HexId(span_bytes, 8));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  return {std::string(key), out.str()};
}

void InitializeLogging(const vera::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::get(kLoggerName);
  if (!logger) logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(FromEnv("VERA_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(FromEnv("VERA_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  const auto trace_context = FromEnv("VERA_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "", "false");
  g_include_trace_context  = trace_context == "1" || trace_context == "true";
  g_access_log             = logging.access_log();
}

void ShutdownLogging() {
  spdlog::shutdown();
}

bool AccessLogEnabled() {
  return g_access_log.load(std::memory_order_relaxed);
}

RequestLogScope::RequestLogScope(std::string request_id) : previous_(std::move(t_request_id)) {
  t_request_id = std::move(request_id);
}

RequestLogScope::~RequestLogScope() {
  t_request_id = std::move(previous_);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  // No default logger once ShutdownLogging has run.
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) return;

  std::string line(message);
  bool        has_request_id = false;
  for (const auto& field : fields) {
    AppendField(line, field.key, field.value);
    has_request_id = has_request_id || field.key == "request_id";
  }
  if (!has_request_id && !t_request_id.empty()) {
    AppendField(line, "request_id", t_request_id);
  }
  AppendTraceContext(line);
  logger->log(level, "{}", line);
}

} // namespace vera::observability
