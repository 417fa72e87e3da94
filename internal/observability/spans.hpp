#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace vera::runtime::config {
class RuntimeConfig;
}

namespace vera::observability {

/*
  Tracing and metrics

  Both export over OTLP when the server is built with ENABLE_OTEL and the
  observability section of the configuration turns them on. Without
  ENABLE_OTEL every call below compiles to nothing.
*/

bool InitializeTracing(const vera::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const vera::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// One span per emulated API call or admin RPC. Ends when the scope does.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Metrics

  vera.request.count      requests by service, action and error code
                          (empty code on success)
  vera.request.latency_ms end-to-end latency by service and action
  vera.resource.changes   creates and deletes by resource type; cascaded
                          deletes are counted per resource
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view service, std::string_view action, std::string_view error_code);
  void ObserveRequestLatencyMs(std::string_view service, std::string_view action, double latency_ms);
  void RecordResourceChange(std::string_view resource_type, std::string_view change);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const vera::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const vera::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, std::string_view, std::string_view) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, std::string_view, double) {
}

inline void Metrics::RecordResourceChange(std::string_view, std::string_view) {
}
#endif

} // namespace vera::observability
