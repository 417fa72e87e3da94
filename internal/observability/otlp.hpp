#pragma once

#ifdef ENABLE_OTEL

#include <string>
#include <string_view>

#include <opentelemetry/sdk/resource/resource.h>

namespace vera::runtime::config {
class RuntimeConfig;
}

namespace vera::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpTarget {
  std::string endpoint;
  bool        http = false;
};

// Endpoint precedence: configuration, then the per-signal and generic
// OTEL_EXPORTER_OTLP_* variables, then the collector's local default.
OtlpTarget ResolveOtlpTarget(const vera::runtime::config::RuntimeConfig& config, OtlpSignal signal);

// service.* plus the emulated cloud.region and cloud.account.id.
opentelemetry::sdk::resource::Resource EmulatorResource(const vera::runtime::config::RuntimeConfig& config);

constexpr std::string_view kInstrumentationName    = "vera";
constexpr std::string_view kInstrumentationVersion = "0.1.0";

} // namespace vera::observability

#endif
