#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>

#include "config/config.pb.h"

namespace vera::observability {

namespace resource = opentelemetry::sdk::resource;

OtlpTarget ResolveOtlpTarget(const vera::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpTarget target;
  target.http = observability.transport() == vera::runtime::config::OTLP_TRANSPORT_HTTP;

  const char* signal_variable = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (!observability.otlp_endpoint().empty()) {
    target.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(signal_variable)) {
    target.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = endpoint;
  } else if (target.http) {
    target.endpoint = signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    target.endpoint = "localhost:4317";
  }
  return target;
}

resource::Resource EmulatorResource(const vera::runtime::config::RuntimeConfig& config) {
  resource::ResourceAttributes attributes = {
      {"service.name", std::string(kInstrumentationName)},
      {"service.version", std::string(kInstrumentationVersion)},
      {"cloud.region", config.emulator().region()},
      {"cloud.account.id", config.emulator().account_id()},
  };
  return resource::Resource::Create(attributes);
}

} // namespace vera::observability

#endif
