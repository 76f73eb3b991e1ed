#include "internal/observability/otlp_export.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace booking::observability {

ExportTarget ResolveExportTarget(const runtime::config::ObservabilityConfig& config, Signal signal) {
  ExportTarget target;
  target.http = config.transport() == runtime::config::OTLP_TRANSPORT_HTTP;
  if (config.export_interval_ms() > 0) target.interval = std::chrono::milliseconds(config.export_interval_ms());
  if (config.export_timeout_ms() > 0) target.timeout = std::chrono::milliseconds(config.export_timeout_ms());

  const bool  traces     = signal == Signal::kTraces;
  const char* signal_env = traces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = config.otlp_endpoint();
  } else if (const char* env = std::getenv(signal_env)) {
    target.endpoint = env;
  } else if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = env;
  } else if (target.http) {
    target.endpoint = traces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    target.endpoint = "localhost:4317";
  }
  return target;
}

opentelemetry::sdk::resource::Resource ServiceResource() {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", "booking-engine"}, {"service.version", "0.1.0"}};
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace booking::observability
