#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <opentelemetry/sdk/resource/resource.h>

namespace booking::runtime::config {
class ObservabilityConfig;
}

namespace booking::observability {

enum class Signal { kTraces, kMetrics };

// Where and how one signal is exported.
struct ExportTarget {
  std::string               endpoint;
  bool                      http = false;
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds timeout{500};
};

// The configured endpoint wins, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// then OTEL_EXPORTER_OTLP_ENDPOINT, then the collector's local default.
ExportTarget ResolveExportTarget(const runtime::config::ObservabilityConfig& config, Signal signal);

opentelemetry::sdk::resource::Resource ServiceResource();

} // namespace booking::observability
