#include "internal/observability/metrics.hpp"

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/noop.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>

#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_export.hpp"

namespace booking::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const ExportTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url     = target.endpoint;
    options.timeout = target.timeout;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint = target.endpoint;
  options.timeout  = target.timeout;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const runtime::config::ObservabilityConfig& config) {
  ShutdownMetrics();
  if (!config.metrics_enabled()) return false;

  const auto target = ResolveExportTarget(config, Signal::kMetrics);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = target.interval;
  reader_options.export_timeout_millis  = target.timeout;

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), ServiceResource());
  g_provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(target), reader_options));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) return;
  g_provider->ForceFlush();
  g_provider->Shutdown();
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(new metrics_api::NoopMeterProvider()));
  g_provider.reset();
}

// Instruments bind to whichever provider is installed on first use, so
// InitializeMetrics must run before the first recorded operation.
struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter>                    meter;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>>   requests;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>        latency_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<std::uint64_t>> slots;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>>   conflicts;
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter      = metrics_api::Provider::GetMeterProvider()->GetMeter("booking-engine", "0.1.0");
  impl_->requests   = impl_->meter->CreateUInt64Counter("booking.request.count", "Engine operations", "1");
  impl_->latency_ms = impl_->meter->CreateDoubleHistogram("booking.request.latency_ms", "Engine operation latency", "ms");
  impl_->slots      = impl_->meter->CreateUInt64Histogram("booking.slots.returned", "Slots returned per search", "1");
  impl_->conflicts  = impl_->meter->CreateUInt64Counter("booking.write.conflicts", "Writes refused by the overlap check", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view operation, bool success) {
  impl_->requests->Add(1, {{"operation", std::string(operation)}, {"success", success}}, opentelemetry::context::Context{});
}

void Metrics::ObserveRequestLatencyMs(std::string_view operation, double latency_ms) {
  impl_->latency_ms->Record(latency_ms, {{"operation", std::string(operation)}}, opentelemetry::context::Context{});
}

void Metrics::ObserveSlotsReturned(std::string_view operation, std::uint64_t count) {
  impl_->slots->Record(count, {{"operation", std::string(operation)}}, opentelemetry::context::Context{});
}

void Metrics::RecordWriteConflict(std::string_view operation) {
  impl_->conflicts->Add(1, {{"operation", std::string(operation)}}, opentelemetry::context::Context{});
}

} // namespace booking::observability
