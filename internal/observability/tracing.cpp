#include "internal/observability/tracing.hpp"

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>

#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_export.hpp"

namespace booking::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider> g_provider;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const ExportTarget& target) {
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url     = target.endpoint;
    options.timeout = target.timeout;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint = target.endpoint;
  options.timeout  = target.timeout;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const runtime::config::ObservabilityConfig& config) {
  ShutdownTracing();
  if (!config.tracing_enabled()) return false;

  const auto target = ResolveExportTarget(config, Signal::kTraces);

  sdktrace::BatchSpanProcessorOptions batching;
  batching.schedule_delay_millis = target.interval;
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(target), batching);

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), ServiceResource()));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  return true;
}

void ShutdownTracing() {
  if (!g_provider) return;
  g_provider->ForceFlush();
  g_provider->Shutdown();
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(new trace_api::NoopTracerProvider()));
  g_provider.reset();
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

SpanScope::SpanScope(std::string_view name) {
  auto tracer = trace_api::Provider::GetTracerProvider()->GetTracer("booking-engine");
  impl_       = std::make_unique<Impl>(tracer->StartSpan(std::string(name)));
}

SpanScope::~SpanScope() {
  impl_->span->End();
}

void SpanScope::RecordException(std::string_view description) {
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace booking::observability
