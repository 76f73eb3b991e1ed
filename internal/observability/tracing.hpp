#pragma once

#include <memory>
#include <string_view>

namespace booking::runtime::config {
class ObservabilityConfig;
}

namespace booking::observability {

// Installs the OTLP span exporter when tracing_enabled is set.
bool InitializeTracing(const runtime::config::ObservabilityConfig& config);
void ShutdownTracing();

/*
  Span covering one engine operation; becomes the active span for the
  lifetime of the scope. Does nothing unless tracing is initialized.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  // Marks the span failed.
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const runtime::config::ObservabilityConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace booking::observability
