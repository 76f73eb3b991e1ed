#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace booking::runtime::config {
class ObservabilityConfig;
}

namespace booking::observability {

// Installs the periodic OTLP metric reader when metrics_enabled is set.
bool InitializeMetrics(const runtime::config::ObservabilityConfig& config);
void ShutdownMetrics();

/*
  Engine instruments, keyed by operation name:
    booking.request.count       counter, success attribute
    booking.request.latency_ms  histogram
    booking.slots.returned      histogram, per Search
    booking.write.conflicts     counter, writes refused by the overlap check
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view operation, bool success);
  void ObserveRequestLatencyMs(std::string_view operation, double latency_ms);
  void ObserveSlotsReturned(std::string_view operation, std::uint64_t count);
  void RecordWriteConflict(std::string_view operation);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const runtime::config::ObservabilityConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveSlotsReturned(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordWriteConflict(std::string_view) {
}
#endif

} // namespace booking::observability
