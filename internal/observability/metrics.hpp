#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace freight::runtime::config {
class RuntimeConfig;
}

namespace freight::observability {

/*
  OTLP metrics export.

  Built only with ENABLE_OTEL; otherwise every call below is an inline no-op
  so call sites never need their own #ifdef.
*/

bool InitializeMetrics(const freight::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // outcome: "matched", "relisted", "cancelled"
  void RecordAuctionClose(std::string_view trigger, std::string_view outcome);
  void RecordBid(bool accepted);
  void RecordExecutionOutcome(std::string_view outcome);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const freight::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordAuctionClose(std::string_view, std::string_view) {
}

inline void Metrics::RecordBid(bool) {
}

inline void Metrics::RecordExecutionOutcome(std::string_view) {
}
#endif

} // namespace freight::observability
