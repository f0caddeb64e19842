#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace freight::service {

// Records request count and latency per route; failures are logged and rethrown.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_id, Fn&& fn) {
  auto& metrics    = freight::observability::Metrics::Instance();
  auto  started_at = std::chrono::steady_clock::now();
  auto  elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    FREIGHT_LOG_ERROR("RPC failed", {freight::observability::StringField("route", route), freight::observability::StringField("error", ex.what()),
                                     freight::observability::StringField("subject_id", subject_id)});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace freight::service
