#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace tierbridge::service {

/*
  Wraps one RPC body in a span, request metrics and failure logging.
  Exceptions are rethrown for the gRPC adapter to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view source_id, Fn&& fn) {
  tierbridge::observability::SpanScope span(route);
  if (!source_id.empty()) {
    span.SetAttribute("source.id", source_id);
  }

  auto& metrics    = tierbridge::observability::Metrics::Instance();
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

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
    span.RecordException(ex.what());
    TIERBRIDGE_LOG_ERROR("RPC failed", {tierbridge::observability::StringField("route", route),
                                        tierbridge::observability::StringField("error", ex.what()),
                                        tierbridge::observability::StringField("source_id", source_id)});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace tierbridge::service
