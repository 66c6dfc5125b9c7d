#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace registry::service {

namespace detail {

inline double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

inline void RecordOutcome(std::string_view route, bool success, std::chrono::steady_clock::time_point started_at) {
  registry::observability::Metrics::Instance().RecordRequest(route, success);
  registry::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
}

} // namespace detail

/*
  Wraps one service call in a span and request metrics.

  Registry errors are expected outcomes and log at WARN with their kind;
  anything else is logged at ERROR. The exception is always rethrown for the
  transport layer to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& caller, Fn&& fn) {
  registry::observability::SpanScope span(route);
  span.SetAttribute("registry.caller", caller);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      detail::RecordOutcome(route, true, started_at);
      return;
    } else {
      auto result = fn();
      detail::RecordOutcome(route, true, started_at);
      return result;
    }
  } catch (const registry::util::RegistryError& ex) {
    span.RecordException(ex.what());
    REGISTRY_LOG_WARN("RPC rejected", {registry::observability::StringField("route", route), registry::observability::StringField("caller", caller),
                                       registry::observability::StringField("kind", registry::util::KindName(ex.Kind())),
                                       registry::observability::StringField("error", ex.what())});
    detail::RecordOutcome(route, false, started_at);
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    REGISTRY_LOG_ERROR("RPC failed", {registry::observability::StringField("route", route), registry::observability::StringField("caller", caller),
                                      registry::observability::StringField("error", ex.what())});
    detail::RecordOutcome(route, false, started_at);
    throw;
  }
}

} // namespace registry::service
