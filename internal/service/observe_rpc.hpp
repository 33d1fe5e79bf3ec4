#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace tablebook::service {

/*
  Wraps one RPC with a span, request metrics and failure logging.
  Exceptions are rethrown unchanged for the transport to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view restaurant_id, Fn&& fn) {
  tablebook::observability::SpanScope span(route);
  if (!restaurant_id.empty()) {
    span.SetAttribute("restaurant.id", restaurant_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      tablebook::observability::Metrics::Instance().RecordRequest(route, true);
      tablebook::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      tablebook::observability::Metrics::Instance().RecordRequest(route, true);
      tablebook::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const tablebook::util::BookingError& ex) {
    span.RecordException(ex.what());
    // rejections log at warn, storage failures at error
    if (ex.kind() == tablebook::util::ErrorKind::kStorage) {
      TABLEBOOK_LOG_ERROR("RPC failed", {tablebook::observability::StringField("route", route),
                                         tablebook::observability::StringField("error", ex.what())});
    } else {
      TABLEBOOK_LOG_WARN("RPC rejected", {tablebook::observability::StringField("route", route),
                                          tablebook::observability::StringField("kind", tablebook::util::ToString(ex.kind())),
                                          tablebook::observability::StringField("error", ex.what())});
    }
    tablebook::observability::Metrics::Instance().RecordRequest(route, false);
    tablebook::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    TABLEBOOK_LOG_ERROR("RPC failed", {tablebook::observability::StringField("route", route),
                                       tablebook::observability::StringField("error", ex.what())});
    tablebook::observability::Metrics::Instance().RecordRequest(route, false);
    tablebook::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace tablebook::service
