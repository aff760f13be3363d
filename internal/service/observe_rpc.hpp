#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"

namespace slideshow::service {

/*
  Span + request metrics + error log around one RPC body.
  Exceptions are logged and rethrown unchanged.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, int64_t project_id, Fn&& fn) {
  slideshow::observability::Span span(route);
  if (project_id != 0) {
    span.SetProject(project_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&started_at] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      slideshow::observability::Metrics::Instance().RecordRpc(route, true, elapsed_ms());
      return;
    } else {
      auto result = fn();
      slideshow::observability::Metrics::Instance().RecordRpc(route, true, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordError("rpc_error", ex.what());
    SLIDESHOW_LOG_ERROR("RPC failed", {slideshow::observability::StringField("route", route),
                                       slideshow::observability::StringField("error", ex.what()),
                                       slideshow::observability::ProjectField(project_id)});
    slideshow::observability::Metrics::Instance().RecordRpc(route, false, elapsed_ms());
    throw;
  }
}

} // namespace slideshow::service
