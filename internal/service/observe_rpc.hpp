#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace taskorch::service {

// Span, request metrics and failure logging around one RPC body.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view task_id, Fn&& fn) {
  taskorch::observability::SpanScope span(route);
  if (!task_id.empty()) {
    span.SetAttribute("task.id", task_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    taskorch::observability::Metrics::Instance().RecordRequest(route, success);
    taskorch::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    TASKORCH_LOG_ERROR("RPC failed", {taskorch::observability::StringField("route", route),
                                      taskorch::observability::StringField("error", ex.what()),
                                      taskorch::observability::StringField("task_id", task_id)});
    finish(false);
    throw;
  }
}

} // namespace taskorch::service
