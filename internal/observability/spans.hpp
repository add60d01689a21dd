#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace taskorch::runtime::config {
class RuntimeConfig;
}

namespace taskorch::observability {

bool InitializeTracing(const taskorch::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const taskorch::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  SpanScope

  One span for the lifetime of the scope, made current for nested
  scopes. Fields of the thread's LogContext (worker_id, task_id) are
  copied onto the span when it starts, so traces and log lines carry
  the same keys.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // claimed=false counts empty polls
  void RecordClaim(std::string_view shard, bool claimed);
  void RecordRecovery(std::string_view worker_status);
  void RecordBreakerTrip(std::string_view capability);
  void RecordSpend(std::string_view capability, double amount);
  // once per session, when the verdict is reached
  void RecordConsensus(std::string_view result);
  // threshold is "rate" or "daily"
  void RecordKillSwitch(std::string_view threshold);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const taskorch::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const taskorch::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
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

inline void Metrics::RecordClaim(std::string_view, bool) {
}

inline void Metrics::RecordRecovery(std::string_view) {
}

inline void Metrics::RecordBreakerTrip(std::string_view) {
}

inline void Metrics::RecordSpend(std::string_view, double) {
}

inline void Metrics::RecordConsensus(std::string_view) {
}

inline void Metrics::RecordKillSwitch(std::string_view) {
}
#endif

} // namespace taskorch::observability
