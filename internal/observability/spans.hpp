#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace blockforge::runtime::config {
class RuntimeConfig;
}

namespace blockforge::observability {

/*
  Tracing and metrics facade.

  Built with ENABLE_OTEL the calls go to the OpenTelemetry SDK and are
  exported over OTLP. Without it every call below is an inline no-op so
  the lifecycle code can instrument unconditionally.
*/

bool InitializeTracing(const blockforge::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const blockforge::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

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

  // outcome is "success" or an ExecutionFailure kind name.
  void ObserveExecutionDurationMs(std::string_view outcome, double duration_ms);

  // trigger is "manual" or "auto".
  void RecordHealAttempt(std::string_view trigger, bool success);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const blockforge::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const blockforge::runtime::config::RuntimeConfig&) {
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

inline void Metrics::ObserveExecutionDurationMs(std::string_view, double) {
}

inline void Metrics::RecordHealAttempt(std::string_view, bool) {
}
#endif

} // namespace blockforge::observability
