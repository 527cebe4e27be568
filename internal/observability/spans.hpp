#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace unison::runtime::config {
class RuntimeConfig;
}

namespace unison::observability {

// OTLP exporters are configured from RuntimeConfig.observability; an empty
// endpoint falls back to the standard OTEL_EXPORTER_OTLP_* variables.
bool InitializeTracing(const unison::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const unison::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

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

/*
  Queue counters, labelled by queue name.

    unison.queue.enqueued
    unison.queue.outcome            outcome=completed|retried|dead_lettered
    unison.queue.handler.duration_ms
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordEnqueued(std::string_view queue);
  void RecordOutcome(std::string_view queue, std::string_view outcome);
  void ObserveHandlerDurationMs(std::string_view queue, double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const unison::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const unison::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordEnqueued(std::string_view) {
}

inline void Metrics::RecordOutcome(std::string_view, std::string_view) {
}

inline void Metrics::ObserveHandlerDurationMs(std::string_view, double) {
}
#endif

} // namespace unison::observability
