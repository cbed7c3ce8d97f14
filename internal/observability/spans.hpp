#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace settle::runtime::config {
class RuntimeConfig;
}

namespace settle::observability {

// Both return false when the signal is disabled in config or compiled out.
bool InitializeTracing(const settle::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const settle::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Figures of one preview or execute run. Attached to the request span and
  exported as metrics tagged with use_case and mode.
*/
struct RunSample {
  std::string_view use_case;
  bool             committed          = false; // execute; preview persists nothing
  std::int64_t     batch_id           = 0;
  std::uint64_t    events_considered  = 0;
  std::uint64_t    unpriced_events    = 0;
  std::uint64_t    lines              = 0;
  std::uint64_t    transfers          = 0;
  double           netting_efficiency = 0.0;
  double           suppressed_eur     = 0.0;
};

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
  void RecordRun(const RunSample& run);
  // error_class is one of the ErrorClass names, e.g. "caller_error".
  void RecordError(std::string_view error_class, std::string_view message);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // outcome is "ok" or an ErrorClass name.
  void RecordRequest(std::string_view route, std::string_view outcome, double latency_ms);
  void ObserveRun(const RunSample& run);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const settle::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const settle::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::RecordRun(const RunSample&) {
}

inline void SpanScope::RecordError(std::string_view, std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, std::string_view, double) {
}

inline void Metrics::ObserveRun(const RunSample&) {
}
#endif

} // namespace settle::observability
