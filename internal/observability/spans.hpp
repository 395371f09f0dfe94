#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace transcription::runtime::config {
class RuntimeConfig;
}

namespace transcription::observability {

/*
  Tracing and metrics facade.

  Built without ENABLE_OTEL every call below is an inline no-op, so call
  sites never need their own #ifdefs.
*/

// false when the signal is disabled in config
bool InitializeTracing(const transcription::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const transcription::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// RAII span, active for the lifetime of the object
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
  void ObserveProviderLatencyMs(std::string_view provider, bool success, double latency_ms);
  // how a submission was satisfied: created, cached or in_progress
  void RecordSubmission(std::string_view disposition);
  void RecordJobOutcome(std::string_view provider, std::string_view status);
  void SetQueueDepth(std::uint64_t depth);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const transcription::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const transcription::runtime::config::RuntimeConfig&) {
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

inline void Metrics::ObserveProviderLatencyMs(std::string_view, bool, double) {
}

inline void Metrics::RecordSubmission(std::string_view) {
}

inline void Metrics::RecordJobOutcome(std::string_view, std::string_view) {
}

inline void Metrics::SetQueueDepth(std::uint64_t) {
}
#endif

} // namespace transcription::observability
