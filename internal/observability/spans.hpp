#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace vkyc::config {
class RuntimeConfig;
}

namespace vkyc::observability {

bool InitializeTracing(const vkyc::config::RuntimeConfig& config);
bool InitializeMetrics(const vkyc::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Active span for the lifetime of the object. Spans opened on behalf of a
  session carry vkyc.session_id so one call's work can be found by session.
  Without ENABLE_OTEL every member is a no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  SpanScope(std::string_view name, std::string_view session_id);
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
  void RecordSessionTransition(std::string_view state, std::string_view reason);
  void RecordBiometricDropped(std::uint64_t count);
  void RecordRegistryUnavailable(std::string_view document_type);
  void RecordRecordingFailure(std::string_view phase);
  void ObserveExternalCallMs(std::string_view capability, double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const vkyc::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const vkyc::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::SpanScope(std::string_view, std::string_view) {
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

inline void Metrics::RecordSessionTransition(std::string_view, std::string_view) {
}

inline void Metrics::RecordBiometricDropped(std::uint64_t) {
}

inline void Metrics::RecordRegistryUnavailable(std::string_view) {
}

inline void Metrics::RecordRecordingFailure(std::string_view) {
}

inline void Metrics::ObserveExternalCallMs(std::string_view, double) {
}
#endif

} // namespace vkyc::observability
