#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace apparatus::runtime::config {
class RuntimeConfig;
}

namespace apparatus::observability {

/*
  OTLP traces and metrics for builds and the gate.

  Compiled in with ENABLE_OTEL. Without it every call below is an inline
  no-op, so call sites never check the build flag.
*/

// false when the config leaves the signal off.
bool InitializeTracing(const apparatus::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const apparatus::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span around one public operation.
class SpanScope {
 public:
  SpanScope(std::string_view operation, std::string_view subject);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void Fail(std::string_view message);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordOperation(std::string_view operation, bool success, double latency_ms);

  void RecordUnitsCreated(std::uint64_t count);
  // Supports a build found already present and did not write again.
  void RecordSupportsDeduplicated(std::uint64_t count);
  // cause is "conflict" or "not_found"
  void RecordRetry(std::string_view cause);
  void RecordLocationFailure(std::string_view kind);

  // From the unit's creation to its acknowledgement.
  void RecordAcknowledgementLatencyMs(std::string_view significance, double latency_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const apparatus::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const apparatus::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view, std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::Fail(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, bool, double) {
}

inline void Metrics::RecordUnitsCreated(std::uint64_t) {
}

inline void Metrics::RecordSupportsDeduplicated(std::uint64_t) {
}

inline void Metrics::RecordRetry(std::string_view) {
}

inline void Metrics::RecordLocationFailure(std::string_view) {
}

inline void Metrics::RecordAcknowledgementLatencyMs(std::string_view, double) {
}
#endif

} // namespace apparatus::observability
