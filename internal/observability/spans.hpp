#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace storykb::runtime::config {
class RuntimeConfig;
}

namespace storykb::observability {

// Both return false when the signal is disabled in the config; OTLP
// export is plaintext.
bool InitializeTracing(const storykb::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const storykb::runtime::config::RuntimeConfig& config);
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
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments.

  outcome: committed | rolled_back | partially_committed | conflict
  phase:   prepare | commit | rollback
  result:  converged | superseded | failed | unrepairable
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordTransactionOutcome(std::string_view outcome);
  void ObservePhaseLatencyMs(std::string_view phase, double latency_ms);
  void RecordReconciliation(std::string_view result);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const storykb::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const storykb::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordTransactionOutcome(std::string_view) {
}

inline void Metrics::ObservePhaseLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordReconciliation(std::string_view) {
}
#endif

} // namespace storykb::observability
