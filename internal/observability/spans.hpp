#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace collab::runtime::config {
class RuntimeConfig;
}

namespace collab::observability {

// Install the OTLP exporter described by config.observability(). Return false
// when the signal is disabled there.
bool InitializeTracing(const collab::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const collab::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Span around one RPC or one graph operation (apply, rebuild, path search,
  trend refresh). Ends on destruction.

  Inline no-op unless built with ENABLE_OTEL, and a no-op span until
  InitializeTracing has installed a provider.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  // ids and counts: work_id, max_depth, rows, pairs
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

// Background work whose duration is tracked.
enum class PopulationOp {
  kApply,
  kRebuild,
  kTrendRefresh,
};

class Metrics {
 public:
  static Metrics& Instance();

  // route is "CollaborationGraphService.<Method>"
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void ObservePopulationDurationMs(PopulationOp op, double duration_ms);
  void RecordPathLookup(bool cache_hit);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const collab::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const collab::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObservePopulationDurationMs(PopulationOp, double) {
}

inline void Metrics::RecordPathLookup(bool) {
}
#endif

} // namespace collab::observability
