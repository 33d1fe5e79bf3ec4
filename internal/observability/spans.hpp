#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace tablebook::runtime::config {
class RuntimeConfig;
}

namespace tablebook::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"tablebook"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

#ifdef ENABLE_OTEL
// Exporter settings from RuntimeConfig.observability, falling back to OTEL_* env vars.
OtlpConfig ToOtlpConfig(const tablebook::runtime::config::RuntimeConfig& config);
#endif

// Both return false when disabled in config or built without ENABLE_OTEL.
bool InitializeTracing(const tablebook::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const tablebook::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span, active for the current thread until destroyed.
  Spans cover RPCs, booking mutations and lock acquisition.
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

  // Time spent waiting for a booking lock, whatever the outcome.
  void ObserveLockWaitMs(double wait_ms);
  // outcome: acquired | busy | cancelled | retried | failed
  void RecordLockOutcome(std::string_view outcome);
  // outcome: created | modified | cancelled | conflict | override_required | overridden
  void RecordBookingOutcome(std::string_view outcome);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const tablebook::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const tablebook::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveLockWaitMs(double) {
}

inline void Metrics::RecordLockOutcome(std::string_view) {
}

inline void Metrics::RecordBookingOutcome(std::string_view) {
}
#endif

} // namespace tablebook::observability
