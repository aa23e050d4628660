#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

namespace bookland {

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., calls, checksum mismatches). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values. Default implementation does nothing. */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/** A trace span interface (very small surface area). */
struct TraceSpan {
  virtual ~TraceSpan() = default;

  virtual void SetAttribute(std::string_view key, uint64_t value) = 0;
  virtual void SetAttribute(std::string_view key, std::string_view value) = 0;
  virtual void AddEvent(std::string_view name) = 0;

  /** Must be called exactly once to finish the span.
   *  outcome is a low-cardinality name such as "ok" or "format_error". */
  virtual void End(std::string_view outcome) = 0;
};

/** A tracer creates spans. If unset, tracing is disabled. */
struct Tracer {
  virtual ~Tracer() = default;
  virtual std::unique_ptr<TraceSpan> StartSpan(std::string_view name) = 0;
};

namespace internal {

// Monotonic timestamp helper for metrics/tracing (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

inline void EmitCounter(MetricsSink* metrics, std::string_view name, uint64_t delta = 1) {
  if (metrics) metrics->Counter(name, delta);
}

inline void EmitHistogram(MetricsSink* metrics, std::string_view name, uint64_t value) {
  if (metrics) metrics->Histogram(name, value);
}

inline void SpanAttr(TraceSpan* span, std::string_view key, uint64_t value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanAttr(TraceSpan* span, std::string_view key, std::string_view value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanEvent(TraceSpan* span, std::string_view name) {
  if (span) span->AddEvent(name);
}

}  // namespace internal
}  // namespace bookland
