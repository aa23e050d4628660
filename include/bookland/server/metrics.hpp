#pragma once

#include <bookland/catalog.hpp>
#include <bookland/observability.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

namespace bookland::server {

/**
 * Prometheus-compatible metrics sink.
 *
 * Collects the bookland.* counters, histograms and gauges emitted by the
 * dispatcher and the catalog, plus per-route HTTP request metrics, and
 * exports them in Prometheus text exposition format. Dotted names are
 * exported with underscores (bookland.convert.calls -> bookland_convert_calls).
 */
class PrometheusMetrics : public MetricsSink {
 public:
  PrometheusMetrics() = default;

  // MetricsSink interface
  void Counter(std::string_view name, uint64_t delta) override;
  void Histogram(std::string_view name, uint64_t value) override;
  void Gauge(std::string_view name, double value) override;

  /**
   * Generate Prometheus text format output.
   */
  std::string Export() const;

  /**
   * Record an HTTP request metric. path should be the route pattern, not the
   * concrete URL, to keep label cardinality bounded.
   */
  void RecordHttpRequest(const std::string& method,
                         const std::string& path,
                         int status_code,
                         double latency_ms);

  /** Prometheus metric name for a dotted sink name. */
  static std::string ExportName(std::string_view name);

 private:
  struct HistogramData {
    std::vector<uint64_t> buckets;  // cumulative, last entry is +Inf
    uint64_t count = 0;
    double sum = 0.0;
  };

  static void Observe(HistogramData* h, const std::vector<double>& bounds, double value);

  mutable std::mutex mu_;

  // Ordered so the exposition output is stable
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, HistogramData> histograms_;
  std::map<std::string, double> gauges_;

  // (method, path, status) -> count
  std::map<std::tuple<std::string, std::string, int>, uint64_t> http_requests_;
  HistogramData http_latency_;
};

/**
 * Register the metrics endpoint with the Drogon app. If catalog is non-null,
 * a product-count gauge is refreshed on every scrape.
 */
void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            UpcCatalog* catalog,
                            const std::string& path = "/metrics");

/**
 * RAII helper for timing HTTP requests.
 */
class RequestTimer {
 public:
  RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
               std::string method,
               std::string path);

  ~RequestTimer();

  void SetStatusCode(int code) { status_code_ = code; }

 private:
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::string method_;
  std::string path_;
  int status_code_ = 200;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace bookland::server
