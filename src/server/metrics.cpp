#include <bookland/server/metrics.hpp>

#include <drogon/drogon.h>

#include <iomanip>
#include <sstream>

namespace bookland::server {

namespace {

// Sink histograms carry microseconds (bookland.convert.latency_us)
const std::vector<double> kMicrosBuckets = {
    1, 2, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000, 100000};

// HTTP latency is recorded in milliseconds
const std::vector<double> kMillisBuckets = {
    0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

void WriteHistogram(std::ostringstream& out,
                    const std::string& name,
                    const std::vector<double>& bounds,
                    const std::vector<uint64_t>& buckets,
                    double sum,
                    uint64_t count) {
  out << "# TYPE " << name << " histogram\n";
  for (size_t i = 0; i < bounds.size(); ++i) {
    out << name << "_bucket{le=\"" << bounds[i] << "\"} "
        << buckets[i] << "\n";
  }
  out << name << "_bucket{le=\"+Inf\"} " << buckets.back() << "\n";
  out << name << "_sum " << sum << "\n";
  out << name << "_count " << count << "\n";
}

}  // namespace

// --- PrometheusMetrics ---

std::string PrometheusMetrics::ExportName(std::string_view name) {
  std::string out(name);
  for (char& c : out) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '_' || c == ':';
    if (!ok) c = '_';
  }
  if (!out.empty() && out[0] >= '0' && out[0] <= '9') out.insert(out.begin(), '_');
  return out;
}

void PrometheusMetrics::Observe(HistogramData* h, const std::vector<double>& bounds,
                                double value) {
  if (h->buckets.empty()) {
    h->buckets.resize(bounds.size() + 1, 0);
  }
  size_t bucket = bounds.size();  // +Inf
  for (size_t i = 0; i < bounds.size(); ++i) {
    if (value <= bounds[i]) {
      bucket = i;
      break;
    }
  }
  for (size_t i = bucket; i < h->buckets.size(); ++i) {
    h->buckets[i]++;
  }
  h->count++;
  h->sum += value;
}

void PrometheusMetrics::Counter(std::string_view name, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_[ExportName(name)] += delta;
}

void PrometheusMetrics::Histogram(std::string_view name, uint64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  Observe(&histograms_[ExportName(name)], kMicrosBuckets, static_cast<double>(value));
}

void PrometheusMetrics::Gauge(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  gauges_[ExportName(name)] = value;
}

void PrometheusMetrics::RecordHttpRequest(const std::string& method,
                                          const std::string& path,
                                          int status_code,
                                          double latency_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  http_requests_[std::make_tuple(method, path, status_code)]++;
  Observe(&http_latency_, kMillisBuckets, latency_ms);
}

std::string PrometheusMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;
  out << std::fixed << std::setprecision(6);

  for (const auto& [name, value] : counters_) {
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
  }

  for (const auto& [name, value] : gauges_) {
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << value << "\n";
  }

  for (const auto& [name, data] : histograms_) {
    WriteHistogram(out, name, kMicrosBuckets, data.buckets, data.sum, data.count);
  }

  if (!http_requests_.empty()) {
    out << "# TYPE bookland_http_requests_total counter\n";
    for (const auto& [key, count] : http_requests_) {
      out << "bookland_http_requests_total{method=\"" << std::get<0>(key)
          << "\",path=\"" << std::get<1>(key) << "\",status=\"" << std::get<2>(key)
          << "\"} " << count << "\n";
    }
  }

  if (http_latency_.count > 0) {
    WriteHistogram(out, "bookland_http_request_duration_ms", kMillisBuckets,
                   http_latency_.buckets, http_latency_.sum, http_latency_.count);
  }

  return out.str();
}

// --- Metrics Handler Registration ---

void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            UpcCatalog* catalog,
                            const std::string& path) {
  drogon::app().registerHandler(
      path,
      [metrics, catalog](const drogon::HttpRequestPtr& req,
                         std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        (void)req;
        if (catalog && catalog->IsOpen()) {
          uint64_t products = 0;
          auto status = catalog->CountProducts(&products);
          if (status.ok()) {
            metrics->Gauge("bookland.catalog.products", static_cast<double>(products));
          } else {
            LOG_WARN << "Catalog product count failed: " << status.ToString();
          }
        }

        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(metrics->Export());
        resp->setContentTypeString("text/plain; version=0.0.4; charset=utf-8");
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

// --- RequestTimer ---

RequestTimer::RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
                           std::string method,
                           std::string path)
    : metrics_(std::move(metrics)),
      method_(std::move(method)),
      path_(std::move(path)),
      start_(std::chrono::steady_clock::now()) {}

RequestTimer::~RequestTimer() {
  if (metrics_) {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_);
    metrics_->RecordHttpRequest(method_, path_, status_code_,
                                static_cast<double>(elapsed.count()) / 1000.0);
  }
}

}  // namespace bookland::server
