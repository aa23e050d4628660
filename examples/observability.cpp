// Scan-station demo: a UPC catalog and the dispatcher share one metrics sink
// and one tracer. Every scan prints a one-line span; a summary with latency
// percentiles follows.
//
// Usage: bookland_example_observability [catalog_dir] [code...]

#include <bookland/catalog.hpp>
#include <bookland/convert.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr const char* kDemoUpc = "01234567890512345";

// Keeps raw histogram samples so the summary can report percentiles.
class SampleMetrics final : public bookland::MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lk(mu_);
    counters_[std::string(name)] += delta;
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lk(mu_);
    samples_[std::string(name)].push_back(value);
  }

  void Report(std::ostream& os) const {
    std::lock_guard<std::mutex> lk(mu_);
    os << "\ncounters:\n";
    for (const auto& [name, value] : counters_) {
      os << "  " << name << " " << value << "\n";
    }
    os << "latency:\n";
    for (const auto& [name, values] : samples_) {
      std::vector<uint64_t> sorted = values;
      std::sort(sorted.begin(), sorted.end());
      os << "  " << name << " n=" << sorted.size() << " p50=" << Percentile(sorted, 50)
         << " p99=" << Percentile(sorted, 99) << "\n";
    }
  }

 private:
  static uint64_t Percentile(const std::vector<uint64_t>& sorted, size_t p) {
    if (sorted.empty()) return 0;
    return sorted[(sorted.size() - 1) * p / 100];
  }

  mutable std::mutex mu_;
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, std::vector<uint64_t>> samples_;
};

// One line per span: "name outcome key=value ... [event event]".
class LineSpan final : public bookland::TraceSpan {
 public:
  explicit LineSpan(std::string_view name) { line_ << name; }

  void SetAttribute(std::string_view key, uint64_t value) override {
    line_ << " " << key << "=" << value;
  }

  void SetAttribute(std::string_view key, std::string_view value) override {
    line_ << " " << key << "=" << value;
  }

  void AddEvent(std::string_view name) override { events_ += " " + std::string(name); }

  void End(std::string_view outcome) override {
    std::cout << "[" << outcome << "] " << line_.str();
    if (!events_.empty()) std::cout << " [" << events_.substr(1) << "]";
    std::cout << "\n";
  }

 private:
  std::ostringstream line_;
  std::string events_;
};

class LineTracer final : public bookland::Tracer {
 public:
  std::unique_ptr<bookland::TraceSpan> StartSpan(std::string_view name) override {
    return std::make_unique<LineSpan>(name);
  }
};

}  // namespace

int main(int argc, char** argv) {
  const std::string catalog_dir = argc > 1 ? argv[1] : "./bookland_catalog";

  std::vector<std::string> scans;
  for (int i = 2; i < argc; ++i) scans.emplace_back(argv[i]);
  if (scans.empty()) {
    scans = {"9781595828057", "16001088571999", "9781595828050", kDemoUpc,
             "978159582805751299", "0843610727", "12345"};
  }

  auto metrics = std::make_shared<SampleMetrics>();
  auto tracer = std::make_shared<LineTracer>();

  bookland::CatalogOptions catalog_opt;
  catalog_opt.metrics = metrics;
  catalog_opt.tracer = tracer;

  std::unique_ptr<bookland::UpcCatalog> catalog;
  auto s = bookland::UpcCatalog::Open(catalog_dir, &catalog, catalog_opt);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  s = catalog->PutProduct("p1", "9781600108853");
  if (s.ok()) s = catalog->LinkUpc(kDemoUpc, "p1");
  if (!s.ok()) {
    std::cerr << "Catalog setup failed: " << s.ToString() << "\n";
    return 1;
  }

  bookland::ConvertOptions opt;
  opt.resolver = std::move(catalog);
  opt.metrics = metrics;
  opt.tracer = tracer;

  for (const auto& scan : scans) {
    auto r = bookland::ConvertTo13(scan, opt);
    std::cout << "  " << scan << " -> "
              << (r.has_value() ? r.isbn13() : "(" + r.message() + ")") << "\n";
  }

  metrics->Report(std::cout);
  return 0;
}
