#pragma once

#include <bookland/observability.hpp>
#include <bookland/resolver.hpp>

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bookland::testing {

// =============================================================================
// Recording Metrics Sink
// =============================================================================

/**
 * Metrics sink that keeps every emission for later assertions.
 */
class RecordingMetrics : public MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[std::string(name)] += delta;
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    histograms_[std::string(name)].push_back(value);
  }

  void Gauge(std::string_view name, double value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[std::string(name)] = value;
  }

  uint64_t CounterValue(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
  }

  size_t HistogramCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(name);
    return it == histograms_.end() ? 0 : it->second.size();
  }

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, uint64_t> counters_;
  std::unordered_map<std::string, std::vector<uint64_t>> histograms_;
  std::unordered_map<std::string, double> gauges_;
};

// =============================================================================
// Recording Tracer
// =============================================================================

/** Everything a finished span reported. */
struct SpanRecord {
  std::string name;
  std::map<std::string, std::string> attributes;
  std::vector<std::string> events;
  std::string outcome;
  bool ended = false;
};

/**
 * Tracer that stores finished spans in order.
 */
class RecordingTracer : public Tracer {
 public:
  std::unique_ptr<TraceSpan> StartSpan(std::string_view name) override {
    return std::make_unique<Span>(this, name);
  }

  std::vector<SpanRecord> Spans() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_;
  }

  size_t SpanCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_.size();
  }

 private:
  class Span : public TraceSpan {
   public:
    Span(RecordingTracer* owner, std::string_view name) : owner_(owner) {
      record_.name = std::string(name);
    }

    void SetAttribute(std::string_view key, uint64_t value) override {
      record_.attributes[std::string(key)] = std::to_string(value);
    }

    void SetAttribute(std::string_view key, std::string_view value) override {
      record_.attributes[std::string(key)] = std::string(value);
    }

    void AddEvent(std::string_view name) override {
      record_.events.emplace_back(name);
    }

    void End(std::string_view outcome) override {
      record_.outcome = std::string(outcome);
      record_.ended = true;
      owner_->Record(record_);
    }

   private:
    RecordingTracer* owner_;
    SpanRecord record_;
  };

  void Record(const SpanRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.push_back(record);
  }

  mutable std::mutex mutex_;
  std::vector<SpanRecord> spans_;
};

// =============================================================================
// Fake UPC Resolver
// =============================================================================

/**
 * In-memory UpcResolver. Unknown UPCs resolve to an empty, successful lookup.
 */
class FakeResolver : public UpcResolver {
 public:
  LookupResult Lookup(std::string_view upc) const override {
    calls_.fetch_add(1);
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_) {
      LookupResult failed;
      failed.error_message = failure_message_;
      return failed;
    }
    LookupResult result;
    result.success = true;
    auto it = records_.find(std::string(upc));
    if (it != records_.end()) result.records = it->second;
    return result;
  }

  void Add(const std::string& upc, std::string isbn, bool superseded = false) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = records_[upc];
    ProductRecord record;
    record.product_id = "p" + std::to_string(list.size() + 1);
    record.isbn_number = std::move(isbn);
    record.superseded = superseded;
    list.push_back(std::move(record));
  }

  // Make every lookup report failure with message.
  void FailWith(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ = true;
    failure_message_ = std::move(message);
  }

  uint64_t Calls() const { return calls_.load(); }

 private:
  mutable std::mutex mutex_;
  mutable std::atomic<uint64_t> calls_{0};
  std::unordered_map<std::string, std::vector<ProductRecord>> records_;
  bool failing_ = false;
  std::string failure_message_;
};

// =============================================================================
// Temporary Directory
// =============================================================================

/** Unique directory under the system temp path, removed on destruction. */
class TempDir {
 public:
  explicit TempDir(const std::string& stem = "bookland_test_") {
    std::mt19937 gen(std::random_device{}());
    path_ = std::filesystem::temp_directory_path() / (stem + std::to_string(gen() % 1000000));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  std::filesystem::path path() const { return path_; }
  std::string string() const { return path_.string(); }

 private:
  std::filesystem::path path_;
};

// =============================================================================
// Cross-thread Results
// =============================================================================

/**
 * Counts outcomes from worker threads. gtest assertions are only reliable on
 * the main thread, so workers record here and the test asserts afterwards.
 * The first failure message is kept for the assertion output.
 */
class TestResultCollector {
 public:
  void RecordSuccess() { successes_.fetch_add(1); }

  void RecordFailure(const std::string& message) {
    if (failures_.fetch_add(1) == 0) {
      std::lock_guard<std::mutex> lock(mutex_);
      first_failure_ = message;
    }
  }

  uint64_t SuccessCount() const { return successes_.load(); }
  uint64_t FailureCount() const { return failures_.load(); }
  bool AllSucceeded() const { return FailureCount() == 0; }

  std::string FirstFailure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return first_failure_;
  }

 private:
  std::atomic<uint64_t> successes_{0};
  std::atomic<uint64_t> failures_{0};
  mutable std::mutex mutex_;
  std::string first_failure_;
};

#define BOOKLAND_CHECK_AND_RECORD(collector, condition, fail_msg) \
  do {                                                             \
    if (condition) {                                               \
      (collector).RecordSuccess();                                 \
    } else {                                                       \
      (collector).RecordFailure(fail_msg);                         \
    }                                                              \
  } while (0)

}  // namespace bookland::testing
