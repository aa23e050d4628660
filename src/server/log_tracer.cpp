#include <bookland/server/log_tracer.hpp>

#include <trantor/utils/Logger.h>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace bookland::server {

namespace {

bool DebugEnabled() {
  return trantor::Logger::logLevel() <= trantor::Logger::kDebug;
}

class LogSpan : public TraceSpan {
 public:
  explicit LogSpan(std::string_view name)
      : name_(name), enabled_(DebugEnabled()), start_us_(internal::NowMicros()) {}

  void SetAttribute(std::string_view key, uint64_t value) override {
    if (enabled_) attrs_.emplace_back(std::string(key), std::to_string(value));
  }

  void SetAttribute(std::string_view key, std::string_view value) override {
    if (enabled_) attrs_.emplace_back(std::string(key), std::string(value));
  }

  void AddEvent(std::string_view name) override {
    if (enabled_) events_.emplace_back(name);
  }

  void End(std::string_view outcome) override {
    if (!enabled_) return;

    std::ostringstream line;
    line << "span " << name_ << " outcome=" << outcome;
    for (const auto& [key, value] : attrs_) {
      line << " " << key << "=" << value;
    }
    if (!events_.empty()) {
      line << " events=[";
      for (size_t i = 0; i < events_.size(); ++i) {
        if (i) line << ",";
        line << events_[i];
      }
      line << "]";
    }
    line << " span_us=" << (internal::NowMicros() - start_us_);
    LOG_DEBUG << line.str();
  }

 private:
  std::string name_;
  bool enabled_;
  uint64_t start_us_;
  std::vector<std::pair<std::string, std::string>> attrs_;
  std::vector<std::string> events_;
};

}  // namespace

std::unique_ptr<TraceSpan> LogTracer::StartSpan(std::string_view name) {
  return std::make_unique<LogSpan>(name);
}

}  // namespace bookland::server
