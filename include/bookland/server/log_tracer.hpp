#pragma once

#include <bookland/observability.hpp>

#include <memory>
#include <string_view>

namespace bookland::server {

/**
 * Tracer that writes each finished span as one debug line to the Drogon
 * (trantor) log:
 *
 *   span bookland.ConvertTo13 outcome=ok input_length=13 route=isbn13 ... events=[...]
 *
 * Spans are cheap when the log level is above debug: nothing is formatted.
 */
class LogTracer : public Tracer {
 public:
  std::unique_ptr<TraceSpan> StartSpan(std::string_view name) override;
};

}  // namespace bookland::server
