#include <bookland/convert.hpp>

#include <bookland/checksum.hpp>
#include <bookland/digits.hpp>

namespace bookland {

namespace {

constexpr size_t kIsbn10Length = 10;
constexpr size_t kIsbn13Length = 13;
constexpr size_t kIsbn14Length = 14;
constexpr size_t kUpc17Length = 17;
constexpr size_t kEan18Length = 18;

void RequireLength(std::string_view code, size_t n) {
  if (code.size() != n) {
    throw LengthError("need " + std::to_string(n) + " digits - got " +
                      std::to_string(code.size()));
  }
}

ConversionRoute RouteForLength(size_t length) {
  switch (length) {
    case kIsbn10Length: return ConversionRoute::kIsbn10;
    case kIsbn13Length: return ConversionRoute::kIsbn13;
    case kIsbn14Length: return ConversionRoute::kIsbn14;
    case kUpc17Length: return ConversionRoute::kUpc17;
    case kEan18Length: return ConversionRoute::kEan18;
    default: return ConversionRoute::kUnknown;
  }
}

// Advisory check. An unreadable code counts as a mismatch.
bool CheckIsbn13(const std::string& isbn13, TraceSpan* span) {
  bool good = false;
  try {
    good = Isbn13Verify(isbn13);
  } catch (const Error&) {
    internal::SpanEvent(span, "checksum_unreadable");
    good = false;
  }
  internal::SpanAttr(span, "checksum", good ? "good" : "bad");
  return good;
}

}  // namespace

std::string Convert10To13(std::string_view isbn10) {
  RequireLength(isbn10, kIsbn10Length);
  std::string isbn = std::string(kBooklandPrefix) + std::string(isbn10);
  isbn[kIsbn13Length - 1] = Isbn13Checksum(std::string_view(isbn).substr(0, kIsbn13Length - 1));
  return isbn;
}

std::string Convert14To13(std::string_view code) {
  if (HasBooklandPrefix(code)) {
    throw FormatError("unexpected prefix " + std::string(kBooklandPrefix) + " in " +
                      std::string(code));
  }
  RequireLength(code, kIsbn14Length);
  return Convert10To13(TruncateTo(code, kIsbn10Length));
}

std::string Convert18To13(std::string_view code) {
  if (!HasBooklandPrefix(code)) {
    throw FormatError("expected prefix " + std::string(kBooklandPrefix) + " in " +
                      std::string(code));
  }
  RequireLength(code, kEan18Length);
  return TruncateTo(code, kIsbn13Length);
}

std::optional<std::string> ScannedToIsbn13(std::string_view scanned) {
  if (scanned.empty()) return std::nullopt;
  std::string code(scanned);
  if (!HasBooklandPrefix(code)) {
    code.insert(0, kBooklandPrefix);
  }
  if (code.size() > kIsbn13Length) code.resize(kIsbn13Length);
  return code;
}

std::optional<std::string> ScannedToIsbn10(std::string_view scanned) {
  if (scanned.empty()) return std::nullopt;
  std::string code = StripBooklandPrefix(scanned);
  if (code.size() > kIsbn10Length) code.resize(kIsbn10Length);
  return code;
}

std::string_view ConversionRouteName(ConversionRoute route) {
  switch (route) {
    case ConversionRoute::kIsbn10: return "isbn10";
    case ConversionRoute::kIsbn13: return "isbn13";
    case ConversionRoute::kIsbn14: return "isbn14";
    case ConversionRoute::kUpc17: return "upc17";
    case ConversionRoute::kEan18: return "ean18";
    case ConversionRoute::kUnknown: return "unknown";
  }
  return "unknown";
}

// --- ConversionResult ---

ConversionResult ConversionResult::Converted(std::string isbn13, bool checksum_valid,
                                             ConversionRoute route) {
  ConversionResult r;
  r.kind_ = ConversionKind::kConverted;
  r.isbn13_ = std::move(isbn13);
  r.checksum_valid_ = checksum_valid;
  r.route_ = route;
  return r;
}

ConversionResult ConversionResult::Unsupported(std::string message,
                                               ConversionRoute route) {
  ConversionResult r;
  r.kind_ = ConversionKind::kUnsupported;
  r.error_ = ErrorCode::kUnsupported;
  r.message_ = std::move(message);
  r.route_ = route;
  return r;
}

ConversionResult ConversionResult::Failed(ErrorCode code, std::string message,
                                          ConversionRoute route) {
  ConversionResult r;
  r.kind_ = ConversionKind::kFailed;
  r.error_ = code;
  r.message_ = std::move(message);
  r.route_ = route;
  return r;
}

std::optional<std::string> ConversionResult::value() const {
  if (!has_value()) return std::nullopt;
  return isbn13_;
}

// --- Dispatcher ---

ConversionResult ConvertTo13(std::string_view input, const ConvertOptions& opt) {
  MetricsSink* metrics = opt.metrics.get();
  internal::EmitCounter(metrics, "bookland.convert.calls", 1);

  const uint64_t op_start_us = internal::NowMicros();
  std::unique_ptr<TraceSpan> span;
  if (opt.tracer) span = opt.tracer->StartSpan("bookland.ConvertTo13");

  std::string code;
  code.reserve(input.size());
  for (char c : input) {
    if (c != '\n') code.push_back(c);
  }

  const ConversionRoute route = RouteForLength(code.size());
  internal::SpanAttr(span.get(), "input_length", static_cast<uint64_t>(code.size()));
  internal::SpanAttr(span.get(), "route", ConversionRouteName(route));

  auto finish = [&](ConversionResult r) -> ConversionResult {
    const uint64_t dur_us = internal::NowMicros() - op_start_us;
    internal::EmitHistogram(metrics, "bookland.convert.latency_us", dur_us);

    switch (r.kind()) {
      case ConversionKind::kConverted:
        internal::EmitCounter(metrics, "bookland.convert.converted_total", 1);
        if (!r.checksum_valid()) {
          internal::EmitCounter(metrics, "bookland.convert.checksum_mismatch_total", 1);
        }
        break;
      case ConversionKind::kUnsupported:
        internal::EmitCounter(metrics, "bookland.convert.unsupported_total", 1);
        break;
      case ConversionKind::kFailed:
        internal::EmitCounter(metrics, "bookland.convert.failed_total", 1);
        break;
    }

    if (span) {
      internal::SpanAttr(span.get(), "latency_us", dur_us);
      internal::SpanAttr(span.get(), "outcome", ErrorCodeName(r.error()));
      if (r.has_value()) {
        internal::SpanAttr(span.get(), "isbn13", r.isbn13());
      } else {
        internal::SpanAttr(span.get(), "checksum", "unchecked");
      }
      span->End(ErrorCodeName(r.error()));
    }
    return r;
  };

  try {
    switch (route) {
      case ConversionRoute::kIsbn10:
        return finish(ConversionResult::Unsupported("size 10 -> not supported", route));

      case ConversionRoute::kIsbn13: {
        const bool good = CheckIsbn13(code, span.get());
        return finish(ConversionResult::Converted(code, good, route));
      }

      case ConversionRoute::kIsbn14: {
        std::string out = Convert14To13(code);
        internal::SpanEvent(span.get(), "price_dropped");
        const bool good = CheckIsbn13(out, span.get());
        return finish(ConversionResult::Converted(std::move(out), good, route));
      }

      case ConversionRoute::kUpc17: {
        if (!opt.resolver) {
          return finish(ConversionResult::Unsupported(
              "size 17 -> no UPC resolver configured", route));
        }
        internal::SpanEvent(span.get(), "upc_lookup");
        LookupResult lookup = opt.resolver->Lookup(code);
        if (!lookup.success) {
          return finish(ConversionResult::Failed(
              ErrorCode::kResolver, "UPC lookup failed: " + lookup.error_message, route));
        }
        internal::SpanAttr(span.get(), "upc_matches",
                           static_cast<uint64_t>(lookup.records.size()));
        std::string out = SelectUniqueIsbn(lookup.records, code);
        const bool good = CheckIsbn13(out, span.get());
        return finish(ConversionResult::Converted(std::move(out), good, route));
      }

      case ConversionRoute::kEan18: {
        std::string out = Convert18To13(code);
        internal::SpanEvent(span.get(), "supplement_dropped");
        const bool good = CheckIsbn13(out, span.get());
        return finish(ConversionResult::Converted(std::move(out), good, route));
      }

      case ConversionRoute::kUnknown:
        break;
    }
  } catch (const Error& e) {
    return finish(ConversionResult::Failed(e.code(), e.what(), route));
  }

  return finish(ConversionResult::Failed(
      ErrorCode::kUnknownLength,
      "unknown size " + std::to_string(code.size()) + " for " + code, route));
}

}  // namespace bookland
