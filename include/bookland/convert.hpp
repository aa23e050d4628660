#pragma once

#include <bookland/errors.hpp>
#include <bookland/observability.hpp>
#include <bookland/resolver.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace bookland {

/** Syntactically valid ISBN-13 used as a stand-in for unknown items. */
inline constexpr std::string_view kPlaceholderIsbn13 = "9739999999996";

inline bool IsPlaceholderIsbn13(std::string_view code) {
  return code == kPlaceholderIsbn13;
}

// ---------------------------------------------------------------------------
// Fixed-width conversions (throw on malformed input)
// ---------------------------------------------------------------------------

/**
 * ISBN-10 -> ISBN-13: prepend "978" and recompute the check digit.
 * The ISBN-10 check digit is dropped, not carried over.
 * @throws LengthError if isbn10 is not 10 characters.
 */
std::string Convert10To13(std::string_view isbn10);

/**
 * 14-character scan (ISBN-10 + 4-digit price) -> ISBN-13.
 *
 *   scans as:         16001088571999
 *   should read:  978 1600108853  // (5) 1999
 *
 * @throws FormatError if the code already starts with "978".
 * @throws LengthError if the code is not 14 characters.
 */
std::string Convert14To13(std::string_view code);

/**
 * 18-character scan (ISBN-13 + EAN-5 price) -> ISBN-13.
 * @throws FormatError unless the code starts with "978".
 * @throws LengthError if the code is not 18 characters.
 */
std::string Convert18To13(std::string_view code);

// Best-effort helpers: no validation beyond emptiness.
std::optional<std::string> ScannedToIsbn13(std::string_view scanned);
std::optional<std::string> ScannedToIsbn10(std::string_view scanned);

// ---------------------------------------------------------------------------
// Top-level dispatcher
// ---------------------------------------------------------------------------

enum class ConversionKind {
  kConverted,
  kUnsupported,
  kFailed
};

/** Which encoding the dispatcher recognized from the input length. */
enum class ConversionRoute {
  kIsbn10,   // 10: ISBN-10 (not converted)
  kIsbn13,   // 13: already canonical
  kIsbn14,   // 14: ISBN-10 + price/currency
  kUpc17,    // 17: UPC-12 + supplement, needs a resolver
  kEan18,    // 18: ISBN-13 + EAN-5
  kUnknown
};

std::string_view ConversionRouteName(ConversionRoute route);

/**
 * Tagged result of ConvertTo13().
 *
 * Converted results carry the ISBN-13 and an advisory checksum flag.
 * Unsupported and Failed results carry an ErrorCode and a message.
 */
class ConversionResult {
 public:
  static ConversionResult Converted(std::string isbn13, bool checksum_valid,
                                    ConversionRoute route);
  static ConversionResult Unsupported(std::string message, ConversionRoute route);
  static ConversionResult Failed(ErrorCode code, std::string message,
                                 ConversionRoute route);

  ConversionKind kind() const { return kind_; }
  bool has_value() const { return kind_ == ConversionKind::kConverted; }

  /** Empty unless has_value(). */
  const std::string& isbn13() const { return isbn13_; }
  std::optional<std::string> value() const;

  /** Advisory: a mismatch never blocks conversion. */
  bool checksum_valid() const { return checksum_valid_; }

  /** kOk for converted results. */
  ErrorCode error() const { return error_; }
  const std::string& message() const { return message_; }
  ConversionRoute route() const { return route_; }

 private:
  ConversionResult() = default;

  ConversionKind kind_ = ConversionKind::kFailed;
  std::string isbn13_;
  bool checksum_valid_ = false;
  ErrorCode error_ = ErrorCode::kOk;
  std::string message_;
  ConversionRoute route_ = ConversionRoute::kUnknown;
};

/** Per-call collaborators for ConvertTo13(). All optional. */
struct ConvertOptions {
  // Consulted for 17-character inputs; without one they are unsupported.
  std::shared_ptr<const UpcResolver> resolver;

  // Observability hooks. If set, each call emits bookland.convert.* metrics
  // and one "bookland.ConvertTo13" span.
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Tracer> tracer;
};

/**
 * Normalize any supported encoding to ISBN-13.
 *
 * Embedded '\n' characters are removed, then the input is dispatched on its
 * length. Never throws for malformed input: errors come back as
 * ConversionKind::kFailed.
 */
ConversionResult ConvertTo13(std::string_view input,
                             const ConvertOptions& opt = ConvertOptions{});

}  // namespace bookland
