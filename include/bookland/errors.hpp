#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace bookland {

/** Error kinds reported by the engine.
 *  kUnsupported and kUnknownLength are non-fatal at the dispatcher level:
 *  they produce a result without a value rather than an exception.
 */
enum class ErrorCode {
  kOk,
  kLength,         // Fixed-width input has the wrong length
  kFormat,         // Prefix precondition violated or non-digit character
  kNotFound,       // UPC resolved to zero products
  kAmbiguous,      // UPC resolved to more than one distinct product
  kUnsupported,    // Recognized length with no conversion available
  kUnknownLength,  // Length matches no known encoding
  kResolver        // The UPC collaborator itself failed
};

// Low-cardinality name for traces, metrics and wire responses.
inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kLength: return "length_error";
    case ErrorCode::kFormat: return "format_error";
    case ErrorCode::kNotFound: return "not_found";
    case ErrorCode::kAmbiguous: return "ambiguous";
    case ErrorCode::kUnsupported: return "unsupported";
    case ErrorCode::kUnknownLength: return "unknown_length";
    case ErrorCode::kResolver: return "resolver_error";
  }
  return "other";
}

/** Base class of every exception thrown by the engine. */
class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

class LengthError : public Error {
 public:
  explicit LengthError(const std::string& message)
      : Error(ErrorCode::kLength, message) {}
};

class FormatError : public Error {
 public:
  explicit FormatError(const std::string& message)
      : Error(ErrorCode::kFormat, message) {}
};

class NotFoundError : public Error {
 public:
  explicit NotFoundError(const std::string& message)
      : Error(ErrorCode::kNotFound, message) {}
};

class AmbiguousError : public Error {
 public:
  explicit AmbiguousError(const std::string& message)
      : Error(ErrorCode::kAmbiguous, message) {}
};

}  // namespace bookland
