#include <bookland/digits.hpp>
#include <bookland/errors.hpp>

namespace bookland {

bool HasBooklandPrefix(std::string_view code) {
  return code.size() >= kBooklandPrefix.size() &&
         code.compare(0, kBooklandPrefix.size(), kBooklandPrefix) == 0;
}

std::string StripBooklandPrefix(std::string_view code) {
  if (HasBooklandPrefix(code)) {
    code.remove_prefix(kBooklandPrefix.size());
  }
  return std::string(code);
}

std::string TruncateTo(std::string_view code, size_t n) {
  if (code.size() < n) {
    throw LengthError("need at least " + std::to_string(n) + " characters - got " +
                      std::to_string(code.size()));
  }
  return std::string(code.substr(0, n));
}

int DigitValue(char ch, DigitContext context) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch == 'X' && context == DigitContext::kIsbn10CheckDigit) return 10;
  throw FormatError(std::string("invalid digit '") + ch + "'");
}

bool IsAllDigits(std::string_view code) {
  for (char c : code) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

bool IsIsbn10Shaped(std::string_view code) {
  return code.size() == 10 && IsAllDigits(code);
}

bool IsIsbn13Shaped(std::string_view code) {
  return code.size() == 13 && IsAllDigits(code);
}

}  // namespace bookland
