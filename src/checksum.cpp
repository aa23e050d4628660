#include <bookland/checksum.hpp>

#include <bookland/digits.hpp>
#include <bookland/errors.hpp>

#include <string>

namespace bookland {

namespace {

constexpr size_t kIsbn10DataDigits = 9;
constexpr size_t kIsbn13DataDigits = 12;

void RequireLength(std::string_view code, size_t n) {
  if (code.size() != n) {
    throw LengthError("need " + std::to_string(n) + " digits - got " +
                      std::to_string(code.size()));
  }
}

}  // namespace

char Isbn10Checksum(std::string_view data9) {
  RequireLength(data9, kIsbn10DataDigits);
  // Digit 0 is outside the window but must still be a digit.
  if (!IsAllDigits(data9)) {
    throw FormatError("invalid digit in " + std::string(data9));
  }

  // Digits 1..8 carry weights 9..2.
  int sum = 0;
  int weight = 9;
  for (size_t i = 1; i < kIsbn10DataDigits; ++i) {
    sum += DigitValue(data9[i]) * weight;
    --weight;
  }

  const int checksum = 11 - (sum % 11);
  if (checksum == 10) return 'X';
  if (checksum == 11) return '0';
  return static_cast<char>('0' + checksum);
}

bool Isbn10Verify(std::string_view isbn10) {
  RequireLength(isbn10, kIsbn10DataDigits + 1);

  const char expected = Isbn10Checksum(isbn10.substr(0, kIsbn10DataDigits));
  const int actual = DigitValue(isbn10[kIsbn10DataDigits],
                                DigitContext::kIsbn10CheckDigit);
  return DigitValue(expected, DigitContext::kIsbn10CheckDigit) == actual;
}

char Isbn13Checksum(std::string_view data12) {
  RequireLength(data12, kIsbn13DataDigits);

  int odd_sum = 0;
  int even_sum = 0;
  size_t position = 1;
  for (size_t i = kIsbn13DataDigits; i-- > 0; ++position) {
    const int digit = DigitValue(data12[i]);
    if (position % 2 == 0) {
      even_sum += digit;
    } else {
      odd_sum += digit;
    }
  }

  const int total = odd_sum * 3 + even_sum;
  const int checksum = (10 - total % 10) % 10;
  return static_cast<char>('0' + checksum);
}

bool Isbn13Verify(std::string_view isbn13) {
  RequireLength(isbn13, kIsbn13DataDigits + 1);

  const char expected = Isbn13Checksum(isbn13.substr(0, kIsbn13DataDigits));
  return DigitValue(isbn13[kIsbn13DataDigits]) == expected - '0';
}

}  // namespace bookland
