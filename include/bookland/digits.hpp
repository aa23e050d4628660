#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace bookland {

/** EAN "Bookland" prefix carried by every ISBN-13 this library produces. */
inline constexpr std::string_view kBooklandPrefix = "978";

/** Where a character is being parsed. Only the ISBN-10 check position
 *  accepts the literal 'X' (value 10). */
enum class DigitContext {
  kData,
  kIsbn10CheckDigit
};

/**
 * Remove a leading "978" if present; anything else is returned unchanged.
 * The match is anchored at position 0.
 */
std::string StripBooklandPrefix(std::string_view code);

/** True if code starts with the Bookland prefix. */
bool HasBooklandPrefix(std::string_view code);

/**
 * First n characters of code.
 * @throws LengthError if code is shorter than n.
 */
std::string TruncateTo(std::string_view code, size_t n);

/**
 * Numeric value of a single character.
 * @return 0..9, or 10 for 'X' in DigitContext::kIsbn10CheckDigit.
 * @throws FormatError for any other character.
 */
int DigitValue(char ch, DigitContext context = DigitContext::kData);

bool IsAllDigits(std::string_view code);

// Exactly 10 / 13 ASCII digits.
bool IsIsbn10Shaped(std::string_view code);
bool IsIsbn13Shaped(std::string_view code);

}  // namespace bookland
