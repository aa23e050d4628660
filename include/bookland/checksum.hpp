#pragma once

#include <string_view>

namespace bookland {

/**
 * ISBN-10 check digit (mod 11).
 *
 * Takes the 9 data digits of an ISBN-10. The weighted sum covers data
 * digits 1..8 with weights 9 down to 2; digit 0 does not contribute. This
 * windowing differs from the textbook ISBN-10 formula (weights 10..2 over
 * digits 0..8) and is kept so that existing canonical data still verifies.
 *
 *   checksum = 11 - (sum mod 11);  10 -> 'X', 11 -> '0'
 *
 * @param data9 Exactly 9 characters.
 * @return '0'..'9' or 'X'.
 * @throws LengthError if data9 is not 9 characters.
 * @throws FormatError on a non-digit character.
 */
char Isbn10Checksum(std::string_view data9);

/**
 * True iff the 10th character equals Isbn10Checksum() of the first 9.
 * @throws LengthError if isbn10 is not 10 characters.
 * @throws FormatError on a non-digit data character or bad check symbol.
 */
bool Isbn10Verify(std::string_view isbn10);

/**
 * ISBN-13 / EAN-13 check digit (mod 10).
 *
 * Positions are counted right to left starting at 1 (odd). Odd-position
 * digits are weighted 3, even-position digits 1.
 *
 * @param data12 Exactly 12 characters.
 * @return '0'..'9'.
 * @throws LengthError if data12 is not 12 characters.
 * @throws FormatError on a non-digit character.
 */
char Isbn13Checksum(std::string_view data12);

/**
 * True iff the 13th character equals Isbn13Checksum() of the first 12.
 * @throws LengthError if isbn13 is not 13 characters.
 * @throws FormatError on a non-digit character (including 'X').
 */
bool Isbn13Verify(std::string_view isbn13);

}  // namespace bookland
