// Unit tests for bookland/checksum.hpp
// Tests: ISBN-10 mod-11 and ISBN-13 mod-10 check digits, verification

#include <gtest/gtest.h>

#include <bookland/checksum.hpp>
#include <bookland/convert.hpp>
#include <bookland/errors.hpp>

#include <random>
#include <string>

namespace bookland {
namespace {

// =============================================================================
// ISBN-10 Tests
// =============================================================================

class Isbn10Test : public ::testing::Test {};

TEST_F(Isbn10Test, KnownVector) {
  // Digits 1..8 = 8,4,3,6,1,0,7,2 with weights 9..2: sum 191, 11 - 4 = 7
  EXPECT_EQ(Isbn10Checksum("084361072"), '7');
}

TEST_F(Isbn10Test, LeadingDigitDoesNotContribute) {
  EXPECT_EQ(Isbn10Checksum("084361072"), Isbn10Checksum("984361072"));
  EXPECT_EQ(Isbn10Checksum("000000000"), Isbn10Checksum("500000000"));
}

TEST_F(Isbn10Test, TenBecomesX) {
  // 6 * 2 = 12, 12 mod 11 = 1, 11 - 1 = 10
  EXPECT_EQ(Isbn10Checksum("000000006"), 'X');
}

TEST_F(Isbn10Test, ElevenCollapsesToZero) {
  EXPECT_EQ(Isbn10Checksum("000000000"), '0');
  // 9*1 + 2*1 = 11 -> 11 - 0 = 11 -> '0'
  EXPECT_EQ(Isbn10Checksum("010000001"), '0');
}

TEST_F(Isbn10Test, WrongLengthThrows) {
  EXPECT_THROW(Isbn10Checksum("08436107"), LengthError);
  EXPECT_THROW(Isbn10Checksum("0843610727"), LengthError);
  EXPECT_THROW(Isbn10Checksum(""), LengthError);
}

TEST_F(Isbn10Test, NonDigitThrows) {
  EXPECT_THROW(Isbn10Checksum("08436107X"), FormatError);
  // Position 0 is excluded from the sum but must still be a digit
  EXPECT_THROW(Isbn10Checksum("A84361072"), FormatError);
}

TEST_F(Isbn10Test, Verify) {
  EXPECT_TRUE(Isbn10Verify("0843610727"));
  EXPECT_FALSE(Isbn10Verify("0843610728"));
}

TEST_F(Isbn10Test, VerifyXCheckDigit) {
  EXPECT_TRUE(Isbn10Verify("000000006X"));
  EXPECT_FALSE(Isbn10Verify("0000000060"));
  EXPECT_FALSE(Isbn10Verify("000000000X"));
}

TEST_F(Isbn10Test, VerifyRejectsBadInput) {
  EXPECT_THROW(Isbn10Verify("084361072"), LengthError);
  EXPECT_THROW(Isbn10Verify("08436107277"), LengthError);
  EXPECT_THROW(Isbn10Verify("084361072?"), FormatError);
  EXPECT_THROW(Isbn10Verify("0843X10727"), FormatError);
}

// =============================================================================
// ISBN-13 Tests
// =============================================================================

class Isbn13Test : public ::testing::Test {};

TEST_F(Isbn13Test, KnownVectors) {
  EXPECT_EQ(Isbn13Checksum("978159582805"), '7');
  EXPECT_EQ(Isbn13Checksum("978160010885"), '3');
  EXPECT_EQ(Isbn13Checksum("978084361072"), '7');
}

TEST_F(Isbn13Test, TotalMultipleOfTenGivesZero) {
  EXPECT_EQ(Isbn13Checksum("000000000000"), '0');
  // Placeholder used for unknown items
  EXPECT_EQ(Isbn13Checksum("973999999999"), '6');
}

TEST_F(Isbn13Test, RightmostDataDigitWeightedThree) {
  // 1 at position 1 -> total 3 -> 7
  EXPECT_EQ(Isbn13Checksum("000000000001"), '7');
  // 1 at position 2 -> total 1 -> 9
  EXPECT_EQ(Isbn13Checksum("000000000010"), '9');
}

TEST_F(Isbn13Test, WrongLengthThrows) {
  EXPECT_THROW(Isbn13Checksum("97815958280"), LengthError);
  EXPECT_THROW(Isbn13Checksum("9781595828057"), LengthError);
}

TEST_F(Isbn13Test, NonDigitThrows) {
  EXPECT_THROW(Isbn13Checksum("97815958280X"), FormatError);
}

TEST_F(Isbn13Test, Verify) {
  EXPECT_TRUE(Isbn13Verify("9781595828057"));
  EXPECT_TRUE(Isbn13Verify("9781600108853"));
  EXPECT_FALSE(Isbn13Verify("9781595828050"));
  EXPECT_FALSE(Isbn13Verify("9781600108854"));
}

TEST_F(Isbn13Test, VerifyRejectsWrongCheckDigit) {
  // Both compute check digit 5
  EXPECT_FALSE(Isbn13Verify("9781595828097"));
  EXPECT_FALSE(Isbn13Verify("9781595829958"));
  EXPECT_TRUE(Isbn13Verify("9781595828095"));
}

TEST_F(Isbn13Test, XIsNeverValid) {
  EXPECT_THROW(Isbn13Verify("978159582805X"), FormatError);
}

TEST_F(Isbn13Test, VerifyWrongLengthThrows) {
  EXPECT_THROW(Isbn13Verify("978159582805"), LengthError);
  EXPECT_THROW(Isbn13Verify("97815958280571"), LengthError);
}

// =============================================================================
// Randomized Sweep
// =============================================================================

class ChecksumSweepTest : public ::testing::Test {
 protected:
  std::string RandomDigits(size_t n) {
    std::uniform_int_distribution<int> digit(0, 9);
    std::string out(n, '0');
    for (char& c : out) c = static_cast<char>('0' + digit(gen_));
    return out;
  }

  std::mt19937 gen_{20240611};
};

TEST_F(ChecksumSweepTest, CheckDigitsStayInRange) {
  for (int i = 0; i < 20000; ++i) {
    const char c10 = Isbn10Checksum(RandomDigits(9));
    EXPECT_TRUE((c10 >= '0' && c10 <= '9') || c10 == 'X') << c10;

    const char c13 = Isbn13Checksum(RandomDigits(12));
    EXPECT_TRUE(c13 >= '0' && c13 <= '9') << c13;
  }
}

TEST_F(ChecksumSweepTest, ConvertedIsbn10AlwaysVerifies) {
  for (int i = 0; i < 20000; ++i) {
    const std::string data = RandomDigits(9);
    const std::string isbn10 = data + Isbn10Checksum(data);
    ASSERT_TRUE(Isbn10Verify(isbn10)) << isbn10;

    const std::string isbn13 = Convert10To13(isbn10);
    EXPECT_TRUE(Isbn13Verify(isbn13)) << isbn10 << " -> " << isbn13;
  }
}

}  // namespace
}  // namespace bookland
