// Unit tests for bookland/resolver.hpp and bookland/errors.hpp
// Tests: UPC match selection, error codes and exception hierarchy

#include <gtest/gtest.h>

#include <bookland/errors.hpp>
#include <bookland/resolver.hpp>

#include <string>
#include <vector>

namespace bookland {
namespace {

ProductRecord Record(std::string id, std::string isbn, bool superseded = false) {
  ProductRecord r;
  r.product_id = std::move(id);
  r.isbn_number = std::move(isbn);
  r.superseded = superseded;
  return r;
}

// =============================================================================
// SelectUniqueIsbn Tests
// =============================================================================

class SelectUniqueIsbnTest : public ::testing::Test {};

TEST_F(SelectUniqueIsbnTest, SingleRecord) {
  EXPECT_EQ(SelectUniqueIsbn({Record("p1", "9781600108853")}, "upc"), "9781600108853");
}

TEST_F(SelectUniqueIsbnTest, EmptyThrowsNotFound) {
  try {
    SelectUniqueIsbn({}, "01234567890512345");
    FAIL() << "expected NotFoundError";
  } catch (const NotFoundError& e) {
    EXPECT_EQ(e.code(), ErrorCode::kNotFound);
    EXPECT_NE(std::string(e.what()).find("01234567890512345"), std::string::npos);
  }
}

TEST_F(SelectUniqueIsbnTest, SupersededExcluded) {
  std::vector<ProductRecord> records = {
      Record("p1", "9781595828057", true),
      Record("p2", "9781600108853"),
  };
  EXPECT_EQ(SelectUniqueIsbn(records, "upc"), "9781600108853");
}

TEST_F(SelectUniqueIsbnTest, AllSupersededThrowsNotFound) {
  std::vector<ProductRecord> records = {
      Record("p1", "9781595828057", true),
      Record("p2", "9781600108853", true),
  };
  EXPECT_THROW(SelectUniqueIsbn(records, "upc"), NotFoundError);
}

TEST_F(SelectUniqueIsbnTest, DeduplicatesByIsbn) {
  // Two product rows for the same book are one match
  std::vector<ProductRecord> records = {
      Record("p1", "9781600108853"),
      Record("p2", "9781600108853"),
  };
  EXPECT_EQ(SelectUniqueIsbn(records, "upc"), "9781600108853");
}

TEST_F(SelectUniqueIsbnTest, DistinctIsbnsThrowAmbiguous) {
  std::vector<ProductRecord> records = {
      Record("p1", "9781600108853"),
      Record("p2", "9781595828057"),
      Record("p3", "9781600108853"),
  };
  try {
    SelectUniqueIsbn(records, "UPC1");
    FAIL() << "expected AmbiguousError";
  } catch (const AmbiguousError& e) {
    EXPECT_EQ(std::string(e.what()), "too many found: 2 items for UPC UPC1");
  }
}

// =============================================================================
// Error Tests
// =============================================================================

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, CodeNames) {
  EXPECT_EQ(ErrorCodeName(ErrorCode::kOk), "ok");
  EXPECT_EQ(ErrorCodeName(ErrorCode::kLength), "length_error");
  EXPECT_EQ(ErrorCodeName(ErrorCode::kFormat), "format_error");
  EXPECT_EQ(ErrorCodeName(ErrorCode::kNotFound), "not_found");
  EXPECT_EQ(ErrorCodeName(ErrorCode::kAmbiguous), "ambiguous");
  EXPECT_EQ(ErrorCodeName(ErrorCode::kUnsupported), "unsupported");
  EXPECT_EQ(ErrorCodeName(ErrorCode::kUnknownLength), "unknown_length");
  EXPECT_EQ(ErrorCodeName(ErrorCode::kResolver), "resolver_error");
}

TEST_F(ErrorTest, HierarchyCarriesCode) {
  EXPECT_EQ(LengthError("x").code(), ErrorCode::kLength);
  EXPECT_EQ(FormatError("x").code(), ErrorCode::kFormat);
  EXPECT_EQ(NotFoundError("x").code(), ErrorCode::kNotFound);
  EXPECT_EQ(AmbiguousError("x").code(), ErrorCode::kAmbiguous);
}

TEST_F(ErrorTest, CatchableAsRuntimeError) {
  try {
    throw FormatError("expected prefix 978 in 123");
  } catch (const std::runtime_error& e) {
    EXPECT_STREQ(e.what(), "expected prefix 978 in 123");
  }
}

}  // namespace
}  // namespace bookland
