// Unit tests for the ConvertTo13 dispatcher
// Tests: length routing, advisory checksums, UPC resolution through a fake
// resolver, error tagging, metrics and tracing, concurrent use

#include <gtest/gtest.h>

#include <bookland/convert.hpp>
#include <bookland/test_utils.hpp>

#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace bookland {
namespace {

using testing::FakeResolver;
using testing::RecordingMetrics;
using testing::RecordingTracer;
using testing::TestResultCollector;

constexpr const char* kUpc = "01234567890512345";

// =============================================================================
// Routing Tests
// =============================================================================

class DispatchTest : public ::testing::Test {};

TEST_F(DispatchTest, Isbn13PassesThrough) {
  auto r = ConvertTo13("9781595828057");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.kind(), ConversionKind::kConverted);
  EXPECT_EQ(r.isbn13(), "9781595828057");
  EXPECT_TRUE(r.checksum_valid());
  EXPECT_EQ(r.error(), ErrorCode::kOk);
  EXPECT_EQ(r.route(), ConversionRoute::kIsbn13);
  EXPECT_EQ(r.value().value_or(""), "9781595828057");
}

TEST_F(DispatchTest, Isbn13BadChecksumStillConverts) {
  auto r = ConvertTo13("9781595828050");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.isbn13(), "9781595828050");
  EXPECT_FALSE(r.checksum_valid());
}

TEST_F(DispatchTest, Isbn13WithNonDigitIsReportedAsBadChecksum) {
  auto r = ConvertTo13("97815958280X7");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.isbn13(), "97815958280X7");
  EXPECT_FALSE(r.checksum_valid());
}

TEST_F(DispatchTest, Isbn14DropsPrice) {
  auto r = ConvertTo13("16001088571999");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.isbn13(), "9781600108853");
  EXPECT_TRUE(r.checksum_valid());
  EXPECT_EQ(r.route(), ConversionRoute::kIsbn14);
}

TEST_F(DispatchTest, Isbn14WithPrefixFails) {
  auto r = ConvertTo13("97816001088571");
  EXPECT_FALSE(r.has_value());
  EXPECT_EQ(r.kind(), ConversionKind::kFailed);
  EXPECT_EQ(r.error(), ErrorCode::kFormat);
  EXPECT_NE(r.message().find("unexpected prefix"), std::string::npos);
}

TEST_F(DispatchTest, Ean18DropsSupplement) {
  auto r = ConvertTo13("978160010885351999");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.isbn13(), "9781600108853");
  EXPECT_TRUE(r.checksum_valid());
  EXPECT_EQ(r.route(), ConversionRoute::kEan18);
}

TEST_F(DispatchTest, Ean18ZeroPriceSupplement) {
  auto r = ConvertTo13("978160010885301999");
  EXPECT_EQ(r.value().value_or(""), "9781600108853");
  EXPECT_TRUE(r.checksum_valid());
}

TEST_F(DispatchTest, Ean18BadChecksumStillConverts) {
  auto r = ConvertTo13("978159582805051299");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.isbn13(), "9781595828050");
  EXPECT_FALSE(r.checksum_valid());
}

TEST_F(DispatchTest, Ean18WithoutPrefixFails) {
  auto r = ConvertTo13("123456789012345678");
  EXPECT_EQ(r.kind(), ConversionKind::kFailed);
  EXPECT_EQ(r.error(), ErrorCode::kFormat);
  EXPECT_NE(r.message().find("expected prefix"), std::string::npos);
}

TEST_F(DispatchTest, Isbn10IsUnsupported) {
  auto r = ConvertTo13("0843610727");
  EXPECT_FALSE(r.has_value());
  EXPECT_EQ(r.kind(), ConversionKind::kUnsupported);
  EXPECT_EQ(r.error(), ErrorCode::kUnsupported);
  EXPECT_EQ(r.route(), ConversionRoute::kIsbn10);
  EXPECT_FALSE(r.value().has_value());
}

TEST_F(DispatchTest, UnknownLengths) {
  for (const char* code : {"", "1", "1234567", "123456789012", "123456789012345", "1234567890123456789"}) {
    auto r = ConvertTo13(code);
    EXPECT_EQ(r.kind(), ConversionKind::kFailed) << code;
    EXPECT_EQ(r.error(), ErrorCode::kUnknownLength) << code;
    EXPECT_EQ(r.route(), ConversionRoute::kUnknown) << code;
    EXPECT_TRUE(r.isbn13().empty()) << code;
  }
}

TEST_F(DispatchTest, UnknownLengthMessageNamesSize) {
  auto r = ConvertTo13("12345");
  EXPECT_EQ(r.message(), "unknown size 5 for 12345");

  auto seven = ConvertTo13("1234567");
  EXPECT_EQ(seven.error(), ErrorCode::kUnknownLength);
  EXPECT_EQ(seven.message(), "unknown size 7 for 1234567");
}

TEST_F(DispatchTest, NewlinesStrippedBeforeRouting) {
  auto r = ConvertTo13("978159582\n8057\n");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.isbn13(), "9781595828057");

  auto r14 = ConvertTo13("\n1600108857\n1999");
  ASSERT_TRUE(r14.has_value());
  EXPECT_EQ(r14.isbn13(), "9781600108853");
}

TEST_F(DispatchTest, OnlyNewlinesAreStripped) {
  // A trailing space changes the length: 14 characters, prefixed
  auto r = ConvertTo13("9781595828057 ");
  EXPECT_EQ(r.error(), ErrorCode::kFormat);
}

TEST_F(DispatchTest, EquivalentEncodingsAgree) {
  auto a = ConvertTo13("16001088571999");
  auto b = ConvertTo13("978160010885351999");
  auto c = ConvertTo13("9781600108853");
  ASSERT_TRUE(a.has_value() && b.has_value() && c.has_value());
  EXPECT_EQ(a.isbn13(), b.isbn13());
  EXPECT_EQ(b.isbn13(), c.isbn13());
}

TEST_F(DispatchTest, RouteNames) {
  EXPECT_EQ(ConversionRouteName(ConversionRoute::kIsbn10), "isbn10");
  EXPECT_EQ(ConversionRouteName(ConversionRoute::kUpc17), "upc17");
  EXPECT_EQ(ConversionRouteName(ConversionRoute::kEan18), "ean18");
  EXPECT_EQ(ConversionRouteName(ConversionRoute::kUnknown), "unknown");
}

// =============================================================================
// UPC Resolution Tests
// =============================================================================

class UpcDispatchTest : public ::testing::Test {
 protected:
  ConvertOptions Options() {
    ConvertOptions opt;
    opt.resolver = resolver_;
    return opt;
  }

  std::shared_ptr<FakeResolver> resolver_ = std::make_shared<FakeResolver>();
};

TEST_F(UpcDispatchTest, UnsupportedWithoutResolver) {
  auto r = ConvertTo13(kUpc);
  EXPECT_EQ(r.kind(), ConversionKind::kUnsupported);
  EXPECT_EQ(r.route(), ConversionRoute::kUpc17);
}

TEST_F(UpcDispatchTest, SingleMatch) {
  resolver_->Add(kUpc, "9781600108853");
  auto r = ConvertTo13(kUpc, Options());
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.isbn13(), "9781600108853");
  EXPECT_TRUE(r.checksum_valid());
  EXPECT_EQ(resolver_->Calls(), 1u);
}

TEST_F(UpcDispatchTest, ResolvedIsbnChecksumIsAdvisory) {
  resolver_->Add(kUpc, "9781595828050");
  auto r = ConvertTo13(kUpc, Options());
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r.checksum_valid());
}

TEST_F(UpcDispatchTest, NoMatchIsNotFound) {
  auto r = ConvertTo13(kUpc, Options());
  EXPECT_EQ(r.kind(), ConversionKind::kFailed);
  EXPECT_EQ(r.error(), ErrorCode::kNotFound);
}

TEST_F(UpcDispatchTest, OnlySupersededIsNotFound) {
  resolver_->Add(kUpc, "9781600108853", /*superseded=*/true);
  auto r = ConvertTo13(kUpc, Options());
  EXPECT_EQ(r.error(), ErrorCode::kNotFound);
}

TEST_F(UpcDispatchTest, SupersededRecordsAreIgnored) {
  resolver_->Add(kUpc, "9781595828057", /*superseded=*/true);
  resolver_->Add(kUpc, "9781600108853");
  auto r = ConvertTo13(kUpc, Options());
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.isbn13(), "9781600108853");
}

TEST_F(UpcDispatchTest, DuplicateIsbnsCollapse) {
  resolver_->Add(kUpc, "9781600108853");
  resolver_->Add(kUpc, "9781600108853");
  auto r = ConvertTo13(kUpc, Options());
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.isbn13(), "9781600108853");
}

TEST_F(UpcDispatchTest, DistinctIsbnsAreAmbiguous) {
  resolver_->Add(kUpc, "9781600108853");
  resolver_->Add(kUpc, "9781595828057");
  auto r = ConvertTo13(kUpc, Options());
  EXPECT_EQ(r.kind(), ConversionKind::kFailed);
  EXPECT_EQ(r.error(), ErrorCode::kAmbiguous);
  EXPECT_NE(r.message().find("too many found: 2"), std::string::npos);
}

TEST_F(UpcDispatchTest, ResolverFailureIsReported) {
  resolver_->FailWith("connection refused");
  auto r = ConvertTo13(kUpc, Options());
  EXPECT_EQ(r.kind(), ConversionKind::kFailed);
  EXPECT_EQ(r.error(), ErrorCode::kResolver);
  EXPECT_NE(r.message().find("connection refused"), std::string::npos);
}

TEST_F(UpcDispatchTest, ResolverNotConsultedForOtherLengths) {
  (void)ConvertTo13("9781595828057", Options());
  (void)ConvertTo13("16001088571999", Options());
  EXPECT_EQ(resolver_->Calls(), 0u);
}

TEST_F(UpcDispatchTest, NewlineStrippedUpcIsLookedUp) {
  resolver_->Add(kUpc, "9781600108853");
  auto r = ConvertTo13(std::string(kUpc) + "\n", Options());
  ASSERT_TRUE(r.has_value());
}

// =============================================================================
// Observability Tests
// =============================================================================

class DispatchObservabilityTest : public ::testing::Test {
 protected:
  ConvertOptions Options() {
    ConvertOptions opt;
    opt.metrics = metrics_;
    opt.tracer = tracer_;
    return opt;
  }

  std::shared_ptr<RecordingMetrics> metrics_ = std::make_shared<RecordingMetrics>();
  std::shared_ptr<RecordingTracer> tracer_ = std::make_shared<RecordingTracer>();
};

TEST_F(DispatchObservabilityTest, CountersPerOutcome) {
  auto opt = Options();
  (void)ConvertTo13("9781595828057", opt);   // converted
  (void)ConvertTo13("9781595828050", opt);   // converted, bad checksum
  (void)ConvertTo13("0843610727", opt);      // unsupported
  (void)ConvertTo13("12345", opt);           // failed
  (void)ConvertTo13("97816001088571", opt);  // failed

  EXPECT_EQ(metrics_->CounterValue("bookland.convert.calls"), 5u);
  EXPECT_EQ(metrics_->CounterValue("bookland.convert.converted_total"), 2u);
  EXPECT_EQ(metrics_->CounterValue("bookland.convert.checksum_mismatch_total"), 1u);
  EXPECT_EQ(metrics_->CounterValue("bookland.convert.unsupported_total"), 1u);
  EXPECT_EQ(metrics_->CounterValue("bookland.convert.failed_total"), 2u);
  EXPECT_EQ(metrics_->HistogramCount("bookland.convert.latency_us"), 5u);
}

TEST_F(DispatchObservabilityTest, OneSpanPerCall) {
  (void)ConvertTo13("16001088571999", Options());
  auto spans = tracer_->Spans();
  ASSERT_EQ(spans.size(), 1u);

  const auto& span = spans[0];
  EXPECT_EQ(span.name, "bookland.ConvertTo13");
  EXPECT_TRUE(span.ended);
  EXPECT_EQ(span.outcome, "ok");
  EXPECT_EQ(span.attributes.at("input_length"), "14");
  EXPECT_EQ(span.attributes.at("route"), "isbn14");
  EXPECT_EQ(span.attributes.at("checksum"), "good");
  EXPECT_EQ(span.attributes.at("isbn13"), "9781600108853");
  ASSERT_EQ(span.events.size(), 1u);
  EXPECT_EQ(span.events[0], "price_dropped");
}

TEST_F(DispatchObservabilityTest, FailedSpanOutcome) {
  (void)ConvertTo13("123456789012345678", Options());
  auto spans = tracer_->Spans();
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].outcome, "format_error");
  EXPECT_EQ(spans[0].attributes.count("isbn13"), 0u);
  EXPECT_EQ(spans[0].attributes.at("checksum"), "unchecked");
}

TEST_F(DispatchObservabilityTest, UnreadableChecksumEvent) {
  (void)ConvertTo13("97815958280X7", Options());
  auto spans = tracer_->Spans();
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].attributes.at("checksum"), "bad");
  ASSERT_EQ(spans[0].events.size(), 1u);
  EXPECT_EQ(spans[0].events[0], "checksum_unreadable");
}

TEST_F(DispatchObservabilityTest, UpcLookupEvent) {
  auto resolver = std::make_shared<FakeResolver>();
  resolver->Add(kUpc, "9781600108853");
  auto opt = Options();
  opt.resolver = resolver;

  (void)ConvertTo13(kUpc, opt);
  auto spans = tracer_->Spans();
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].attributes.at("upc_matches"), "1");
  ASSERT_FALSE(spans[0].events.empty());
  EXPECT_EQ(spans[0].events[0], "upc_lookup");
}

TEST_F(DispatchObservabilityTest, NoHooksIsFine) {
  auto r = ConvertTo13("9781595828057", ConvertOptions{});
  EXPECT_TRUE(r.has_value());
}

// =============================================================================
// Concurrency Tests
// =============================================================================

TEST(DispatchConcurrencyTest, ConcurrentCallsShareOptions) {
  auto resolver = std::make_shared<FakeResolver>();
  resolver->Add(kUpc, "9781600108853");
  auto metrics = std::make_shared<RecordingMetrics>();

  ConvertOptions opt;
  opt.resolver = resolver;
  opt.metrics = metrics;

  constexpr int kThreads = 8;
  constexpr int kIterations = 500;
  TestResultCollector collector;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < kIterations; ++i) {
        auto a = ConvertTo13("16001088571999", opt);
        auto b = ConvertTo13(kUpc, opt);
        BOOKLAND_CHECK_AND_RECORD(collector,
                                  a.has_value() && a.isbn13() == "9781600108853",
                                  "14-digit conversion failed");
        BOOKLAND_CHECK_AND_RECORD(collector,
                                  b.has_value() && b.isbn13() == "9781600108853",
                                  "UPC conversion failed");
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_TRUE(collector.AllSucceeded()) << collector.FirstFailure();
  EXPECT_EQ(collector.SuccessCount(), 2u * kThreads * kIterations);
  EXPECT_EQ(metrics->CounterValue("bookland.convert.calls"), 2u * kThreads * kIterations);
}

}  // namespace
}  // namespace bookland
