// Performance benchmarks for bookland
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: checksums, fixed-width conversions and the dispatcher
//    - Pure CPU, no I/O
// 2. MACROBENCHMARKS: UPC catalog operations and catalog-backed dispatch
//    - Full RocksDB operations with I/O
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use fixed dataset sizes for reproducible results

#include <benchmark/benchmark.h>

#include <bookland/catalog.hpp>
#include <bookland/checksum.hpp>
#include <bookland/convert.hpp>
#include <bookland/internal.hpp>

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

// Random 12-digit ISBN-13 bodies with a Bookland prefix, completed with the
// correct check digit.
std::vector<std::string> MakeIsbn13s(size_t n) {
  std::mt19937 gen(42);
  std::uniform_int_distribution<> digit(0, 9);
  std::vector<std::string> out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    std::string code = "978";
    for (int d = 0; d < 9; ++d) code.push_back(static_cast<char>('0' + digit(gen)));
    code.push_back(bookland::Isbn13Checksum(code));
    out.push_back(std::move(code));
  }
  return out;
}

// =============================================================================
// Benchmark Fixtures and Helpers
// =============================================================================

class CatalogBenchmark : public benchmark::Fixture {
 protected:
  void SetUp(const benchmark::State& state) override {
    (void)state;
    std::random_device rd;
    test_dir_ = std::filesystem::temp_directory_path() /
                ("bookland_bench_" + std::to_string(rd() % 1000000));
    std::filesystem::create_directories(test_dir_);
  }

  void TearDown(const benchmark::State& state) override {
    (void)state;
    catalog_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  // Opens a fresh catalog with n products, each linked from its own UPC.
  bool Populate(size_t n) {
    std::unique_ptr<bookland::UpcCatalog> catalog;
    if (!bookland::UpcCatalog::Open((test_dir_ / "catalog").string(), &catalog).ok()) {
      return false;
    }
    isbns_ = MakeIsbn13s(n);
    upcs_.clear();
    for (size_t i = 0; i < n; ++i) {
      std::string id = "p" + std::to_string(i);
      std::string upc = std::to_string(10000000000000000ULL + i);  // 17 digits
      if (!catalog->PutProduct(id, isbns_[i]).ok()) return false;
      if (!catalog->LinkUpc(upc, id).ok()) return false;
      upcs_.push_back(std::move(upc));
    }
    catalog_ = std::move(catalog);
    return true;
  }

  std::filesystem::path test_dir_;
  std::shared_ptr<bookland::UpcCatalog> catalog_;
  std::vector<std::string> isbns_;
  std::vector<std::string> upcs_;
};

}  // namespace

// =============================================================================
// PART 1: MICROBENCHMARKS - CPU-bound operations without I/O
// =============================================================================

static void BM_Isbn10Checksum(benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(bookland::Isbn10Checksum("084361072"));
  }
}
BENCHMARK(BM_Isbn10Checksum);

static void BM_Isbn13Checksum(benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(bookland::Isbn13Checksum("978159582805"));
  }
}
BENCHMARK(BM_Isbn13Checksum);

static void BM_Isbn13Verify(benchmark::State& state) {
  auto codes = MakeIsbn13s(1024);
  size_t i = 0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(bookland::Isbn13Verify(codes[i++ & 1023]));
  }
}
BENCHMARK(BM_Isbn13Verify);

static void BM_Convert10To13(benchmark::State& state) {
  for (auto _ : state) {
    auto out = bookland::Convert10To13("0843610727");
    benchmark::DoNotOptimize(out);
  }
}
BENCHMARK(BM_Convert10To13);

static void BM_Convert18To13(benchmark::State& state) {
  for (auto _ : state) {
    auto out = bookland::Convert18To13("978160010885351999");
    benchmark::DoNotOptimize(out);
  }
}
BENCHMARK(BM_Convert18To13);

// Each dispatcher route; arg selects the input.
static void BM_ConvertTo13(benchmark::State& state) {
  static const char* kInputs[] = {
      "9781595828057",       // 13
      "16001088571999",      // 14
      "978160010885351999",  // 18
      "12345",               // unknown size
      "97816001088571",      // 14 with prefix: FormatError path
  };
  const char* input = kInputs[state.range(0)];
  for (auto _ : state) {
    auto r = bookland::ConvertTo13(input);
    benchmark::DoNotOptimize(r);
  }
}
BENCHMARK(BM_ConvertTo13)->DenseRange(0, 4);

static void BM_ProductValue_Serialize(benchmark::State& state) {
  bookland::internal::ProductValue value;
  value.isbn_number = "9781600108853";
  for (auto _ : state) {
    auto serialized = value.Serialize();
    benchmark::DoNotOptimize(serialized);
  }
}
BENCHMARK(BM_ProductValue_Serialize);

static void BM_UpcKey_Make(benchmark::State& state) {
  for (auto _ : state) {
    auto key = bookland::internal::MakeUpcKey("01234567890512345", "product-000001");
    benchmark::DoNotOptimize(key);
  }
}
BENCHMARK(BM_UpcKey_Make);

// =============================================================================
// PART 2: MACROBENCHMARKS - Catalog operations with I/O
// =============================================================================

BENCHMARK_DEFINE_F(CatalogBenchmark, FindByUpc)(benchmark::State& state) {
  if (!Populate(static_cast<size_t>(state.range(0)))) {
    state.SkipWithError("catalog setup failed");
    return;
  }
  std::vector<bookland::ProductRecord> records;
  size_t i = 0;
  for (auto _ : state) {
    records.clear();
    auto s = catalog_->FindByUpc(upcs_[i++ % upcs_.size()], &records);
    benchmark::DoNotOptimize(s);
  }
}
BENCHMARK_REGISTER_F(CatalogBenchmark, FindByUpc)->Arg(100)->Arg(10000);

BENCHMARK_DEFINE_F(CatalogBenchmark, ConvertTo13_Upc17)(benchmark::State& state) {
  if (!Populate(1000)) {
    state.SkipWithError("catalog setup failed");
    return;
  }
  bookland::ConvertOptions opt;
  opt.resolver = catalog_;
  size_t i = 0;
  for (auto _ : state) {
    auto r = bookland::ConvertTo13(upcs_[i++ % upcs_.size()], opt);
    benchmark::DoNotOptimize(r);
  }
}
BENCHMARK_REGISTER_F(CatalogBenchmark, ConvertTo13_Upc17);

BENCHMARK_DEFINE_F(CatalogBenchmark, PutProduct)(benchmark::State& state) {
  if (!Populate(0)) {
    state.SkipWithError("catalog setup failed");
    return;
  }
  auto isbns = MakeIsbn13s(1024);
  uint64_t i = 0;
  for (auto _ : state) {
    auto s = catalog_->PutProduct("p" + std::to_string(i), isbns[i & 1023]);
    ++i;
    benchmark::DoNotOptimize(s);
  }
}
BENCHMARK_REGISTER_F(CatalogBenchmark, PutProduct);

BENCHMARK_MAIN();
