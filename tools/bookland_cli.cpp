#include <bookland/catalog.hpp>
#include <bookland/checksum.hpp>
#include <bookland/convert.hpp>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " convert <code> [--catalog <path>] [--trace]\n"
      << "  " << argv0 << " verify10 <isbn10>\n"
      << "  " << argv0 << " verify13 <isbn13>\n"
      << "  " << argv0 << " checksum10 <9 digits>\n"
      << "  " << argv0 << " checksum13 <12 digits>\n"
      << "  " << argv0 << " to13 <isbn10>\n"
      << "  " << argv0 << " scanned <code>\n"
      << "  " << argv0 << " catalog <db_path> put-product <id> <isbn13> [superseded]\n"
      << "  " << argv0 << " catalog <db_path> link <upc> <id>\n"
      << "  " << argv0 << " catalog <db_path> unlink <upc> <id>\n"
      << "  " << argv0 << " catalog <db_path> lookup <upc>\n"
      << "  " << argv0 << " catalog <db_path> upcs [prefix] [limit]\n";
}

namespace {

// Prints each finished span as one line on stderr.
class StderrTracer : public bookland::Tracer {
 public:
  std::unique_ptr<bookland::TraceSpan> StartSpan(std::string_view name) override {
    return std::make_unique<Span>(name);
  }

 private:
  class Span : public bookland::TraceSpan {
   public:
    explicit Span(std::string_view name) : line_("[trace] " + std::string(name)) {}

    void SetAttribute(std::string_view key, uint64_t value) override {
      line_ += " " + std::string(key) + "=" + std::to_string(value);
    }
    void SetAttribute(std::string_view key, std::string_view value) override {
      line_ += " " + std::string(key) + "=" + std::string(value);
    }
    void AddEvent(std::string_view name) override {
      line_ += " +" + std::string(name);
    }
    void End(std::string_view outcome) override {
      std::cerr << line_ << " -> " << outcome << "\n";
    }

   private:
    std::string line_;
  };
};

int RunConvert(int argc, char** argv) {
  // convert <code> [--catalog <path>] [--trace]
  if (argc < 3) { usage(argv[0]); return 2; }
  std::string code = argv[2];
  std::string catalog_path;
  bool trace = false;
  for (int i = 3; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--catalog" && i + 1 < argc) {
      catalog_path = argv[++i];
    } else if (arg == "--trace") {
      trace = true;
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  bookland::ConvertOptions opt;
  if (!catalog_path.empty()) {
    std::unique_ptr<bookland::UpcCatalog> catalog;
    auto s = bookland::UpcCatalog::Open(catalog_path, &catalog);
    if (!s.ok()) {
      std::cerr << "Open failed: " << s.ToString() << "\n";
      return 1;
    }
    opt.resolver = std::move(catalog);
  }
  if (trace) opt.tracer = std::make_shared<StderrTracer>();

  bookland::ConversionResult r = bookland::ConvertTo13(code, opt);
  if (!r.has_value()) {
    std::cerr << bookland::ErrorCodeName(r.error()) << ": " << r.message() << "\n";
    return 1;
  }
  std::cout << r.isbn13();
  if (!r.checksum_valid()) std::cout << " (checksum mismatch)";
  std::cout << "\n";
  return 0;
}

int RunCatalog(int argc, char** argv) {
  if (argc < 4) { usage(argv[0]); return 2; }
  std::string db_path = argv[2];
  std::string cmd = argv[3];

  std::unique_ptr<bookland::UpcCatalog> db;
  auto s = bookland::UpcCatalog::Open(db_path, &db);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  if (cmd == "put-product") {
    if (argc != 6 && argc != 7) { usage(argv[0]); return 2; }
    bool superseded = argc == 7 && std::string(argv[6]) == "superseded";
    s = db->PutProduct(argv[4], argv[5], superseded);
    if (!s.ok()) {
      std::cerr << "PutProduct failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "link" || cmd == "unlink") {
    if (argc != 6) { usage(argv[0]); return 2; }
    s = cmd == "link" ? db->LinkUpc(argv[4], argv[5]) : db->UnlinkUpc(argv[4], argv[5]);
    if (!s.ok()) {
      std::cerr << (cmd == "link" ? "LinkUpc" : "UnlinkUpc") << " failed: "
                << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "lookup") {
    if (argc != 5) { usage(argv[0]); return 2; }
    std::vector<bookland::ProductRecord> records;
    s = db->FindByUpc(argv[4], &records);
    if (!s.ok()) {
      std::cerr << "FindByUpc failed: " << s.ToString() << "\n";
      return 1;
    }
    for (const auto& r : records) {
      std::cout << r.product_id << "\t" << r.isbn_number
                << (r.superseded ? "\tsuperseded" : "") << "\n";
    }
    try {
      std::cout << "isbn13=" << bookland::SelectUniqueIsbn(records, argv[4]) << "\n";
    } catch (const bookland::Error& e) {
      std::cerr << bookland::ErrorCodeName(e.code()) << ": " << e.what() << "\n";
      return 1;
    }
    return 0;
  } else if (cmd == "upcs") {
    // upcs [prefix] [limit]
    std::string prefix;
    uint64_t limit = 0;
    if (argc >= 5) prefix = argv[4];
    if (argc == 6) {
      try {
        limit = static_cast<uint64_t>(std::stoull(argv[5]));
      } catch (const std::exception&) {
        std::cerr << "Invalid limit: " << argv[5] << "\n";
        return 2;
      }
    } else if (argc > 6) {
      usage(argv[0]);
      return 2;
    }
    std::vector<std::string> upcs;
    s = db->ListUpcs(&upcs, limit, prefix);
    if (!s.ok()) {
      std::cerr << "ListUpcs failed: " << s.ToString() << "\n";
      return 1;
    }
    for (const auto& upc : upcs) std::cout << upc << "\n";
    return 0;
  }

  usage(argv[0]);
  return 2;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) { usage(argv[0]); return 2; }

  std::string cmd = argv[1];
  if (cmd == "convert") return RunConvert(argc, argv);
  if (cmd == "catalog") return RunCatalog(argc, argv);
  if (argc != 3) { usage(argv[0]); return 2; }

  std::string code = argv[2];
  try {
    if (cmd == "verify10" || cmd == "verify13") {
      bool ok = cmd == "verify10" ? bookland::Isbn10Verify(code) : bookland::Isbn13Verify(code);
      std::cout << (ok ? "valid" : "invalid") << "\n";
      return ok ? 0 : 1;
    } else if (cmd == "checksum10") {
      std::cout << bookland::Isbn10Checksum(code) << "\n";
      return 0;
    } else if (cmd == "checksum13") {
      std::cout << bookland::Isbn13Checksum(code) << "\n";
      return 0;
    } else if (cmd == "to13") {
      std::cout << bookland::Convert10To13(code) << "\n";
      return 0;
    } else if (cmd == "scanned") {
      auto isbn10 = bookland::ScannedToIsbn10(code);
      auto isbn13 = bookland::ScannedToIsbn13(code);
      std::cout << "isbn10=" << isbn10.value_or("") << " isbn13=" << isbn13.value_or("") << "\n";
      return 0;
    }
  } catch (const bookland::Error& e) {
    std::cerr << bookland::ErrorCodeName(e.code()) << ": " << e.what() << "\n";
    return 1;
  }

  usage(argv[0]);
  return 2;
}
