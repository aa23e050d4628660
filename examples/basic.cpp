#include <bookland/checksum.hpp>
#include <bookland/convert.hpp>

#include <iostream>

int main() {
  // Codes as a scanner reports them.
  const char* scans[] = {
      "0843610727",          // ISBN-10, stays as is
      "9781595828057",       // ISBN-13
      "16001088571999",      // ISBN-10 + price
      "978160010885351999",  // ISBN-13 + EAN-5
      "01234567890512345",   // UPC + supplement, needs a catalog
      "12345",
  };

  for (const char* scan : scans) {
    bookland::ConversionResult r = bookland::ConvertTo13(scan);
    std::cout << scan << " -> ";
    if (r.has_value()) {
      std::cout << r.isbn13() << (r.checksum_valid() ? "" : " (checksum mismatch)") << "\n";
    } else {
      std::cout << bookland::ErrorCodeName(r.error()) << ": " << r.message() << "\n";
    }
  }

  // The fixed-width helpers throw instead.
  try {
    std::cout << "to13(0843610727) = " << bookland::Convert10To13("0843610727") << "\n";
    std::cout << "checksum10(084361072) = " << bookland::Isbn10Checksum("084361072") << "\n";
    bookland::Convert14To13("97816001088571");
  } catch (const bookland::Error& e) {
    std::cerr << "Convert14To13 failed: " << e.what() << "\n";
  }

  std::cout << "done\n";
  return 0;
}
