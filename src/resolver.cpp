#include <bookland/resolver.hpp>

#include <bookland/errors.hpp>

#include <algorithm>

namespace bookland {

std::string SelectUniqueIsbn(const std::vector<ProductRecord>& records,
                             std::string_view upc) {
  std::vector<std::string> survivors;
  for (const auto& record : records) {
    if (record.superseded) continue;
    if (std::find(survivors.begin(), survivors.end(), record.isbn_number) ==
        survivors.end()) {
      survivors.push_back(record.isbn_number);
    }
  }

  if (survivors.empty()) {
    throw NotFoundError("none found for UPC " + std::string(upc));
  }
  if (survivors.size() != 1) {
    throw AmbiguousError("too many found: " + std::to_string(survivors.size()) +
                         " items for UPC " + std::string(upc));
  }
  return survivors.front();
}

}  // namespace bookland
