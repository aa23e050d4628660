#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace bookland {

/** One product known to a UPC catalog. */
struct ProductRecord {
  std::string product_id;
  std::string isbn_number;
  bool superseded = false;  // Replaced by a newer product record
};

/** Result of a UPC lookup. */
struct LookupResult {
  std::vector<ProductRecord> records;
  bool success = false;
  std::string error_message;
};

/**
 * External UPC-to-product resolution capability.
 *
 * Implementations may block on I/O; the engine applies no retry or timeout
 * policy of its own. Must be safe to call from multiple threads if shared.
 */
class UpcResolver {
 public:
  virtual ~UpcResolver() = default;

  virtual LookupResult Lookup(std::string_view upc) const = 0;
};

/**
 * Pick the single ISBN-13 a UPC stands for.
 *
 * Superseded records are dropped and the rest de-duplicated by ISBN.
 *
 * @throws NotFoundError if nothing survives.
 * @throws AmbiguousError if more than one distinct ISBN survives.
 */
std::string SelectUniqueIsbn(const std::vector<ProductRecord>& records,
                             std::string_view upc);

}  // namespace bookland
