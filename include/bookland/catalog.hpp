#pragma once

#include <bookland/observability.hpp>
#include <bookland/resolver.hpp>

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/cache.h>
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/status.h>

namespace bookland {

/**
 * Options for the UPC catalog.
 *
 * These are layered on top of RocksDB's Options. The catalog creates its own
 * column families on first open.
 */
struct CatalogOptions {
  // RocksDB performance knobs
  size_t block_cache_bytes = 64ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;

  // Observability hooks (optional)
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Tracer> tracer;
};

/**
 * bookland::UpcCatalog
 *
 * A RocksDB-backed product catalog that resolves UPC codes to ISBN-13s.
 *
 * Internally:
 *  product_id          -> {isbn_number, superseded}
 *  upc '\0' product_id -> (empty)
 *
 * A UPC may link to several products; SelectUniqueIsbn() decides whether the
 * links name exactly one book.
 */
class UpcCatalog : public UpcResolver {
 public:
  ~UpcCatalog() override;

  UpcCatalog(const UpcCatalog&) = delete;
  UpcCatalog& operator=(const UpcCatalog&) = delete;

  /**
   * Open or create a catalog at db_path.
   *
   * Creates the column families:
   * - bookland_products
   * - bookland_upc_index
   */
  static rocksdb::Status Open(const std::string& db_path,
                              std::unique_ptr<UpcCatalog>* out,
                              const CatalogOptions& opt = CatalogOptions{});

  /** Insert or replace a product. isbn13 must be 13 digits. */
  rocksdb::Status PutProduct(std::string_view product_id,
                             std::string_view isbn13,
                             bool superseded = false);

  rocksdb::Status GetProduct(std::string_view product_id, ProductRecord* out) const;

  /** Flag a product as replaced (or reinstate it). NotFound if absent. */
  rocksdb::Status MarkSuperseded(std::string_view product_id, bool superseded);

  /** Remove a product. Links pointing at it are left dangling and skipped. */
  rocksdb::Status DeleteProduct(std::string_view product_id);

  /** Link a UPC to an existing product. NotFound if the product is absent. */
  rocksdb::Status LinkUpc(std::string_view upc, std::string_view product_id);

  rocksdb::Status UnlinkUpc(std::string_view upc, std::string_view product_id);

  /** All products linked to upc, in product_id order. */
  rocksdb::Status FindByUpc(std::string_view upc, std::vector<ProductRecord>* out) const;

  rocksdb::Status CountProducts(uint64_t* out_count) const;

  /** Distinct UPCs with at least one link. */
  rocksdb::Status ListUpcs(std::vector<std::string>* out_upcs,
                           uint64_t limit = 0,
                           std::string_view prefix = {}) const;

  /** UpcResolver: FindByUpc() wrapped as a LookupResult. */
  LookupResult Lookup(std::string_view upc) const override;

  /**
   * Close the catalog and release RocksDB resources. Blocks until in-flight
   * operations finish. Safe to call multiple times and from any thread.
   */
  void Close();

  bool IsOpen() const;

 private:
  explicit UpcCatalog(const CatalogOptions& opt);

  CatalogOptions opt_;

  // Shared by every operation, exclusive in Close()
  mutable std::shared_mutex mu_;

  rocksdb::DB* db_ = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;
  std::shared_ptr<rocksdb::Cache> block_cache_;

  rocksdb::ColumnFamilyHandle* products_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* upc_index_cf_ = nullptr;
};

}  // namespace bookland
