#include <bookland/catalog.hpp>

#include <rocksdb/filter_policy.h>
#include <rocksdb/iterator.h>
#include <rocksdb/table.h>
#include <rocksdb/write_batch.h>

#include <bookland/digits.hpp>
#include <bookland/internal.hpp>

namespace bookland {

namespace {

constexpr const char* kProductsCF = "bookland_products";
constexpr const char* kUpcIndexCF = "bookland_upc_index";

// Map RocksDB statuses to low-cardinality strings for tracing.
// (Avoid putting status.ToString() into attributes; it's high-cardinality.)
inline std::string_view StatusKind(const rocksdb::Status& s) {
  if (s.ok()) return "ok";
  if (s.IsNotFound()) return "not_found";
  if (s.IsInvalidArgument()) return "invalid_argument";
  if (s.IsTimedOut()) return "timed_out";
  if (s.IsBusy()) return "busy";
  if (s.IsCorruption()) return "corruption";
  if (s.IsIOError()) return "io_error";
  return "other";
}

// Helper: build a ColumnFamilyOptions with shared cache + bloom
rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

rocksdb::Slice ToSlice(std::string_view s) {
  return rocksdb::Slice(s.data(), s.size());
}

}  // namespace

UpcCatalog::UpcCatalog(const CatalogOptions& opt) : opt_(opt) {}

UpcCatalog::~UpcCatalog() { Close(); }

rocksdb::Status UpcCatalog::Open(const std::string& db_path,
                                 std::unique_ptr<UpcCatalog>* out,
                                 const CatalogOptions& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  auto catalog = std::unique_ptr<UpcCatalog>(new UpcCatalog(opt));

  rocksdb::DBOptions options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  auto cache = rocksdb::NewLRUCache(opt.block_cache_bytes);
  catalog->block_cache_ = cache;

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kProductsCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kUpcIndexCF, MakeCFOptions(cache, opt.bloom_bits_per_key));

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::DB* db = nullptr;

  rocksdb::Status s = rocksdb::DB::Open(options, db_path, cfs, &handles, &db);
  if (!s.ok()) {
    for (auto* h : handles) delete h;
    return s;
  }

  catalog->db_ = db;
  catalog->handles_ = std::move(handles);

  // Descriptor order = handle order
  catalog->products_cf_ = catalog->handles_[1];
  catalog->upc_index_cf_ = catalog->handles_[2];

  *out = std::move(catalog);
  return rocksdb::Status::OK();
}

rocksdb::Status UpcCatalog::PutProduct(std::string_view product_id,
                                       std::string_view isbn13,
                                       bool superseded) {
  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("catalog is closed");
  if (product_id.empty()) return rocksdb::Status::InvalidArgument("product_id is empty");
  if (!IsIsbn13Shaped(isbn13)) {
    return rocksdb::Status::InvalidArgument("isbn must be 13 digits: " + std::string(isbn13));
  }

  internal::ProductValue value;
  value.isbn_number = std::string(isbn13);
  value.superseded = superseded;

  rocksdb::Status s = db_->Put(rocksdb::WriteOptions(), products_cf_,
                               ToSlice(product_id), value.Serialize());
  internal::EmitCounter(opt_.metrics.get(),
                        s.ok() ? "bookland.catalog.put_product.ok_total"
                               : "bookland.catalog.put_product.error_total");
  return s;
}

rocksdb::Status UpcCatalog::GetProduct(std::string_view product_id,
                                       ProductRecord* out) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("catalog is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), products_cf_, ToSlice(product_id), &raw);
  if (!s.ok()) return s;

  internal::ProductValue value;
  if (!internal::ProductValue::Deserialize(raw, &value)) {
    return rocksdb::Status::Corruption("bad product record for " + std::string(product_id));
  }

  out->product_id = std::string(product_id);
  out->isbn_number = std::move(value.isbn_number);
  out->superseded = value.superseded;
  return rocksdb::Status::OK();
}

rocksdb::Status UpcCatalog::MarkSuperseded(std::string_view product_id, bool superseded) {
  ProductRecord record;
  rocksdb::Status s = GetProduct(product_id, &record);
  if (!s.ok()) return s;
  if (record.superseded == superseded) return rocksdb::Status::OK();
  return PutProduct(product_id, record.isbn_number, superseded);
}

rocksdb::Status UpcCatalog::DeleteProduct(std::string_view product_id) {
  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("catalog is closed");
  return db_->Delete(rocksdb::WriteOptions(), products_cf_, ToSlice(product_id));
}

rocksdb::Status UpcCatalog::LinkUpc(std::string_view upc, std::string_view product_id) {
  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("catalog is closed");
  if (upc.empty()) return rocksdb::Status::InvalidArgument("upc is empty");
  if (upc.find(internal::kUpcKeySeparator) != std::string_view::npos) {
    return rocksdb::Status::InvalidArgument("upc contains a NUL byte");
  }

  std::string unused;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), products_cf_, ToSlice(product_id), &unused);
  if (s.IsNotFound()) {
    return rocksdb::Status::NotFound("no product " + std::string(product_id));
  }
  if (!s.ok()) return s;

  const std::string key = internal::MakeUpcKey(upc, product_id);
  s = db_->Put(rocksdb::WriteOptions(), upc_index_cf_, key, rocksdb::Slice());
  internal::EmitCounter(opt_.metrics.get(),
                        s.ok() ? "bookland.catalog.link.ok_total"
                               : "bookland.catalog.link.error_total");
  return s;
}

rocksdb::Status UpcCatalog::UnlinkUpc(std::string_view upc, std::string_view product_id) {
  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("catalog is closed");
  const std::string key = internal::MakeUpcKey(upc, product_id);
  return db_->Delete(rocksdb::WriteOptions(), upc_index_cf_, key);
}

rocksdb::Status UpcCatalog::FindByUpc(std::string_view upc,
                                      std::vector<ProductRecord>* out) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("catalog is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  out->clear();
  internal::EmitCounter(opt_.metrics.get(), "bookland.catalog.lookup.calls", 1);

  const uint64_t op_start_us = internal::NowMicros();
  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("bookland.catalog.FindByUpc");
  internal::SpanAttr(span.get(), "upc_bytes", static_cast<uint64_t>(upc.size()));

  auto finish = [&](const rocksdb::Status& st) -> rocksdb::Status {
    const uint64_t dur_us = internal::NowMicros() - op_start_us;
    internal::EmitHistogram(opt_.metrics.get(), "bookland.catalog.lookup.latency_us", dur_us);
    if (!st.ok()) {
      internal::EmitCounter(opt_.metrics.get(), "bookland.catalog.lookup.error_total", 1);
    }
    if (span) {
      internal::SpanAttr(span.get(), "latency_us", dur_us);
      internal::SpanAttr(span.get(), "matches", static_cast<uint64_t>(out->size()));
      span->End(StatusKind(st));
    }
    return st;
  };

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  const std::string prefix = internal::MakeUpcPrefix(upc);
  const rocksdb::Slice prefix_slice(prefix);

  rocksdb::Status result;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, upc_index_cf_));
    for (it->Seek(prefix_slice); it->Valid(); it->Next()) {
      if (!it->key().starts_with(prefix_slice)) break;

      std::string key_upc;
      std::string product_id;
      if (!internal::ParseUpcKey(it->key().ToString(), &key_upc, &product_id)) continue;

      std::string raw;
      rocksdb::Status s = db_->Get(ro, products_cf_, rocksdb::Slice(product_id), &raw);
      if (s.IsNotFound()) {
        internal::SpanEvent(span.get(), "dangling_link");
        continue;
      }
      if (!s.ok()) {
        result = s;
        break;
      }

      internal::ProductValue value;
      if (!internal::ProductValue::Deserialize(raw, &value)) {
        result = rocksdb::Status::Corruption("bad product record for " + product_id);
        break;
      }

      ProductRecord record;
      record.product_id = std::move(product_id);
      record.isbn_number = std::move(value.isbn_number);
      record.superseded = value.superseded;
      out->push_back(std::move(record));
    }

    if (result.ok()) result = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  return finish(result);
}

rocksdb::Status UpcCatalog::CountProducts(uint64_t* out_count) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("catalog is closed");
  if (!out_count) return rocksdb::Status::InvalidArgument("out_count is null");

  uint64_t count = 0;
  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), products_cf_));
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    ++count;
  }
  if (!it->status().ok()) return it->status();

  *out_count = count;
  return rocksdb::Status::OK();
}

rocksdb::Status UpcCatalog::ListUpcs(std::vector<std::string>* out_upcs,
                                     uint64_t limit,
                                     std::string_view prefix) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("catalog is closed");
  if (!out_upcs) return rocksdb::Status::InvalidArgument("out_upcs is null");

  out_upcs->clear();

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  rocksdb::Slice prefix_slice(prefix.data(), prefix.size());

  rocksdb::Status iter_status;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, upc_index_cf_));
    if (prefix.empty()) {
      it->SeekToFirst();
    } else {
      it->Seek(prefix_slice);
    }

    for (; it->Valid(); it->Next()) {
      if (!prefix.empty() && !it->key().starts_with(prefix_slice)) break;

      std::string upc;
      std::string product_id;
      if (!internal::ParseUpcKey(it->key().ToString(), &upc, &product_id)) continue;
      if (!out_upcs->empty() && out_upcs->back() == upc) continue;

      if (limit != 0 && out_upcs->size() >= limit) break;
      out_upcs->push_back(std::move(upc));
    }

    iter_status = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  return iter_status;
}

LookupResult UpcCatalog::Lookup(std::string_view upc) const {
  LookupResult result;
  rocksdb::Status s = FindByUpc(upc, &result.records);
  if (!s.ok()) {
    result.records.clear();
    result.error_message = s.ToString();
    return result;
  }
  result.success = true;
  return result;
}

bool UpcCatalog::IsOpen() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return db_ != nullptr;
}

// Waits for in-flight operations; later calls see "catalog is closed".
void UpcCatalog::Close() {
  std::unique_lock<std::shared_mutex> lock(mu_);
  if (!db_) return;

  for (auto* h : handles_) db_->DestroyColumnFamilyHandle(h);
  handles_.clear();
  delete db_;
  db_ = nullptr;
  products_cf_ = upc_index_cf_ = nullptr;
}

}  // namespace bookland
