/**
 * UpcCatalog class bindings for Bookland Python bindings.
 */

#include "catalog_bindings.hpp"
#include "exceptions.hpp"

#include <bookland/resolver.hpp>

#include <pybind11/stl.h>

#include <vector>

namespace py = pybind11;
using namespace pybind11::literals;

namespace bookland::python {

namespace {

py::dict ProductDict(const ProductRecord& record) {
  return py::dict("product_id"_a = record.product_id,
                  "isbn13"_a = record.isbn_number,
                  "superseded"_a = record.superseded);
}

}  // namespace

std::shared_ptr<PyCatalog> PyCatalog::Open(const std::string& path,
                                           size_t block_cache_bytes) {
  CatalogOptions options;
  options.block_cache_bytes = block_cache_bytes;

  std::unique_ptr<UpcCatalog> catalog;
  rocksdb::Status status;
  {
    py::gil_scoped_release release;  // Release GIL for I/O
    status = UpcCatalog::Open(path, &catalog, options);
  }
  CheckStatus(status);

  auto wrapper = std::make_shared<PyCatalog>();
  wrapper->catalog_ = std::move(catalog);
  wrapper->path_ = path;
  return wrapper;
}

void PyCatalog::PutProduct(const std::string& product_id, const std::string& isbn13,
                           bool superseded) {
  UpcCatalog* catalog = EnsureOpen();
  rocksdb::Status status;
  {
    py::gil_scoped_release release;
    status = catalog->PutProduct(product_id, isbn13, superseded);
  }
  CheckStatus(status);
}

py::dict PyCatalog::GetProduct(const std::string& product_id) {
  UpcCatalog* catalog = EnsureOpen();
  ProductRecord record;
  rocksdb::Status status;
  {
    py::gil_scoped_release release;
    status = catalog->GetProduct(product_id, &record);
  }
  CheckStatus(status);
  return ProductDict(record);
}

void PyCatalog::MarkSuperseded(const std::string& product_id, bool superseded) {
  UpcCatalog* catalog = EnsureOpen();
  rocksdb::Status status;
  {
    py::gil_scoped_release release;
    status = catalog->MarkSuperseded(product_id, superseded);
  }
  CheckStatus(status);
}

void PyCatalog::DeleteProduct(const std::string& product_id) {
  UpcCatalog* catalog = EnsureOpen();
  rocksdb::Status status;
  {
    py::gil_scoped_release release;
    status = catalog->DeleteProduct(product_id);
  }
  CheckStatus(status);
}

void PyCatalog::LinkUpc(const std::string& upc, const std::string& product_id) {
  UpcCatalog* catalog = EnsureOpen();
  rocksdb::Status status;
  {
    py::gil_scoped_release release;
    status = catalog->LinkUpc(upc, product_id);
  }
  CheckStatus(status);
}

void PyCatalog::UnlinkUpc(const std::string& upc, const std::string& product_id) {
  UpcCatalog* catalog = EnsureOpen();
  rocksdb::Status status;
  {
    py::gil_scoped_release release;
    status = catalog->UnlinkUpc(upc, product_id);
  }
  CheckStatus(status);
}

py::list PyCatalog::FindByUpc(const std::string& upc) {
  UpcCatalog* catalog = EnsureOpen();
  std::vector<ProductRecord> records;
  rocksdb::Status status;
  {
    py::gil_scoped_release release;
    status = catalog->FindByUpc(upc, &records);
  }
  CheckStatus(status);

  py::list out;
  for (const auto& record : records) {
    out.append(ProductDict(record));
  }
  return out;
}

std::string PyCatalog::Resolve(const std::string& upc) {
  UpcCatalog* catalog = EnsureOpen();
  std::vector<ProductRecord> records;
  rocksdb::Status status;
  {
    py::gil_scoped_release release;
    status = catalog->FindByUpc(upc, &records);
  }
  CheckStatus(status);
  // NotFoundError / AmbiguousError via the registered translator
  return SelectUniqueIsbn(records, upc);
}

uint64_t PyCatalog::CountProducts() {
  UpcCatalog* catalog = EnsureOpen();
  uint64_t count = 0;
  rocksdb::Status status;
  {
    py::gil_scoped_release release;
    status = catalog->CountProducts(&count);
  }
  CheckStatus(status);
  return count;
}

py::list PyCatalog::ListUpcs(const std::string& prefix, uint64_t limit) {
  UpcCatalog* catalog = EnsureOpen();
  std::vector<std::string> upcs;
  rocksdb::Status status;
  {
    py::gil_scoped_release release;
    status = catalog->ListUpcs(&upcs, limit, prefix);
  }
  CheckStatus(status);
  return py::cast(upcs);
}

void PyCatalog::Close() {
  if (catalog_ && catalog_->IsOpen()) {
    py::gil_scoped_release release;
    catalog_->Close();
  }
}

std::shared_ptr<const UpcResolver> PyCatalog::Resolver() const {
  if (IsClosed()) return nullptr;
  return catalog_;
}

PyCatalog* PyCatalog::Enter() {
  EnsureOpen();
  return this;
}

void PyCatalog::Exit(py::object /*exc_type*/, py::object /*exc_val*/,
                     py::object /*exc_tb*/) {
  Close();
}

UpcCatalog* PyCatalog::EnsureOpen() const {
  if (IsClosed()) {
    throw py::value_error("Catalog is closed");
  }
  return catalog_.get();
}

void BindCatalog(py::module_& m) {
  py::class_<PyCatalog, std::shared_ptr<PyCatalog>>(
      m, "Catalog",
      R"doc(RocksDB-backed catalog resolving UPC codes to ISBN-13.

    Example:
        with bookland.Catalog.open("/path/to/catalog") as catalog:
            catalog.put_product("p1", "9781600108853")
            catalog.link_upc("01234567890512345", "p1")
            result = bookland.convert_to_13("01234567890512345", catalog)
    )doc")

      .def_static("open", &PyCatalog::Open, "path"_a,
                  "block_cache_bytes"_a = CatalogOptions{}.block_cache_bytes,
                  "Open or create a catalog at path.")

      .def("put_product", &PyCatalog::PutProduct, "product_id"_a, "isbn13"_a,
           "superseded"_a = false, "Insert or replace a product.")
      .def("get_product", &PyCatalog::GetProduct, "product_id"_a,
           "Return {product_id, isbn13, superseded}. Raises NotFoundError.")
      .def("mark_superseded", &PyCatalog::MarkSuperseded, "product_id"_a,
           "superseded"_a = true)
      .def("delete_product", &PyCatalog::DeleteProduct, "product_id"_a)
      .def("link_upc", &PyCatalog::LinkUpc, "upc"_a, "product_id"_a,
           "Link a UPC to an existing product.")
      .def("unlink_upc", &PyCatalog::UnlinkUpc, "upc"_a, "product_id"_a)
      .def("find_by_upc", &PyCatalog::FindByUpc, "upc"_a,
           "All products linked to upc, superseded ones included.")
      .def("resolve", &PyCatalog::Resolve, "upc"_a,
           R"doc(The single ISBN-13 a UPC names.

        Raises:
            NotFoundError: no live product is linked
            AmbiguousError: more than one distinct ISBN is linked
        )doc")
      .def("count_products", &PyCatalog::CountProducts)
      .def("list_upcs", &PyCatalog::ListUpcs, "prefix"_a = "", "limit"_a = 0)

      // Properties
      .def_property_readonly("path", &PyCatalog::Path, "Database path.")
      .def_property_readonly("closed", &PyCatalog::IsClosed,
                             "True if catalog is closed.")

      // Lifecycle
      .def("close", &PyCatalog::Close, "Close the catalog.")

      // Context manager
      .def("__enter__", &PyCatalog::Enter, py::return_value_policy::reference)
      .def("__exit__", &PyCatalog::Exit);
}

}  // namespace bookland::python
