/**
 * UpcCatalog class bindings for Bookland Python bindings.
 */

#pragma once

#include <bookland/catalog.hpp>

#include <pybind11/pybind11.h>

#include <memory>
#include <string>

namespace bookland::python {

/**
 * Wrapper class for UpcCatalog that provides a Python-friendly API.
 *
 * Holds the catalog through a shared_ptr so convert_to_13() can use it as a
 * UPC resolver.
 */
class PyCatalog {
 public:
  static std::shared_ptr<PyCatalog> Open(const std::string& path,
                                         size_t block_cache_bytes);

  void PutProduct(const std::string& product_id, const std::string& isbn13,
                  bool superseded);
  pybind11::dict GetProduct(const std::string& product_id);
  void MarkSuperseded(const std::string& product_id, bool superseded);
  void DeleteProduct(const std::string& product_id);
  void LinkUpc(const std::string& upc, const std::string& product_id);
  void UnlinkUpc(const std::string& upc, const std::string& product_id);
  pybind11::list FindByUpc(const std::string& upc);
  std::string Resolve(const std::string& upc);
  uint64_t CountProducts();
  pybind11::list ListUpcs(const std::string& prefix, uint64_t limit);

  void Close();
  bool IsClosed() const { return catalog_ == nullptr || !catalog_->IsOpen(); }
  std::string Path() const { return path_; }

  /** Null once closed. */
  std::shared_ptr<const UpcResolver> Resolver() const;

  // Context manager support
  PyCatalog* Enter();
  void Exit(pybind11::object exc_type, pybind11::object exc_val,
            pybind11::object exc_tb);

 private:
  UpcCatalog* EnsureOpen() const;

  std::shared_ptr<UpcCatalog> catalog_;
  std::string path_;
};

/**
 * Bind Catalog class to the Python module.
 */
void BindCatalog(pybind11::module_& m);

}  // namespace bookland::python
