/**
 * Exception handling for Bookland Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>
#include <rocksdb/status.h>

namespace bookland::python {

/**
 * Register exception types with the Python module and install a translator
 * for bookland::Error.
 */
void RegisterExceptions(pybind11::module_& m);

/**
 * Check a rocksdb::Status and throw appropriate Python exception if not OK.
 */
void CheckStatus(const rocksdb::Status& status);

}  // namespace bookland::python
