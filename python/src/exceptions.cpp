/**
 * Exception handling for Bookland Python bindings.
 *
 * Maps bookland::Error codes and rocksdb::Status to Python exceptions.
 */

#include "exceptions.hpp"

#include <bookland/errors.hpp>

#include <pybind11/pybind11.h>
#include <rocksdb/status.h>

namespace py = pybind11;

namespace bookland::python {

// Static exception type pointers
static PyObject* BooklandError = nullptr;
static PyObject* LengthError_ = nullptr;
static PyObject* FormatError_ = nullptr;
static PyObject* NotFoundError_ = nullptr;
static PyObject* AmbiguousError_ = nullptr;
static PyObject* CatalogError = nullptr;

static PyObject* ExceptionFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kLength: return LengthError_;
    case ErrorCode::kFormat: return FormatError_;
    case ErrorCode::kNotFound: return NotFoundError_;
    case ErrorCode::kAmbiguous: return AmbiguousError_;
    default: return BooklandError;
  }
}

void RegisterExceptions(py::module_& m) {
  // Base exception
  BooklandError =
      PyErr_NewException("bookland.BooklandError", PyExc_Exception, nullptr);
  py::setattr(m, "BooklandError", py::handle(BooklandError));

  // Derived exceptions
  LengthError_ = PyErr_NewException("bookland.LengthError", BooklandError, nullptr);
  py::setattr(m, "LengthError", py::handle(LengthError_));

  FormatError_ = PyErr_NewException("bookland.FormatError", BooklandError, nullptr);
  py::setattr(m, "FormatError", py::handle(FormatError_));

  NotFoundError_ =
      PyErr_NewException("bookland.NotFoundError", BooklandError, nullptr);
  py::setattr(m, "NotFoundError", py::handle(NotFoundError_));

  AmbiguousError_ =
      PyErr_NewException("bookland.AmbiguousError", BooklandError, nullptr);
  py::setattr(m, "AmbiguousError", py::handle(AmbiguousError_));

  // Catalog storage failures other than NotFound
  CatalogError = PyErr_NewException("bookland.CatalogError", BooklandError, nullptr);
  py::setattr(m, "CatalogError", py::handle(CatalogError));

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const Error& e) {
      PyErr_SetString(ExceptionFor(e.code()), e.what());
    }
  });
}

void CheckStatus(const rocksdb::Status& status) {
  if (status.ok()) {
    return;
  }

  const std::string msg = status.ToString();

  if (status.IsNotFound()) {
    PyErr_SetString(NotFoundError_, msg.c_str());
    throw py::error_already_set();
  }
  if (status.IsInvalidArgument()) {
    PyErr_SetString(PyExc_ValueError, msg.c_str());
    throw py::error_already_set();
  }

  PyErr_SetString(CatalogError, msg.c_str());
  throw py::error_already_set();
}

}  // namespace bookland::python
