/**
 * Main pybind11 module definition for Bookland.
 */

#include <pybind11/pybind11.h>
#include <bookland/version.hpp>

#include "catalog_bindings.hpp"
#include "exceptions.hpp"
#include "isbn_bindings.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_bookland, m) {
  m.doc() = R"doc(
Bookland: ISBN normalization and checksums.

Turns the codes a barcode scanner produces (ISBN-10, ISBN-13, ISBN-10 with a
price suffix, ISBN-13 with an EAN-5 supplement, UPC with a supplement) into a
canonical ISBN-13.

Basic usage:
    import bookland

    r = bookland.convert_to_13("16001088571999")
    print(r.isbn13)           # 9781600108853

    bookland.isbn13_verify("9781595828057")  # True
)doc";

  // Register exceptions first
  bookland::python::RegisterExceptions(m);

  bookland::python::BindCatalog(m);
  bookland::python::BindIsbn(m);

  m.attr("__version__") = bookland::Version();
}
