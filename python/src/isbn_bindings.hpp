/**
 * Checksum and conversion bindings for Bookland Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>

namespace bookland::python {

/**
 * Bind checksum functions, fixed-width conversions, the dispatcher and
 * ConversionResult to the Python module.
 */
void BindIsbn(pybind11::module_& m);

}  // namespace bookland::python
