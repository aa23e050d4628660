/**
 * Checksum and conversion bindings for Bookland Python bindings.
 */

#include "isbn_bindings.hpp"
#include "catalog_bindings.hpp"

#include <bookland/checksum.hpp>
#include <bookland/convert.hpp>

#include <pybind11/stl.h>

#include <memory>
#include <string>

namespace py = pybind11;
using namespace pybind11::literals;

namespace bookland::python {

namespace {

std::string CharToString(char c) { return std::string(1, c); }

}  // namespace

void BindIsbn(py::module_& m) {
  // --- Enums ---

  py::enum_<ConversionKind>(m, "ConversionKind")
      .value("CONVERTED", ConversionKind::kConverted)
      .value("UNSUPPORTED", ConversionKind::kUnsupported)
      .value("FAILED", ConversionKind::kFailed);

  py::enum_<ConversionRoute>(m, "ConversionRoute")
      .value("ISBN10", ConversionRoute::kIsbn10)
      .value("ISBN13", ConversionRoute::kIsbn13)
      .value("ISBN14", ConversionRoute::kIsbn14)
      .value("UPC17", ConversionRoute::kUpc17)
      .value("EAN18", ConversionRoute::kEan18)
      .value("UNKNOWN", ConversionRoute::kUnknown);

  // --- ConversionResult ---

  py::class_<ConversionResult>(m, "ConversionResult",
                               "Outcome of convert_to_13().")
      .def_property_readonly("kind", &ConversionResult::kind)
      .def_property_readonly("has_value", &ConversionResult::has_value)
      .def_property_readonly("isbn13", &ConversionResult::value,
                             "The ISBN-13, or None unless converted.")
      .def_property_readonly("checksum_valid", &ConversionResult::checksum_valid,
                             "Advisory check-digit result; never blocks conversion.")
      .def_property_readonly("error",
                             [](const ConversionResult& r) {
                               return std::string(ErrorCodeName(r.error()));
                             })
      .def_property_readonly("message", &ConversionResult::message)
      .def_property_readonly("route",
                             [](const ConversionResult& r) {
                               return std::string(ConversionRouteName(r.route()));
                             })
      .def("__bool__", &ConversionResult::has_value)
      .def("__repr__", [](const ConversionResult& r) {
        if (r.has_value()) {
          return "<ConversionResult " + r.isbn13() +
                 (r.checksum_valid() ? "" : " checksum=bad") + ">";
        }
        return "<ConversionResult " + std::string(ErrorCodeName(r.error())) +
               ": " + r.message() + ">";
      });

  // --- Checksums ---

  m.def("isbn10_checksum",
        [](const std::string& data9) { return CharToString(Isbn10Checksum(data9)); },
        "data9"_a, "ISBN-10 check digit ('0'-'9' or 'X') for 9 data digits.");
  m.def("isbn10_verify", [](const std::string& s) { return Isbn10Verify(s); },
        "isbn10"_a);
  m.def("isbn13_checksum",
        [](const std::string& data12) { return CharToString(Isbn13Checksum(data12)); },
        "data12"_a, "ISBN-13 check digit for 12 data digits.");
  m.def("isbn13_verify", [](const std::string& s) { return Isbn13Verify(s); },
        "isbn13"_a);

  // --- Conversions ---

  m.def("convert_10_to_13", [](const std::string& s) { return Convert10To13(s); },
        "isbn10"_a);
  m.def("convert_14_to_13", [](const std::string& s) { return Convert14To13(s); },
        "code"_a, "ISBN-10 followed by a 4-digit price.");
  m.def("convert_18_to_13", [](const std::string& s) { return Convert18To13(s); },
        "code"_a, "ISBN-13 followed by an EAN-5 supplement.");
  m.def("scanned_to_isbn13", [](const std::string& s) { return ScannedToIsbn13(s); },
        "scanned"_a);
  m.def("scanned_to_isbn10", [](const std::string& s) { return ScannedToIsbn10(s); },
        "scanned"_a);
  m.def("is_placeholder_isbn13",
        [](const std::string& s) { return IsPlaceholderIsbn13(s); }, "code"_a);
  m.attr("PLACEHOLDER_ISBN13") = std::string(kPlaceholderIsbn13);

  // --- Dispatcher ---

  m.def(
      "convert_to_13",
      [](const std::string& input, std::shared_ptr<PyCatalog> catalog) {
        ConvertOptions opt;
        if (catalog) opt.resolver = catalog->Resolver();
        py::gil_scoped_release release;
        return ConvertTo13(input, opt);
      },
      "input"_a, "catalog"_a = py::none(),
      R"doc(Normalize any supported encoding to ISBN-13.

    Never raises for malformed input; inspect the returned ConversionResult.
    17-digit UPC scans need a catalog and are unsupported without one.
    )doc");
}

}  // namespace bookland::python
