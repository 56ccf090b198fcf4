#include <string>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "uncertain/api/errors.hpp"
#include "uncertain/api/options.hpp"
#include "uncertain/api/uncertain.hpp"
#include "uncertain/format/formatter.hpp"
#include "uncertain/parse/parser.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_uncertain, m) {
  m.doc() = "Shorthand notation for quantities with symmetric uncertainty";

  py::register_exception<uncertain::ParseError>(m, "ParseError", PyExc_ValueError);
  py::register_exception<uncertain::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);

  py::enum_<uncertain::ExponentStyle>(m, "ExponentStyle")
      .value("CaretTen", uncertain::ExponentStyle::CaretTen)
      .value("ENotation", uncertain::ExponentStyle::ENotation);

  py::class_<uncertain::FormatOptions>(m, "FormatOptions")
      .def(py::init<>())
      .def_readwrite("precision", &uncertain::FormatOptions::precision)
      .def_readwrite("uncertainty_digits", &uncertain::FormatOptions::uncertainty_digits)
      .def_readwrite("exponent_style", &uncertain::FormatOptions::exponent_style)
      .def_readwrite("force_sign", &uncertain::FormatOptions::force_sign);

  py::class_<uncertain::Uncertain>(m, "Uncertain")
      .def(py::init<double, double>(), py::arg("mean"), py::arg("uncertainty"))
      .def_property_readonly("mean", &uncertain::Uncertain::mean)
      .def_property_readonly("uncertainty", &uncertain::Uncertain::uncertainty)
      .def("__str__", &uncertain::Uncertain::str)
      .def("__repr__",
           [](const uncertain::Uncertain& value) {
             return "Uncertain(" + py::repr(py::float_(value.mean())).cast<std::string>() + ", " +
                    py::repr(py::float_(value.uncertainty())).cast<std::string>() + ")";
           })
      .def("__format__",
           [](const uncertain::Uncertain& value, const std::string& spec) { return value.format(spec); },
           py::arg("format_spec"))
      .def("format",
           py::overload_cast<const uncertain::FormatOptions&>(&uncertain::Uncertain::format, py::const_),
           py::arg("options"))
      .def("__eq__", [](const uncertain::Uncertain& lhs, const uncertain::Uncertain& rhs) { return lhs == rhs; })
      .def_static("from_string", &uncertain::Uncertain::from_string, py::arg("text"));

  m.def("format",
        &uncertain::format,
        py::arg("mean"),
        py::arg("uncertainty"),
        py::arg("options") = uncertain::FormatOptions{});
  m.def("parse", &uncertain::parse, py::arg("text"));
  m.def("parse_format_spec", &uncertain::parse_format_spec, py::arg("spec"));
}
