#pragma once
// Error bindings: SplitErrorCode, SplitError

#include <nanobind/nanobind.h>

#include <bytesplit/detail/split_error.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace bytesplit_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // SplitErrorCode enum
    // =========================================================================

    nb::enum_<bytesplit::SplitErrorCode>(m, "SplitErrorCode",
                                         "Failure categories of split operations")
        .value("size_mismatch", bytesplit::SplitErrorCode::size_mismatch,
               "Buffer too short, frame overrun, or unconsumed bytes")
        .value("usage_error", bytesplit::SplitErrorCode::usage_error,
               "Options that contradict the schema or each other")
        .value("construction_error", bytesplit::SplitErrorCode::construction_error,
               "A field rejected its bytes")
        .value("attribute_resolution", bytesplit::SplitErrorCode::attribute_resolution,
               "Name is not a field of a partially built target")
        .def("__str__", [](bytesplit::SplitErrorCode code) {
            return std::string(bytesplit::split_error_string(code));
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // SplitError - every failed split, frame decode or dispense
    auto split_error = nb::exception<std::runtime_error>(m, "SplitError", PyExc_ValueError);
    split_error_type = split_error.ptr();
}

} // namespace bytesplit_python
