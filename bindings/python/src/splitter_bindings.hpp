#pragma once
// Splitter bindings over raw-bytes schemas

#include <nanobind/nanobind.h>

#include <bytesplit/splitter.hpp>

#include "py_types.hpp"

#include <cstdint>
#include <sstream>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace bytesplit_python {

/**
 * Convert one positional Splitter argument: an int length or
 * VARIABLE_LENGTH. Negative lengths raise ValueError.
 */
inline bytesplit::FieldSpec field_from_python(nb::handle field) {
    if (nb::isinstance<PyVariableLength>(field)) {
        return bytesplit::variable_length;
    }
    if (nb::isinstance<nb::int_>(field) && !nb::isinstance<nb::bool_>(field)) {
        return bytesplit::FieldSpec(nb::cast<int64_t>(field));
    }
    throw nb::type_error("Splitter fields must be int lengths or VARIABLE_LENGTH");
}

inline void bind_splitter(nb::module_& m) {
    nb::class_<PySplitter>(m, "Splitter",
                           "Declarative splitter: Splitter(5, 1, 5), Splitter(16, VARIABLE_LENGTH)")
        .def("__init__",
             [](PySplitter* self, nb::args fields) {
                 std::vector<bytesplit::FieldSpec> specs;
                 specs.reserve(fields.size());
                 for (nb::handle f : fields) {
                     specs.push_back(field_from_python(f));
                 }
                 new (self) PySplitter{bytesplit::Splitter(std::move(specs))};
             })
        .def(
            "split",
            [](const PySplitter& self, nb::bytes data) {
                return to_python(unwrap(self.splitter.split(as_view(data))));
            },
            "data"_a, "Split data into one bytes object per field")
        .def(
            "__call__",
            [](const PySplitter& self, nb::bytes data) {
                return to_python(unwrap(self.splitter.split(as_view(data))));
            },
            "data"_a)
        .def(
            "split_single",
            [](const PySplitter& self, nb::bytes data) {
                return to_python(unwrap(self.splitter.split_single(as_view(data))));
            },
            "data"_a, "Split with a one-field schema and return the bare value")
        .def(
            "split_with_remainder",
            [](const PySplitter& self, nb::bytes data, bool msgpack) {
                bytesplit::SplitOptions options;
                options.return_remainder = !msgpack;
                options.decode_remainder_as_mapping = msgpack;
                return to_python(unwrap(self.splitter.split(as_view(data), options)));
            },
            "data"_a, "msgpack"_a = false,
            "Split data and append the unconsumed tail, as bytes or as a decoded "
            "MessagePack dict")
        .def(
            "repeat",
            [](const PySplitter& self, nb::bytes data) {
                return to_python(unwrap(self.splitter.repeat(as_view(data))));
            },
            "data"_a, "Apply the schema back to back until data is exhausted")
        .def("__add__",
             [](const PySplitter& self, const PySplitter& other) {
                 return PySplitter{bytesplit::concat(self.splitter, other.splitter)};
             })
        .def("__mul__",
             [](const PySplitter& self, size_t times) {
                 return PySplitter{bytesplit::repeat_schema(self.splitter, times)};
             })
        .def("__len__", [](const PySplitter& self) { return self.splitter.size(); })
        .def_prop_ro("fixed_size",
                     [](const PySplitter& self) -> nb::object {
                         if (auto size = self.splitter.fixed_size()) {
                             return nb::cast(*size);
                         }
                         return nb::none();
                     })
        .def("__repr__", [](const PySplitter& self) {
            std::ostringstream oss;
            oss << "Splitter(";
            for (size_t i = 0; i < self.splitter.size(); ++i) {
                const auto& length = self.splitter.specs()[i].length();
                oss << (i ? ", " : "");
                if (length.is_variable()) {
                    oss << "VARIABLE_LENGTH";
                } else {
                    oss << length.bytes();
                }
            }
            oss << ")";
            return oss.str();
        });
}

} // namespace bytesplit_python
