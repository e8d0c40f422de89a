#pragma once
// Frame codec bindings: VARIABLE_LENGTH, encode_frame, bundle, dispense

#include <nanobind/nanobind.h>

#include <bytesplit/frame.hpp>

#include "py_types.hpp"

#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace bytesplit_python {

inline void bind_frames(nb::module_& m) {
    nb::class_<PyVariableLength>(m, "VariableLength",
                                 "Marker for a length-prefixed field in a Splitter schema")
        .def("__repr__", [](const PyVariableLength&) { return "VARIABLE_LENGTH"; });

    m.attr("VARIABLE_LENGTH") = PyVariableLength{};
    m.attr("FRAME_PREFIX_SIZE") = bytesplit::frame_prefix_size;

    m.def(
        "encode_frame",
        [](nb::bytes payload) {
            return to_py_bytes(bytesplit::VariableLengthFrame::encode(as_view(payload)));
        },
        "payload"_a, "Prefix payload with its 4-byte big-endian length");

    m.def(
        "bundle",
        [](nb::iterable items) {
            std::vector<bytesplit::Bytes> payloads;
            for (nb::handle item : items) {
                auto view = as_view(nb::cast<nb::bytes>(item));
                payloads.emplace_back(view.begin(), view.end());
            }
            return to_py_bytes(bytesplit::VariableLengthFrame::bundle(payloads));
        },
        "items"_a, "Encode each bytes object as a frame and concatenate them");

    m.def(
        "dispense",
        [](nb::bytes data) {
            auto payloads = unwrap(bytesplit::VariableLengthFrame::dispense(as_view(data)));
            nb::list out;
            for (const auto& p : payloads) {
                out.append(to_py_bytes(p));
            }
            return out;
        },
        "data"_a, "Split a bundle back into its payloads");
}

} // namespace bytesplit_python
