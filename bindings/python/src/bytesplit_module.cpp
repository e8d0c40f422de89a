// bytesplit Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

// Binding components
#include "error_bindings.hpp"
#include "frame_bindings.hpp"
#include "splitter_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointer (declared extern in py_types.hpp)
namespace bytesplit_python {
PyObject* split_error_type = nullptr;
} // namespace bytesplit_python

NB_MODULE(bytesplit, m) {
    m.doc() = "bytesplit - declarative binary splitting";

    // 1. Error types (sets split_error_type)
    bytesplit_python::bind_errors(m);

    // 2. Frame codec and the VARIABLE_LENGTH marker - needs split_error_type
    bytesplit_python::bind_frames(m);

    // 3. Splitter - needs VARIABLE_LENGTH and split_error_type
    bytesplit_python::bind_splitter(m);
}
