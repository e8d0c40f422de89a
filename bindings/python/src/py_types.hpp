#pragma once
// Python wrapper types and conversions for bytesplit bindings

#include <nanobind/nanobind.h>

#include <bytesplit.hpp>

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace nb = nanobind;

namespace bytesplit_python {

// Exception type pointer (set during module init)
extern PyObject* split_error_type;

/**
 * @brief Marker exposed to Python as VARIABLE_LENGTH
 */
struct PyVariableLength {};

/**
 * @brief Python wrapper for Splitter (raw-bytes schemas only)
 */
struct PySplitter {
    bytesplit::Splitter splitter;
};

inline bytesplit::ByteView as_view(const nb::bytes& data) {
    return {reinterpret_cast<const uint8_t*>(data.c_str()), data.size()};
}

inline nb::bytes to_py_bytes(bytesplit::ByteView data) {
    return nb::bytes(reinterpret_cast<const char*>(data.data()), data.size());
}

[[noreturn]] inline void raise_split_error(const bytesplit::SplitError& error) {
    PyErr_SetString(split_error_type, error.describe().c_str());
    throw nb::python_error();
}

template <typename T>
T unwrap(bytesplit::SplitResult<T> result) {
    if (!result.has_value()) {
        raise_split_error(result.error());
    }
    return std::move(*result);
}

inline nb::object to_python(const bytesplit::MapValue& value);

inline nb::object to_python(const bytesplit::Mapping& mapping) {
    nb::dict out;
    for (const auto& entry : mapping) {
        out[to_python(entry.key)] = to_python(entry.value);
    }
    return std::move(out);
}

inline nb::object to_python(const bytesplit::MapValue& value) {
    return std::visit(
        [](const auto& v) -> nb::object {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                return nb::none();
            } else if constexpr (std::is_same_v<V, std::string>) {
                return nb::str(v.data(), v.size());
            } else if constexpr (std::is_same_v<V, bytesplit::Bytes>) {
                return to_py_bytes(v);
            } else if constexpr (std::is_same_v<V, bytesplit::MapArray>) {
                nb::list items;
                for (const auto& item : v) {
                    items.append(to_python(item));
                }
                return std::move(items);
            } else if constexpr (std::is_same_v<V, bytesplit::Mapping>) {
                return to_python(v);
            } else {
                return nb::cast(v);
            }
        },
        value.data);
}

/**
 * @brief Convert one split value: raw bytes, a decoded remainder mapping,
 * or a group from repeat()
 */
inline nb::object to_python(const bytesplit::FieldValue& value) {
    if (const auto* raw = value.get_if<bytesplit::Bytes>()) {
        return to_py_bytes(*raw);
    }
    if (const auto* mapping = value.get_if<bytesplit::Mapping>()) {
        return to_python(*mapping);
    }
    if (value.is_group()) {
        nb::list items;
        for (const auto& item : value.group()) {
            items.append(to_python(item));
        }
        return std::move(items);
    }
    throw nb::type_error("split value has no Python representation");
}

inline nb::list to_python(const bytesplit::FieldList& values) {
    nb::list out;
    for (const auto& value : values) {
        out.append(to_python(value));
    }
    return out;
}

} // namespace bytesplit_python
