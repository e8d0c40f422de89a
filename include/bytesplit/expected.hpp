#pragma once

// BYTESPLIT Expected Type
//
// Every decode-time operation in bytesplit returns expected<T, SplitError>
// instead of throwing. The alias is backed by the TartanLlama implementation,
// which mirrors std::expected (C++23) while building as C++20.
//
// Usage:
//   bytesplit::expected<FieldList, SplitError> values = splitter(buffer);
//   if (values) {
//       consume(*values);
//   } else {
//       report(values.error().describe());
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain on success
//   result.map(f)       - transform value
//   result.or_else(f)   - chain on error
//   result.map_error(f) - transform error

#include <tl/expected.hpp>

namespace bytesplit {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace bytesplit
