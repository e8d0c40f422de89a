#pragma once

#include <string>
#include <utility>

#include "../expected.hpp"
#include "split_error.hpp"

namespace bytesplit {

/**
 * @brief Result type for splitting operations
 *
 * Alias for expected<T, SplitError>. Holds either the decoded value(s) or a
 * SplitError describing why the buffer could not be split.
 *
 * Usage:
 * @code
 *   auto result = splitter(buffer);
 *   if (result.has_value()) {
 *       auto& first = result->front();
 *   } else {
 *       std::cerr << result.error().describe() << "\n";
 *   }
 * @endcode
 *
 * @tparam T The type produced on success
 */
template <typename T>
using SplitResult = expected<T, SplitError>;

/**
 * @brief Factory for errors without byte-count context
 *
 * @param code The error category
 * @param field_index Schema slot involved, or no_field
 * @param detail Additional context
 * @return unexpected<SplitError> suitable for returning from split functions
 */
inline auto make_split_error(SplitErrorCode code, size_t field_index, std::string detail) {
    return unexpected(SplitError{.code = code,
                                 .field_index = field_index,
                                 .expected_bytes = 0,
                                 .available_bytes = 0,
                                 .detail = std::move(detail)});
}

/**
 * @brief Factory for size_mismatch errors
 *
 * @param field_index Schema slot involved, or no_field for whole-buffer checks
 * @param expected Bytes required
 * @param available Bytes present
 * @param detail Additional context
 */
inline auto make_size_error(size_t field_index, size_t expected, size_t available,
                            std::string detail) {
    return unexpected(SplitError{.code = SplitErrorCode::size_mismatch,
                                 .field_index = field_index,
                                 .expected_bytes = expected,
                                 .available_bytes = available,
                                 .detail = std::move(detail)});
}

} // namespace bytesplit
