#pragma once

#include <limits>
#include <string>

#include <cstddef>
#include <cstdint>

namespace bytesplit {

/**
 * Failure categories shared by every splitting, framing and kwargifier call.
 */
enum class SplitErrorCode : uint8_t {
    none,                ///< No error
    size_mismatch,       ///< Buffer too short, frame overrun, or unconsumed bytes
    usage_error,         ///< Options that contradict the schema or each other
    construction_error,  ///< A field or target type rejected its bytes or arguments
    attribute_resolution ///< Name is not a field of a partially built target
};

/**
 * Convert SplitErrorCode to a human-readable string.
 */
constexpr const char* split_error_string(SplitErrorCode code) noexcept {
    switch (code) {
        case SplitErrorCode::none:
            return "No error";
        case SplitErrorCode::size_mismatch:
            return "Buffer size does not match schema";
        case SplitErrorCode::usage_error:
            return "Invalid use of splitter options";
        case SplitErrorCode::construction_error:
            return "Field construction failed";
        case SplitErrorCode::attribute_resolution:
            return "Not a field of the partially built target";
    }
    return "Unknown error";
}

/// Sentinel for errors that are not tied to a single schema slot
inline constexpr size_t no_field = std::numeric_limits<size_t>::max();

/**
 * @brief Error information from a failed split, frame decode or build
 *
 * Carries enough context to diagnose a failure without re-running it: the
 * schema slot involved (or no_field), byte counts for size errors, and a
 * free-form detail string (for construction errors, the target's own
 * message).
 */
struct SplitError {
    SplitErrorCode code = SplitErrorCode::none;
    size_t field_index = no_field; ///< Schema slot that failed, or no_field
    size_t expected_bytes = 0;     ///< Bytes required (size_mismatch only)
    size_t available_bytes = 0;    ///< Bytes present (size_mismatch only)
    std::string detail;            ///< Context specific to this failure

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the error code
     */
    [[nodiscard]] const char* message() const noexcept { return split_error_string(code); }

    /**
     * @brief Full diagnostic including field index, byte counts and detail
     */
    [[nodiscard]] std::string describe() const {
        std::string out = message();
        if (field_index != no_field) {
            out += " (field ";
            out += std::to_string(field_index);
            out += ")";
        }
        if (code == SplitErrorCode::size_mismatch) {
            out += ": expected ";
            out += std::to_string(expected_bytes);
            out += " bytes, ";
            out += std::to_string(available_bytes);
            out += " available";
        }
        if (!detail.empty()) {
            out += ": ";
            out += detail;
        }
        return out;
    }
};

} // namespace bytesplit
