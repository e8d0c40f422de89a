#pragma once

#include <bit>
#include <concepts>
#include <span>

#include <cstdint>
#include <cstring>

#include "../types.hpp"

namespace bytesplit::detail {

// ============================================================================
// Byte swap implementations
// ============================================================================

inline uint32_t byteswap32(uint32_t value) noexcept {
    return __builtin_bswap32(value);
}

inline constexpr bool is_little_endian = std::endian::native == std::endian::little;

// ============================================================================
// Network byte order conversion
// ============================================================================

inline uint32_t host_to_network32(uint32_t value) noexcept {
    if constexpr (is_little_endian) {
        return byteswap32(value);
    } else {
        return value;
    }
}

inline uint32_t network_to_host32(uint32_t value) noexcept {
    return host_to_network32(value);
}

/**
 * @brief Read a big-endian 32-bit value at @p offset
 *
 * Caller guarantees that offset + 4 <= size of the underlying buffer.
 */
inline uint32_t read_u32(const uint8_t* data, size_t offset) noexcept {
    uint32_t raw;
    std::memcpy(&raw, data + offset, sizeof(raw));
    return network_to_host32(raw);
}

/**
 * @brief Write a 32-bit value in big-endian order at @p offset
 */
inline void write_u32(uint8_t* data, size_t offset, uint32_t value) noexcept {
    uint32_t raw = host_to_network32(value);
    std::memcpy(data + offset, &raw, sizeof(raw));
}

/**
 * @brief Assemble an unsigned integer from up to 8 bytes
 *
 * Accepts any length from 0 to 8 so odd widths (3-byte counters and the
 * like) decode the same way as native ones.
 */
inline uint64_t read_uint(ByteView bytes, ByteOrder order) noexcept {
    uint64_t value = 0;
    if (order == ByteOrder::big) {
        for (uint8_t b : bytes) {
            value = (value << 8) | b;
        }
    } else {
        for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
            value = (value << 8) | *it;
        }
    }
    return value;
}

/**
 * @brief Sign-extend the low @p width_bytes of @p value
 */
inline int64_t sign_extend(uint64_t value, size_t width_bytes) noexcept {
    if (width_bytes == 0 || width_bytes >= 8) {
        return static_cast<int64_t>(value);
    }
    const unsigned shift = static_cast<unsigned>(64 - width_bytes * 8);
    return static_cast<int64_t>(value << shift) >> shift;
}

} // namespace bytesplit::detail
