#pragma once

#include <algorithm>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "detail/byte_order.hpp"
#include "detail/split_result.hpp"
#include "types.hpp"

namespace bytesplit {

// ============================================================================
// Wire constants
// ============================================================================

/// Width of the big-endian length prefix in front of every frame payload
inline constexpr size_t frame_prefix_size = 4;

/// Largest payload a frame prefix can describe
inline constexpr size_t frame_max_payload = 0xFFFFFFFFu;

/**
 * @brief A frame located inside a larger buffer
 *
 * payload views the input buffer and is only valid while that buffer is.
 */
struct DecodedFrame {
    ByteView payload; ///< Payload bytes (without prefix)
    size_t consumed;  ///< Prefix plus payload, i.e. how far the cursor advances
};

/**
 * Self-describing variable-length byte string.
 *
 * Wire format:
 *   [payload length: uint32 big-endian][payload: length bytes]
 *
 * No padding and no terminator. A bundle is several frames back to back
 * with no outer count, so dispense() stops when the buffer is exhausted.
 *
 * The class doubles as a value type: a VariableLengthFrame owns one payload
 * and can be used as a schema field type, in which case the splitter reads
 * the prefix and hands the payload to it.
 *
 * Usage:
 *   auto wire = VariableLengthFrame::bundle(payloads);
 *   auto back = VariableLengthFrame::dispense(wire);   // == payloads
 */
class VariableLengthFrame {
public:
    VariableLengthFrame() = default;

    /**
     * @throws std::length_error if the payload exceeds frame_max_payload
     */
    explicit VariableLengthFrame(Bytes payload)
        : payload_(std::move(payload)) {
        check_payload_size(payload_.size());
    }

    explicit VariableLengthFrame(ByteView payload)
        : VariableLengthFrame(Bytes(payload.begin(), payload.end())) {}

    const Bytes& payload() const noexcept { return payload_; }

    size_t payload_size() const noexcept { return payload_.size(); }

    /// Prefix plus payload
    size_t encoded_size() const noexcept { return frame_prefix_size + payload_.size(); }

    /// Encoded form: prefix followed by payload
    Bytes to_bytes() const { return encode(payload_); }

    /// Frames are self-describing wherever they appear in a schema
    static constexpr FieldLength expected_bytes_length() noexcept { return variable_length; }

    // ========================================================================
    // Codec
    // ========================================================================

    /**
     * @brief Encode one payload as a frame
     * @throws std::length_error if the payload exceeds frame_max_payload
     */
    static Bytes encode(ByteView payload) {
        check_payload_size(payload.size());
        Bytes out(frame_prefix_size + payload.size());
        detail::write_u32(out.data(), 0, static_cast<uint32_t>(payload.size()));
        std::copy(payload.begin(), payload.end(), out.begin() + frame_prefix_size);
        return out;
    }

    /**
     * @brief Locate the frame starting at @p offset
     *
     * Fails with size_mismatch if the prefix, or the payload it declares,
     * runs past the end of @p buffer.
     */
    static SplitResult<DecodedFrame> decode(ByteView buffer, size_t offset = 0) {
        if (offset > buffer.size()) {
            return make_size_error(no_field, offset, buffer.size(),
                                   "frame offset past end of buffer");
        }
        const size_t available = buffer.size() - offset;
        if (available < frame_prefix_size) {
            return make_size_error(no_field, frame_prefix_size, available,
                                   "truncated frame length prefix");
        }

        const size_t declared = detail::read_u32(buffer.data(), offset);
        if (declared > available - frame_prefix_size) {
            return make_size_error(no_field, frame_prefix_size + declared, available,
                                   "frame payload overruns buffer");
        }

        return DecodedFrame{.payload = buffer.subspan(offset + frame_prefix_size, declared),
                            .consumed = frame_prefix_size + declared};
    }

    /**
     * @brief Parse a buffer holding exactly one frame
     *
     * Bytes after the frame are a size_mismatch.
     */
    static SplitResult<VariableLengthFrame> from_bytes(ByteView buffer) {
        auto frame = decode(buffer);
        if (!frame) {
            return make_unexpected(frame.error());
        }
        if (frame->consumed != buffer.size()) {
            return make_size_error(no_field, frame->consumed, buffer.size(),
                                   "trailing bytes after frame");
        }
        return VariableLengthFrame(frame->payload);
    }

    /**
     * @brief Encode each payload as a frame and concatenate them
     */
    static Bytes bundle(std::span<const Bytes> payloads) {
        size_t total = 0;
        for (const auto& p : payloads) {
            total += frame_prefix_size + p.size();
        }

        Bytes out;
        out.reserve(total);
        for (const auto& p : payloads) {
            append(out, encode(p));
        }
        return out;
    }

    /**
     * @brief Split a bundle back into its payloads
     *
     * Decodes frames from the front until the cursor lands exactly on the end
     * of the buffer. A partial frame at the end fails the whole call.
     */
    static SplitResult<std::vector<Bytes>> dispense(ByteView buffer) {
        std::vector<Bytes> payloads;
        size_t cursor = 0;

        while (cursor < buffer.size()) {
            auto frame = decode(buffer, cursor);
            if (!frame) {
                SplitError err = frame.error();
                err.field_index = payloads.size();
                return make_unexpected(std::move(err));
            }
            payloads.emplace_back(frame->payload.begin(), frame->payload.end());
            cursor += frame->consumed;
        }

        return payloads;
    }

    // ========================================================================
    // Comparison and concatenation
    // ========================================================================

    friend bool operator==(const VariableLengthFrame&, const VariableLengthFrame&) = default;

    /// A frame equals a raw byte string when its payload does
    friend bool operator==(const VariableLengthFrame& frame, ByteView payload) noexcept {
        return std::ranges::equal(frame.payload_, payload);
    }

    /// Encoded forms back to back, i.e. a two-frame bundle
    friend Bytes operator+(const VariableLengthFrame& lhs, const VariableLengthFrame& rhs) {
        Bytes out = lhs.to_bytes();
        append(out, rhs.to_bytes());
        return out;
    }

private:
    static void check_payload_size(size_t size) {
        if (size > frame_max_payload) {
            throw std::length_error("frame payload of " + std::to_string(size) +
                                    " bytes exceeds the 32-bit length prefix");
        }
    }

    Bytes payload_;
};

} // namespace bytesplit
