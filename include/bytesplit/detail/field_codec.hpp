#pragma once

#include <concepts>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#include <cstdint>

#include "../frame.hpp"
#include "../types.hpp"
#include "byte_order.hpp"

namespace bytesplit {

/**
 * @brief Built-in decoders for library-provided field types
 *
 * Specializations expose:
 *   static T decode(ByteView segment, const ExtraArgs& args);
 *   static constexpr bool accepts_extra_args;
 *
 * decode() throws on rejection; the splitter turns that into a
 * construction_error.
 */
template <typename T>
struct FieldCodec {};

template <typename T>
concept HasBuiltinCodec = requires(ByteView bytes, const ExtraArgs& args) {
    { FieldCodec<T>::decode(bytes, args) } -> std::same_as<T>;
    { FieldCodec<T>::accepts_extra_args } -> std::convertible_to<bool>;
};

// Raw bytes pass through unchanged
template <>
struct FieldCodec<Bytes> {
    static constexpr bool accepts_extra_args = false;

    static Bytes decode(ByteView bytes, const ExtraArgs&) { return Bytes(bytes.begin(), bytes.end()); }
};

// Frame payload wrapped back into a frame value
template <>
struct FieldCodec<VariableLengthFrame> {
    static constexpr bool accepts_extra_args = false;

    static VariableLengthFrame decode(ByteView bytes, const ExtraArgs&) {
        return VariableLengthFrame(bytes);
    }
};

namespace detail {

inline bool is_ascii(std::string_view text) noexcept {
    for (char c : text) {
        if (static_cast<unsigned char>(c) > 0x7f) {
            return false;
        }
    }
    return true;
}

/// Well-formed UTF-8 check (rejects overlongs, surrogates and values past U+10FFFF)
inline bool is_utf8(std::string_view text) noexcept {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        uint32_t cp = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xe0) == 0xc0) {
            extra = 1;
            cp = lead & 0x1f;
        } else if ((lead & 0xf0) == 0xe0) {
            extra = 2;
            cp = lead & 0x0f;
        } else if ((lead & 0xf8) == 0xf0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            return false;
        }
        if (extra >= text.size() - i) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xc0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3f);
        }
        constexpr uint32_t min_for_width[] = {0, 0x80, 0x800, 0x10000};
        if (cp < min_for_width[extra] || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

inline ByteOrder parse_byte_order(const ExtraArgs& args) {
    const std::string order = arg_or<std::string>(args, "byteorder", "big");
    if (order == "big") {
        return ByteOrder::big;
    }
    if (order == "little") {
        return ByteOrder::little;
    }
    throw std::invalid_argument("byteorder must be 'big' or 'little', got '" + order + "'");
}

} // namespace detail

/**
 * Text fields. Extra argument "encoding": "utf-8" (default) or "ascii".
 * Bytes that are not valid in the requested encoding are rejected.
 */
template <>
struct FieldCodec<std::string> {
    static constexpr bool accepts_extra_args = true;

    static std::string decode(ByteView bytes, const ExtraArgs& args) {
        std::string text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        const std::string encoding = arg_or<std::string>(args, "encoding", "utf-8");

        if (encoding == "utf-8" || encoding == "utf8") {
            if (!detail::is_utf8(text)) {
                throw std::invalid_argument("bytes are not valid utf-8");
            }
        } else if (encoding == "ascii") {
            if (!detail::is_ascii(text)) {
                throw std::invalid_argument("bytes are not valid ascii");
            }
        } else {
            throw std::invalid_argument("unsupported text encoding '" + encoding + "'");
        }
        return text;
    }
};

/**
 * Integer fields. Extra argument "byteorder": "big" (default) or "little".
 * Any width up to sizeof(T) is accepted; signed types are sign-extended
 * from the field width.
 */
template <std::integral T>
    requires(!std::same_as<T, bool>)
struct FieldCodec<T> {
    static constexpr bool accepts_extra_args = true;

    static T decode(ByteView bytes, const ExtraArgs& args) {
        if (bytes.size() > sizeof(T)) {
            throw std::out_of_range(std::to_string(bytes.size()) + " bytes do not fit a " +
                                    std::to_string(sizeof(T)) + "-byte integer");
        }
        const uint64_t raw = detail::read_uint(bytes, detail::parse_byte_order(args));
        if constexpr (std::is_signed_v<T>) {
            return static_cast<T>(detail::sign_extend(raw, bytes.size()));
        } else {
            return static_cast<T>(raw);
        }
    }
};

} // namespace bytesplit
