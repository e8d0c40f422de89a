#pragma once

#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace bytesplit {

// ============================================================================
// Byte containers
// ============================================================================

/// Owning byte string (decoded raw fields, remainders, encoded frames)
using Bytes = std::vector<uint8_t>;

/// Non-owning view over an input buffer
using ByteView = std::span<const uint8_t>;

/**
 * @brief Copy a character string into an owning byte string
 *
 * Convenience for building buffers from text literals in tests and examples.
 */
inline Bytes to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

/**
 * @brief View a character string as bytes without copying
 */
inline ByteView as_byte_view(std::string_view text) noexcept {
    return ByteView(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

/**
 * @brief Append the bytes of @p tail to @p head
 */
inline void append(Bytes& head, ByteView tail) {
    head.insert(head.end(), tail.begin(), tail.end());
}

/**
 * @brief Concatenate any number of byte sequences
 */
template <typename... Parts>
Bytes concat_bytes(const Parts&... parts) {
    Bytes out;
    out.reserve((std::size(parts) + ... + 0));
    (append(out, ByteView(parts)), ...);
    return out;
}

enum class ByteOrder : uint8_t { big, little };

// ============================================================================
// Field length
// ============================================================================

/**
 * Marker for a self-describing field: the field's bytes are preceded on the
 * wire by a length prefix (see VariableLengthFrame).
 */
struct VariableLength {
    constexpr bool operator==(const VariableLength&) const = default;
};

inline constexpr VariableLength variable_length{};

/**
 * @brief Byte length of one schema slot
 *
 * Either a fixed number of bytes known when the schema is built, or
 * variable, in which case the length is read from the frame prefix at
 * decode time.
 */
class FieldLength {
public:
    constexpr FieldLength(size_t bytes) noexcept // NOLINT(google-explicit-constructor)
        : bytes_(bytes),
          variable_(false) {}

    constexpr FieldLength(VariableLength) noexcept // NOLINT(google-explicit-constructor)
        : bytes_(0),
          variable_(true) {}

    static constexpr FieldLength fixed(size_t bytes) noexcept { return FieldLength(bytes); }
    static constexpr FieldLength variable() noexcept { return FieldLength(variable_length); }

    constexpr bool is_fixed() const noexcept { return !variable_; }
    constexpr bool is_variable() const noexcept { return variable_; }

    /// Fixed byte count; zero for variable lengths
    constexpr size_t bytes() const noexcept { return bytes_; }

    constexpr bool operator==(const FieldLength&) const = default;

private:
    size_t bytes_;
    bool variable_;
};

// ============================================================================
// Extra construction arguments
// ============================================================================

using ArgValue = std::variant<bool, int64_t, double, std::string>;

/// Named extra arguments handed to a field type's constructor or factory
using ExtraArgs = std::map<std::string, ArgValue, std::less<>>;

/**
 * @brief Look up an extra argument by name
 *
 * @return The argument if present, std::nullopt if absent
 * @throws std::invalid_argument if present but holding another type
 */
template <typename T>
std::optional<T> find_arg(const ExtraArgs& args, std::string_view name) {
    auto it = args.find(name);
    if (it == args.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<T>(&it->second)) {
        return *value;
    }
    throw std::invalid_argument("extra argument '" + std::string(name) +
                                "' has an unexpected type");
}

/**
 * @brief Look up an extra argument, falling back to a default when absent
 */
template <typename T>
T arg_or(const ExtraArgs& args, std::string_view name, T fallback) {
    return find_arg<T>(args, name).value_or(std::move(fallback));
}

} // namespace bytesplit
