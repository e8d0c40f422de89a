#pragma once

#include <concepts>
#include <string>
#include <type_traits>

#include "../expected.hpp"
#include "../field_value.hpp"
#include "../types.hpp"

namespace bytesplit {

// ============================================================================
// Field type capabilities
// ============================================================================

/**
 * Anything a split can hand back. Values are stored type-erased, which
 * requires copyability.
 */
template <typename T>
concept FieldValueType = std::copy_constructible<T> && std::destructible<T> &&
                         !std::is_reference_v<T> && !std::is_const_v<T>;

/**
 * Factory-decode capability: T::from_bytes(bytes, args).
 *
 * The factory either returns T (and may throw) or returns
 * expected<T, std::string> to report rejection without an exception.
 */
template <typename T>
concept ThrowingFactoryDecodable = requires(ByteView bytes, const ExtraArgs& args) {
    { T::from_bytes(bytes, args) } -> std::convertible_to<T>;
};

template <typename T>
concept ExpectedFactoryDecodable = requires(ByteView bytes, const ExtraArgs& args) {
    { T::from_bytes(bytes, args) } -> std::same_as<expected<T, std::string>>;
};

template <typename T>
concept FactoryDecodable = ThrowingFactoryDecodable<T> || ExpectedFactoryDecodable<T>;

/// Direct-construct capability with extra arguments: T(bytes, args)
template <typename T>
concept ArgsConstructible = std::constructible_from<T, ByteView, const ExtraArgs&>;

/// Direct-construct capability from bytes alone: T(bytes)
template <typename T>
concept BytesConstructible = std::constructible_from<T, ByteView>;

/**
 * A type that knows its own wire length, so it can appear in a schema
 * without an explicit one.
 */
template <typename T>
concept DeclaresLength = requires {
    { T::expected_bytes_length() } -> std::convertible_to<FieldLength>;
};

// ============================================================================
// Target type capabilities (Kwargifier)
// ============================================================================

template <typename T>
concept FieldMapFactory = requires(const FieldMap& fields) {
    { T::from_fields(fields) } -> std::convertible_to<T>;
};

/**
 * A Kwargifier target: built from decoded named fields, either through
 * T::from_fields(fields) or a T(fields) constructor.
 */
template <typename T>
concept FieldMapConstructible =
    std::move_constructible<T> && (FieldMapFactory<T> || std::constructible_from<T, const FieldMap&>);

} // namespace bytesplit
