#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <cstdint>

#include "expected.hpp"
#include "types.hpp"

namespace bytesplit {

struct MapValue;
struct MapEntry;

using MapArray = std::vector<MapValue>;

/// Key/value pairs in encoded order
using Mapping = std::vector<MapEntry>;

/**
 * @brief One value of a decoded structured map
 *
 * Nil is std::monostate. Integers that fit are held as int64_t; only values
 * above INT64_MAX use uint64_t.
 */
struct MapValue {
    using Storage = std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string,
                                 Bytes, MapArray, Mapping>;

    Storage data;

    bool is_nil() const noexcept { return std::holds_alternative<std::monostate>(data); }

    template <typename T>
    bool is() const noexcept {
        return std::holds_alternative<T>(data);
    }

    template <typename T>
    const T& as() const {
        return std::get<T>(data);
    }

    bool operator==(const MapValue& other) const;
};

struct MapEntry {
    MapValue key;
    MapValue value;

    bool operator==(const MapEntry& other) const = default;
};

inline bool MapValue::operator==(const MapValue& other) const {
    return data == other.data;
}

/**
 * @brief Find the value stored under a text or binary key
 * @return Pointer into @p map, or nullptr if no entry matches
 */
inline const MapValue* find_entry(const Mapping& map, std::string_view key) noexcept {
    for (const auto& entry : map) {
        if (const auto* s = std::get_if<std::string>(&entry.key.data); s && *s == key) {
            return &entry.value;
        }
        if (const auto* b = std::get_if<Bytes>(&entry.key.data);
            b && std::string_view(reinterpret_cast<const char*>(b->data()), b->size()) == key) {
            return &entry.value;
        }
    }
    return nullptr;
}

/**
 * Decodes trailing bytes into a key/value mapping.
 *
 * The splitter calls this only when decode_remainder_as_mapping is set. An
 * implementation must consume the whole input; a failure message is
 * reported to the caller as a construction_error.
 */
class MappingDecoder {
public:
    virtual ~MappingDecoder() = default;

    virtual expected<Mapping, std::string> decode(ByteView bytes) const = 0;
};

} // namespace bytesplit
