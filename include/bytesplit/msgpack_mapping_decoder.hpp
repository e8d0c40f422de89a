#pragma once

#include <limits>
#include <string>
#include <utility>

#include <cstddef>
#include <cstdint>
#include <msgpack.hpp>

#include "mapping.hpp"

namespace bytesplit {

/**
 * Built-in MappingDecoder for MessagePack-encoded maps, backed by msgpack-cxx.
 *
 * Supports nil, bool, every integer width, float32/64, str, bin, array and
 * map families. Ext types are rejected. The top-level object must be a map
 * and must span the whole input. Nesting is capped at max_depth, and
 * container counts are capped by the input size so a hostile header cannot
 * force a large allocation.
 */
class MsgpackMappingDecoder final : public MappingDecoder {
public:
    static constexpr size_t max_depth = 64;

    expected<Mapping, std::string> decode(ByteView bytes) const override {
        if (bytes.empty()) {
            return make_unexpected(std::string("msgpack remainder truncated: no bytes"));
        }

        // Every array element takes at least one byte, every map entry two
        const size_t len = bytes.size();
        const msgpack::unpack_limit limits(len, len / 2, len, len, len, max_depth);

        msgpack::object_handle handle;
        size_t offset = 0;
        try {
            handle = msgpack::unpack(reinterpret_cast<const char*>(bytes.data()), len, offset,
                                     nullptr, nullptr, limits);
        } catch (const msgpack::depth_size_overflow&) {
            return make_unexpected(std::string("msgpack nesting too deep"));
        } catch (const msgpack::size_overflow& e) {
            return make_unexpected(std::string("msgpack count truncated by input size: ") +
                                   e.what());
        } catch (const msgpack::insufficient_bytes&) {
            return make_unexpected(std::string("msgpack remainder truncated"));
        } catch (const msgpack::unpack_error& e) {
            return make_unexpected(std::string("malformed msgpack: ") + e.what());
        }

        const msgpack::object& root = handle.get();
        if (root.type != msgpack::type::MAP) {
            return make_unexpected(std::string("msgpack remainder is not a map"));
        }
        if (offset != len) {
            return make_unexpected("msgpack remainder has " + std::to_string(len - offset) +
                                   " trailing bytes after the map");
        }

        auto value = convert(root);
        if (!value) {
            return make_unexpected(std::move(value.error()));
        }
        return std::move(std::get<Mapping>(value->data));
    }

private:
    using ValueResult = expected<MapValue, std::string>;

    // Depth is already bounded by the unpack limits
    static ValueResult convert(const msgpack::object& obj) {
        switch (obj.type) {
            case msgpack::type::NIL:
                return MapValue{std::monostate{}};
            case msgpack::type::BOOLEAN:
                return MapValue{obj.via.boolean};
            case msgpack::type::POSITIVE_INTEGER:
                if (obj.via.u64 > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return MapValue{obj.via.u64};
                }
                return MapValue{static_cast<int64_t>(obj.via.u64)};
            case msgpack::type::NEGATIVE_INTEGER:
                return MapValue{obj.via.i64};
            case msgpack::type::FLOAT32:
            case msgpack::type::FLOAT64:
                return MapValue{obj.via.f64};
            case msgpack::type::STR:
                return MapValue{std::string(obj.via.str.ptr, obj.via.str.size)};
            case msgpack::type::BIN: {
                const auto* first = reinterpret_cast<const uint8_t*>(obj.via.bin.ptr);
                return MapValue{Bytes(first, first + obj.via.bin.size)};
            }
            case msgpack::type::ARRAY: {
                MapArray items;
                items.reserve(obj.via.array.size);
                for (uint32_t i = 0; i < obj.via.array.size; ++i) {
                    auto item = convert(obj.via.array.ptr[i]);
                    if (!item) {
                        return item;
                    }
                    items.push_back(std::move(*item));
                }
                return MapValue{std::move(items)};
            }
            case msgpack::type::MAP: {
                Mapping entries;
                entries.reserve(obj.via.map.size);
                for (uint32_t i = 0; i < obj.via.map.size; ++i) {
                    auto key = convert(obj.via.map.ptr[i].key);
                    if (!key) {
                        return key;
                    }
                    auto value = convert(obj.via.map.ptr[i].val);
                    if (!value) {
                        return value;
                    }
                    entries.push_back(MapEntry{std::move(*key), std::move(*value)});
                }
                return MapValue{std::move(entries)};
            }
            case msgpack::type::EXT:
                return make_unexpected("msgpack ext type " + std::to_string(obj.via.ext.type()) +
                                       " is not supported");
            default:
                return make_unexpected(std::string("unsupported msgpack object type"));
        }
    }
};

} // namespace bytesplit
