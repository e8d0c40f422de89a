#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <cstddef>

#include "detail/split_result.hpp"
#include "field_spec.hpp"
#include "field_value.hpp"
#include "frame.hpp"
#include "mapping.hpp"
#include "msgpack_mapping_decoder.hpp"
#include "types.hpp"

namespace bytesplit {

/**
 * Per-call options for Splitter::split().
 *
 * With neither remainder option set, the schema must consume the buffer
 * exactly. Setting both is a usage_error.
 */
struct SplitOptions {
    /// Append unconsumed bytes as a trailing Bytes value
    bool return_remainder = false;

    /// Append unconsumed bytes decoded as a Mapping
    bool decode_remainder_as_mapping = false;

    /// Decoder for decode_remainder_as_mapping; nullptr selects MessagePack
    const MappingDecoder* mapping_decoder = nullptr;
};

/**
 * Location of one field's bytes inside the split buffer. For framed fields
 * this is the payload, not including the prefix.
 */
struct Segment {
    size_t offset = 0;
    size_t size = 0;

    constexpr bool operator==(const Segment&) const = default;
};

/**
 * Declarative splitter for flat byte buffers.
 *
 * A Splitter is an ordered list of FieldSpecs. Each call walks the specs
 * with a cursor, slicing fixed-length fields directly and reading a frame
 * prefix for variable-length ones, then builds each field's value.
 *
 * Splitters are immutable; the spec list is shared between copies, so a
 * splitter can be built once and used from any number of threads.
 *
 * Usage:
 *   Splitter splitter{5, 1, 5};
 *   auto words = splitter(as_byte_view("hello world"));
 *   if (words) {
 *       // words->at(0).bytes() == "hello"
 *   } else {
 *       std::cerr << words.error().describe() << "\n";
 *   }
 */
class Splitter {
public:
    Splitter()
        : Splitter(std::vector<FieldSpec>{}) {}

    Splitter(std::initializer_list<FieldSpec> specs)
        : Splitter(std::vector<FieldSpec>(specs)) {}

    explicit Splitter(std::vector<FieldSpec> specs)
        : specs_(std::make_shared<const std::vector<FieldSpec>>(std::move(specs))),
          fixed_size_(compute_fixed_size(*specs_)) {}

    const std::vector<FieldSpec>& specs() const noexcept { return *specs_; }

    /// Number of fields
    size_t size() const noexcept { return specs_->size(); }

    bool empty() const noexcept { return specs_->empty(); }

    /**
     * @brief Total bytes consumed by one application
     * @return Sum of the field lengths, or std::nullopt if any field is
     *         self-describing (total then depends on the buffer)
     */
    std::optional<size_t> fixed_size() const noexcept { return fixed_size_; }

    bool is_fixed_length() const noexcept { return fixed_size_.has_value(); }

    // ========================================================================
    // Splitting
    // ========================================================================

    /**
     * @brief Split @p buffer into one value per field
     *
     * @return One value per field, plus a trailing remainder value when a
     *         remainder option is set; or the first error encountered
     */
    SplitResult<FieldList> split(ByteView buffer, const SplitOptions& options = {}) const {
        if (options.return_remainder && options.decode_remainder_as_mapping) {
            return make_split_error(SplitErrorCode::usage_error, no_field,
                                    "return_remainder and decode_remainder_as_mapping are "
                                    "mutually exclusive");
        }

        std::vector<Segment> segments;
        segments.reserve(specs_->size());
        auto end = segment_from(buffer, 0, segments);
        if (!end) {
            return make_unexpected(std::move(end.error()));
        }

        const bool keep_remainder =
            options.return_remainder || options.decode_remainder_as_mapping;
        if (*end != buffer.size() && !keep_remainder) {
            return make_size_error(no_field, *end, buffer.size(),
                                   std::to_string(buffer.size() - *end) +
                                       " excess bytes after last field");
        }

        auto values = decode_segments(buffer, segments);
        if (!values) {
            return values;
        }

        const ByteView tail = buffer.subspan(*end);
        if (options.return_remainder) {
            values->emplace_back(Bytes(tail.begin(), tail.end()));
        } else if (options.decode_remainder_as_mapping) {
            MsgpackMappingDecoder msgpack;
            const MappingDecoder& decoder =
                options.mapping_decoder ? *options.mapping_decoder : msgpack;
            auto mapping = decoder.decode(tail);
            if (!mapping) {
                return make_split_error(SplitErrorCode::construction_error, specs_->size(),
                                        "remainder is not a valid mapping: " + mapping.error());
            }
            values->emplace_back(std::move(*mapping));
        }

        return values;
    }

    SplitResult<FieldList> operator()(ByteView buffer, const SplitOptions& options = {}) const {
        return split(buffer, options);
    }

    /**
     * @brief Split a one-field schema and return the bare value
     *
     * Fails with usage_error, before the buffer is examined, if the schema
     * has more than one field or if a remainder option is set.
     */
    SplitResult<FieldValue> split_single(ByteView buffer, const SplitOptions& options = {}) const {
        if (specs_->size() != 1) {
            return make_split_error(SplitErrorCode::usage_error, no_field,
                                    "single value requested from a schema of " +
                                        std::to_string(specs_->size()) + " fields");
        }
        if (options.return_remainder || options.decode_remainder_as_mapping) {
            return make_split_error(SplitErrorCode::usage_error, no_field,
                                    "single value cannot be combined with a remainder");
        }

        auto values = split(buffer, options);
        if (!values) {
            return make_unexpected(std::move(values.error()));
        }
        return std::move(values->front());
    }

    /**
     * @brief Locate every field without building any value
     *
     * Applies the same size rules as split() with no remainder option.
     */
    SplitResult<std::vector<Segment>> segment(ByteView buffer) const {
        std::vector<Segment> segments;
        segments.reserve(specs_->size());
        auto end = segment_from(buffer, 0, segments);
        if (!end) {
            return make_unexpected(std::move(end.error()));
        }
        if (*end != buffer.size()) {
            return make_size_error(no_field, *end, buffer.size(),
                                   std::to_string(buffer.size() - *end) +
                                       " excess bytes after last field");
        }
        return segments;
    }

    /**
     * @brief Apply the schema back to back until @p buffer is exhausted
     *
     * A one-field schema yields one bare value per application; wider
     * schemas yield one group per application (FieldValue::group()).
     *
     * For a fixed-length schema the buffer must be an exact multiple of
     * fixed_size(). For a self-describing schema each application consumes
     * what its frames declare, and a partial record at the end is an error.
     */
    SplitResult<FieldList> repeat(ByteView buffer) const {
        FieldList results;
        if (buffer.empty()) {
            return results;
        }

        if (fixed_size_ && (*fixed_size_ == 0 || buffer.size() % *fixed_size_ != 0)) {
            return make_size_error(no_field, *fixed_size_, buffer.size(),
                                   "buffer is not a whole number of records");
        }

        std::vector<Segment> segments;
        size_t cursor = 0;
        while (cursor < buffer.size()) {
            segments.clear();
            auto end = segment_from(buffer, cursor, segments);
            if (!end) {
                SplitError err = std::move(end.error());
                err.detail = "record " + std::to_string(results.size()) + ": " + err.detail;
                return make_unexpected(std::move(err));
            }

            auto values = decode_segments(buffer, segments);
            if (!values) {
                return values;
            }

            if (specs_->size() == 1) {
                results.push_back(std::move(values->front()));
            } else {
                results.emplace_back(std::move(*values));
            }
            cursor = *end;
        }

        return results;
    }

private:
    static std::optional<size_t> compute_fixed_size(const std::vector<FieldSpec>& specs) noexcept {
        size_t total = 0;
        for (const auto& spec : specs) {
            if (spec.length().is_variable()) {
                return std::nullopt;
            }
            total += spec.length().bytes();
        }
        return total;
    }

    /**
     * Walk the specs from @p offset, appending one segment per field.
     * @return Cursor after the last field
     */
    SplitResult<size_t> segment_from(ByteView buffer, size_t offset,
                                     std::vector<Segment>& out) const {
        size_t cursor = offset;
        for (size_t i = 0; i < specs_->size(); ++i) {
            const FieldLength& length = (*specs_)[i].length();

            if (length.is_fixed()) {
                const size_t available = buffer.size() - cursor;
                if (length.bytes() > available) {
                    return make_size_error(i, length.bytes(), available,
                                           "fixed-length field overruns buffer");
                }
                out.push_back(Segment{.offset = cursor, .size = length.bytes()});
                cursor += length.bytes();
            } else {
                auto frame = VariableLengthFrame::decode(buffer, cursor);
                if (!frame) {
                    SplitError err = std::move(frame.error());
                    err.field_index = i;
                    return make_unexpected(std::move(err));
                }
                out.push_back(Segment{.offset = cursor + frame_prefix_size,
                                      .size = frame->payload.size()});
                cursor += frame->consumed;
            }
        }
        return cursor;
    }

    SplitResult<FieldList> decode_segments(ByteView buffer,
                                           const std::vector<Segment>& segments) const {
        FieldList values;
        values.reserve(segments.size());
        for (size_t i = 0; i < segments.size(); ++i) {
            auto value = (*specs_)[i].decode(buffer.subspan(segments[i].offset, segments[i].size));
            if (!value) {
                return make_split_error(SplitErrorCode::construction_error, i,
                                        std::move(value.error()));
            }
            values.push_back(std::move(*value));
        }
        return values;
    }

    std::shared_ptr<const std::vector<FieldSpec>> specs_;
    std::optional<size_t> fixed_size_;
};

// ============================================================================
// Schema composition
// ============================================================================

/**
 * @brief Schema of @p head followed by @p tail
 */
inline Splitter concat(const Splitter& head, const Splitter& tail) {
    std::vector<FieldSpec> specs;
    specs.reserve(head.size() + tail.size());
    specs.insert(specs.end(), head.specs().begin(), head.specs().end());
    specs.insert(specs.end(), tail.specs().begin(), tail.specs().end());
    return Splitter(std::move(specs));
}

/**
 * @brief Schema of @p record repeated @p times times
 *
 * Lets n homogeneous records be split in one call; repeat_schema(s, 0) is
 * the empty schema.
 */
inline Splitter repeat_schema(const Splitter& record, size_t times) {
    std::vector<FieldSpec> specs;
    specs.reserve(record.size() * times);
    for (size_t i = 0; i < times; ++i) {
        specs.insert(specs.end(), record.specs().begin(), record.specs().end());
    }
    return Splitter(std::move(specs));
}

} // namespace bytesplit
