#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "detail/field_concepts.hpp"
#include "detail/named_schema.hpp"
#include "detail/split_result.hpp"
#include "field_value.hpp"
#include "splitter.hpp"
#include "types.hpp"

namespace bytesplit {

template <FieldMapConstructible Target>
class Kwargifier;

/**
 * Partially built target with just-in-time field decoding.
 *
 * Produced by Kwargifier::build_partial(). The buffer has already been
 * segmented, so every field's bytes are known, but nothing has been
 * decoded. get_field() decodes one field on first use and caches it;
 * later reads return the cached value. None of Target's own behavior is
 * reachable until finish() builds the real object.
 *
 * Usage:
 *   auto brewing = coffee_kwargifier.build_partial(buffer);
 *   auto blend = brewing->get<Bytes>("blend");     // decodes "blend" only
 *   auto cup = std::move(*brewing).finish();       // decodes the rest
 *
 * Not thread-safe: the cache is mutated by reads. Owns a copy of the
 * buffer, so it does not depend on the caller's buffer lifetime.
 */
template <FieldMapConstructible Target>
class PartialResult {
public:
    PartialResult(const PartialResult&) = delete;
    PartialResult& operator=(const PartialResult&) = delete;

    PartialResult(PartialResult&& other) noexcept
        : schema_(std::move(other.schema_)),
          buffer_(std::move(other.buffer_)),
          segments_(std::move(other.segments_)),
          cache_(std::move(other.cache_)),
          finished_(std::exchange(other.finished_, true)) {}

    PartialResult& operator=(PartialResult&& other) noexcept {
        if (this != &other) {
            schema_ = std::move(other.schema_);
            buffer_ = std::move(other.buffer_);
            segments_ = std::move(other.segments_);
            cache_ = std::move(other.cache_);
            finished_ = std::exchange(other.finished_, true);
        }
        return *this;
    }

    /**
     * @brief Decode (or fetch from cache) one named field
     *
     * Errors:
     * - attribute_resolution: @p name is not a field of the schema
     * - construction_error: the field's bytes were rejected
     * - usage_error: the result has already been finished
     */
    SplitResult<FieldValue> get_field(std::string_view name) {
        auto value = resolve(name);
        if (!value) {
            return make_unexpected(std::move(value.error()));
        }
        return **value;
    }

    /**
     * @brief Typed form of get_field()
     *
     * A field holding another type is a usage_error.
     */
    template <typename T>
    SplitResult<T> get(std::string_view name) {
        auto value = resolve(name);
        if (!value) {
            return make_unexpected(std::move(value.error()));
        }
        if (const T* typed = (*value)->template get_if<T>()) {
            return *typed;
        }
        return make_split_error(SplitErrorCode::usage_error, no_field,
                                "field '" + std::string(name) + "' holds another type");
    }

    /// Fields decoded so far
    const FieldMap& resolved() const noexcept { return cache_; }

    bool is_resolved(std::string_view name) const { return cache_.contains(name); }

    bool finished() const noexcept { return finished_; }

    /// Schema field names; empty on a moved-from result
    const std::vector<std::string>& field_names() const noexcept {
        static const std::vector<std::string> none;
        return schema_ ? schema_->names : none;
    }

    /**
     * @brief Decode the remaining fields and build the target
     *
     * Cached values are reused, not decoded again. A successful finish()
     * consumes the partial result and a second finish() is a usage_error.
     * On any failure, a field decode or the target constructor, the result
     * is left unfinished with its cache intact.
     */
    SplitResult<Target> finish() && {
        if (finished_) {
            return make_split_error(SplitErrorCode::usage_error, no_field,
                                    "partial result already finished");
        }

        for (size_t i = 0; i < schema_->names.size(); ++i) {
            auto value = resolve_index(i);
            if (!value) {
                return make_unexpected(std::move(value.error()));
            }
        }

        auto target = detail::construct_target<Target>(cache_);
        if (!target) {
            return target;
        }

        finished_ = true;
        cache_ = FieldMap{};
        Bytes().swap(buffer_);
        return target;
    }

private:
    friend class Kwargifier<Target>;

    PartialResult(std::shared_ptr<const detail::NamedSchema> schema, Bytes buffer,
                  std::vector<Segment> segments)
        : schema_(std::move(schema)),
          buffer_(std::move(buffer)),
          segments_(std::move(segments)) {}

    SplitResult<const FieldValue*> resolve(std::string_view name) {
        if (finished_) {
            return make_split_error(SplitErrorCode::usage_error, no_field,
                                    "partial result already finished");
        }
        auto index = schema_->index_of(name);
        if (!index) {
            return make_split_error(SplitErrorCode::attribute_resolution, no_field,
                                    "'" + std::string(name) +
                                        "' is not a field; call finish() to build the target");
        }
        return resolve_index(*index);
    }

    SplitResult<const FieldValue*> resolve_index(size_t index) {
        const std::string& name = schema_->names[index];
        if (cache_.contains(name)) {
            return &cache_.at(name);
        }

        const Segment& seg = segments_[index];
        auto value = schema_->splitter.specs()[index].decode(
            ByteView(buffer_).subspan(seg.offset, seg.size));
        if (!value) {
            return make_split_error(SplitErrorCode::construction_error, index,
                                    "field '" + name + "': " + value.error());
        }

        cache_.insert(name, std::move(*value));
        return &cache_.at(name);
    }

    std::shared_ptr<const detail::NamedSchema> schema_;
    Bytes buffer_;
    std::vector<Segment> segments_;
    FieldMap cache_;
    bool finished_ = false;
};

} // namespace bytesplit
