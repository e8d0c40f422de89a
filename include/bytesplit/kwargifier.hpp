#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "detail/field_concepts.hpp"
#include "detail/named_schema.hpp"
#include "detail/split_result.hpp"
#include "field_value.hpp"
#include "partial_result.hpp"
#include "splitter.hpp"
#include "types.hpp"

namespace bytesplit {

/**
 * Splitter that names its fields and builds a Target from them.
 *
 * Target receives the decoded fields as a FieldMap, through either
 * `static Target from_fields(const FieldMap&)` or a `Target(const FieldMap&)`
 * constructor, and reads them by name:
 *
 * @code
 *   struct Coffee {
 *       explicit Coffee(const FieldMap& f)
 *           : blend(f.get<Bytes>("blend")), size(f.get<uint16_t>("size")) {}
 *       Bytes blend;
 *       uint16_t size;
 *   };
 *
 *   Kwargifier<Coffee> coffee{{"blend", variable_length},
 *                             {"size", field<uint16_t>(2)}};
 *   auto cup = coffee(buffer);                  // expected<Coffee, SplitError>
 *   auto brewing = coffee.build_partial(buffer); // lazy, see PartialResult
 * @endcode
 *
 * Immutable and safe to share across threads once built.
 */
template <FieldMapConstructible Target>
class Kwargifier {
public:
    /**
     * @throws std::invalid_argument on an empty or duplicate field name
     */
    Kwargifier(std::initializer_list<NamedField> fields)
        : Kwargifier(std::vector<NamedField>(fields)) {}

    explicit Kwargifier(std::vector<NamedField> fields)
        : schema_(detail::make_named_schema(std::move(fields))) {}

    /**
     * @brief Split @p buffer and construct the target in one call
     *
     * The schema must consume the buffer exactly. Target constructor
     * failures, such as a missing required field, become construction_error.
     */
    SplitResult<Target> build(ByteView buffer) const {
        auto values = schema_->splitter.split(buffer);
        if (!values) {
            return make_unexpected(std::move(values.error()));
        }

        FieldMap fields;
        for (size_t i = 0; i < values->size(); ++i) {
            fields.insert(schema_->names[i], std::move((*values)[i]));
        }
        return detail::construct_target<Target>(fields);
    }

    SplitResult<Target> operator()(ByteView buffer) const { return build(buffer); }

    /**
     * @brief Segment @p buffer without decoding any field
     *
     * Size errors are reported here; construction errors are deferred to
     * the PartialResult's get_field() and finish().
     */
    SplitResult<PartialResult<Target>> build_partial(ByteView buffer) const {
        auto segments = schema_->splitter.segment(buffer);
        if (!segments) {
            return make_unexpected(std::move(segments.error()));
        }
        return PartialResult<Target>(schema_, Bytes(buffer.begin(), buffer.end()),
                                     std::move(*segments));
    }

    const std::vector<std::string>& field_names() const noexcept { return schema_->names; }

    const Splitter& splitter() const noexcept { return schema_->splitter; }

private:
    std::shared_ptr<const detail::NamedSchema> schema_;
};

} // namespace bytesplit
