#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../field_spec.hpp"
#include "../field_value.hpp"
#include "../splitter.hpp"
#include "field_concepts.hpp"
#include "split_result.hpp"

namespace bytesplit {

/**
 * One named slot of a Kwargifier schema.
 *
 * @code
 *   NamedField{"blend", variable_length}
 *   NamedField{"size", field<uint16_t>(2, {{"byteorder", "big"}})}
 * @endcode
 */
struct NamedField {
    std::string name;
    FieldSpec spec;
};

namespace detail {

/**
 * Field names paired with the splitter that decodes them, shared by a
 * Kwargifier and every PartialResult it hands out.
 */
struct NamedSchema {
    std::vector<std::string> names;
    Splitter splitter;

    std::optional<size_t> index_of(std::string_view name) const noexcept {
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == name) {
                return i;
            }
        }
        return std::nullopt;
    }
};

/**
 * @throws std::invalid_argument on an empty or duplicate field name
 */
inline std::shared_ptr<const NamedSchema> make_named_schema(std::vector<NamedField> fields) {
    std::vector<std::string> names;
    std::vector<FieldSpec> specs;
    std::unordered_set<std::string> seen;
    names.reserve(fields.size());
    specs.reserve(fields.size());

    for (auto& f : fields) {
        if (f.name.empty()) {
            throw std::invalid_argument("kwargifier field names must not be empty");
        }
        if (!seen.insert(f.name).second) {
            throw std::invalid_argument("duplicate kwargifier field '" + f.name + "'");
        }
        names.push_back(std::move(f.name));
        specs.push_back(std::move(f.spec));
    }

    return std::make_shared<const NamedSchema>(
        NamedSchema{.names = std::move(names), .splitter = Splitter(std::move(specs))});
}

/**
 * Build a target from its decoded fields. Anything the target throws,
 * MissingField included, is reported as a construction_error.
 */
template <FieldMapConstructible Target>
SplitResult<Target> construct_target(const FieldMap& fields) {
    try {
        if constexpr (FieldMapFactory<Target>) {
            Target target = Target::from_fields(fields);
            return target;
        } else {
            Target target(fields);
            return target;
        }
    } catch (const std::exception& e) {
        return make_split_error(SplitErrorCode::construction_error, no_field,
                                std::string("cannot construct ") + typeid(Target).name() +
                                    ": " + e.what());
    } catch (...) {
        return make_split_error(SplitErrorCode::construction_error, no_field,
                                std::string("cannot construct ") + typeid(Target).name() +
                                    ": target threw a non-standard exception");
    }
}

} // namespace detail
} // namespace bytesplit
