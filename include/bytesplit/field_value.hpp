#pragma once

#include <any>
#include <concepts>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <type_traits>
#include <utility>
#include <vector>

#include "types.hpp"

namespace bytesplit {

class FieldValue;

/// Ordered decoded values produced by one split
using FieldList = std::vector<FieldValue>;

/**
 * @brief One decoded field value
 *
 * Owning, type-erased holder for whatever a schema slot produced: raw Bytes,
 * a std::string, an integer, a Mapping decoded from a remainder, or an
 * arbitrary field type. Repeated application of a multi-field schema stores
 * each record as a group (a FieldValue holding a FieldList).
 *
 * Access is checked: as<T>() throws std::bad_any_cast on a type mismatch,
 * get_if<T>() returns nullptr instead.
 */
class FieldValue {
public:
    FieldValue() = default;

    template <typename T>
        requires(!std::same_as<std::decay_t<T>, FieldValue> &&
                 std::copy_constructible<std::decay_t<T>>)
    explicit FieldValue(T&& value)
        : value_(std::forward<T>(value)) {}

    bool has_value() const noexcept { return value_.has_value(); }

    const std::type_info& type() const noexcept { return value_.type(); }

    template <typename T>
    bool is() const noexcept {
        return value_.type() == typeid(T);
    }

    template <typename T>
    const T* get_if() const noexcept {
        return std::any_cast<T>(&value_);
    }

    /**
     * @brief Access the held value
     * @throws std::bad_any_cast if the value is not a T
     */
    template <typename T>
    const T& as() const {
        if (const T* value = get_if<T>()) {
            return *value;
        }
        throw std::bad_any_cast();
    }

    /// Raw bytes of an undecoded field or remainder
    const Bytes& bytes() const { return as<Bytes>(); }

    bool is_group() const noexcept { return is<FieldList>(); }

    /// Values of one record from Splitter::repeat() on a multi-field schema
    const FieldList& group() const { return as<FieldList>(); }

private:
    std::any value_;
};

/**
 * Thrown by FieldMap::at() when a target asks for a field the schema did
 * not provide.
 */
class MissingField : public std::out_of_range {
public:
    explicit MissingField(const std::string& name)
        : std::out_of_range("missing required field '" + name + "'"),
          name_(name) {}

    const std::string& field_name() const noexcept { return name_; }

private:
    std::string name_;
};

/**
 * @brief Decoded fields addressed by name
 *
 * What a Kwargifier hands to its target type. Targets read their fields
 * with get<T>(name); asking for a field the schema lacks throws MissingField,
 * asking for the wrong type throws std::bad_any_cast. Both surface from the
 * Kwargifier as construction_error.
 */
class FieldMap {
public:
    using container_type = std::map<std::string, FieldValue, std::less<>>;
    using const_iterator = container_type::const_iterator;

    /// Insert or replace a field
    void insert(std::string name, FieldValue value) {
        fields_.insert_or_assign(std::move(name), std::move(value));
    }

    bool contains(std::string_view name) const { return fields_.find(name) != fields_.end(); }

    /**
     * @throws MissingField if @p name is absent
     */
    const FieldValue& at(std::string_view name) const {
        auto it = fields_.find(name);
        if (it == fields_.end()) {
            throw MissingField(std::string(name));
        }
        return it->second;
    }

    template <typename T>
    const T& get(std::string_view name) const {
        return at(name).as<T>();
    }

    size_t size() const noexcept { return fields_.size(); }
    bool empty() const noexcept { return fields_.empty(); }

    const_iterator begin() const noexcept { return fields_.begin(); }
    const_iterator end() const noexcept { return fields_.end(); }

    /// Field names in sorted order
    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(fields_.size());
        for (const auto& [name, value] : fields_) {
            out.push_back(name);
        }
        return out;
    }

private:
    container_type fields_;
};

} // namespace bytesplit
