#pragma once

#include "value.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace re2 {
class RE2;
}

namespace castor::openapi {

enum class schema_kind : uint8_t { any, string, integer, number, boolean, object, array, null_type };

std::string_view schema_kind_name(schema_kind kind) noexcept;

struct schema;

struct number_constraints {
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<double> exclusive_minimum;
    std::optional<double> exclusive_maximum;
    std::optional<double> multiple_of;
};

struct discriminator {
    std::string property_name;
    // Discriminator value -> schema name, in document order.
    std::vector<std::pair<std::string, std::string>> mapping;

    [[nodiscard]] const std::string* find_mapping(std::string_view key) const noexcept;
};

struct property {
    std::string name;
    const schema* type = nullptr;
};

// One alternative per schema shape; the engine dispatches on the alternative.
struct any_shape {};

struct ref_shape {
    std::string name; // bare component name, resolved through the registry per cast
};

struct all_of_shape {
    std::vector<const schema*> branches;
    // x-struct of a node that also carries its own object keywords; wins over the branches' tags.
    std::string x_struct;
};

struct one_of_shape {
    std::vector<const schema*> branches;
    std::optional<openapi::discriminator> dispatch;
};

struct any_of_shape {
    std::vector<const schema*> branches;
};

struct not_shape {
    const schema* inner = nullptr;
};

struct string_shape {
    std::optional<size_t> min_length;
    std::optional<size_t> max_length;
    std::string pattern_source;
    // Compiled with RE2: matching is linear in the subject and never recurses on it.
    std::shared_ptr<const re2::RE2> pattern;
};

struct integer_shape {
    number_constraints bounds;
};

struct number_shape {
    number_constraints bounds;
};

struct boolean_shape {};

struct null_shape {};

struct object_shape {
    std::vector<property> properties;
    std::vector<std::string> required;
    const schema* additional = nullptr; // schema for undeclared keys
    bool additional_allowed = true;     // false: undeclared keys are errors
    std::optional<size_t> min_properties;
    std::optional<size_t> max_properties;
    std::string x_struct;

    [[nodiscard]] const property* find_property(std::string_view name) const noexcept;
    [[nodiscard]] bool is_required(std::string_view name) const noexcept;
};

struct array_shape {
    const schema* items = nullptr;
    std::optional<size_t> min_items;
    std::optional<size_t> max_items;
    bool unique_items = false;
};

using schema_shape = std::variant<any_shape,
                                  ref_shape,
                                  all_of_shape,
                                  one_of_shape,
                                  any_of_shape,
                                  not_shape,
                                  string_shape,
                                  integer_shape,
                                  number_shape,
                                  boolean_shape,
                                  null_shape,
                                  object_shape,
                                  array_shape>;

// Immutable once the owning registry is published. Child schemas are
// non-owning pointers into the same registry.
struct schema {
    std::string name; // component name; empty for inline schemas

    // Declared `type`. Governs null acceptance even when the shape is a
    // composition (e.g. `type: object` + `allOf`).
    schema_kind type = schema_kind::any;
    schema_shape shape;

    std::string format;
    std::string title;
    std::string description;
    bool nullable = false;
    bool read_only = false;
    bool write_only = false;
    bool deprecated = false;

    std::vector<value> enum_values;
    std::optional<value> default_value;
    std::optional<value> example;

    template <typename Shape> [[nodiscard]] const Shape* as() const noexcept {
        return std::get_if<Shape>(&shape);
    }

    template <typename Shape> [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<Shape>(shape);
    }

    [[nodiscard]] bool accepts_null() const noexcept;
};

} // namespace castor::openapi
