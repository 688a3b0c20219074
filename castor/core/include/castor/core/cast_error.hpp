#pragma once

#include "value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace castor {

enum class cast_error_kind : uint8_t {
    invalid_type,
    invalid_format,
    invalid_enum,
    missing_field,
    unexpected_field,
    no_match,
    ambiguous_match,
    unexpected_match,
    schema_not_found,
    discriminator_not_found,
    below_minimum,
    above_maximum,
    too_short,
    too_long,
    pattern_mismatch,
    not_multiple_of,
    duplicate_items,
    too_few_properties,
    too_many_properties,
};

// Stable identifier, e.g. "invalid-type".
std::string_view cast_error_kind_name(cast_error_kind kind) noexcept;

inline constexpr std::string_view cast_error_title(cast_error_kind kind) noexcept {
    switch (kind) {
    case cast_error_kind::invalid_type:
        return "Invalid type";
    case cast_error_kind::invalid_format:
        return "Invalid format";
    case cast_error_kind::invalid_enum:
        return "Invalid enum value";
    case cast_error_kind::missing_field:
        return "Missing field";
    case cast_error_kind::unexpected_field:
        return "Unexpected field";
    case cast_error_kind::no_match:
        return "No schema matched";
    case cast_error_kind::ambiguous_match:
        return "Ambiguous match";
    case cast_error_kind::unexpected_match:
        return "Unexpected match";
    case cast_error_kind::schema_not_found:
        return "Schema not found";
    case cast_error_kind::discriminator_not_found:
        return "Discriminator not found";
    case cast_error_kind::below_minimum:
        return "Value too small";
    case cast_error_kind::above_maximum:
        return "Value too large";
    case cast_error_kind::too_short:
        return "Too short";
    case cast_error_kind::too_long:
        return "Too long";
    case cast_error_kind::pattern_mismatch:
        return "Pattern mismatch";
    case cast_error_kind::not_multiple_of:
        return "Not a multiple";
    case cast_error_kind::duplicate_items:
        return "Duplicate items";
    case cast_error_kind::too_few_properties:
        return "Too few properties";
    case cast_error_kind::too_many_properties:
        return "Too many properties";
    }
    return "Invalid value";
}

// Object key or array index.
using path_segment = std::variant<std::string, size_t>;
using json_pointer = std::vector<path_segment>;

// RFC 6901 text; the root renders as "/".
std::string to_pointer(const json_pointer& path);

struct cast_error;
using cast_errors = std::vector<cast_error>;

struct cast_error {
    cast_error_kind kind = cast_error_kind::invalid_type;
    json_pointer path;
    value offending; // raw sub-value at `path`; null for missing fields

    // Kind-specific parameters. `expected` holds the type name, format,
    // pattern, field name, schema name or discriminator value.
    std::string expected;
    std::optional<double> bound;
    bool exclusive = false;
    std::vector<value> allowed;
    std::vector<cast_errors> branches; // no_match: failures of every branch, in order
    std::vector<size_t> matched;       // ambiguous_match: indices of the matching branches

    [[nodiscard]] std::string message() const;
    [[nodiscard]] std::string_view title() const noexcept { return cast_error_title(kind); }
    [[nodiscard]] std::string pointer() const { return to_pointer(path); }
};

// {"errors":[{"message":..,"source":{"pointer":..},"title":..}, ...]}
value render_errors(const cast_errors& errors);

} // namespace castor
