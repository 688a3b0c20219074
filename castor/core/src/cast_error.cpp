#include "castor/core/cast_error.hpp"

#include "castor/core/formats.hpp"
#include "castor/core/json.hpp"

namespace castor {

std::string_view cast_error_kind_name(cast_error_kind kind) noexcept {
    switch (kind) {
    case cast_error_kind::invalid_type:
        return "invalid-type";
    case cast_error_kind::invalid_format:
        return "invalid-format";
    case cast_error_kind::invalid_enum:
        return "invalid-enum";
    case cast_error_kind::missing_field:
        return "missing-field";
    case cast_error_kind::unexpected_field:
        return "unexpected-field";
    case cast_error_kind::no_match:
        return "no-match";
    case cast_error_kind::ambiguous_match:
        return "ambiguous-match";
    case cast_error_kind::unexpected_match:
        return "unexpected-match";
    case cast_error_kind::schema_not_found:
        return "schema-not-found";
    case cast_error_kind::discriminator_not_found:
        return "discriminator-not-found";
    case cast_error_kind::below_minimum:
        return "below-minimum";
    case cast_error_kind::above_maximum:
        return "above-maximum";
    case cast_error_kind::too_short:
        return "too-short";
    case cast_error_kind::too_long:
        return "too-long";
    case cast_error_kind::pattern_mismatch:
        return "pattern-mismatch";
    case cast_error_kind::not_multiple_of:
        return "not-multiple-of";
    case cast_error_kind::duplicate_items:
        return "duplicate-items";
    case cast_error_kind::too_few_properties:
        return "too-few-properties";
    case cast_error_kind::too_many_properties:
        return "too-many-properties";
    }
    return "unknown";
}

std::string to_pointer(const json_pointer& path) {
    if (path.empty()) {
        return "/";
    }
    std::string out;
    for (const auto& segment : path) {
        out.push_back('/');
        if (const auto* index = std::get_if<size_t>(&segment)) {
            out.append(std::to_string(*index));
            continue;
        }
        for (char c : std::get<std::string>(segment)) {
            if (c == '~') {
                out.append("~0");
            } else if (c == '/') {
                out.append("~1");
            } else {
                out.push_back(c);
            }
        }
    }
    return out;
}

namespace {

std::string bound_text(const std::optional<double>& bound) {
    return bound ? formats::format_number(*bound) : std::string("?");
}

std::string list_allowed(const std::vector<value>& allowed) {
    std::string out;
    for (size_t i = 0; i < allowed.size(); ++i) {
        if (i != 0) {
            out.append(", ");
        }
        to_json(allowed[i], out);
    }
    return out;
}

} // namespace

std::string cast_error::message() const {
    const std::string got(value_kind_name(offending.kind()));
    switch (kind) {
    case cast_error_kind::invalid_type:
        return "Invalid " + expected + ". Got: " + got;
    case cast_error_kind::invalid_format:
        return "Invalid format. Expected: " + expected;
    case cast_error_kind::invalid_enum:
        return "Invalid value. Expected one of: " + list_allowed(allowed);
    case cast_error_kind::missing_field:
        return "Missing field: " + expected;
    case cast_error_kind::unexpected_field:
        return "Unexpected field: " + expected;
    case cast_error_kind::no_match:
        return "Value matched none of " + std::to_string(branches.size()) + " schemas";
    case cast_error_kind::ambiguous_match:
        return "Value matched " + std::to_string(matched.size()) +
               " schemas, expected exactly one";
    case cast_error_kind::unexpected_match:
        return "Value must not match the schema";
    case cast_error_kind::schema_not_found:
        return "Schema not found: " + expected;
    case cast_error_kind::discriminator_not_found:
        return "No schema for discriminator value: " + expected;
    case cast_error_kind::below_minimum:
        return std::string("Value must be greater than ") + (exclusive ? "" : "or equal to ") +
               bound_text(bound);
    case cast_error_kind::above_maximum:
        return std::string("Value must be less than ") + (exclusive ? "" : "or equal to ") +
               bound_text(bound);
    case cast_error_kind::too_short:
        if (offending.is_array()) {
            return "Array must contain at least " + bound_text(bound) + " items";
        }
        return "Length must be at least " + bound_text(bound);
    case cast_error_kind::too_long:
        if (offending.is_array()) {
            return "Array must contain at most " + bound_text(bound) + " items";
        }
        return "Length must be at most " + bound_text(bound);
    case cast_error_kind::pattern_mismatch:
        return "Value does not match pattern: " + expected;
    case cast_error_kind::not_multiple_of:
        return "Value must be a multiple of " + bound_text(bound);
    case cast_error_kind::duplicate_items:
        return "Array items must be unique";
    case cast_error_kind::too_few_properties:
        return "Object must have at least " + bound_text(bound) + " properties";
    case cast_error_kind::too_many_properties:
        return "Object must have at most " + bound_text(bound) + " properties";
    }
    return "Invalid value";
}

value render_errors(const cast_errors& errors) {
    array_t list;
    list.reserve(errors.size());
    for (const auto& e : errors) {
        list.push_back(value::object({
            {"message", e.message()},
            {"source", value::object({{"pointer", e.pointer()}})},
            {"title", e.title()},
        }));
    }
    return value::object({{"errors", value(std::move(list))}});
}

} // namespace castor
