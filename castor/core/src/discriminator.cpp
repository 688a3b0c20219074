#include "castor/core/discriminator.hpp"

namespace castor::openapi {

std::expected<const schema*, cast_error> resolve_discriminator(const value& input,
                                                               const discriminator& disc,
                                                               const registry& reg,
                                                               const json_pointer& path) {
    json_pointer property_path = path;
    property_path.emplace_back(disc.property_name);

    const value* tag = input.find(disc.property_name);
    if (!tag) {
        cast_error err;
        err.kind = cast_error_kind::missing_field;
        err.path = std::move(property_path);
        err.expected = disc.property_name;
        return std::unexpected(std::move(err));
    }
    if (!tag->is_string()) {
        cast_error err;
        err.kind = cast_error_kind::invalid_type;
        err.path = std::move(property_path);
        err.offending = *tag;
        err.expected = "string";
        return std::unexpected(std::move(err));
    }

    const std::string& literal = tag->as_string();
    const std::string* target = disc.find_mapping(literal);
    if (const schema* s = reg.resolve(target ? *target : literal)) {
        return s;
    }

    cast_error err;
    if (target) {
        // The mapping names a component the document does not define.
        err.kind = cast_error_kind::schema_not_found;
        err.path = path;
        err.offending = input;
        err.expected = *target;
        return std::unexpected(std::move(err));
    }
    err.kind = cast_error_kind::discriminator_not_found;
    err.path = path;
    err.offending = input;
    err.expected = literal;
    return std::unexpected(std::move(err));
}

} // namespace castor::openapi
