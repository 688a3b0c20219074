#include "castor/core/schema.hpp"

#include <algorithm>

namespace castor::openapi {

std::string_view schema_kind_name(schema_kind kind) noexcept {
    switch (kind) {
    case schema_kind::any:
        return "any";
    case schema_kind::string:
        return "string";
    case schema_kind::integer:
        return "integer";
    case schema_kind::number:
        return "number";
    case schema_kind::boolean:
        return "boolean";
    case schema_kind::object:
        return "object";
    case schema_kind::array:
        return "array";
    case schema_kind::null_type:
        return "null";
    }
    return "unknown";
}

const std::string* discriminator::find_mapping(std::string_view key) const noexcept {
    for (const auto& [from, to] : mapping) {
        if (from == key) {
            return &to;
        }
    }
    return nullptr;
}

const property* object_shape::find_property(std::string_view name) const noexcept {
    auto it = std::find_if(
        properties.begin(), properties.end(), [&](const property& p) { return p.name == name; });
    return it == properties.end() ? nullptr : &*it;
}

bool object_shape::is_required(std::string_view name) const noexcept {
    return std::find(required.begin(), required.end(), name) != required.end();
}

bool schema::accepts_null() const noexcept {
    return nullable || type == schema_kind::any || type == schema_kind::null_type ||
           is<null_shape>();
}

} // namespace castor::openapi
