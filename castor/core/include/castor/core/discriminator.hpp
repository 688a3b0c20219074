#pragma once

#include "cast_error.hpp"
#include "registry.hpp"
#include "schema.hpp"
#include "value.hpp"

#include <expected>

namespace castor::openapi {

// Picks the concrete schema for a polymorphic object. The property value is
// looked up in the explicit mapping first, then used as a schema name.
//   missing property          -> missing-field at path/<propertyName>
//   non-string property value -> invalid-type at path/<propertyName>
//   no schema for the value   -> discriminator-not-found at path
// `input` must be an object.
std::expected<const schema*, cast_error> resolve_discriminator(const value& input,
                                                               const discriminator& disc,
                                                               const registry& reg,
                                                               const json_pointer& path);

} // namespace castor::openapi
