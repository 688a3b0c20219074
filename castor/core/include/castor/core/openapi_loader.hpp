#pragma once

#include "registry.hpp"
#include "result.hpp"
#include "schema.hpp"
#include "value.hpp"

#include <string>
#include <string_view>

namespace castor::openapi {

struct document {
    std::string openapi_version;
    std::string info_title;
    std::string info_version;
    registry schemas; // components.schemas
};

// Loads an OpenAPI 3.x document (JSON or YAML). Paths are not modelled.
//   openapi_parse_error  : unreadable file, malformed JSON/YAML
//   openapi_invalid_spec : not 3.x, or a schema fails construction checks
result<document> load_from_string(std::string_view text);
result<document> load_from_file(const char* path);
result<document> load_from_value(const value& root);

// Builds one inline schema into an existing registry. References must name
// components of that registry; they are resolved at cast time.
result<const schema*> parse_schema(const value& node, registry& reg);
result<const schema*> parse_schema(std::string_view text, registry& reg);

} // namespace castor::openapi
