#pragma once

#include "cast_error.hpp"
#include "registry.hpp"
#include "schema.hpp"
#include "value.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace castor {

// Where the raw value came from. Only `parameter` values (path, query,
// header text) may be coerced from strings to integers, numbers and booleans.
enum class cast_context : uint8_t { body, parameter };

// readOnly properties are not required in requests, writeOnly ones not in responses.
enum class cast_direction : uint8_t { request, response };

struct cast_options {
    cast_context context = cast_context::body;
    cast_direction direction = cast_direction::request;
    bool apply_defaults = true;
};

using cast_result = std::expected<value, cast_errors>;
using validate_result = std::expected<void, cast_errors>;

// Casts `input` against `s`, resolving references through `reg`. Failures at
// independent sibling positions are all reported. Pure: safe to call from any
// number of threads against the same registry.
cast_result cast(const value& input,
                 const openapi::schema& s,
                 const openapi::registry& reg,
                 const cast_options& opts = {});

// Same, with errors located below `path` instead of the root.
cast_result cast(const value& input,
                 const openapi::schema& s,
                 const openapi::registry& reg,
                 const json_pointer& path,
                 const cast_options& opts = {});

// Success/failure only, against a named component schema. An unknown name
// fails with schema-not-found at the root.
validate_result validate(const value& input,
                         std::string_view schema_name,
                         const openapi::registry& reg,
                         const cast_options& opts = {});

struct example_failure {
    std::string schema_name;
    cast_errors errors;
};

// Casts every named schema's `example` against that schema.
std::vector<example_failure> check_examples(const openapi::registry& reg,
                                            const cast_options& opts = {});

} // namespace castor
