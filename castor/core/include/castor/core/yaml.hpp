#pragma once

#include "result.hpp"
#include "value.hpp"

#include <string>
#include <string_view>

namespace castor {

// Reads the YAML subset used by OpenAPI documents (see serde.hpp). Plain
// scalars are typed: null/~/empty, true/false, integers and floats; anything
// else, and every quoted scalar, is a string. On failure `error` (when given)
// receives "line N: reason".
result<value> parse_yaml(std::string_view text, std::string* error = nullptr);

// JSON when the text starts with '{' or '[', YAML otherwise.
result<value> parse_document(std::string_view text, std::string* error = nullptr);

} // namespace castor
