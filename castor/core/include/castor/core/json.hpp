#pragma once

#include "result.hpp"
#include "value.hpp"

#include <string>
#include <string_view>

namespace castor {

// Strict RFC 8259 reader. Integer literals that fit int64 become integer
// values, every other number becomes a double. Duplicate keys are rejected.
result<value> parse_json(std::string_view text);

// Compact writer. Dates render as YYYY-MM-DD, date-times as RFC 3339.
std::string to_json(const value& v);
void to_json(const value& v, std::string& out);

} // namespace castor
