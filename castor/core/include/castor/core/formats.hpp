#pragma once

#include "value.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace castor::formats {

// Full-date per RFC 3339 (YYYY-MM-DD), calendar-checked.
std::optional<std::chrono::year_month_day> parse_date(std::string_view v) noexcept;

// Date-time per RFC 3339; the offset ("Z" or +hh:mm) is mandatory.
std::optional<date_time> parse_date_time(std::string_view v) noexcept;

bool is_valid_email(std::string_view v) noexcept;
bool is_valid_uri(std::string_view v) noexcept;
bool is_valid_uuid(std::string_view v) noexcept;
bool is_valid_base64(std::string_view v) noexcept;

std::string format_date(std::chrono::year_month_day d);
std::string format_date_time(const date_time& dt);

// Shortest round-trip text for a double; integral values print without a fraction.
std::string format_number(double d);

// Number of Unicode code points in UTF-8 text.
size_t utf8_length(std::string_view v) noexcept;

} // namespace castor::formats
