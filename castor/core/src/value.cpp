#include "castor/core/value.hpp"

#include <algorithm>
#include <stdexcept>

namespace castor {

std::string_view value_kind_name(value_kind kind) noexcept {
    switch (kind) {
    case value_kind::null:
        return "null";
    case value_kind::boolean:
        return "boolean";
    case value_kind::integer:
        return "integer";
    case value_kind::number:
        return "number";
    case value_kind::string:
        return "string";
    case value_kind::array:
        return "array";
    case value_kind::object:
        return "object";
    case value_kind::date:
        return "date";
    case value_kind::date_time:
        return "date-time";
    }
    return "unknown";
}

const value* object_t::find(std::string_view key) const noexcept {
    for (const auto& [name, member] : members) {
        if (name == key) {
            return &member;
        }
    }
    return nullptr;
}

value* object_t::find(std::string_view key) noexcept {
    for (auto& [name, member] : members) {
        if (name == key) {
            return &member;
        }
    }
    return nullptr;
}

void object_t::set(std::string key, value v) {
    if (auto* existing = find(key)) {
        *existing = std::move(v);
        return;
    }
    members.emplace_back(std::move(key), std::move(v));
}

value value::object(std::initializer_list<std::pair<std::string, value>> members) {
    object_t obj;
    obj.members.reserve(members.size());
    for (const auto& kv : members) {
        obj.set(kv.first, kv.second);
    }
    return value(std::move(obj));
}

namespace {

[[noreturn]] void bad_access(value_kind expected, value_kind actual) {
    throw std::logic_error("bad value access: expected " + std::string(value_kind_name(expected)) +
                           ", holds " + std::string(value_kind_name(actual)));
}

} // namespace

bool value::as_bool() const {
    if (!is_bool()) {
        bad_access(value_kind::boolean, kind());
    }
    return std::get<bool>(data_);
}

int64_t value::as_integer() const {
    if (!is_integer()) {
        bad_access(value_kind::integer, kind());
    }
    return std::get<int64_t>(data_);
}

double value::as_number() const {
    if (is_integer()) {
        return static_cast<double>(std::get<int64_t>(data_));
    }
    if (kind() != value_kind::number) {
        bad_access(value_kind::number, kind());
    }
    return std::get<double>(data_);
}

const std::string& value::as_string() const {
    if (!is_string()) {
        bad_access(value_kind::string, kind());
    }
    return std::get<std::string>(data_);
}

const array_t& value::as_array() const {
    if (!is_array()) {
        bad_access(value_kind::array, kind());
    }
    return std::get<array_t>(data_);
}

array_t& value::as_array() {
    if (!is_array()) {
        bad_access(value_kind::array, kind());
    }
    return std::get<array_t>(data_);
}

const object_t& value::as_object() const {
    if (!is_object()) {
        bad_access(value_kind::object, kind());
    }
    return std::get<object_t>(data_);
}

object_t& value::as_object() {
    if (!is_object()) {
        bad_access(value_kind::object, kind());
    }
    return std::get<object_t>(data_);
}

std::chrono::year_month_day value::as_date() const {
    if (!is_date()) {
        bad_access(value_kind::date, kind());
    }
    return std::get<std::chrono::year_month_day>(data_);
}

const date_time& value::as_date_time() const {
    if (!is_date_time()) {
        bad_access(value_kind::date_time, kind());
    }
    return std::get<date_time>(data_);
}

const value* value::find(std::string_view key) const noexcept {
    if (!is_object()) {
        return nullptr;
    }
    return std::get<object_t>(data_).find(key);
}

size_t value::size() const noexcept {
    if (is_array()) {
        return std::get<array_t>(data_).size();
    }
    if (is_object()) {
        return std::get<object_t>(data_).size();
    }
    return 0;
}

bool operator==(const value& lhs, const value& rhs) noexcept {
    if (lhs.is_number() && rhs.is_number()) {
        if (lhs.is_integer() && rhs.is_integer()) {
            return lhs.as_integer() == rhs.as_integer();
        }
        return lhs.as_number() == rhs.as_number();
    }
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    switch (lhs.kind()) {
    case value_kind::null:
        return true;
    case value_kind::boolean:
        return lhs.as_bool() == rhs.as_bool();
    case value_kind::string:
        return lhs.as_string() == rhs.as_string();
    case value_kind::date:
        return lhs.as_date() == rhs.as_date();
    case value_kind::date_time:
        return lhs.as_date_time() == rhs.as_date_time();
    case value_kind::array: {
        const auto& a = lhs.as_array();
        const auto& b = rhs.as_array();
        return std::equal(a.begin(), a.end(), b.begin(), b.end());
    }
    case value_kind::object: {
        const auto& a = lhs.as_object();
        const auto& b = rhs.as_object();
        if (a.size() != b.size()) {
            return false;
        }
        return std::all_of(a.members.begin(), a.members.end(), [&](const auto& kv) {
            const value* other = b.find(kv.first);
            return other && kv.second == *other;
        });
    }
    default:
        return false;
    }
}

} // namespace castor
