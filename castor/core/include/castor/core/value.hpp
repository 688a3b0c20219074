#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace castor {

enum class value_kind : uint8_t { null, boolean, integer, number, string, array, object, date, date_time };

std::string_view value_kind_name(value_kind kind) noexcept;

// RFC 3339 timestamp: the UTC instant plus the offset it was written with.
struct date_time {
    std::chrono::sys_time<std::chrono::microseconds> instant{};
    std::chrono::minutes offset{0};

    [[nodiscard]] bool operator==(const date_time& other) const noexcept {
        return instant == other.instant && offset == other.offset;
    }
};

class value;

using array_t = std::vector<value>;

struct object_t {
    std::vector<std::pair<std::string, value>> members;
    // Set by x-struct schemas: identity of the concrete type this object stands for.
    std::string struct_name;

    [[nodiscard]] const value* find(std::string_view key) const noexcept;
    [[nodiscard]] value* find(std::string_view key) noexcept;
    [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }
    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    // Inserts or replaces, keeping the position of an existing key.
    void set(std::string key, value v);
};

class value {
public:
    value() noexcept = default;
    value(std::nullptr_t) noexcept {}
    value(bool b) noexcept : data_(b) {}
    template <std::integral I>
        requires(!std::same_as<I, bool>)
    value(I i) noexcept : data_(static_cast<int64_t>(i)) {}
    value(double d) noexcept : data_(d) {}
    value(std::string s) : data_(std::move(s)) {}
    value(std::string_view s) : data_(std::string(s)) {}
    value(const char* s) : data_(std::string(s)) {}
    value(array_t a) : data_(std::move(a)) {}
    value(object_t o) : data_(std::move(o)) {}
    value(std::chrono::year_month_day d) noexcept : data_(d) {}
    value(date_time dt) noexcept : data_(dt) {}

    static value array(std::initializer_list<value> items) { return value(array_t(items)); }
    static value object(std::initializer_list<std::pair<std::string, value>> members);

    [[nodiscard]] value_kind kind() const noexcept { return static_cast<value_kind>(data_.index()); }

    [[nodiscard]] bool is_null() const noexcept { return kind() == value_kind::null; }
    [[nodiscard]] bool is_bool() const noexcept { return kind() == value_kind::boolean; }
    [[nodiscard]] bool is_integer() const noexcept { return kind() == value_kind::integer; }
    [[nodiscard]] bool is_number() const noexcept {
        return kind() == value_kind::number || kind() == value_kind::integer;
    }
    [[nodiscard]] bool is_string() const noexcept { return kind() == value_kind::string; }
    [[nodiscard]] bool is_array() const noexcept { return kind() == value_kind::array; }
    [[nodiscard]] bool is_object() const noexcept { return kind() == value_kind::object; }
    [[nodiscard]] bool is_date() const noexcept { return kind() == value_kind::date; }
    [[nodiscard]] bool is_date_time() const noexcept { return kind() == value_kind::date_time; }

    // Accessors throw std::logic_error on a kind mismatch.
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] int64_t as_integer() const;
    [[nodiscard]] double as_number() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const array_t& as_array() const;
    [[nodiscard]] array_t& as_array();
    [[nodiscard]] const object_t& as_object() const;
    [[nodiscard]] object_t& as_object();
    [[nodiscard]] std::chrono::year_month_day as_date() const;
    [[nodiscard]] const date_time& as_date_time() const;

    // Object member lookup; nullptr when this is not an object or the key is absent.
    [[nodiscard]] const value* find(std::string_view key) const noexcept;

    [[nodiscard]] const value& operator[](size_t index) const { return as_array().at(index); }

    [[nodiscard]] size_t size() const noexcept;

private:
    std::variant<std::monostate,
                 bool,
                 int64_t,
                 double,
                 std::string,
                 array_t,
                 object_t,
                 std::chrono::year_month_day,
                 date_time>
        data_;
};

inline size_t object_t::size() const noexcept {
    return members.size();
}

inline bool object_t::empty() const noexcept {
    return members.empty();
}

bool operator==(const value& lhs, const value& rhs) noexcept;

// Writes the compact JSON form.
std::ostream& operator<<(std::ostream& os, const value& v);

} // namespace castor
