#include "castor/core/cast.hpp"

#include "castor/core/discriminator.hpp"
#include "castor/core/formats.hpp"

#include <re2/re2.h>

#include <charconv>
#include <cmath>
#include <compare>
#include <limits>
#include <optional>
#include <system_error>
#include <utility>

namespace castor {

namespace {

using openapi::schema;

constexpr double kMultipleOfTolerance = 1e-9;
// 2^63, exactly representable as a double.
constexpr double kTwoPow63 = 9223372036854775808.0;

// Follows a chain of reference nodes; nullptr on a dangling name.
const schema* follow_refs(const schema* s, const openapi::registry& reg) noexcept {
    size_t hops = 0;
    while (s) {
        const auto* ref = s->as<openapi::ref_shape>();
        if (!ref || ++hops > reg.size() + 1) {
            break;
        }
        s = reg.resolve(ref->name);
    }
    return s;
}

bool flag_on_chain(const schema* s, const openapi::registry& reg, bool schema::*flag) noexcept {
    if (!s) {
        return false;
    }
    if (s->*flag) {
        return true;
    }
    const schema* target = follow_refs(s, reg);
    return target && target->*flag;
}

const value* default_on_chain(const schema* s, const openapi::registry& reg) noexcept {
    if (!s) {
        return nullptr;
    }
    if (s->default_value) {
        return &*s->default_value;
    }
    const schema* target = follow_refs(s, reg);
    return target && target->default_value ? &*target->default_value : nullptr;
}

bool same_as_raw(const value& v, const value* raw) noexcept {
    return raw && v.kind() == raw->kind() && v == *raw;
}

// allOf results merge left to right: nested objects merge, any other later value wins
// unless it is the raw input copied through while the earlier branch typed it.
void deep_merge(value& into, const value& from, const value* raw) {
    if (!into.is_object() || !from.is_object()) {
        if (same_as_raw(from, raw) && !same_as_raw(into, raw)) {
            return;
        }
        into = from;
        return;
    }
    object_t& dst = into.as_object();
    const object_t& src = from.as_object();
    const object_t* raw_obj = raw && raw->is_object() ? &raw->as_object() : nullptr;
    for (const auto& [key, v] : src.members) {
        if (value* existing = dst.find(key)) {
            deep_merge(*existing, v, raw_obj ? raw_obj->find(key) : nullptr);
        } else {
            dst.members.emplace_back(key, v);
        }
    }
    if (!src.struct_name.empty()) {
        dst.struct_name = src.struct_name;
    }
}

// Orders an integer against a bound without rounding the integer through double.
std::strong_ordering compare_to_bound(int64_t x, double bound) noexcept {
    if (bound >= kTwoPow63) {
        return std::strong_ordering::less;
    }
    if (bound < -kTwoPow63) {
        return std::strong_ordering::greater;
    }
    const double whole = std::floor(bound);
    const auto floor_bound = static_cast<int64_t>(whole);
    if (x != floor_bound) {
        return x <=> floor_bound;
    }
    return whole == bound ? std::strong_ordering::equal : std::strong_ordering::less;
}

std::optional<int64_t> parse_int64(std::string_view text) noexcept {
    int64_t out = 0;
    auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc() || p != text.data() + text.size()) {
        return std::nullopt;
    }
    return out;
}

std::optional<double> parse_double(std::string_view text) noexcept {
    double out = 0.0;
    auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc() || p != text.data() + text.size() || !std::isfinite(out)) {
        return std::nullopt;
    }
    return out;
}

class caster {
public:
    caster(const openapi::registry& reg, const cast_options& opts, json_pointer path)
        : reg_(reg), opts_(opts), path_(std::move(path)) {}

    // nullopt exactly when at least one error was recorded.
    std::optional<value> cast_node(const value& in, const schema& s) {
        if (in.is_null() && s.nullable) {
            return value();
        }
        if (const auto* ref = s.as<openapi::ref_shape>()) {
            const schema* target = reg_.resolve(ref->name);
            if (!target) {
                fail(cast_error_kind::schema_not_found, in, ref->name);
                return std::nullopt;
            }
            return cast_node(in, *target);
        }
        if (in.is_null()) {
            if (s.accepts_null()) {
                return value();
            }
            fail(cast_error_kind::invalid_type, in, std::string(schema_kind_name(s.type)));
            return std::nullopt;
        }

        auto typed = std::visit([&](const auto& shape) { return cast_shape(in, s, shape); },
                                s.shape);
        if (typed && !s.enum_values.empty()) {
            bool allowed = false;
            for (const auto& member : s.enum_values) {
                if (member == *typed || member == in) {
                    allowed = true;
                    break;
                }
            }
            if (!allowed) {
                auto& err = fail(cast_error_kind::invalid_enum, in);
                err.allowed = s.enum_values;
                return std::nullopt;
            }
        }
        return typed;
    }

    cast_errors take_errors() noexcept { return std::move(errors_); }

private:
    cast_error& fail(cast_error_kind kind, const value& offending, std::string expected = {}) {
        cast_error& err = errors_.emplace_back();
        err.kind = kind;
        err.path = path_;
        err.offending = offending;
        err.expected = std::move(expected);
        return err;
    }

    cast_error& fail_bound(cast_error_kind kind, const value& offending, double bound,
                           bool exclusive = false) {
        cast_error& err = fail(kind, offending);
        err.bound = bound;
        err.exclusive = exclusive;
        return err;
    }

    // Casts in isolation at the current path, for composition branches.
    cast_result attempt(const value& in, const schema& s) const {
        caster sub(reg_, opts_, path_);
        auto typed = sub.cast_node(in, s);
        if (typed && sub.errors_.empty()) {
            return std::move(*typed);
        }
        return std::unexpected(sub.take_errors());
    }

    std::optional<value> cast_child(const value& in, const schema* s, path_segment segment) {
        path_.push_back(std::move(segment));
        std::optional<value> out = s ? cast_node(in, *s) : std::optional<value>(in);
        path_.pop_back();
        return out;
    }

    std::optional<value> cast_shape(const value& in, const schema&, const openapi::any_shape&) {
        return in;
    }

    std::optional<value> cast_shape(const value& in, const schema&, const openapi::ref_shape&) {
        // Handled in cast_node before dispatch.
        return in;
    }

    std::optional<value>
    cast_shape(const value& in, const schema&, const openapi::all_of_shape& shape) {
        std::optional<value> merged;
        bool failed = false;
        for (const schema* branch : shape.branches) {
            auto r = attempt(in, *branch);
            if (!r) {
                failed = true;
                for (auto& e : r.error()) {
                    errors_.push_back(std::move(e));
                }
                continue;
            }
            if (!merged) {
                merged = std::move(*r);
            } else {
                deep_merge(*merged, *r, &in);
            }
        }
        if (failed) {
            return std::nullopt;
        }
        if (!merged) {
            return in;
        }
        if (!shape.x_struct.empty() && merged->is_object()) {
            merged->as_object().struct_name = shape.x_struct;
        }
        return merged;
    }

    std::optional<value>
    cast_shape(const value& in, const schema&, const openapi::one_of_shape& shape) {
        if (shape.dispatch) {
            if (!in.is_object()) {
                fail(cast_error_kind::invalid_type, in, "object");
                return std::nullopt;
            }
            auto chosen = openapi::resolve_discriminator(in, *shape.dispatch, reg_, path_);
            if (!chosen) {
                errors_.push_back(std::move(chosen.error()));
                return std::nullopt;
            }
            return cast_node(in, **chosen);
        }

        std::vector<cast_errors> failures;
        std::vector<size_t> matched;
        std::optional<value> first;
        for (size_t i = 0; i < shape.branches.size(); ++i) {
            auto r = attempt(in, *shape.branches[i]);
            if (r) {
                matched.push_back(i);
                if (!first) {
                    first = std::move(*r);
                }
            } else {
                failures.push_back(std::move(r.error()));
            }
        }
        if (matched.size() == 1) {
            return first;
        }
        if (matched.empty()) {
            auto& err = fail(cast_error_kind::no_match, in);
            err.branches = std::move(failures);
            return std::nullopt;
        }
        auto& err = fail(cast_error_kind::ambiguous_match, in);
        err.matched = std::move(matched);
        return std::nullopt;
    }

    std::optional<value>
    cast_shape(const value& in, const schema&, const openapi::any_of_shape& shape) {
        std::vector<cast_errors> failures;
        for (const schema* branch : shape.branches) {
            auto r = attempt(in, *branch);
            if (r) {
                return std::move(*r);
            }
            failures.push_back(std::move(r.error()));
        }
        auto& err = fail(cast_error_kind::no_match, in);
        err.branches = std::move(failures);
        return std::nullopt;
    }

    std::optional<value> cast_shape(const value& in, const schema&, const openapi::not_shape& shape) {
        if (shape.inner && attempt(in, *shape.inner)) {
            fail(cast_error_kind::unexpected_match, in);
            return std::nullopt;
        }
        return in;
    }

    std::optional<value>
    cast_shape(const value& in, const schema& s, const openapi::string_shape& shape) {
        std::string text;
        std::optional<value> typed;
        if (in.is_string()) {
            text = in.as_string();
        } else if (in.is_date() && s.format == "date") {
            text = formats::format_date(in.as_date());
            typed = in;
        } else if (in.is_date_time() && s.format == "date-time") {
            text = formats::format_date_time(in.as_date_time());
            typed = in;
        } else {
            fail(cast_error_kind::invalid_type, in, "string");
            return std::nullopt;
        }

        if (!typed) {
            typed = cast_string_format(in, text, s.format);
            if (!typed) {
                return std::nullopt;
            }
        }

        const size_t before = errors_.size();
        const size_t length = formats::utf8_length(text);
        if (shape.min_length && length < *shape.min_length) {
            fail_bound(cast_error_kind::too_short, in, static_cast<double>(*shape.min_length));
        }
        if (shape.max_length && length > *shape.max_length) {
            fail_bound(cast_error_kind::too_long, in, static_cast<double>(*shape.max_length));
        }
        if (shape.pattern && !re2::RE2::PartialMatch(text, *shape.pattern)) {
            fail(cast_error_kind::pattern_mismatch, in, shape.pattern_source);
        }
        if (errors_.size() != before) {
            return std::nullopt;
        }
        return typed;
    }

    std::optional<value>
    cast_string_format(const value& in, const std::string& text, const std::string& format) {
        if (format == "date") {
            if (auto d = formats::parse_date(text)) {
                return value(*d);
            }
        } else if (format == "date-time") {
            if (auto dt = formats::parse_date_time(text)) {
                return value(*dt);
            }
        } else if ((format == "email" && !formats::is_valid_email(text)) ||
                   (format == "uri" && !formats::is_valid_uri(text)) ||
                   (format == "uuid" && !formats::is_valid_uuid(text)) ||
                   (format == "byte" && !formats::is_valid_base64(text))) {
            fail(cast_error_kind::invalid_format, in, format);
            return std::nullopt;
        } else {
            return in;
        }
        fail(cast_error_kind::invalid_format, in, format);
        return std::nullopt;
    }

    std::optional<value>
    cast_shape(const value& in, const schema& s, const openapi::integer_shape& shape) {
        std::optional<int64_t> i;
        if (in.is_integer()) {
            i = in.as_integer();
        } else if (in.kind() == value_kind::number) {
            const double d = in.as_number();
            if (std::isfinite(d) && std::trunc(d) == d) {
                if (d < kTwoPow63 && d >= -kTwoPow63) {
                    i = static_cast<int64_t>(d);
                } else if (s.format == "int64") {
                    fail(cast_error_kind::invalid_format, in, "int64");
                    return std::nullopt;
                }
            }
        } else if (in.is_string() && opts_.context == cast_context::parameter) {
            i = parse_int64(in.as_string());
        }
        if (!i) {
            fail(cast_error_kind::invalid_type, in, "integer");
            return std::nullopt;
        }
        if (s.format == "int32" &&
            (*i < std::numeric_limits<int32_t>::min() || *i > std::numeric_limits<int32_t>::max())) {
            fail(cast_error_kind::invalid_format, in, "int32");
            return std::nullopt;
        }
        if (!check_integer_bounds(in, *i, shape.bounds)) {
            return std::nullopt;
        }
        return value(*i);
    }

    std::optional<value>
    cast_shape(const value& in, const schema&, const openapi::number_shape& shape) {
        std::optional<value> typed;
        if (in.is_number()) {
            typed = in;
        } else if (in.is_string() && opts_.context == cast_context::parameter) {
            if (auto i = parse_int64(in.as_string())) {
                typed = value(*i);
            } else if (auto d = parse_double(in.as_string())) {
                typed = value(*d);
            }
        }
        if (!typed) {
            fail(cast_error_kind::invalid_type, in, "number");
            return std::nullopt;
        }
        if (!check_bounds(in, typed->as_number(), shape.bounds)) {
            return std::nullopt;
        }
        return typed;
    }

    bool check_bounds(const value& in, double x, const openapi::number_constraints& b) {
        const size_t before = errors_.size();
        if (b.minimum && x < *b.minimum) {
            fail_bound(cast_error_kind::below_minimum, in, *b.minimum);
        }
        if (b.exclusive_minimum && x <= *b.exclusive_minimum) {
            fail_bound(cast_error_kind::below_minimum, in, *b.exclusive_minimum, true);
        }
        if (b.maximum && x > *b.maximum) {
            fail_bound(cast_error_kind::above_maximum, in, *b.maximum);
        }
        if (b.exclusive_maximum && x >= *b.exclusive_maximum) {
            fail_bound(cast_error_kind::above_maximum, in, *b.exclusive_maximum, true);
        }
        if (b.multiple_of && *b.multiple_of > 0.0) {
            const double q = x / *b.multiple_of;
            if (std::fabs(q - std::round(q)) > kMultipleOfTolerance) {
                fail_bound(cast_error_kind::not_multiple_of, in, *b.multiple_of);
            }
        }
        return errors_.size() == before;
    }

    bool check_integer_bounds(const value& in, int64_t x, const openapi::number_constraints& b) {
        const size_t before = errors_.size();
        if (b.minimum && compare_to_bound(x, *b.minimum) < 0) {
            fail_bound(cast_error_kind::below_minimum, in, *b.minimum);
        }
        if (b.exclusive_minimum && compare_to_bound(x, *b.exclusive_minimum) <= 0) {
            fail_bound(cast_error_kind::below_minimum, in, *b.exclusive_minimum, true);
        }
        if (b.maximum && compare_to_bound(x, *b.maximum) > 0) {
            fail_bound(cast_error_kind::above_maximum, in, *b.maximum);
        }
        if (b.exclusive_maximum && compare_to_bound(x, *b.exclusive_maximum) >= 0) {
            fail_bound(cast_error_kind::above_maximum, in, *b.exclusive_maximum, true);
        }
        if (b.multiple_of && *b.multiple_of > 0.0) {
            const double m = *b.multiple_of;
            bool multiple = false;
            if (std::trunc(m) == m && m < kTwoPow63) {
                multiple = x % static_cast<int64_t>(m) == 0;
            } else {
                const double q = static_cast<double>(x) / m;
                multiple = std::fabs(q - std::round(q)) <= kMultipleOfTolerance;
            }
            if (!multiple) {
                fail_bound(cast_error_kind::not_multiple_of, in, m);
            }
        }
        return errors_.size() == before;
    }

    std::optional<value> cast_shape(const value& in, const schema&, const openapi::boolean_shape&) {
        if (in.is_bool()) {
            return in;
        }
        if (in.is_string() && opts_.context == cast_context::parameter) {
            if (in.as_string() == "true") {
                return value(true);
            }
            if (in.as_string() == "false") {
                return value(false);
            }
        }
        fail(cast_error_kind::invalid_type, in, "boolean");
        return std::nullopt;
    }

    std::optional<value> cast_shape(const value& in, const schema&, const openapi::null_shape&) {
        fail(cast_error_kind::invalid_type, in, "null");
        return std::nullopt;
    }

    std::optional<value>
    cast_shape(const value& in, const schema&, const openapi::object_shape& shape) {
        if (!in.is_object()) {
            fail(cast_error_kind::invalid_type, in, "object");
            return std::nullopt;
        }
        const object_t& raw = in.as_object();
        const size_t before = errors_.size();

        if (shape.min_properties && raw.size() < *shape.min_properties) {
            fail_bound(
                cast_error_kind::too_few_properties, in, static_cast<double>(*shape.min_properties));
        }
        if (shape.max_properties && raw.size() > *shape.max_properties) {
            fail_bound(
                cast_error_kind::too_many_properties, in, static_cast<double>(*shape.max_properties));
        }

        object_t out;
        out.members.reserve(raw.size());
        for (const auto& [key, member] : raw.members) {
            std::optional<value> typed;
            if (const auto* prop = shape.find_property(key)) {
                typed = cast_child(member, prop->type, key);
            } else if (shape.additional) {
                typed = cast_child(member, shape.additional, key);
            } else if (!shape.additional_allowed) {
                path_.emplace_back(key);
                fail(cast_error_kind::unexpected_field, member, key);
                path_.pop_back();
            } else {
                typed = member;
            }
            if (typed) {
                out.members.emplace_back(key, std::move(*typed));
            }
        }

        for (const auto& prop : shape.properties) {
            if (raw.contains(prop.name)) {
                continue;
            }
            if (shape.is_required(prop.name) && !exempt_from_required(prop.type)) {
                path_.emplace_back(prop.name);
                fail(cast_error_kind::missing_field, value(), prop.name);
                path_.pop_back();
                continue;
            }
            if (opts_.apply_defaults) {
                if (const value* def = default_on_chain(prop.type, reg_)) {
                    out.members.emplace_back(prop.name, *def);
                }
            }
        }
        // Required names without a declared property still have to be present.
        for (const auto& name : shape.required) {
            if (!shape.find_property(name) && !raw.contains(name)) {
                path_.emplace_back(name);
                fail(cast_error_kind::missing_field, value(), name);
                path_.pop_back();
            }
        }

        if (errors_.size() != before) {
            return std::nullopt;
        }
        out.struct_name = shape.x_struct;
        return value(std::move(out));
    }

    bool exempt_from_required(const schema* prop) const noexcept {
        if (opts_.direction == cast_direction::request) {
            return flag_on_chain(prop, reg_, &schema::read_only);
        }
        return flag_on_chain(prop, reg_, &schema::write_only);
    }

    std::optional<value>
    cast_shape(const value& in, const schema&, const openapi::array_shape& shape) {
        if (!in.is_array()) {
            fail(cast_error_kind::invalid_type, in, "array");
            return std::nullopt;
        }
        const array_t& raw = in.as_array();
        const size_t before = errors_.size();

        if (shape.min_items && raw.size() < *shape.min_items) {
            fail_bound(cast_error_kind::too_short, in, static_cast<double>(*shape.min_items));
        }
        if (shape.max_items && raw.size() > *shape.max_items) {
            fail_bound(cast_error_kind::too_long, in, static_cast<double>(*shape.max_items));
        }
        if (shape.unique_items && has_duplicates(raw)) {
            fail(cast_error_kind::duplicate_items, in);
        }

        array_t out;
        out.reserve(raw.size());
        for (size_t i = 0; i < raw.size(); ++i) {
            if (auto typed = cast_child(raw[i], shape.items, i)) {
                out.push_back(std::move(*typed));
            }
        }

        if (errors_.size() != before) {
            return std::nullopt;
        }
        return value(std::move(out));
    }

    static bool has_duplicates(const array_t& items) noexcept {
        for (size_t i = 0; i < items.size(); ++i) {
            for (size_t j = i + 1; j < items.size(); ++j) {
                if (items[i] == items[j]) {
                    return true;
                }
            }
        }
        return false;
    }

    const openapi::registry& reg_;
    const cast_options& opts_;
    json_pointer path_;
    cast_errors errors_;
};

} // namespace

cast_result cast(const value& input,
                 const openapi::schema& s,
                 const openapi::registry& reg,
                 const cast_options& opts) {
    return cast(input, s, reg, json_pointer{}, opts);
}

cast_result cast(const value& input,
                 const openapi::schema& s,
                 const openapi::registry& reg,
                 const json_pointer& path,
                 const cast_options& opts) {
    caster c(reg, opts, path);
    auto typed = c.cast_node(input, s);
    auto errors = c.take_errors();
    if (!typed || !errors.empty()) {
        return std::unexpected(std::move(errors));
    }
    return std::move(*typed);
}

validate_result validate(const value& input,
                         std::string_view schema_name,
                         const openapi::registry& reg,
                         const cast_options& opts) {
    const openapi::schema* s = reg.resolve(schema_name);
    if (!s) {
        cast_error err;
        err.kind = cast_error_kind::schema_not_found;
        err.offending = input;
        err.expected = std::string(schema_name);
        return std::unexpected(cast_errors{std::move(err)});
    }
    auto r = cast(input, *s, reg, opts);
    if (!r) {
        return std::unexpected(std::move(r.error()));
    }
    return {};
}

std::vector<example_failure> check_examples(const openapi::registry& reg,
                                            const cast_options& opts) {
    std::vector<example_failure> failures;
    for (const openapi::schema* s : reg.named()) {
        if (!s->example) {
            continue;
        }
        auto r = cast(*s->example, *s, reg, opts);
        if (!r) {
            failures.push_back({s->name, std::move(r.error())});
        }
    }
    return failures;
}

} // namespace castor
