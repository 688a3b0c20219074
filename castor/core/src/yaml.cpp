#include "castor/core/yaml.hpp"

#include "castor/core/json.hpp"
#include "castor/core/serde.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>

namespace castor {

namespace {

using serde::yaml_node;

bool is_plain_integer(std::string_view s) noexcept {
    size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    if (i >= s.size()) {
        return false;
    }
    for (; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') {
            return false;
        }
    }
    return true;
}

bool is_plain_float(std::string_view s) noexcept {
    size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    size_t mantissa_digits = 0;
    bool seen_dot = false;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (c >= '0' && c <= '9') {
            ++mantissa_digits;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            break;
        }
    }
    if (mantissa_digits == 0) {
        return false;
    }
    if (i == s.size()) {
        return seen_dot;
    }
    if (s[i] != 'e' && s[i] != 'E') {
        return false;
    }
    ++i;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
        ++i;
    }
    if (i >= s.size()) {
        return false;
    }
    for (; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') {
            return false;
        }
    }
    return true;
}

std::optional<uint32_t> parse_hex(std::string_view s) noexcept {
    uint32_t cp = 0;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), cp, 16);
    if (ec != std::errc() || p != s.data() + s.size()) {
        return std::nullopt;
    }
    return cp;
}

std::optional<std::string> unquote_double(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++i >= s.size()) {
            return std::nullopt;
        }
        switch (s[i]) {
        case 'n':
            out.push_back('\n');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 'b':
            out.push_back('\b');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case '0':
            out.push_back('\0');
            break;
        case '\"':
        case '\\':
        case '/':
        case ' ':
            out.push_back(s[i]);
            break;
        case 'x':
        case 'u': {
            const size_t width = s[i] == 'x' ? 2 : 4;
            if (i + width >= s.size()) {
                return std::nullopt;
            }
            auto cp = parse_hex(s.substr(i + 1, width));
            if (!cp) {
                return std::nullopt;
            }
            serde::append_utf8(out, *cp);
            i += width;
            break;
        }
        default:
            return std::nullopt;
        }
    }
    return out;
}

std::string unquote_single(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        out.push_back(s[i]);
        if (s[i] == '\'' && i + 1 < s.size() && s[i + 1] == '\'') {
            ++i;
        }
    }
    return out;
}

std::optional<value> type_scalar(std::string_view raw) {
    if (serde::is_quoted(raw)) {
        auto inner = raw.substr(1, raw.size() - 2);
        if (raw.front() == '\'') {
            return value(unquote_single(inner));
        }
        auto unescaped = unquote_double(inner);
        if (!unescaped) {
            return std::nullopt;
        }
        return value(std::move(*unescaped));
    }
    if (raw.empty() || raw == "~" || raw == "null" || raw == "Null" || raw == "NULL") {
        return value();
    }
    if (raw == "true" || raw == "True" || raw == "TRUE") {
        return value(true);
    }
    if (raw == "false" || raw == "False" || raw == "FALSE") {
        return value(false);
    }
    if (is_plain_integer(raw)) {
        auto digits = raw.front() == '+' ? raw.substr(1) : raw;
        int64_t i = 0;
        auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), i);
        if (ec == std::errc() && p == digits.data() + digits.size()) {
            return value(i);
        }
    }
    if (is_plain_float(raw)) {
        auto digits = raw.front() == '+' ? raw.substr(1) : raw;
        double d = 0.0;
        auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), d);
        if (ec == std::errc() && p == digits.data() + digits.size()) {
            return value(d);
        }
    }
    return value(std::string(raw));
}

std::optional<value> to_value(const yaml_node& node, std::string* error) {
    switch (node.k) {
    case yaml_node::kind::scalar: {
        auto v = type_scalar(node.scalar);
        if (!v && error) {
            *error = "invalid escape in quoted scalar: " + node.scalar;
        }
        return v;
    }
    case yaml_node::kind::array: {
        array_t items;
        items.reserve(node.array.size());
        for (const auto& child : node.array) {
            auto v = to_value(*child, error);
            if (!v) {
                return std::nullopt;
            }
            items.push_back(std::move(*v));
        }
        return value(std::move(items));
    }
    case yaml_node::kind::object: {
        object_t obj;
        obj.members.reserve(node.object.size());
        for (const auto& [key, child] : node.object) {
            auto v = to_value(*child, error);
            if (!v) {
                return std::nullopt;
            }
            obj.members.emplace_back(key, std::move(*v));
        }
        return value(std::move(obj));
    }
    }
    return std::nullopt;
}

std::unexpected<std::error_code> yaml_failure(std::string* error, size_t line, std::string_view why) {
    if (error) {
        *error = "line " + std::to_string(line) + ": " + std::string(why);
    }
    return std::unexpected(make_error_code(error_code::yaml_parse_error));
}

} // namespace

result<value> parse_yaml(std::string_view text, std::string* error) {
    auto lines = serde::tokenize_yaml(text);
    if (lines.empty()) {
        return yaml_failure(error, 0, "empty document");
    }

    serde::yaml_diagnostic diag;
    yaml_node root;
    size_t idx = 0;
    const auto& first = lines.front();
    const bool is_item = first.content == "-" || first.content.starts_with("- ");
    if (lines.size() == 1 && !is_item &&
        serde::find_mapping_colon(first.content) == std::string_view::npos) {
        root = serde::parse_inline_value(first.content, &diag, first.number);
        idx = 1;
    } else {
        root = serde::parse_yaml_block(lines, idx, first.indent, &diag);
    }
    if (diag.message.empty() && idx < lines.size()) {
        serde::set_yaml_error(&diag, lines[idx].number, "content outside the document root");
    }
    if (!diag.message.empty()) {
        return yaml_failure(error, diag.line, diag.message);
    }

    std::string scalar_error;
    auto v = to_value(root, &scalar_error);
    if (!v) {
        return yaml_failure(error, first.number, scalar_error);
    }
    return std::move(*v);
}

result<value> parse_document(std::string_view text, std::string* error) {
    auto trimmed = serde::trim_view(text);
    if (!trimmed.empty() && (trimmed.front() == '{' || trimmed.front() == '[')) {
        auto v = parse_json(trimmed);
        if (!v && error) {
            *error = "malformed JSON";
        }
        return v;
    }
    return parse_yaml(text, error);
}

} // namespace castor
