#include "castor/core/json.hpp"

#include "castor/core/formats.hpp"
#include "castor/core/serde.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <system_error>

namespace castor {

namespace {

using serde::json_cursor;

constexpr int kMaxNestingDepth = 256;

class json_reader {
public:
    explicit json_reader(std::string_view text) : cur_(text.data(), text.data() + text.size()) {}

    std::optional<value> read_document() {
        auto v = read_value(0);
        if (!v) {
            return std::nullopt;
        }
        cur_.skip_ws();
        if (!cur_.eof()) {
            return std::nullopt;
        }
        return v;
    }

private:
    std::optional<value> read_value(int depth) {
        if (depth > kMaxNestingDepth) {
            return std::nullopt;
        }
        cur_.skip_ws();
        switch (cur_.peek()) {
        case '{':
            return read_object(depth);
        case '[':
            return read_array(depth);
        case '\"': {
            auto s = read_string();
            if (!s) {
                return std::nullopt;
            }
            return value(std::move(*s));
        }
        case 't':
            if (cur_.consume_literal("true")) {
                return value(true);
            }
            return std::nullopt;
        case 'f':
            if (cur_.consume_literal("false")) {
                return value(false);
            }
            return std::nullopt;
        case 'n':
            if (cur_.consume_literal("null")) {
                return value();
            }
            return std::nullopt;
        default:
            return read_number();
        }
    }

    std::optional<value> read_object(int depth) {
        cur_.try_object_start();
        object_t obj;
        if (cur_.try_object_end()) {
            return value(std::move(obj));
        }
        while (true) {
            cur_.skip_ws();
            auto key = read_string();
            if (!key || !cur_.consume(':')) {
                return std::nullopt;
            }
            if (obj.contains(*key)) {
                return std::nullopt;
            }
            auto member = read_value(depth + 1);
            if (!member) {
                return std::nullopt;
            }
            obj.members.emplace_back(std::move(*key), std::move(*member));
            if (cur_.try_comma()) {
                continue;
            }
            if (cur_.try_object_end()) {
                return value(std::move(obj));
            }
            return std::nullopt;
        }
    }

    std::optional<value> read_array(int depth) {
        cur_.try_array_start();
        array_t items;
        if (cur_.try_array_end()) {
            return value(std::move(items));
        }
        while (true) {
            auto item = read_value(depth + 1);
            if (!item) {
                return std::nullopt;
            }
            items.push_back(std::move(*item));
            if (cur_.try_comma()) {
                continue;
            }
            if (cur_.try_array_end()) {
                return value(std::move(items));
            }
            return std::nullopt;
        }
    }

    std::optional<uint32_t> read_hex4() noexcept {
        if (cur_.end - cur_.ptr < 4) {
            return std::nullopt;
        }
        uint32_t cp = 0;
        auto [p, ec] = std::from_chars(cur_.ptr, cur_.ptr + 4, cp, 16);
        if (ec != std::errc() || p != cur_.ptr + 4) {
            return std::nullopt;
        }
        cur_.ptr += 4;
        return cp;
    }

    std::optional<std::string> read_string() {
        if (cur_.eof() || *cur_.ptr != '\"') {
            return std::nullopt;
        }
        ++cur_.ptr;
        std::string out;
        while (!cur_.eof()) {
            char c = *cur_.ptr++;
            if (c == '\"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return std::nullopt;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (cur_.eof()) {
                return std::nullopt;
            }
            char esc = *cur_.ptr++;
            switch (esc) {
            case '\"':
            case '\\':
            case '/':
                out.push_back(esc);
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u': {
                auto cp = read_hex4();
                if (!cp) {
                    return std::nullopt;
                }
                if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                    if (!cur_.consume_literal("\\u")) {
                        return std::nullopt;
                    }
                    auto low = read_hex4();
                    if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                        return std::nullopt;
                    }
                    *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                } else if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
                    return std::nullopt;
                }
                serde::append_utf8(out, *cp);
                break;
            }
            default:
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<value> read_number() {
        const char* start = cur_.ptr;
        const char* p = start;
        auto digits = [&]() {
            const char* begin = p;
            while (p < cur_.end && *p >= '0' && *p <= '9') {
                ++p;
            }
            return p != begin;
        };
        if (p < cur_.end && *p == '-') {
            ++p;
        }
        if (p < cur_.end && *p == '0') {
            ++p;
        } else if (!digits()) {
            return std::nullopt;
        }
        bool integral = true;
        if (p < cur_.end && *p == '.') {
            ++p;
            integral = false;
            if (!digits()) {
                return std::nullopt;
            }
        }
        if (p < cur_.end && (*p == 'e' || *p == 'E')) {
            ++p;
            integral = false;
            if (p < cur_.end && (*p == '+' || *p == '-')) {
                ++p;
            }
            if (!digits()) {
                return std::nullopt;
            }
        }
        cur_.ptr = p;

        if (integral) {
            int64_t i = 0;
            auto [end, ec] = std::from_chars(start, p, i);
            if (ec == std::errc() && end == p) {
                return value(i);
            }
        }
        double d = 0.0;
        auto [end, ec] = std::from_chars(start, p, d);
        if (ec != std::errc() || end != p) {
            return std::nullopt;
        }
        return value(d);
    }

    json_cursor cur_;
};

} // namespace

result<value> parse_json(std::string_view text) {
    json_reader reader(text);
    auto v = reader.read_document();
    if (!v) {
        return std::unexpected(make_error_code(error_code::json_parse_error));
    }
    return std::move(*v);
}

void to_json(const value& v, std::string& out) {
    switch (v.kind()) {
    case value_kind::null:
        out.append("null");
        break;
    case value_kind::boolean:
        out.append(v.as_bool() ? "true" : "false");
        break;
    case value_kind::integer:
        out.append(std::to_string(v.as_integer()));
        break;
    case value_kind::number:
        out.append(formats::format_number(v.as_number()));
        break;
    case value_kind::string:
        out.push_back('\"');
        out.append(serde::escape_json_string(v.as_string()));
        out.push_back('\"');
        break;
    case value_kind::date:
        out.push_back('\"');
        out.append(formats::format_date(v.as_date()));
        out.push_back('\"');
        break;
    case value_kind::date_time:
        out.push_back('\"');
        out.append(formats::format_date_time(v.as_date_time()));
        out.push_back('\"');
        break;
    case value_kind::array: {
        out.push_back('[');
        const auto& items = v.as_array();
        for (size_t i = 0; i < items.size(); ++i) {
            if (i != 0) {
                out.push_back(',');
            }
            to_json(items[i], out);
        }
        out.push_back(']');
        break;
    }
    case value_kind::object: {
        out.push_back('{');
        const auto& obj = v.as_object();
        for (size_t i = 0; i < obj.members.size(); ++i) {
            if (i != 0) {
                out.push_back(',');
            }
            out.push_back('\"');
            out.append(serde::escape_json_string(obj.members[i].first));
            out.append("\":");
            to_json(obj.members[i].second, out);
        }
        out.push_back('}');
        break;
    }
    }
}

std::string to_json(const value& v) {
    std::string out;
    to_json(v, out);
    return out;
}

std::ostream& operator<<(std::ostream& os, const value& v) {
    return os << to_json(v);
}

} // namespace castor
