#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace castor::serde {

inline std::string_view trim_view(std::string_view sv) noexcept {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

struct json_cursor {
    const char* ptr;
    const char* end;
    const char* start; // Track start for position calculation

    json_cursor(const char* p, const char* e) : ptr(p), end(e), start(p) {}

    bool eof() const noexcept { return ptr >= end; }

    size_t pos() const noexcept { return static_cast<size_t>(ptr - start); }

    char peek() const noexcept { return eof() ? '\0' : *ptr; }

    void skip_ws() noexcept {
        while (!eof() && std::isspace(static_cast<unsigned char>(*ptr))) {
            ++ptr;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (eof() || *ptr != c) {
            return false;
        }
        ++ptr;
        return true;
    }

    bool consume_literal(std::string_view lit) noexcept {
        skip_ws();
        if (static_cast<size_t>(end - ptr) < lit.size() ||
            std::string_view(ptr, lit.size()) != lit) {
            return false;
        }
        ptr += lit.size();
        return true;
    }

    bool try_object_start() noexcept { return consume('{'); }
    bool try_object_end() noexcept { return consume('}'); }
    bool try_array_start() noexcept { return consume('['); }
    bool try_array_end() noexcept { return consume(']'); }
    bool try_comma() noexcept { return consume(','); }
};

inline void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline std::string escape_json_string(std::string_view sv) {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\"':
            out += "\\\"";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                out += "\\u00";
                out.push_back(hex[(static_cast<unsigned char>(c) >> 4) & 0xF]);
                out.push_back(hex[static_cast<unsigned char>(c) & 0xF]);
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

// YAML subset used by OpenAPI documents: block maps and sequences, flow
// collections on one line, quoted and plain scalars, full-line and trailing
// comments. Scalars are kept verbatim (quotes included) and typed later.
struct yaml_node {
    enum class kind { scalar, object, array };

    kind k{kind::scalar};
    std::string scalar;
    std::vector<std::pair<std::string, std::unique_ptr<yaml_node>>> object;
    std::vector<std::unique_ptr<yaml_node>> array;

    static yaml_node scalar_node(std::string value) {
        yaml_node n;
        n.k = kind::scalar;
        n.scalar = std::move(value);
        return n;
    }

    static yaml_node object_node() {
        yaml_node n;
        n.k = kind::object;
        return n;
    }

    static yaml_node array_node() {
        yaml_node n;
        n.k = kind::array;
        return n;
    }
};

struct yaml_diagnostic {
    size_t line = 0;
    std::string message;
};

inline void set_yaml_error(yaml_diagnostic* diag, size_t line, std::string_view message) {
    if (!diag || !diag->message.empty()) {
        return;
    }
    diag->line = line;
    diag->message.assign(message.begin(), message.end());
}

struct yaml_line {
    int indent;
    size_t number;
    std::string_view content;
};

// Drops a trailing " # comment" that is not inside quotes.
inline std::string_view strip_yaml_comment(std::string_view line) noexcept {
    bool in_single = false;
    bool in_double = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\'' && !in_double) {
            in_single = !in_single;
        } else if (c == '\"' && !in_single) {
            in_double = !in_double;
        } else if (c == '\\' && in_double) {
            ++i;
        } else if (c == '#' && !in_single && !in_double &&
                   (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return trim_view(line.substr(0, i));
        }
    }
    return line;
}

inline std::vector<yaml_line> tokenize_yaml(std::string_view text) {
    std::vector<yaml_line> lines;
    size_t pos = 0;
    size_t number = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(pos, end - pos);
        pos = end + 1;
        ++number;
        if (line.empty()) {
            continue;
        }
        int indent = 0;
        for (char c : line) {
            if (c == ' ') {
                ++indent;
            } else {
                break;
            }
        }
        std::string_view content = line.substr(static_cast<size_t>(indent));
        content = strip_yaml_comment(trim_view(content));
        if (content.empty() || content == "---") {
            continue;
        }
        lines.push_back({indent, number, content});
    }
    return lines;
}

inline bool is_quoted(std::string_view sv) noexcept {
    return sv.size() >= 2 && ((sv.front() == '\"' && sv.back() == '\"') ||
                              (sv.front() == '\'' && sv.back() == '\''));
}

inline std::string normalize_key(std::string_view key) {
    auto trimmed = trim_view(key);
    if (is_quoted(trimmed)) {
        trimmed = trimmed.substr(1, trimmed.size() - 2);
    }
    return std::string(trimmed);
}

// Position of the "key: value" separator outside quotes, or npos.
inline size_t find_mapping_colon(std::string_view content) noexcept {
    bool in_single = false;
    bool in_double = false;
    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c == '\'' && !in_double) {
            in_single = !in_single;
        } else if (c == '\"' && !in_single) {
            in_double = !in_double;
        } else if (c == '\\' && in_double) {
            ++i;
        } else if (c == ':' && !in_single && !in_double &&
                   (i + 1 == content.size() || content[i + 1] == ' ')) {
            return i;
        } else if ((c == '{' || c == '[') && !in_single && !in_double && i == 0) {
            return std::string_view::npos;
        }
    }
    return std::string_view::npos;
}

inline std::vector<std::string_view> split_top_level(std::string_view input,
                                                     char delimiter = ',') noexcept {
    std::vector<std::string_view> parts;
    size_t start = 0;
    int depth = 0;
    bool in_single = false;
    bool in_double = false;

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '\'' && !in_double) {
            in_single = !in_single;
        } else if (c == '\"' && !in_single) {
            in_double = !in_double;
        } else if (!in_single && !in_double) {
            if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                --depth;
            } else if (c == delimiter && depth == 0) {
                parts.push_back(trim_view(input.substr(start, i - start)));
                start = i + 1;
            }
        }
    }

    auto tail = trim_view(input.substr(start));
    if (!tail.empty()) {
        parts.push_back(tail);
    }
    return parts;
}

inline yaml_node parse_yaml_block(const std::vector<yaml_line>& lines,
                                  size_t& idx,
                                  int indent,
                                  yaml_diagnostic* diag);

inline yaml_node parse_inline_map(std::string_view value, yaml_diagnostic* diag, size_t line_no);
inline yaml_node
parse_inline_sequence(std::string_view value, yaml_diagnostic* diag, size_t line_no);

inline yaml_node parse_inline_value(std::string_view value, yaml_diagnostic* diag, size_t line_no) {
    auto trimmed = trim_view(value);
    if (trimmed.empty()) {
        return yaml_node::scalar_node("");
    }
    if (trimmed.front() == '{' && trimmed.back() == '}') {
        return parse_inline_map(trimmed, diag, line_no);
    }
    if (trimmed.front() == '[' && trimmed.back() == ']') {
        return parse_inline_sequence(trimmed, diag, line_no);
    }
    return yaml_node::scalar_node(std::string(trimmed));
}

inline yaml_node parse_inline_map(std::string_view value, yaml_diagnostic* diag, size_t line_no) {
    yaml_node obj = yaml_node::object_node();
    auto inner = trim_view(value.substr(1, value.size() - 2));
    std::unordered_set<std::string> seen;
    for (auto part : split_top_level(inner)) {
        if (part.empty()) {
            continue;
        }
        auto colon = part.find(':');
        if (colon == std::string_view::npos) {
            set_yaml_error(diag, line_no, "expected 'key: value' in inline map");
            continue;
        }
        auto key = normalize_key(part.substr(0, colon));
        auto val = trim_view(part.substr(colon + 1));
        if (!seen.insert(key).second) {
            set_yaml_error(diag, line_no, std::string("duplicate key '") + key + "' in inline map");
            continue;
        }
        obj.object.emplace_back(
            std::move(key), std::make_unique<yaml_node>(parse_inline_value(val, diag, line_no)));
    }
    return obj;
}

inline yaml_node
parse_inline_sequence(std::string_view value, yaml_diagnostic* diag, size_t line_no) {
    yaml_node arr = yaml_node::array_node();
    auto inner = trim_view(value.substr(1, value.size() - 2));
    for (auto part : split_top_level(inner)) {
        if (part.empty()) {
            continue;
        }
        arr.array.push_back(std::make_unique<yaml_node>(parse_inline_value(part, diag, line_no)));
    }
    return arr;
}

inline yaml_node parse_yaml_value(std::string_view value,
                                  const std::vector<yaml_line>& lines,
                                  size_t& idx,
                                  int indent,
                                  yaml_diagnostic* diag,
                                  size_t line_no) {
    auto trimmed_val = trim_view(value);
    if (trimmed_val.empty()) {
        if (idx < lines.size() && lines[idx].indent > indent) {
            return parse_yaml_block(lines, idx, lines[idx].indent, diag);
        }
        // Block sequences may sit at the same indent as their parent key.
        if (idx < lines.size() && lines[idx].indent == indent &&
            lines[idx].content.starts_with("- ")) {
            return parse_yaml_block(lines, idx, indent, diag);
        }
        return yaml_node::scalar_node("");
    }
    if ((trimmed_val.front() == '{' && trimmed_val.back() == '}') ||
        (trimmed_val.front() == '[' && trimmed_val.back() == ']')) {
        return parse_inline_value(trimmed_val, diag, line_no);
    }
    if (trimmed_val == "|" || trimmed_val == ">" || trimmed_val == "|-" || trimmed_val == ">-") {
        set_yaml_error(diag, line_no, "block scalars are not supported");
    }
    return yaml_node::scalar_node(std::string(trimmed_val));
}

inline yaml_node parse_yaml_block(const std::vector<yaml_line>& lines,
                                  size_t& idx,
                                  int indent,
                                  yaml_diagnostic* diag) {
    yaml_node node = yaml_node::object_node();
    std::unordered_set<std::string> seen_keys;
    bool started = false;

    while (idx < lines.size()) {
        const auto& ln = lines[idx];
        if (ln.indent < indent) {
            break;
        }
        if (ln.indent > indent) {
            set_yaml_error(diag, ln.number, "unexpected indentation");
            ++idx;
            continue;
        }

        std::string_view content = ln.content;
        const bool is_item = content == "-" || content.starts_with("- ");
        if (started && is_item != (node.k == yaml_node::kind::array)) {
            set_yaml_error(diag, ln.number, "cannot mix sequence items and mapping keys");
            ++idx;
            continue;
        }
        started = true;

        if (is_item) {
            node.k = yaml_node::kind::array;

            std::string_view item = trim_view(content.substr(1));
            size_t line_no = ln.number;
            ++idx;

            if (item.empty()) {
                if (idx < lines.size() && lines[idx].indent > indent) {
                    node.array.push_back(std::make_unique<yaml_node>(
                        parse_yaml_block(lines, idx, lines[idx].indent, diag)));
                } else {
                    node.array.push_back(std::make_unique<yaml_node>(yaml_node::scalar_node("")));
                }
                continue;
            }

            auto colon_pos = find_mapping_colon(item);
            if (colon_pos != std::string_view::npos && !is_quoted(item)) {
                // "- key: value" opens a map whose further keys sit two columns in.
                const int item_indent = indent + 2;
                std::string key = normalize_key(item.substr(0, colon_pos));
                std::string_view val = trim_view(item.substr(colon_pos + 1));
                yaml_node obj = yaml_node::object_node();
                yaml_node parsed_val = parse_yaml_value(val, lines, idx, item_indent, diag, line_no);
                obj.object.emplace_back(std::move(key),
                                        std::make_unique<yaml_node>(std::move(parsed_val)));
                if (idx < lines.size() && lines[idx].indent == item_indent &&
                    !lines[idx].content.starts_with("- ")) {
                    yaml_node extra = parse_yaml_block(lines, idx, item_indent, diag);
                    for (auto& kv : extra.object) {
                        auto dup = std::find_if(obj.object.begin(),
                                                obj.object.end(),
                                                [&](const auto& e) { return e.first == kv.first; });
                        if (dup != obj.object.end()) {
                            set_yaml_error(diag, line_no, "duplicate key '" + kv.first + "'");
                            continue;
                        }
                        obj.object.emplace_back(std::move(kv.first), std::move(kv.second));
                    }
                }
                node.array.push_back(std::make_unique<yaml_node>(std::move(obj)));
            } else {
                node.array.push_back(
                    std::make_unique<yaml_node>(parse_inline_value(item, diag, line_no)));
            }
        } else {
            auto colon_pos = find_mapping_colon(content);
            if (colon_pos == std::string_view::npos) {
                set_yaml_error(diag, ln.number, "expected 'key: value'");
                ++idx;
                continue;
            }
            std::string key = normalize_key(content.substr(0, colon_pos));
            std::string_view val = trim_view(content.substr(colon_pos + 1));
            size_t line_no = ln.number;
            ++idx;

            yaml_node child = parse_yaml_value(val, lines, idx, indent, diag, line_no);
            if (!seen_keys.insert(key).second) {
                set_yaml_error(diag, line_no, std::string("duplicate key '") + key + "'");
                continue;
            }
            node.object.emplace_back(std::move(key), std::make_unique<yaml_node>(std::move(child)));
        }
    }

    return node;
}

} // namespace castor::serde
