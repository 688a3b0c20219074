#include "castor/core/openapi_loader.hpp"

#include "castor/core/formats.hpp"
#include "castor/core/serde.hpp"
#include "castor/core/yaml.hpp"

#include <re2/re2.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace castor::openapi {

namespace {

constexpr int kMaxSchemaDepth = 64;
constexpr std::string_view kComponentPrefix = "#/components/schemas/";

std::unexpected<std::error_code> invalid_spec() {
    return std::unexpected(make_error_code(error_code::openapi_invalid_spec));
}

std::unexpected<std::error_code> parse_error() {
    return std::unexpected(make_error_code(error_code::openapi_parse_error));
}

// "#/components/schemas/Pet" -> "Pet"; nullopt for anything else.
std::optional<std::string> component_name(std::string_view ref) {
    if (!ref.starts_with(kComponentPrefix)) {
        return std::nullopt;
    }
    auto rest = ref.substr(kComponentPrefix.size());
    if (rest.empty() || rest.find('/') != std::string_view::npos) {
        return std::nullopt;
    }
    std::string out;
    out.reserve(rest.size());
    for (size_t i = 0; i < rest.size(); ++i) {
        if (rest[i] == '~' && i + 1 < rest.size() && (rest[i + 1] == '0' || rest[i + 1] == '1')) {
            out.push_back(rest[i + 1] == '0' ? '~' : '/');
            ++i;
        } else {
            out.push_back(rest[i]);
        }
    }
    return out;
}

std::optional<schema_kind> kind_from_name(std::string_view name) noexcept {
    if (name == "string") {
        return schema_kind::string;
    }
    if (name == "integer") {
        return schema_kind::integer;
    }
    if (name == "number") {
        return schema_kind::number;
    }
    if (name == "boolean") {
        return schema_kind::boolean;
    }
    if (name == "object") {
        return schema_kind::object;
    }
    if (name == "array") {
        return schema_kind::array;
    }
    if (name == "null") {
        return schema_kind::null_type;
    }
    return std::nullopt;
}

bool has_any(const object_t& obj, std::initializer_list<std::string_view> keys) noexcept {
    for (auto key : keys) {
        if (obj.contains(key)) {
            return true;
        }
    }
    return false;
}

class schema_builder {
public:
    explicit schema_builder(registry& reg) : reg_(reg) {}

    result<void> build_component(schema& target, const value& node, std::string owner) {
        owner_ = std::move(owner);
        return build_into(target, node, 0);
    }

    void warn_unresolved() const {
        for (const auto& [owner, name] : refs_) {
            if (!reg_.contains(name)) {
                std::cerr << "[openapi] " << owner << ": unresolved reference '" << name << "'\n";
            }
        }
    }

private:
    std::unexpected<std::error_code> fail(std::string_view message) const {
        std::cerr << "[openapi] " << owner_ << ": " << message << "\n";
        return invalid_spec();
    }

    result<const schema*> build_child(const value& node, int depth) {
        schema& child = reg_.add_inline_schema();
        auto built = build_into(child, node, depth);
        if (!built) {
            return std::unexpected(built.error());
        }
        return &child;
    }

    result<std::vector<const schema*>> build_branches(const object_t& obj,
                                                      std::string_view key,
                                                      int depth) {
        const value* list = obj.find(key);
        if (!list->is_array() || list->size() == 0) {
            return fail(std::string(key) + " must be a non-empty array");
        }
        std::vector<const schema*> branches;
        for (const auto& item : list->as_array()) {
            auto child = build_child(item, depth + 1);
            if (!child) {
                return std::unexpected(child.error());
            }
            branches.push_back(*child);
        }
        return branches;
    }

    result<std::optional<size_t>> size_keyword(const object_t& obj, std::string_view key) const {
        const value* v = obj.find(key);
        if (!v) {
            return std::optional<size_t>{};
        }
        if (v->is_integer() && v->as_integer() >= 0) {
            return std::optional<size_t>(static_cast<size_t>(v->as_integer()));
        }
        return fail(std::string(key) + " must be a non-negative integer");
    }

    result<std::optional<double>> number_keyword(const object_t& obj, std::string_view key) const {
        const value* v = obj.find(key);
        if (!v) {
            return std::optional<double>{};
        }
        if (v->is_number()) {
            return std::optional<double>(v->as_number());
        }
        return fail(std::string(key) + " must be a number");
    }

    void read_metadata(schema& target, const object_t& obj) const {
        if (const value* v = obj.find("title"); v && v->is_string()) {
            target.title = v->as_string();
        }
        if (const value* v = obj.find("description"); v && v->is_string()) {
            target.description = v->as_string();
        }
        auto read_flag = [&](std::string_view key, bool& out) {
            if (const value* v = obj.find(key); v && v->is_bool()) {
                out = v->as_bool();
            }
        };
        read_flag("nullable", target.nullable);
        read_flag("deprecated", target.deprecated);
        read_flag("readOnly", target.read_only);
        read_flag("writeOnly", target.write_only);
        if (const value* v = obj.find("default")) {
            target.default_value = *v;
        }
        if (const value* v = obj.find("example")) {
            target.example = *v;
        }
    }

    result<void> build_into(schema& target, const value& node, int depth) {
        if (depth > kMaxSchemaDepth) {
            return fail("schema nesting exceeds 64 levels");
        }
        if (node.is_bool()) {
            // `true` accepts everything, `false` nothing.
            if (!node.as_bool()) {
                target.shape = not_shape{&reg_.add_inline_schema()};
            }
            return {};
        }
        if (!node.is_object()) {
            return fail("schema must be an object or a boolean");
        }
        const object_t& obj = node.as_object();
        read_metadata(target, obj);

        if (const value* ref = obj.find("$ref")) {
            if (!ref->is_string()) {
                return fail("$ref must be a string");
            }
            auto name = component_name(ref->as_string());
            if (!name) {
                return fail("unsupported $ref '" + ref->as_string() + "'");
            }
            refs_.emplace_back(owner_, *name);
            target.shape = ref_shape{std::move(*name)};
            return {};
        }

        std::vector<schema_kind> kinds;
        if (const value* t = obj.find("type")) {
            std::vector<const value*> names;
            if (t->is_array()) {
                for (const auto& item : t->as_array()) {
                    names.push_back(&item);
                }
            } else {
                names.push_back(t);
            }
            for (const value* n : names) {
                if (!n->is_string()) {
                    return fail("type must be a string or an array of strings");
                }
                auto kind = kind_from_name(n->as_string());
                if (!kind) {
                    return fail("unknown type '" + n->as_string() + "'");
                }
                if (*kind == schema_kind::null_type && t->is_array()) {
                    target.nullable = true;
                    continue;
                }
                kinds.push_back(*kind);
            }
            if (kinds.empty()) {
                kinds.push_back(schema_kind::null_type);
            }
        }

        if (const value* f = obj.find("format"); f && f->is_string()) {
            target.format = f->as_string();
        }
        if (const value* e = obj.find("enum")) {
            if (!e->is_array()) {
                return fail("enum must be an array");
            }
            target.enum_values = e->as_array();
        }

        if (kinds.size() > 1) {
            // Multi-type (3.1): any of the single-type readings of this node.
            any_of_shape alternatives;
            for (schema_kind kind : kinds) {
                object_t single = obj;
                single.set("type", std::string(schema_kind_name(kind)));
                auto child = build_child(value(std::move(single)), depth + 1);
                if (!child) {
                    return std::unexpected(child.error());
                }
                alternatives.branches.push_back(*child);
            }
            // Only the null check reads the declared type here.
            target.type = kinds.front();
            target.shape = std::move(alternatives);
            return {};
        }
        if (kinds.size() == 1) {
            target.type = kinds.front();
        }

        auto base = build_base_shape(target.type, obj, depth);
        if (!base) {
            return std::unexpected(base.error());
        }
        return attach_compositions(target, std::move(*base), obj, depth);
    }

    result<schema_shape> build_base_shape(schema_kind type, const object_t& obj, int depth) {
        if (type == schema_kind::any) {
            if (has_any(obj,
                        {"properties",
                         "additionalProperties",
                         "required",
                         "minProperties",
                         "maxProperties",
                         "x-struct"})) {
                type = schema_kind::object;
            } else if (has_any(obj, {"items", "minItems", "maxItems", "uniqueItems"})) {
                type = schema_kind::array;
            }
        }

        switch (type) {
        case schema_kind::any:
            return schema_shape{any_shape{}};
        case schema_kind::boolean:
            return schema_shape{boolean_shape{}};
        case schema_kind::null_type:
            return schema_shape{null_shape{}};
        case schema_kind::string:
            return build_string(obj);
        case schema_kind::integer: {
            auto bounds = build_bounds(obj);
            if (!bounds) {
                return std::unexpected(bounds.error());
            }
            return schema_shape{integer_shape{*bounds}};
        }
        case schema_kind::number: {
            auto bounds = build_bounds(obj);
            if (!bounds) {
                return std::unexpected(bounds.error());
            }
            return schema_shape{number_shape{*bounds}};
        }
        case schema_kind::object:
            return build_object(obj, depth);
        case schema_kind::array:
            return build_array(obj, depth);
        }
        return schema_shape{any_shape{}};
    }

    result<schema_shape> build_string(const object_t& obj) {
        string_shape shape;
        auto min_length = size_keyword(obj, "minLength");
        auto max_length = size_keyword(obj, "maxLength");
        if (!min_length || !max_length) {
            return invalid_spec();
        }
        shape.min_length = *min_length;
        shape.max_length = *max_length;
        if (const value* p = obj.find("pattern")) {
            if (!p->is_string()) {
                return fail("pattern must be a string");
            }
            shape.pattern_source = p->as_string();
            re2::RE2::Options options;
            options.set_log_errors(false);
            auto compiled = std::make_shared<const re2::RE2>(shape.pattern_source, options);
            if (!compiled->ok()) {
                return fail("invalid pattern '" + shape.pattern_source + "': " + compiled->error());
            }
            shape.pattern = std::move(compiled);
        }
        return schema_shape{std::move(shape)};
    }

    result<number_constraints> build_bounds(const object_t& obj) {
        number_constraints b;
        auto minimum = number_keyword(obj, "minimum");
        auto maximum = number_keyword(obj, "maximum");
        auto multiple_of = number_keyword(obj, "multipleOf");
        if (!minimum || !maximum || !multiple_of) {
            return invalid_spec();
        }
        b.minimum = *minimum;
        b.maximum = *maximum;
        if (*multiple_of && **multiple_of <= 0.0) {
            return fail("multipleOf must be greater than 0");
        }
        b.multiple_of = *multiple_of;

        // 3.0 spells exclusivity as a boolean beside minimum/maximum, 3.1 as the bound itself.
        auto exclusive = [&](std::string_view key,
                             std::optional<double>& inclusive,
                             std::optional<double>& out) -> result<void> {
            const value* v = obj.find(key);
            if (!v) {
                return {};
            }
            if (v->is_bool()) {
                if (v->as_bool() && inclusive) {
                    out = inclusive;
                    inclusive.reset();
                }
                return {};
            }
            if (v->is_number()) {
                out = v->as_number();
                return {};
            }
            return fail(std::string(key) + " must be a boolean or a number");
        };
        if (auto r = exclusive("exclusiveMinimum", b.minimum, b.exclusive_minimum); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = exclusive("exclusiveMaximum", b.maximum, b.exclusive_maximum); !r) {
            return std::unexpected(r.error());
        }
        return b;
    }

    result<schema_shape> build_object(const object_t& obj, int depth) {
        object_shape shape;
        if (const value* props = obj.find("properties")) {
            if (!props->is_object()) {
                return fail("properties must be an object");
            }
            for (const auto& [name, child_node] : props->as_object().members) {
                auto child = build_child(child_node, depth + 1);
                if (!child) {
                    return std::unexpected(child.error());
                }
                shape.properties.push_back({name, *child});
            }
        }
        if (const value* req = obj.find("required")) {
            if (!req->is_array()) {
                return fail("required must be an array of strings");
            }
            for (const auto& item : req->as_array()) {
                if (!item.is_string()) {
                    return fail("required must be an array of strings");
                }
                shape.required.push_back(item.as_string());
            }
        }
        if (const value* extra = obj.find("additionalProperties")) {
            if (extra->is_bool()) {
                shape.additional_allowed = extra->as_bool();
            } else {
                auto child = build_child(*extra, depth + 1);
                if (!child) {
                    return std::unexpected(child.error());
                }
                shape.additional = *child;
            }
        }
        auto min_properties = size_keyword(obj, "minProperties");
        auto max_properties = size_keyword(obj, "maxProperties");
        if (!min_properties || !max_properties) {
            return invalid_spec();
        }
        shape.min_properties = *min_properties;
        shape.max_properties = *max_properties;
        if (const value* tag = obj.find("x-struct"); tag && tag->is_string()) {
            shape.x_struct = tag->as_string();
        }
        return schema_shape{std::move(shape)};
    }

    result<schema_shape> build_array(const object_t& obj, int depth) {
        array_shape shape;
        if (const value* items = obj.find("items")) {
            auto child = build_child(*items, depth + 1);
            if (!child) {
                return std::unexpected(child.error());
            }
            shape.items = *child;
        }
        auto min_items = size_keyword(obj, "minItems");
        auto max_items = size_keyword(obj, "maxItems");
        if (!min_items || !max_items) {
            return invalid_spec();
        }
        shape.min_items = *min_items;
        shape.max_items = *max_items;
        if (const value* unique = obj.find("uniqueItems"); unique && unique->is_bool()) {
            shape.unique_items = unique->as_bool();
        }
        return schema_shape{std::move(shape)};
    }

    result<discriminator> build_discriminator(const value& node) {
        if (!node.is_object()) {
            return fail("discriminator must be an object");
        }
        const value* property = node.find("propertyName");
        if (!property || !property->is_string()) {
            return fail("discriminator.propertyName must be a string");
        }
        discriminator disc;
        disc.property_name = property->as_string();
        if (const value* mapping = node.find("mapping")) {
            if (!mapping->is_object()) {
                return fail("discriminator.mapping must be an object");
            }
            for (const auto& [key, target] : mapping->as_object().members) {
                if (!target.is_string()) {
                    return fail("discriminator.mapping values must be strings");
                }
                const std::string& raw = target.as_string();
                if (raw.starts_with("#")) {
                    auto name = component_name(raw);
                    if (!name) {
                        return fail("unsupported discriminator mapping '" + raw + "'");
                    }
                    refs_.emplace_back(owner_, *name);
                    disc.mapping.emplace_back(key, std::move(*name));
                } else {
                    refs_.emplace_back(owner_, raw);
                    disc.mapping.emplace_back(key, raw);
                }
            }
        }
        return disc;
    }

    // A node mixing structural keywords with compositions becomes allOf of
    // its structural part followed by each composition.
    result<void>
    attach_compositions(schema& target, schema_shape base, const object_t& obj, int depth) {
        std::vector<const schema*> all_of;
        std::vector<schema_shape> others;
        const bool has_all_of = obj.contains("allOf");

        if (has_all_of) {
            auto branches = build_branches(obj, "allOf", depth);
            if (!branches) {
                return std::unexpected(branches.error());
            }
            all_of = std::move(*branches);
        }
        if (obj.contains("oneOf")) {
            auto branches = build_branches(obj, "oneOf", depth);
            if (!branches) {
                return std::unexpected(branches.error());
            }
            one_of_shape one_of{std::move(*branches), std::nullopt};
            if (const value* disc = obj.find("discriminator")) {
                auto built = build_discriminator(*disc);
                if (!built) {
                    return std::unexpected(built.error());
                }
                one_of.dispatch = std::move(*built);
            }
            others.emplace_back(std::move(one_of));
        } else if (obj.contains("discriminator")) {
            return fail("discriminator requires a sibling oneOf");
        }
        if (obj.contains("anyOf")) {
            auto branches = build_branches(obj, "anyOf", depth);
            if (!branches) {
                return std::unexpected(branches.error());
            }
            others.emplace_back(any_of_shape{std::move(*branches)});
        }
        if (const value* negated = obj.find("not")) {
            auto inner = build_child(*negated, depth + 1);
            if (!inner) {
                return std::unexpected(inner.error());
            }
            others.emplace_back(not_shape{*inner});
        }

        const bool structural = !std::holds_alternative<any_shape>(base);
        const size_t compositions = (has_all_of ? 1 : 0) + others.size();
        if (compositions == 0) {
            target.shape = std::move(base);
            return {};
        }
        if (compositions == 1 && !structural) {
            if (has_all_of) {
                all_of_shape only;
                only.branches = std::move(all_of);
                target.shape = std::move(only);
            } else {
                target.shape = std::move(others.front());
            }
            return {};
        }

        all_of_shape merged;
        if (structural) {
            if (const auto* own = std::get_if<object_shape>(&base)) {
                merged.x_struct = own->x_struct;
            }
            schema& part = reg_.add_inline_schema();
            part.type = target.type;
            part.format = target.format;
            part.shape = std::move(base);
            merged.branches.push_back(&part);
        }
        merged.branches.insert(merged.branches.end(), all_of.begin(), all_of.end());
        for (auto& shape : others) {
            schema& part = reg_.add_inline_schema();
            part.shape = std::move(shape);
            merged.branches.push_back(&part);
        }
        target.shape = std::move(merged);
        return {};
    }

    registry& reg_;
    std::string owner_ = "<inline>";
    std::vector<std::pair<std::string, std::string>> refs_; // (owner, referenced name)
};

std::string scalar_text(const value* v) {
    if (!v) {
        return {};
    }
    if (v->is_string()) {
        return v->as_string();
    }
    if (v->is_number()) {
        return formats::format_number(v->as_number());
    }
    return {};
}

} // namespace

result<document> load_from_value(const value& root) {
    if (!root.is_object()) {
        std::cerr << "[openapi] document root must be an object\n";
        return invalid_spec();
    }
    const value* version = root.find("openapi");
    if (!version || !version->is_string() || !version->as_string().starts_with("3.")) {
        std::cerr << "[openapi] unsupported or missing 'openapi' version\n";
        return invalid_spec();
    }

    document doc;
    doc.openapi_version = version->as_string();
    if (const value* info = root.find("info")) {
        doc.info_title = scalar_text(info->find("title"));
        doc.info_version = scalar_text(info->find("version"));
    }

    const value* components = root.find("components");
    const value* schemas = components ? components->find("schemas") : nullptr;
    if (!schemas) {
        return doc;
    }
    if (!schemas->is_object()) {
        std::cerr << "[openapi] components.schemas must be an object\n";
        return invalid_spec();
    }

    // Register every name first so build order does not matter.
    std::vector<std::pair<schema*, const value*>> pending;
    for (const auto& [name, node] : schemas->as_object().members) {
        schema* s = doc.schemas.add_schema(name);
        if (!s) {
            std::cerr << "[openapi] duplicate schema name '" << name << "'\n";
            return invalid_spec();
        }
        pending.emplace_back(s, &node);
    }

    schema_builder builder(doc.schemas);
    for (auto [s, node] : pending) {
        if (auto built = builder.build_component(*s, *node, s->name); !built) {
            return std::unexpected(built.error());
        }
    }
    builder.warn_unresolved();
    return doc;
}

result<document> load_from_string(std::string_view text) {
    if (serde::trim_view(text).empty()) {
        return parse_error();
    }
    std::string parse_message;
    auto root = parse_document(text, &parse_message);
    if (!root) {
        if (root.error() == make_error_code(error_code::yaml_parse_error)) {
            std::cerr << "[openapi][yaml] " << parse_message << "\n";
        } else {
            std::cerr << "[openapi] " << parse_message << "\n";
        }
        return parse_error();
    }
    return load_from_value(*root);
}

result<document> load_from_file(const char* path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::cerr << "[openapi] cannot open " << path << "\n";
        return parse_error();
    }
    std::string content;
    in.seekg(0, std::ios::end);
    const auto size = in.tellg();
    if (size < 0) {
        return parse_error();
    }
    content.resize(static_cast<size_t>(size));
    in.seekg(0, std::ios::beg);
    in.read(content.data(), static_cast<std::streamsize>(content.size()));
    return load_from_string(content);
}

result<const schema*> parse_schema(const value& node, registry& reg) {
    schema_builder builder(reg);
    schema& s = reg.add_inline_schema();
    if (auto built = builder.build_component(s, node, "<inline>"); !built) {
        return std::unexpected(built.error());
    }
    builder.warn_unresolved();
    return &s;
}

result<const schema*> parse_schema(std::string_view text, registry& reg) {
    std::string parse_message;
    auto node = parse_document(text, &parse_message);
    if (!node) {
        std::cerr << "[openapi] " << parse_message << "\n";
        return parse_error();
    }
    return parse_schema(*node, reg);
}

} // namespace castor::openapi
