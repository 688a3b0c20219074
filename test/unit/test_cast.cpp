#include "castor/core/cast.hpp"
#include "castor/core/json.hpp"
#include "castor/core/openapi_loader.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace castor;
using namespace std::chrono;

namespace {

std::string describe(const cast_errors& errors) {
    std::string out;
    for (const auto& e : errors) {
        out.append(e.pointer()).append(" ").append(e.message()).append("\n");
    }
    return out;
}

cast_options parameter_context() {
    cast_options opts;
    opts.context = cast_context::parameter;
    return opts;
}

} // namespace

class CastTest : public ::testing::Test {
protected:
    const openapi::schema& schema_of(std::string_view text) {
        auto s = openapi::parse_schema(text, reg);
        if (!s) {
            throw std::invalid_argument("schema did not build: " + std::string(text));
        }
        return **s;
    }

    cast_result run(std::string_view input, std::string_view schema_text,
                    const cast_options& opts = {}) {
        auto v = parse_json(input);
        if (!v) {
            throw std::invalid_argument("bad input JSON: " + std::string(input));
        }
        return cast(*v, schema_of(schema_text), reg, opts);
    }

    openapi::registry reg;
};

TEST_F(CastTest, IntegerAcceptsIntegralValues) {
    const auto& s = schema_of(R"({"type": "integer"})");
    auto a = cast(value(3), s, reg);
    ASSERT_TRUE(a);
    EXPECT_EQ(a->as_integer(), 3);

    auto b = cast(value(3.0), s, reg);
    ASSERT_TRUE(b);
    EXPECT_TRUE(b->is_integer());
    EXPECT_EQ(b->as_integer(), 3);
}

TEST_F(CastTest, IntegerRejectsFractionsAndText) {
    const auto& s = schema_of(R"({"type": "integer"})");
    auto fraction = cast(value(3.5), s, reg);
    ASSERT_FALSE(fraction);
    ASSERT_EQ(fraction.error().size(), 1U);
    EXPECT_EQ(fraction.error()[0].kind, cast_error_kind::invalid_type);
    EXPECT_EQ(fraction.error()[0].message(), "Invalid integer. Got: number");
    EXPECT_EQ(fraction.error()[0].pointer(), "/");

    auto text = cast(value("3"), s, reg);
    ASSERT_FALSE(text);
    EXPECT_EQ(text.error()[0].message(), "Invalid integer. Got: string");
}

TEST_F(CastTest, IntegerFormats) {
    const auto& i32 = schema_of(R"({"type": "integer", "format": "int32"})");
    EXPECT_TRUE(cast(value(2147483647), i32, reg));
    auto over = cast(value(int64_t{2147483648}), i32, reg);
    ASSERT_FALSE(over);
    EXPECT_EQ(over.error()[0].kind, cast_error_kind::invalid_format);
    EXPECT_EQ(over.error()[0].expected, "int32");

    const auto& i64 = schema_of(R"({"type": "integer", "format": "int64"})");
    auto huge = cast(value(1e19), i64, reg);
    ASSERT_FALSE(huge);
    EXPECT_EQ(huge.error()[0].kind, cast_error_kind::invalid_format);
    EXPECT_EQ(huge.error()[0].expected, "int64");
}

TEST_F(CastTest, InclusiveAndExclusiveBounds) {
    auto r = run("-1", R"({"type": "integer", "minimum": 0, "maximum": 10})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error()[0].kind, cast_error_kind::below_minimum);
    EXPECT_EQ(r.error()[0].message(), "Value must be greater than or equal to 0");

    EXPECT_TRUE(run("0", R"({"type": "integer", "minimum": 0})"));
    EXPECT_TRUE(run("10", R"({"type": "integer", "maximum": 10})"));

    // 3.0 boolean form
    auto exclusive_min = run("0", R"({"type": "integer", "minimum": 0, "exclusiveMinimum": true})");
    ASSERT_FALSE(exclusive_min);
    EXPECT_TRUE(exclusive_min.error()[0].exclusive);
    EXPECT_EQ(exclusive_min.error()[0].message(), "Value must be greater than 0");

    // 3.1 numeric form
    auto exclusive_max = run("10", R"({"type": "number", "exclusiveMaximum": 10})");
    ASSERT_FALSE(exclusive_max);
    EXPECT_EQ(exclusive_max.error()[0].kind, cast_error_kind::above_maximum);
    EXPECT_EQ(exclusive_max.error()[0].message(), "Value must be less than 10");
    EXPECT_TRUE(run("9.99", R"({"type": "number", "exclusiveMaximum": 10})"));
}

TEST_F(CastTest, MultipleOfToleratesBinaryFractions) {
    const char* schema = R"({"type": "number", "multipleOf": 0.1})";
    EXPECT_TRUE(run("0.3", schema));
    EXPECT_TRUE(run("7", schema));
    auto r = run("0.35", schema);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error()[0].kind, cast_error_kind::not_multiple_of);
    EXPECT_EQ(r.error()[0].message(), "Value must be a multiple of 0.1");
}

TEST_F(CastTest, NumberKeepsIntegerInput) {
    auto r = run("4", R"({"type": "number"})");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r->is_integer());

    auto bad = run("\"4\"", R"({"type": "number"})");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error()[0].message(), "Invalid number. Got: string");
}

TEST_F(CastTest, ParameterContextCoercesStrings) {
    const auto& id = schema_of(R"({"type": "integer", "minimum": 1})");
    auto ok = cast(value("42"), id, reg, parameter_context());
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->as_integer(), 42);

    auto low = cast(value("0"), id, reg, parameter_context());
    ASSERT_FALSE(low);
    EXPECT_EQ(low.error()[0].kind, cast_error_kind::below_minimum);
    EXPECT_EQ(low.error()[0].offending, value("0"));

    auto junk = cast(value("4x"), id, reg, parameter_context());
    ASSERT_FALSE(junk);
    EXPECT_EQ(junk.error()[0].kind, cast_error_kind::invalid_type);

    const auto& ratio = schema_of(R"({"type": "number"})");
    auto d = cast(value("2.5"), ratio, reg, parameter_context());
    ASSERT_TRUE(d);
    EXPECT_DOUBLE_EQ(d->as_number(), 2.5);
    EXPECT_FALSE(cast(value("nan"), ratio, reg, parameter_context()));

    const auto& flag = schema_of(R"({"type": "boolean"})");
    auto t = cast(value("true"), flag, reg, parameter_context());
    ASSERT_TRUE(t);
    EXPECT_TRUE(t->as_bool());
    EXPECT_FALSE(cast(value("yes"), flag, reg, parameter_context()));
    EXPECT_FALSE(cast(value("true"), flag, reg));
}

TEST_F(CastTest, StringLengthCountsCodePoints) {
    const auto& s = schema_of(R"({"type": "string", "minLength": 2, "maxLength": 3})");
    auto one = cast(value("\xC3\xA9"), s, reg);
    ASSERT_FALSE(one);
    EXPECT_EQ(one.error()[0].kind, cast_error_kind::too_short);
    EXPECT_EQ(one.error()[0].message(), "Length must be at least 2");

    EXPECT_TRUE(cast(value("\xC3\xA9\xC3\xA9\xC3\xA9"), s, reg));

    auto four = cast(value("abcd"), s, reg);
    ASSERT_FALSE(four);
    EXPECT_EQ(four.error()[0].message(), "Length must be at most 3");
}

TEST_F(CastTest, PatternIsSearchedNotAnchored) {
    const auto& digit = schema_of(R"({"type": "string", "pattern": "[0-9]"})");
    EXPECT_TRUE(cast(value("a1b"), digit, reg));

    const auto& word = schema_of(R"({"type": "string", "pattern": "^[a-z]+$"})");
    auto r = cast(value("abc1"), word, reg);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error()[0].kind, cast_error_kind::pattern_mismatch);
    EXPECT_EQ(r.error()[0].message(), "Value does not match pattern: ^[a-z]+$");
}

TEST_F(CastTest, StringReportsLengthAndPatternTogether) {
    auto r = run("\"ABCDE\"", R"({"type": "string", "maxLength": 3, "pattern": "^[a-z]*$"})");
    ASSERT_FALSE(r);
    ASSERT_EQ(r.error().size(), 2U) << describe(r.error());
    EXPECT_EQ(r.error()[0].kind, cast_error_kind::too_long);
    EXPECT_EQ(r.error()[1].kind, cast_error_kind::pattern_mismatch);
}

TEST_F(CastTest, DateFormatProducesDateValue) {
    const auto& s = schema_of(R"({"type": "string", "format": "date"})");
    auto r = cast(value("2024-02-29"), s, reg);
    ASSERT_TRUE(r);
    ASSERT_TRUE(r->is_date());
    EXPECT_EQ(r->as_date(), year{2024} / 2 / 29);
    EXPECT_EQ(to_json(*r), "\"2024-02-29\"");

    auto bad = cast(value("not-a-date"), s, reg);
    ASSERT_FALSE(bad);
    ASSERT_EQ(bad.error().size(), 1U);
    EXPECT_EQ(bad.error()[0].kind, cast_error_kind::invalid_format);
    EXPECT_EQ(bad.error()[0].pointer(), "/");
    EXPECT_EQ(bad.error()[0].message(), "Invalid format. Expected: date");

    EXPECT_FALSE(cast(value("2023-02-29"), s, reg));
}

TEST_F(CastTest, AlreadyTypedDateIsAccepted) {
    const auto& s = schema_of(R"({"type": "string", "format": "date"})");
    value d(year{2000} / 1 / 1);
    auto r = cast(d, s, reg);
    ASSERT_TRUE(r);
    EXPECT_EQ(*r, d);
}

TEST_F(CastTest, DateTimeFormat) {
    const auto& s = schema_of(R"({"type": "string", "format": "date-time"})");
    auto r = cast(value("2020-01-01T10:00:00+01:00"), s, reg);
    ASSERT_TRUE(r);
    ASSERT_TRUE(r->is_date_time());
    EXPECT_EQ(r->as_date_time().instant, sys_days{year{2020} / 1 / 1} + hours{9});
    EXPECT_FALSE(cast(value("2020-01-01T10:00:00"), s, reg));
}

TEST_F(CastTest, CheckedStringFormats) {
    const auto& email = schema_of(R"({"type": "string", "format": "email"})");
    const auto& uuid = schema_of(R"({"type": "string", "format": "uuid"})");
    const auto& uri = schema_of(R"({"type": "string", "format": "uri"})");
    const auto& bytes = schema_of(R"({"type": "string", "format": "byte"})");
    const auto& unchecked = schema_of(R"({"type": "string", "format": "password"})");

    auto ok = cast(value("ada@example.com"), email, reg);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->as_string(), "ada@example.com");

    auto bad = cast(value("ada"), email, reg);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error()[0].message(), "Invalid format. Expected: email");

    EXPECT_TRUE(cast(value("123e4567-e89b-12d3-a456-426614174000"), uuid, reg));
    EXPECT_FALSE(cast(value("123"), uuid, reg));
    EXPECT_TRUE(cast(value("https://example.com"), uri, reg));
    EXPECT_FALSE(cast(value("example"), uri, reg));
    EXPECT_TRUE(cast(value("aGk="), bytes, reg));
    EXPECT_FALSE(cast(value("aGk"), bytes, reg));
    EXPECT_TRUE(cast(value("anything at all"), unchecked, reg));
}

TEST_F(CastTest, NullHandling) {
    auto rejected = run("null", R"({"type": "string"})");
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error()[0].kind, cast_error_kind::invalid_type);
    EXPECT_EQ(rejected.error()[0].message(), "Invalid string. Got: null");

    auto nullable = run("null", R"({"type": "string", "nullable": true})");
    ASSERT_TRUE(nullable);
    EXPECT_TRUE(nullable->is_null());

    EXPECT_TRUE(run("null", "{}"));
    EXPECT_TRUE(run("null", R"({"type": "null"})"));
    EXPECT_FALSE(run("0", R"({"type": "null"})"));
}

TEST_F(CastTest, TypeListWithNull) {
    const auto& s = schema_of(R"({"type": ["string", "null"]})");
    EXPECT_TRUE(cast(value(), s, reg));
    EXPECT_TRUE(cast(value("x"), s, reg));
    EXPECT_FALSE(cast(value(1), s, reg));
}

TEST_F(CastTest, EnumMembership) {
    const auto& s = schema_of(R"({"type": "string", "enum": ["a", "b"]})");
    EXPECT_TRUE(cast(value("a"), s, reg));
    auto r = cast(value("c"), s, reg);
    ASSERT_FALSE(r);
    ASSERT_EQ(r.error().size(), 1U);
    EXPECT_EQ(r.error()[0].kind, cast_error_kind::invalid_enum);
    EXPECT_EQ(r.error()[0].message(), "Invalid value. Expected one of: \"a\", \"b\"");

    EXPECT_TRUE(run("2.0", R"({"type": "integer", "enum": [1, 2]})"));
    EXPECT_TRUE(run("\"2024-01-01\"", R"({"type": "string", "format": "date", "enum": ["2024-01-01"]})"));
}

TEST_F(CastTest, MissingRequiredFieldIsReportedOnce) {
    auto r = run(R"({"name": "x"})",
                 R"({"type": "object", "required": ["k"], "properties": {"k": {"type": "string"},
                     "name": {"type": "string"}}})");
    ASSERT_FALSE(r);
    ASSERT_EQ(r.error().size(), 1U) << describe(r.error());
    EXPECT_EQ(r.error()[0].kind, cast_error_kind::missing_field);
    EXPECT_EQ(r.error()[0].pointer(), "/k");
    EXPECT_EQ(r.error()[0].message(), "Missing field: k");
    EXPECT_TRUE(r.error()[0].offending.is_null());
}

TEST_F(CastTest, RequiredNameWithoutDeclaredProperty) {
    auto r = run("{}", R"({"type": "object", "required": ["id"]})");
    ASSERT_FALSE(r);
    ASSERT_EQ(r.error().size(), 1U);
    EXPECT_EQ(r.error()[0].pointer(), "/id");
}

TEST_F(CastTest, SiblingErrorsAreAllCollected) {
    const char* schema = R"({
        "type": "object",
        "required": ["name", "age", "email"],
        "properties": {
            "name": {"type": "string"},
            "age": {"type": "integer", "minimum": 0},
            "email": {"type": "string", "format": "email"}
        }
    })";
    auto r = run(R"({"age": -1, "name": 5})", schema);
    ASSERT_FALSE(r);
    ASSERT_EQ(r.error().size(), 3U) << describe(r.error());
    EXPECT_EQ(r.error()[0].pointer(), "/age");
    EXPECT_EQ(r.error()[0].kind, cast_error_kind::below_minimum);
    EXPECT_EQ(r.error()[1].pointer(), "/name");
    EXPECT_EQ(r.error()[1].kind, cast_error_kind::invalid_type);
    EXPECT_EQ(r.error()[2].pointer(), "/email");
    EXPECT_EQ(r.error()[2].kind, cast_error_kind::missing_field);
}

TEST_F(CastTest, AdditionalProperties) {
    const char* closed =
        R"({"type": "object", "properties": {"a": {"type": "integer"}}, "additionalProperties": false})";
    auto r = run(R"({"a": 1, "b": 2})", closed);
    ASSERT_FALSE(r);
    ASSERT_EQ(r.error().size(), 1U);
    EXPECT_EQ(r.error()[0].kind, cast_error_kind::unexpected_field);
    EXPECT_EQ(r.error()[0].pointer(), "/b");
    EXPECT_EQ(r.error()[0].message(), "Unexpected field: b");

    auto open = run(R"({"a": 1, "b": 2})", R"({"type": "object", "properties": {"a": {"type": "integer"}}})");
    ASSERT_TRUE(open);
    EXPECT_EQ(open->find("b")->as_integer(), 2);

    auto typed = run(R"({"a": 1, "b": "x"})",
                     R"({"type": "object", "additionalProperties": {"type": "integer"}})");
    ASSERT_FALSE(typed);
    EXPECT_EQ(typed.error()[0].pointer(), "/b");
    EXPECT_EQ(typed.error()[0].kind, cast_error_kind::invalid_type);
}

TEST_F(CastTest, PropertyCountBounds) {
    const char* schema = R"({"type": "object", "minProperties": 1, "maxProperties": 2})";
    auto empty = run("{}", schema);
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error()[0].message(), "Object must have at least 1 properties");
    auto full = run(R"({"a": 1, "b": 2, "c": 3})", schema);
    ASSERT_FALSE(full);
    EXPECT_EQ(full.error()[0].kind, cast_error_kind::too_many_properties);
    EXPECT_TRUE(run(R"({"a": 1})", schema));
}

TEST_F(CastTest, DefaultsFillAbsentOptionalFields) {
    const char* schema = R"({
        "type": "object",
        "properties": {
            "name": {"type": "string"},
            "role": {"type": "string", "default": "member"},
            "limit": {"type": "integer", "default": 10}
        }
    })";
    auto r = run(R"({"limit": 3, "name": "ada"})", schema);
    ASSERT_TRUE(r);
    EXPECT_EQ(to_json(*r), R"({"limit":3,"name":"ada","role":"member"})");

    cast_options no_defaults;
    no_defaults.apply_defaults = false;
    auto bare = run(R"({"name": "ada"})", schema, no_defaults);
    ASSERT_TRUE(bare);
    EXPECT_EQ(bare->find("role"), nullptr);
}

TEST_F(CastTest, StructTagIsAttached) {
    auto r = run(R"({"id": 1})",
                 R"({"type": "object", "x-struct": "User", "properties": {"id": {"type": "integer"}}})");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->as_object().struct_name, "User");
}

TEST_F(CastTest, ReadOnlyAndWriteOnlyFollowDirection) {
    const char* schema = R"({
        "type": "object",
        "required": ["id", "password"],
        "properties": {
            "id": {"type": "integer", "readOnly": true},
            "password": {"type": "string", "writeOnly": true}
        }
    })";
    auto request = run(R"({"password": "secret"})", schema);
    EXPECT_TRUE(request) << describe(request.error());

    cast_options response;
    response.direction = cast_direction::response;
    auto reply = run(R"({"id": 7})", schema, response);
    EXPECT_TRUE(reply) << describe(reply.error());

    auto missing = run(R"({"id": 7})", schema);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error()[0].pointer(), "/password");
}

TEST_F(CastTest, ArraysCastItemsAtIndexPaths) {
    const char* schema = R"({"type": "array", "items": {"type": "string", "format": "date"}})";
    auto ok = run(R"(["2024-01-01", "2024-01-02"])", schema);
    ASSERT_TRUE(ok);
    EXPECT_TRUE((*ok)[1].is_date());

    auto bad = run(R"(["2024-01-01", "x", 3])", schema);
    ASSERT_FALSE(bad);
    ASSERT_EQ(bad.error().size(), 2U);
    EXPECT_EQ(bad.error()[0].pointer(), "/1");
    EXPECT_EQ(bad.error()[0].kind, cast_error_kind::invalid_format);
    EXPECT_EQ(bad.error()[1].pointer(), "/2");
    EXPECT_EQ(bad.error()[1].kind, cast_error_kind::invalid_type);
}

TEST_F(CastTest, ArrayItemCountAndUniqueness) {
    const char* schema = R"({"type": "array", "minItems": 1, "maxItems": 3, "uniqueItems": true})";
    auto empty = run("[]", schema);
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error()[0].message(), "Array must contain at least 1 items");

    auto many = run("[1, 2, 3, 4]", schema);
    ASSERT_FALSE(many);
    EXPECT_EQ(many.error()[0].kind, cast_error_kind::too_long);

    auto dup = run("[1, 1.0]", schema);
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error()[0].kind, cast_error_kind::duplicate_items);
    EXPECT_EQ(dup.error()[0].message(), "Array items must be unique");

    EXPECT_TRUE(run(R"([{"a": 1}, {"a": 2}])", schema));
}

TEST_F(CastTest, NestedPathsReachDeepErrors) {
    const char* schema = R"({
        "type": "object",
        "properties": {
            "owner": {
                "type": "object",
                "properties": {
                    "pets": {"type": "array", "items": {"type": "object",
                        "properties": {"name": {"type": "string"}}}}
                }
            }
        }
    })";
    auto r = run(R"({"owner": {"pets": [{"name": "a"}, {"name": 1}]}})", schema);
    ASSERT_FALSE(r);
    ASSERT_EQ(r.error().size(), 1U);
    EXPECT_EQ(r.error()[0].pointer(), "/owner/pets/1/name");
}

TEST_F(CastTest, BasePathPrefixesErrors) {
    const auto& s = schema_of(R"({"type": "object", "required": ["id"]})");
    json_pointer body{std::string("body")};
    auto r = cast(value::object({}), s, reg, body);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error()[0].pointer(), "/body/id");
}

TEST_F(CastTest, DanglingReferenceIsSchemaNotFound) {
    auto r = run("1", R"({"$ref": "#/components/schemas/Missing"})");
    ASSERT_FALSE(r);
    ASSERT_EQ(r.error().size(), 1U);
    EXPECT_EQ(r.error()[0].kind, cast_error_kind::schema_not_found);
    EXPECT_EQ(r.error()[0].message(), "Schema not found: Missing");
}

TEST_F(CastTest, ValidateByName) {
    auto doc = openapi::load_from_string(R"({
        "openapi": "3.0.3",
        "info": {"title": "t", "version": "1"},
        "components": {"schemas": {"Age": {"type": "integer", "minimum": 0}}}
    })");
    ASSERT_TRUE(doc);
    EXPECT_TRUE(validate(value(5), "Age", doc->schemas));

    auto low = validate(value(-5), "Age", doc->schemas);
    ASSERT_FALSE(low);
    EXPECT_EQ(low.error()[0].kind, cast_error_kind::below_minimum);

    auto unknown = validate(value(5), "Nope", doc->schemas);
    ASSERT_FALSE(unknown);
    ASSERT_EQ(unknown.error().size(), 1U);
    EXPECT_EQ(unknown.error()[0].kind, cast_error_kind::schema_not_found);
    EXPECT_EQ(unknown.error()[0].pointer(), "/");
}

TEST_F(CastTest, RepeatedCastsAreIdentical) {
    const auto& s = schema_of(R"({
        "type": "object",
        "required": ["a", "b"],
        "properties": {"a": {"type": "integer", "maximum": 1}, "b": {"type": "string", "format": "uuid"},
                       "c": {"type": "boolean", "default": false}}
    })");
    auto good = parse_json(R"({"a": 1, "b": "123e4567-e89b-12d3-a456-426614174000"})");
    auto bad = parse_json(R"({"a": 2, "b": "x", "z": null})");
    ASSERT_TRUE(good && bad);

    auto g1 = cast(*good, s, reg);
    auto g2 = cast(*good, s, reg);
    ASSERT_TRUE(g1 && g2);
    EXPECT_EQ(to_json(*g1), to_json(*g2));

    auto b1 = cast(*bad, s, reg);
    auto b2 = cast(*bad, s, reg);
    ASSERT_FALSE(b1);
    ASSERT_FALSE(b2);
    EXPECT_EQ(to_json(render_errors(b1.error())), to_json(render_errors(b2.error())));
}

TEST_F(CastTest, ConcurrentCastsShareRegistry) {
    const auto& s = schema_of(R"({"type": "array", "items": {"type": "integer", "minimum": 0}})");
    auto input = parse_json("[1, 2, -3, 4]");
    ASSERT_TRUE(input);
    const std::string expected = to_json(render_errors(cast(*input, s, reg).error()));

    std::vector<std::string> seen(4);
    std::vector<std::thread> workers;
    for (size_t t = 0; t < seen.size(); ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 200; ++i) {
                auto r = cast(*input, s, reg);
                seen[t] = r ? std::string("ok") : to_json(render_errors(r.error()));
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    for (const auto& out : seen) {
        EXPECT_EQ(out, expected);
    }
}

TEST_F(CastTest, NegativeAgeIsSingleBelowMinimum) {
    auto r = run(R"({"age": -1})",
                 R"({"type": "object", "properties": {"age": {"type": "integer", "minimum": 0}},
                     "required": ["age"]})");
    ASSERT_FALSE(r);
    ASSERT_EQ(r.error().size(), 1U) << describe(r.error());
    EXPECT_EQ(r.error()[0].kind, cast_error_kind::below_minimum);
    EXPECT_EQ(r.error()[0].pointer(), "/age");
}

TEST_F(CastTest, EpochDate) {
    auto r = run("\"1970-01-01\"", R"({"type": "string", "format": "date"})");
    ASSERT_TRUE(r);
    EXPECT_EQ(*r, value(year{1970} / 1 / 1));
}

TEST_F(CastTest, LongStringAgainstPattern) {
    const auto& s = schema_of(R"({"type": "string", "pattern": "^(a|b)*$"})");
    std::string text(200000, 'a');
    text[100000] = 'b';
    EXPECT_TRUE(cast(value(text), s, reg));

    text.push_back('c');
    auto r = cast(value(text), s, reg);
    ASSERT_FALSE(r);
    ASSERT_EQ(r.error().size(), 1U);
    EXPECT_EQ(r.error()[0].kind, cast_error_kind::pattern_mismatch);
}

TEST_F(CastTest, IntegralDoubleOutsideInt64IsNotAnInteger) {
    const auto& s = schema_of(R"({"type": "integer"})");
    auto r = cast(value(1e19), s, reg);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error()[0].kind, cast_error_kind::invalid_type);
    EXPECT_EQ(r.error()[0].expected, "integer");
}

TEST_F(CastTest, IntegerBoundsAreExactPastDoublePrecision) {
    // 2^53 + 1 rounds to 2^53 as a double.
    auto over = run("9007199254740993", R"({"type": "integer", "maximum": 9007199254740992})");
    ASSERT_FALSE(over);
    EXPECT_EQ(over.error()[0].kind, cast_error_kind::above_maximum);

    EXPECT_TRUE(run("9007199254740993", R"({"type": "integer", "minimum": 9007199254740992,
                                            "exclusiveMinimum": true})"));
    EXPECT_TRUE(run("9007199254740993", R"({"type": "integer", "multipleOf": 3})"));
    auto odd = run("9007199254740995", R"({"type": "integer", "multipleOf": 3})");
    ASSERT_FALSE(odd);
    EXPECT_EQ(odd.error()[0].kind, cast_error_kind::not_multiple_of);
}
