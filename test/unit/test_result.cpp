#include "castor/core/json.hpp"
#include "castor/core/openapi_loader.hpp"
#include "castor/core/result.hpp"
#include "castor/core/yaml.hpp"

#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <system_error>

using namespace castor;

TEST(Result, ErrorCategoryNameAndMessages) {
    auto ec = make_error_code(error_code::openapi_invalid_spec);
    EXPECT_STREQ(ec.category().name(), "castor");
    EXPECT_EQ(ec.value(), 4);
    EXPECT_EQ(ec.message(), "invalid or unsupported OpenAPI document");
    EXPECT_EQ(make_error_code(error_code::yaml_parse_error).message(), "malformed YAML text");
    EXPECT_EQ(make_error_code(error_code::ok).message(), "success");
}

TEST(Result, UnknownValueHasFallbackMessage) {
    std::error_code ec(99, get_error_category());
    EXPECT_EQ(ec.message(), "unknown error");
}

TEST(Result, ErrorCodeEnumConvertsImplicitly) {
    std::error_code ec = error_code::openapi_parse_error;
    EXPECT_EQ(ec, make_error_code(error_code::openapi_parse_error));
    EXPECT_NE(ec, make_error_code(error_code::json_parse_error));
}

TEST(Result, CategoryIsSharedAndDistinct) {
    EXPECT_EQ(&make_error_code(error_code::json_parse_error).category(), &get_error_category());
    EXPECT_EQ(&make_error_code(error_code::yaml_parse_error).category(), &get_error_category());
    // Same numeric value in another category is a different error.
    EXPECT_NE(make_error_code(error_code::json_parse_error),
              std::error_code(1, std::generic_category()));
}

TEST(Result, ReadersReportTheirOwnCodes) {
    auto json = parse_json("{\"a\": }");
    ASSERT_FALSE(json);
    EXPECT_EQ(json.error(), error_code::json_parse_error);
    EXPECT_EQ(json.error().category().name(), std::string("castor"));

    auto yaml = parse_yaml("a: 1\na: 2\n");
    ASSERT_FALSE(yaml);
    EXPECT_EQ(yaml.error(), error_code::yaml_parse_error);
}

TEST(Result, LoaderSeparatesSyntaxFromSemantics) {
    openapi::registry reg;
    auto unreadable = openapi::parse_schema(std::string_view("{\"type\": "), reg);
    ASSERT_FALSE(unreadable);
    EXPECT_EQ(unreadable.error(), error_code::openapi_parse_error);

    auto unsupported = openapi::parse_schema(std::string_view(R"({"type": "decimal"})"), reg);
    ASSERT_FALSE(unsupported);
    EXPECT_EQ(unsupported.error(), error_code::openapi_invalid_spec);
    EXPECT_EQ(unsupported.error().message(), "invalid or unsupported OpenAPI document");
}
