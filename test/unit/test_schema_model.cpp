#include "castor/core/registry.hpp"
#include "castor/core/schema.hpp"

#include <gtest/gtest.h>

using namespace castor;
using namespace castor::openapi;

TEST(SchemaModel, DefaultIsAnyAndAcceptsNull) {
    schema s;
    EXPECT_TRUE(s.is<any_shape>());
    EXPECT_EQ(s.type, schema_kind::any);
    EXPECT_TRUE(s.accepts_null());
}

TEST(SchemaModel, TypedSchemaRejectsNullUnlessNullable) {
    schema s;
    s.type = schema_kind::string;
    s.shape = string_shape{};
    EXPECT_FALSE(s.accepts_null());
    s.nullable = true;
    EXPECT_TRUE(s.accepts_null());

    schema n;
    n.type = schema_kind::null_type;
    n.shape = null_shape{};
    EXPECT_TRUE(n.accepts_null());
}

TEST(SchemaModel, CompositionShapes) {
    schema a;
    a.shape = all_of_shape{};
    schema o;
    o.shape = one_of_shape{};
    schema x;
    x.shape = not_shape{};
    schema r;
    r.shape = ref_shape{"Pet"};
    EXPECT_TRUE(a.is<all_of_shape>());
    EXPECT_TRUE(o.is<one_of_shape>());
    EXPECT_TRUE(x.is<not_shape>());
    ASSERT_NE(r.as<ref_shape>(), nullptr);
    EXPECT_EQ(r.as<ref_shape>()->name, "Pet");
    EXPECT_EQ(r.as<object_shape>(), nullptr);
}

TEST(SchemaModel, KindNames) {
    EXPECT_EQ(schema_kind_name(schema_kind::null_type), "null");
    EXPECT_EQ(schema_kind_name(schema_kind::boolean), "boolean");
    EXPECT_EQ(schema_kind_name(schema_kind::any), "any");
}

TEST(SchemaModel, ObjectShapeLookups) {
    schema id;
    id.type = schema_kind::integer;
    id.shape = integer_shape{};

    object_shape obj;
    obj.properties.push_back({"id", &id});
    obj.properties.push_back({"name", nullptr});
    obj.required = {"id"};

    ASSERT_NE(obj.find_property("id"), nullptr);
    EXPECT_EQ(obj.find_property("id")->type, &id);
    EXPECT_EQ(obj.find_property("missing"), nullptr);
    EXPECT_TRUE(obj.is_required("id"));
    EXPECT_FALSE(obj.is_required("name"));
}

TEST(SchemaModel, DiscriminatorMappingLookup) {
    discriminator d;
    d.property_name = "kind";
    d.mapping = {{"dog", "Dog"}, {"cat", "Cat"}};
    ASSERT_NE(d.find_mapping("cat"), nullptr);
    EXPECT_EQ(*d.find_mapping("cat"), "Cat");
    EXPECT_EQ(d.find_mapping("Cat"), nullptr);
}
