#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "exschema/error/exception.hpp"
#include "exschema/schema/document.hpp"

using namespace exschema::schema;
using exschema::error::MalformedSchema;
using ::testing::HasSubstr;

class SchemaDocumentTest : public ::testing::Test {
protected:
    static auto load(const json& schema) -> std::unique_ptr<SchemaDocument> {
        return SchemaDocument::load(schema, "urn:test");
    }
};

TEST_F(SchemaDocumentTest, LoadsEverySubschemaPosition) {
    json schema = {
        {"properties", {{"a", {{"type", "string"}}}, {"b", true}}},
        {"patternProperties", {{"^x", json::object()}}},
        {"additionalProperties", false},
        {"items", json::array({json::object(), json::object()})},
        {"allOf", json::array({{{"minimum", 1}}})},
        {"not", {{"type", "null"}}},
        {"definitions", {{"d", json::object()}}},
        {"dependencies", {{"a", json::array({"b"})}, {"c", json::object()}}}};
    auto document = load(schema);

    EXPECT_EQ(document->uri(), "urn:test");
    EXPECT_EQ(document->root().pointer(), "");
    EXPECT_NE(document->find("/properties/a"), nullptr);
    EXPECT_NE(document->find("/properties/b"), nullptr);
    EXPECT_NE(document->find("/patternProperties/^x"), nullptr);
    EXPECT_NE(document->find("/additionalProperties"), nullptr);
    EXPECT_NE(document->find("/items/1"), nullptr);
    EXPECT_NE(document->find("/allOf/0"), nullptr);
    EXPECT_NE(document->find("/not"), nullptr);
    EXPECT_NE(document->find("/definitions/d"), nullptr);
    EXPECT_NE(document->find("/dependencies/c"), nullptr);
    EXPECT_EQ(document->find("/dependencies/a"), nullptr);
    EXPECT_EQ(document->nodes().size(), 11);
}

TEST_F(SchemaDocumentTest, NodeKindsAndAccessors) {
    json schema = {{"properties",
                    {{"flag", false},
                     {"link", {{"$ref", "#/definitions/x"}, {"type", "null"}}},
                     {"plain", {{"title", "plain"}}}}}};
    auto document = load(schema);

    const auto& root = document->root();
    EXPECT_EQ(root.kind(), NodeKind::Object);
    EXPECT_TRUE(root.hasKeyword("properties"));
    EXPECT_EQ(root.keyword("type"), nullptr);

    const auto* flag = root.child("properties", "flag");
    ASSERT_NE(flag, nullptr);
    EXPECT_EQ(flag->kind(), NodeKind::Boolean);
    EXPECT_FALSE(flag->booleanValue());

    const auto* link = root.child("properties", "link");
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->kind(), NodeKind::Reference);
    EXPECT_EQ(link->reference(), "#/definitions/x");
    EXPECT_EQ(link->identifier(), "urn:test#/properties/link");

    const auto* plain = root.child("properties", "plain");
    ASSERT_NE(plain, nullptr);
    EXPECT_EQ(plain->value()["title"], "plain");
}

TEST_F(SchemaDocumentTest, IdOpensNewScope) {
    json schema = {
        {"$id", "http://example.com/root.json"},
        {"definitions",
         {{"a", {{"$id", "item.json"}, {"properties", {{"x", true}}}}},
          {"b", {{"$id", "#named"}}}}}};
    auto document = SchemaDocument::load(schema, "urn:doc");

    EXPECT_EQ(document->root().scopeUri(), "http://example.com/root.json");

    const auto* a = document->find("/definitions/a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->scopeUri(), "http://example.com/item.json");
    EXPECT_EQ(a->scopePointer(), "");

    const auto* x = document->find("/definitions/a/properties/x");
    ASSERT_NE(x, nullptr);
    EXPECT_EQ(x->scopedIdentifier(),
              "http://example.com/item.json#/properties/x");

    const auto* b = document->find("/definitions/b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->anchor(), "named");
    EXPECT_EQ(b->scopeUri(), "http://example.com/root.json");
    EXPECT_EQ(b->scopePointer(), "/definitions/b");
}

TEST_F(SchemaDocumentTest, Draft04IdIsHonoured) {
    json schema = {{"id", "http://example.com/draft4.json"}};
    auto document = load(schema);
    EXPECT_EQ(document->root().scopeUri(), "http://example.com/draft4.json");
}

TEST_F(SchemaDocumentTest, RootMustBeObjectOrBoolean) {
    EXPECT_NO_THROW(load(json(true)));
    EXPECT_THROW(load(json(42)), MalformedSchema);
    EXPECT_THROW(load(json::array()), MalformedSchema);
}

TEST_F(SchemaDocumentTest, RejectsWrongKeywordShapes) {
    EXPECT_THROW(load({{"properties", json::array()}}), MalformedSchema);
    EXPECT_THROW(load({{"required", json::array({1})}}), MalformedSchema);
    EXPECT_THROW(load({{"minLength", -1}}), MalformedSchema);
    EXPECT_THROW(load({{"minLength", 1.5}}), MalformedSchema);
    EXPECT_THROW(load({{"type", 3}}), MalformedSchema);
    EXPECT_THROW(load({{"$ref", 3}}), MalformedSchema);
    EXPECT_THROW(load({{"enum", "a"}}), MalformedSchema);
    EXPECT_THROW(load({{"multipleOf", 0}}), MalformedSchema);
    EXPECT_THROW(load({{"allOf", json::array()}}), MalformedSchema);
    EXPECT_THROW(load({{"not", "x"}}), MalformedSchema);
    EXPECT_THROW(load({{"properties", {{"a", 1}}}}), MalformedSchema);
    EXPECT_THROW(load({{"items", json::array({1})}}), MalformedSchema);
    EXPECT_THROW(load({{"dependencies", {{"a", 1}}}}), MalformedSchema);
}

TEST_F(SchemaDocumentTest, MalformedSchemaNamesLocation) {
    try {
        (void)load({{"properties", {{"name", {{"maxLength", "ten"}}}}}});
        FAIL() << "expected MalformedSchema";
    } catch (const MalformedSchema& e) {
        EXPECT_EQ(e.location(), "urn:test#/properties/name/maxLength");
        EXPECT_THAT(e.what(), HasSubstr("maxLength"));
    }
}

TEST_F(SchemaDocumentTest, UnknownKeywordsAreNotWalked) {
    auto document = load({{"x-custom", {{"type", 5}}}});
    EXPECT_EQ(document->nodes().size(), 1);
}
