#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "exschema/error/exception.hpp"
#include "exschema/schema/compiler.hpp"
#include "exschema/schema/vocabulary.hpp"

using namespace exschema::schema;
using exschema::error::InvalidOptions;
using exschema::error::MalformedSchema;
using exschema::error::RecursionLimitExceeded;
using exschema::error::UnresolvedReference;
using exschema::error::UnsupportedKeyword;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

class SchemaCompilerTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    SchemaCompiler compiler;
};

TEST_F(SchemaCompilerTest, CompilesEmptyAndBooleanSchemas) {
    EXPECT_TRUE(compiler.compile(json::object()).isValid(json{{"a", 1}}));
    EXPECT_TRUE(compiler.compile(json(true)).isValid(json(nullptr)));

    auto never = compiler.compile(json(false));
    auto errors = never.validate(json(1));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "false");
}

TEST_F(SchemaCompilerTest, UnknownKeywordsAreInert) {
    auto plain = compiler.compile({{"type", "integer"}});
    auto extended = compiler.compile(
        {{"type", "integer"}, {"x-vendor", {{"anything", true}}}});
    for (const auto& instance :
         {json(1), json("a"), json(2.5), json::array(), json(nullptr)}) {
        EXPECT_EQ(plain.validate(instance).size(),
                  extended.validate(instance).size())
            << instance.dump();
    }
}

TEST_F(SchemaCompilerTest, StrictModeRejectsUnknownKeywords) {
    SchemaCompiler strict(CompileOptions{.strict = true});
    EXPECT_NO_THROW((void)strict.compile({{"title", "annotations are fine"},
                                          {"description", "really"},
                                          {"type", "string"}}));
    try {
        (void)strict.compile({{"properties", {{"a", {{"typo", 1}}}}}});
        FAIL() << "expected UnsupportedKeyword";
    } catch (const UnsupportedKeyword& e) {
        EXPECT_EQ(e.location(), "#/properties/a/typo");
    }
}

TEST_F(SchemaCompilerTest, SemanticErrorsAreMalformed) {
    EXPECT_THROW((void)compiler.compile({{"minimum", 5}, {"maximum", 1}}),
                 MalformedSchema);
    EXPECT_THROW((void)compiler.compile({{"minLength", 5}, {"maxLength", 1}}),
                 MalformedSchema);
    EXPECT_THROW((void)compiler.compile({{"minItems", 2}, {"maxItems", 1}}),
                 MalformedSchema);
    EXPECT_THROW((void)compiler.compile({{"pattern", "(unclosed"}}),
                 MalformedSchema);
    EXPECT_THROW((void)compiler.compile(
                     {{"patternProperties", {{"[", json::object()}}}}),
                 MalformedSchema);
    EXPECT_THROW((void)compiler.compile({{"type", "float"}}), MalformedSchema);
    EXPECT_THROW(
        (void)compiler.compile({{"type", json::array({"string", "string"})}}),
        MalformedSchema);
    EXPECT_THROW((void)compiler.compile({{"enum", json::array()}}),
                 MalformedSchema);
    EXPECT_THROW((void)compiler.compile({{"enum", json::array({1, 1})}}),
                 MalformedSchema);
    EXPECT_THROW(
        (void)compiler.compile({{"required", json::array({"a", "a"})}}),
        MalformedSchema);
    EXPECT_THROW((void)compiler.compile({{"exclusiveMinimum", true}}),
                 MalformedSchema);
    EXPECT_THROW((void)compiler.compile({{"contains", json::object()},
                                         {"minContains", 3},
                                         {"maxContains", 2}}),
                 MalformedSchema);
}

TEST_F(SchemaCompilerTest, UnknownTypeNamesAreMalformed) {
    EXPECT_THROW(
        (void)compiler.compile({{"type", "strng"}, {"enum", json::array({1})}}),
        MalformedSchema);
    EXPECT_THROW((void)compiler.compile({{"type", json::array()}}),
                 MalformedSchema);
    EXPECT_THROW(
        (void)compiler.compile({{"type", json::array({"string", "strng"})}}),
        MalformedSchema);
    try {
        (void)compiler.compile(
            {{"properties", {{"a", {{"type", "Integer"}}}}}});
        FAIL() << "expected MalformedSchema";
    } catch (const MalformedSchema& e) {
        EXPECT_EQ(e.location(), "#/properties/a/type");
        EXPECT_THAT(e.what(), HasSubstr("Integer"));
    }
}

TEST_F(SchemaCompilerTest, SupportedDialectsCompile) {
    for (const char* uri :
         {"http://json-schema.org/draft-04/schema#",
          "http://json-schema.org/draft-06/schema#",
          "http://json-schema.org/draft-07/schema#",
          "https://json-schema.org/draft-07/schema",
          "https://json-schema.org/draft/2019-09/schema",
          "https://json-schema.org/draft/2020-12/schema#"}) {
        auto schema = compiler.compile({{"$schema", uri}, {"type", "string"}});
        EXPECT_TRUE(schema.isValid(json("x"))) << uri;
        EXPECT_FALSE(schema.isValid(json(1))) << uri;
    }
}

TEST_F(SchemaCompilerTest, UnknownDialectIsMalformed) {
    try {
        (void)compiler.compile({{"$schema", "http://example.com/my-dialect"},
                                {"type", "string"}});
        FAIL() << "expected MalformedSchema";
    } catch (const MalformedSchema& e) {
        EXPECT_TRUE(e.location().ends_with("#/$schema"))
            << e.location();
        EXPECT_THAT(e.what(), HasSubstr("my-dialect"));
    }
    EXPECT_THROW((void)compiler.compile({{"$schema", 7}}), MalformedSchema);
    EXPECT_THROW((void)compiler.compile(
                     {{"$schema", "json-schema.org/draft-07/schema"}}),
                 MalformedSchema);
}

TEST(DialectTest, ParseDialect) {
    EXPECT_EQ(parseDialect("http://json-schema.org/draft-04/schema#"),
              Dialect::Draft4);
    EXPECT_EQ(parseDialect("https://json-schema.org/draft-06/schema"),
              Dialect::Draft6);
    EXPECT_EQ(parseDialect("http://json-schema.org/draft-07/schema"),
              Dialect::Draft7);
    EXPECT_EQ(parseDialect("https://json-schema.org/draft/2019-09/schema"),
              Dialect::Draft2019_09);
    EXPECT_EQ(parseDialect("https://json-schema.org/draft/2020-12/schema#"),
              Dialect::Draft2020_12);
    EXPECT_FALSE(parseDialect("").has_value());
    EXPECT_FALSE(parseDialect("ftp://json-schema.org/draft-07/schema"));
    EXPECT_FALSE(parseDialect("http://json-schema.org/draft-05/schema#"));
    EXPECT_FALSE(parseDialect("http://json-schema.org/draft-07/schema##"));
}

TEST_F(SchemaCompilerTest, MaximumEqualToMinimumIsAccepted) {
    auto schema = compiler.compile({{"minimum", 3}, {"maximum", 3.0}});
    EXPECT_TRUE(schema.isValid(json(3)));
    EXPECT_FALSE(schema.isValid(json(4)));
}

TEST_F(SchemaCompilerTest, UnresolvedReferenceFailsCompilation) {
    EXPECT_THROW((void)compiler.compile({{"$ref", "#/definitions/missing"}}),
                 UnresolvedReference);
    EXPECT_THROW((void)compiler.compile({{"$ref", "http://nowhere/x.json"}}),
                 UnresolvedReference);
}

TEST_F(SchemaCompilerTest, ReferenceLoopsAreRejected) {
    EXPECT_THROW((void)compiler.compile({{"$ref", "#"}}),
                 RecursionLimitExceeded);
    EXPECT_THROW(
        (void)compiler.compile(
            {{"definitions",
              {{"a", {{"$ref", "#/definitions/b"}}},
               {"b", {{"$ref", "#/definitions/a"}}}}},
             {"properties", {{"x", {{"$ref", "#/definitions/a"}}}}}}),
        RecursionLimitExceeded);
}

TEST_F(SchemaCompilerTest, ReferenceChainLengthIsBounded) {
    json definitions = json::object();
    for (int i = 0; i < 5; ++i) {
        definitions["d" + std::to_string(i)] = {
            {"$ref", "#/definitions/d" + std::to_string(i + 1)}};
    }
    definitions["d5"] = {{"type", "integer"}};
    const json schema = {{"definitions", definitions},
                         {"$ref", "#/definitions/d0"}};

    SchemaCompiler shallow(CompileOptions{.max_reference_depth = 3});
    EXPECT_THROW((void)shallow.compile(schema), RecursionLimitExceeded);

    auto compiled = compiler.compile(schema);
    EXPECT_TRUE(compiled.isValid(json(1)));
    EXPECT_FALSE(compiled.isValid(json("1")));
}

TEST_F(SchemaCompilerTest, RegisteredDocumentsAreReachable) {
    compiler.registerDocument(
        "http://example.com/defs.json",
        {{"definitions",
          {{"point",
            {{"type", "object"},
             {"required", json::array({"x", "y"})},
             {"properties",
              {{"x", {{"type", "number"}}}, {"y", {{"type", "number"}}}}}}}}}});

    auto schema = compiler.compile(
        {{"type", "array"},
         {"items", {{"$ref", "defs.json#/definitions/point"}}}},
        "http://example.com/polygon.json");

    EXPECT_TRUE(schema.isValid(json::array({{{"x", 1}, {"y", 2}}})));
    auto errors = schema.validate(json::array({{{"x", 1}}}));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "required");
    EXPECT_EQ(errors[0].schema_path,
              "http://example.com/defs.json#/definitions/point/required");
}

TEST_F(SchemaCompilerTest, CompileRegisteredFragment) {
    compiler.registerDocument(
        "urn:defs", {{"definitions", {{"name", {{"type", "string"}}}}}});
    auto schema = compiler.compileRegistered("urn:defs#/definitions/name");
    EXPECT_EQ(schema.identifier(), "urn:defs#/definitions/name");
    EXPECT_TRUE(schema.isValid(json("bob")));
    EXPECT_FALSE(schema.isValid(json(7)));
}

TEST_F(SchemaCompilerTest, DuplicateDocumentRegistrationThrows) {
    compiler.registerDocument("urn:a", json::object());
    EXPECT_THROW(compiler.registerDocument("urn:a", json::object()),
                 MalformedSchema);
    EXPECT_THROW((void)compiler.compile(json::object(), "urn:a"),
                 MalformedSchema);
}

TEST_F(SchemaCompilerTest, BaseUriNamesAnonymousSchemas) {
    SchemaCompiler named(CompileOptions{.base_uri = "urn:anonymous"});
    auto schema = named.compile({{"minimum", 1}});
    EXPECT_EQ(schema.identifier(), "urn:anonymous");
    auto errors = schema.validate(json(0));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].schema_path, "urn:anonymous#/minimum");
}

TEST_F(SchemaCompilerTest, CompiledSchemasAreIndependentOfLaterRegistrations) {
    auto first = compiler.compile({{"type", "string"}}, "urn:first");
    compiler.registerDocument("urn:later", json::object());
    EXPECT_TRUE(first.isValid(json("still works")));
    EXPECT_NO_THROW((void)compiler.compile({{"$ref", "urn:later"}}));
}

TEST_F(SchemaCompilerTest, DeadKeywordIsReportedAndDropped) {
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(
        std::make_shared<spdlog::logger>("compiler-test", sink));
    spdlog::set_level(spdlog::level::warn);

    auto schema = compiler.compile({{"type", "string"}, {"minimum", 5}});

    spdlog::set_default_logger(previous);
    spdlog::set_level(spdlog::level::off);

    EXPECT_THAT(sink->last_formatted(),
                Contains(HasSubstr("will never be used")));
    EXPECT_TRUE(schema.isValid(json("x")));
    EXPECT_THAT(schema.toString(), ::testing::Not(HasSubstr("minimum")));
}

TEST_F(SchemaCompilerTest, GraphDumpListsPlansAndLinks) {
    auto schema = compiler.compile(
        {{"type", "object"},
         {"properties", {{"next", {{"$ref", "#"}}}}}},
        "urn:list");
    const auto dump = schema.toString();
    EXPECT_THAT(dump, HasSubstr("ValidatorGraph"));
    EXPECT_THAT(dump, HasSubstr("-> #0 (urn:list#)"));
    EXPECT_THAT(dump, HasSubstr("object:"));
}

TEST(CompileOptionsTest, FromJsonReadsKnownKeys) {
    auto options = CompileOptions::fromJson({{"strict", true},
                                             {"enforceFormat", true},
                                             {"maxReferenceDepth", 4},
                                             {"maxRecursionDepth", 10},
                                             {"baseUri", "urn:x"}});
    EXPECT_TRUE(options.strict);
    EXPECT_TRUE(options.enforce_format);
    EXPECT_EQ(options.max_reference_depth, 4);
    EXPECT_EQ(options.max_recursion_depth, 10);
    EXPECT_EQ(options.base_uri, "urn:x");
    EXPECT_EQ(CompileOptions::fromJson(options.toJson()).toJson(),
              options.toJson());
}

TEST(CompileOptionsTest, DefaultsSurviveEmptyConfig) {
    auto options = CompileOptions::fromJson(json::object());
    EXPECT_FALSE(options.strict);
    EXPECT_FALSE(options.enforce_format);
    EXPECT_EQ(options.max_reference_depth, 16);
    EXPECT_EQ(options.max_recursion_depth, 512);
    EXPECT_THAT(options.base_uri, IsEmpty());
}

TEST(CompileOptionsTest, RejectsBadConfig) {
    EXPECT_THROW((void)CompileOptions::fromJson({{"strictness", true}}),
                 InvalidOptions);
    EXPECT_THROW((void)CompileOptions::fromJson({{"strict", "yes"}}),
                 InvalidOptions);
    EXPECT_THROW((void)CompileOptions::fromJson({{"maxRecursionDepth", -1}}),
                 InvalidOptions);
    EXPECT_THROW((void)CompileOptions::fromJson(json::array()),
                 InvalidOptions);
}
