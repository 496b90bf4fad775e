#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "exschema/error/exception.hpp"
#include "exschema/schema/compiler.hpp"
#include "exschema/validator/errors.hpp"

using namespace exschema::schema;
using namespace exschema::validator;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

class KeywordTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    auto check(const json& schema, const json& instance)
        -> std::vector<ErrorRecord> {
        return compiler.compile(schema).validate(instance);
    }

    SchemaCompiler compiler;
};

TEST_F(KeywordTest, TypeMismatchOnRoot) {
    auto errors = check({{"type", "string"}}, json(3.14));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "type");
    EXPECT_THAT(errors[0].path, IsEmpty());
    EXPECT_EQ(errors[0].value, json(3.14));
    EXPECT_THAT(errors[0].message, HasSubstr("Type mismatch"));
    EXPECT_THAT(errors[0].message, HasSubstr("string"));
}

TEST_F(KeywordTest, TypeUnion) {
    const json schema = {{"type", json::array({"string", "null"})}};
    EXPECT_THAT(check(schema, json("x")), IsEmpty());
    EXPECT_THAT(check(schema, json(nullptr)), IsEmpty());
    auto errors = check(schema, json(true));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_THAT(errors[0].message, HasSubstr("string or null"));
    EXPECT_EQ(errors[0].context["expected"], json::array({"string", "null"}));
}

TEST_F(KeywordTest, IntegerFollowsRepresentation) {
    EXPECT_THAT(check({{"type", "integer"}}, json(4)), IsEmpty());
    EXPECT_THAT(check({{"type", "integer"}}, json(4.5)), SizeIs(1));
    EXPECT_THAT(check({{"type", "number"}}, json(4)), IsEmpty());
    EXPECT_THAT(check({{"type", "number"}}, json(4.5)), IsEmpty());
}

TEST_F(KeywordTest, EnumAndConst) {
    const json choices = {{"enum", json::array({"red", 1, nullptr,
                                                {{"a", 1}}})}};
    EXPECT_THAT(check(choices, json("red")), IsEmpty());
    EXPECT_THAT(check(choices, json(1.0)), IsEmpty());
    EXPECT_THAT(check(choices, json{{"a", 1}}), IsEmpty());
    auto errors = check(choices, json("blue"));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "enum");

    EXPECT_THAT(check({{"const", {{"k", json::array({1, 2})}}}},
                      json{{"k", json::array({1, 2})}}),
                IsEmpty());
    EXPECT_THAT(check({{"const", false}}, json(0)), SizeIs(1));
}

TEST_F(KeywordTest, NumericBounds) {
    const json schema = {{"minimum", 1}, {"maximum", 10}};
    EXPECT_THAT(check(schema, json(1)), IsEmpty());
    EXPECT_THAT(check(schema, json(10.0)), IsEmpty());
    auto low = check(schema, json(0.5));
    ASSERT_THAT(low, SizeIs(1));
    EXPECT_EQ(low[0].keyword, "minimum");
    auto high = check(schema, json(11));
    ASSERT_THAT(high, SizeIs(1));
    EXPECT_EQ(high[0].keyword, "maximum");
    EXPECT_THAT(check(schema, json("11")), IsEmpty());
}

TEST_F(KeywordTest, Draft04ExclusiveFlags) {
    const json schema = {{"minimum", 0},
                         {"exclusiveMinimum", true},
                         {"maximum", 5},
                         {"exclusiveMaximum", true}};
    EXPECT_THAT(check(schema, json(0.001)), IsEmpty());
    auto errors = check(schema, json(0));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "minimum");
    EXPECT_THAT(errors[0].message, HasSubstr("exclusive minimum"));
    EXPECT_THAT(check(schema, json(5)), SizeIs(1));
}

TEST_F(KeywordTest, NumericExclusiveForms) {
    const json schema = {{"exclusiveMinimum", 0}, {"exclusiveMaximum", 5}};
    EXPECT_THAT(check(schema, json(3)), IsEmpty());
    auto errors = check(schema, json(0));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "exclusiveMinimum");
    EXPECT_THAT(check(schema, json(5.0)), SizeIs(1));
}

TEST_F(KeywordTest, BoundsAreExactForLargeIntegers) {
    const json schema = {{"maximum", 9007199254740992.0}};
    EXPECT_THAT(check(schema, json(std::int64_t{9007199254740992})),
                IsEmpty());
    EXPECT_THAT(check(schema, json(std::int64_t{9007199254740993})),
                SizeIs(1));
}

TEST_F(KeywordTest, MultipleOf) {
    EXPECT_THAT(check({{"multipleOf", 3}}, json(9)), IsEmpty());
    EXPECT_THAT(check({{"multipleOf", 3}}, json(10)), SizeIs(1));
    EXPECT_THAT(check({{"multipleOf", 0.5}}, json(2.5)), IsEmpty());
    auto errors = check({{"multipleOf", 0.5}}, json(2.2));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "multipleOf");
}

TEST_F(KeywordTest, StringLengthCountsCodePoints) {
    const json schema = {{"minLength", 2}, {"maxLength", 3}};
    EXPECT_THAT(check(schema, json("\xc3\xa9t\xc3\xa9")), IsEmpty());
    EXPECT_THAT(check(schema, json("\xf0\x9f\x98\x80")), SizeIs(1));
    auto errors = check(schema, json("abcd"));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "maxLength");
    EXPECT_THAT(check(schema, json(12345)), IsEmpty());
}

TEST_F(KeywordTest, HugeLengthLimitsSaturate) {
    auto errors = check({{"minLength", 1e30}}, json("abc"));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "minLength");
    EXPECT_THAT(check({{"maxLength", 1e30}}, json("abc")), IsEmpty());
    EXPECT_THAT(check({{"maxItems", 1e300}}, json::array({1, 2})), IsEmpty());
    EXPECT_THAT(check({{"contains", true}, {"minContains", 1e30}},
                      json::array({1, 2})),
                SizeIs(1));
    EXPECT_THROW((void)compiler.compile({{"minLength", 1e30},
                                         {"maxLength", 10}}),
                 exschema::error::MalformedSchema);
}

TEST_F(KeywordTest, PatternIsUnanchoredSearch) {
    const json schema = {{"pattern", "[0-9]{3}"}};
    EXPECT_THAT(check(schema, json("abc123def")), IsEmpty());
    auto errors = check(schema, json("abc12"));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "pattern");
    EXPECT_THAT(errors[0].message, HasSubstr("[0-9]{3}"));
    EXPECT_THAT(check({{"pattern", "^a"}}, json("ba")), SizeIs(1));
}

TEST_F(KeywordTest, FormatIsAdvisoryByDefault) {
    EXPECT_THAT(check({{"format", "ipv4"}}, json("999.1.1.1")), IsEmpty());
    EXPECT_THAT(check({{"format", "no-such-format"}}, json("x")), IsEmpty());
}

TEST_F(KeywordTest, FormatIsEnforcedOnRequest) {
    SchemaCompiler enforcing(CompileOptions{.enforce_format = true});
    auto schema = enforcing.compile({{"format", "ipv4"}});
    EXPECT_TRUE(schema.isValid(json("192.168.0.1")));
    EXPECT_TRUE(schema.isValid(json(42)));
    auto errors = schema.validate(json("999.1.1.1"));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "format");
    EXPECT_THAT(errors[0].message, HasSubstr("ipv4"));
}

TEST_F(KeywordTest, UnknownFormatUnderStrictIsMalformed) {
    SchemaCompiler strict(CompileOptions{.strict = true});
    try {
        (void)strict.compile(
            {{"properties", {{"a", {{"format", "no-such-format"}}}}}});
        FAIL() << "expected MalformedSchema";
    } catch (const exschema::error::MalformedSchema& e) {
        EXPECT_EQ(e.location(), "#/properties/a/format");
    }
    SchemaCompiler enforcing(
        CompileOptions{.strict = true, .enforce_format = true});
    EXPECT_THROW((void)enforcing.compile({{"format", "no-such-format"}}),
                 exschema::error::MalformedSchema);
    EXPECT_NO_THROW((void)strict.compile({{"format", "date"}}));
}

TEST_F(KeywordTest, CustomFormat) {
    SchemaCompiler custom(CompileOptions{.enforce_format = true});
    custom.registerFormat("even-length", [](std::string_view text) {
        return text.size() % 2 == 0;
    });
    auto schema = custom.compile({{"format", "even-length"}});
    EXPECT_TRUE(schema.isValid(json("ab")));
    EXPECT_FALSE(schema.isValid(json("abc")));
}

TEST_F(KeywordTest, KeywordsOnlyApplyToTheirType) {
    const json schema = {{"minLength", 3},
                         {"minimum", 3},
                         {"minItems", 3},
                         {"required", json::array({"a"})}};
    for (const auto& instance : {json(nullptr), json(true), json("abc"),
                                 json(4), json::array({1, 2, 3}),
                                 json{{"a", 1}}}) {
        EXPECT_THAT(check(schema, instance), IsEmpty()) << instance.dump();
    }
}

TEST_F(KeywordTest, ErrorRecordCarriesSchemaLocation) {
    auto schema = compiler.compile(
        {{"properties", {{"age", {{"minimum", 0}}}}}}, "urn:person");
    auto errors = schema.validate(json{{"age", -1}});
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_THAT(errors[0].path, ElementsAre(PathElement{"age"}));
    EXPECT_EQ(errors[0].schema_path, "urn:person#/properties/age/minimum");
    EXPECT_EQ(errors[0].value, json(-1));
}
