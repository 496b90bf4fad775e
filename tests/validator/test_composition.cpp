#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "exschema/schema/compiler.hpp"
#include "exschema/validator/errors.hpp"

using namespace exschema::schema;
using namespace exschema::validator;
using ::testing::ElementsAre;
using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

class CompositionTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    auto check(const json& schema, const json& instance)
        -> std::vector<ErrorRecord> {
        return compiler.compile(schema).validate(instance);
    }

    SchemaCompiler compiler;
};

TEST_F(CompositionTest, AllOfReportsEveryFailingBranch) {
    const json schema = {
        {"allOf", json::array({{{"minimum", 5}}, {{"multipleOf", 2}}})}};
    EXPECT_THAT(check(schema, json(6)), IsEmpty());
    auto errors = check(schema, json(3));
    ASSERT_THAT(errors, SizeIs(2));
    EXPECT_EQ(errors[0].keyword, "minimum");
    EXPECT_EQ(errors[1].keyword, "multipleOf");
    EXPECT_THAT(errors[0].schema_path, EndsWith("/allOf/0/minimum"));
    EXPECT_THAT(errors[1].schema_path, EndsWith("/allOf/1/multipleOf"));
}

TEST_F(CompositionTest, AllOfKeepsInstancePaths) {
    const json schema = {
        {"allOf",
         json::array({{{"properties", {{"a", {{"type", "string"}}}}}}})}};
    auto errors = check(schema, json{{"a", 1}});
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_THAT(errors[0].path, ElementsAre(PathElement{"a"}));
    EXPECT_EQ(errors[0].value, json(1));
}

TEST_F(CompositionTest, AnyOfReportsOneRecordWithBranchDetail) {
    const json schema = {
        {"anyOf", json::array({{{"type", "string"}}, {{"minimum", 10}}})}};
    EXPECT_THAT(check(schema, json("x")), IsEmpty());
    EXPECT_THAT(check(schema, json(11)), IsEmpty());

    auto errors = check(schema, json(3));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "anyOf");
    EXPECT_THAT(errors[0].message, HasSubstr("anyOf"));
    const auto& branches = errors[0].context["branches"];
    ASSERT_EQ(branches.size(), 2);
    EXPECT_EQ(branches[0]["index"], 0);
    EXPECT_EQ(branches[0]["errors"][0]["keyword"], "type");
    EXPECT_EQ(branches[1]["index"], 1);
    EXPECT_EQ(branches[1]["errors"][0]["keyword"], "minimum");
}

TEST_F(CompositionTest, OneOfRequiresExactlyOneMatch) {
    const json schema = {
        {"oneOf", json::array({{{"type", "integer"}}, {{"minimum", 0}}})}};
    EXPECT_THAT(check(schema, json(-1)), IsEmpty());
    EXPECT_THAT(check(schema, json(2.5)), IsEmpty());

    auto several = check(schema, json(5));
    ASSERT_THAT(several, SizeIs(1));
    EXPECT_EQ(several[0].keyword, "oneOf");
    EXPECT_EQ(several[0].context["matched"], json::array({0, 1}));
    EXPECT_THAT(several[0].message, HasSubstr("more than one"));

    auto none = check(schema, json(-2.5));
    ASSERT_THAT(none, SizeIs(1));
    EXPECT_EQ(none[0].keyword, "oneOf");
    EXPECT_EQ(none[0].context["branches"].size(), 2);
    EXPECT_THAT(none[0].message, HasSubstr("matched 0"));
}

TEST_F(CompositionTest, NotInvertsItsSubschema) {
    const json schema = {{"not", {{"type", "string"}}}};
    EXPECT_THAT(check(schema, json(1)), IsEmpty());
    auto errors = check(schema, json("x"));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "not");
}

TEST_F(CompositionTest, DoubleNegationMatchesTheInnerSchema) {
    auto plain = compiler.compile({{"type", "string"}});
    auto twice = compiler.compile({{"not", {{"not", {{"type", "string"}}}}}});
    for (const auto& instance :
         {json("x"), json(1), json(nullptr), json::array(), json{{"k", 1}}}) {
        EXPECT_EQ(plain.isValid(instance), twice.isValid(instance))
            << instance.dump();
    }
    auto errors = twice.validate(json(1));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "not");
}

TEST_F(CompositionTest, ConditionalSelectsABranch) {
    const json schema = {{"if", {{"minimum", 0}}},
                         {"then", {{"multipleOf", 2}}},
                         {"else", {{"multipleOf", 3}}}};
    EXPECT_THAT(check(schema, json(4)), IsEmpty());
    EXPECT_THAT(check(schema, json(-3)), IsEmpty());

    auto positive = check(schema, json(3));
    ASSERT_THAT(positive, SizeIs(1));
    EXPECT_EQ(positive[0].keyword, "multipleOf");
    EXPECT_THAT(positive[0].schema_path, EndsWith("/then/multipleOf"));

    auto negative = check(schema, json(-4));
    ASSERT_THAT(negative, SizeIs(1));
    EXPECT_THAT(negative[0].schema_path, EndsWith("/else/multipleOf"));
}

TEST_F(CompositionTest, ConditionalWithoutElsePassesFailedCondition) {
    const json schema = {{"if", {{"type", "string"}}},
                         {"then", {{"minLength", 2}}}};
    EXPECT_THAT(check(schema, json(1)), IsEmpty());
    EXPECT_THAT(check(schema, json("ab")), IsEmpty());
    EXPECT_THAT(check(schema, json("a")), SizeIs(1));
}

TEST_F(CompositionTest, BooleanBranches) {
    EXPECT_THAT(check({{"anyOf", json::array({false, true})}}, json(1)),
                IsEmpty());
    auto errors = check({{"allOf", json::array({true, false})}}, json(1));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_EQ(errors[0].keyword, "false");
    EXPECT_THAT(errors[0].message, HasSubstr("False schema"));
}
