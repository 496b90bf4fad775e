#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "exschema/schema/compiler.hpp"
#include "exschema/validator/errors.hpp"

using namespace exschema::schema;
using namespace exschema::validator;
using ::testing::SizeIs;

namespace {

// Recursive tree exercising references, regexes and formats.
const json kTree = {
    {"definitions",
     {{"node",
       {{"type", "object"},
        {"required", json::array({"id"})},
        {"properties",
         {{"id", {{"type", "string"}, {"pattern", "^n[0-9]+$"}}},
          {"seen", {{"format", "date"}}},
          {"children",
           {{"type", "array"},
            {"items", {{"$ref", "#/definitions/node"}}}}}}},
        {"additionalProperties", false}}}}},
    {"$ref", "#/definitions/node"}};

auto makeTree(int depth, int width) -> json {
    json node = {{"id", "n" + std::to_string(depth)},
                 {"seen", depth % 2 == 0 ? "2024-02-30" : "2024-01-01"}};
    if (depth > 0) {
        json children = json::array();
        for (int i = 0; i < width; ++i) {
            children.push_back(makeTree(depth - 1, width));
        }
        // One malformed child per level.
        children.push_back({{"id", depth}, {"extra", true}});
        node["children"] = std::move(children);
    }
    return node;
}

}  // namespace

class ConcurrentValidationTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    SchemaCompiler compiler{CompileOptions{.enforce_format = true}};
};

TEST_F(ConcurrentValidationTest, SharedSchemaGivesIdenticalResults) {
    const auto schema = compiler.compile(kTree);
    const std::vector<json> instances = {makeTree(3, 2), makeTree(4, 1),
                                         json{{"id", "n1"}}, json(42)};

    std::vector<json> expected;
    for (const auto& instance : instances) {
        expected.push_back(toJson(schema.validate(instance)));
    }
    ASSERT_NE(expected[0], json::array());
    ASSERT_EQ(expected[2], json::array());

    const int numThreads = 8;
    const int iterations = 50;
    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([&, i]() {
            for (int j = 0; j < iterations; ++j) {
                const auto index = static_cast<std::size_t>(i + j) %
                                   instances.size();
                if (toJson(schema.validate(instances[index])) !=
                    expected[index]) {
                    ++mismatches;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(ConcurrentValidationTest, CopiesShareTheCompiledGraph) {
    const auto schema = compiler.compile(kTree);
    std::vector<std::thread> threads;
    std::vector<std::size_t> counts(4, 0);

    for (std::size_t i = 0; i < counts.size(); ++i) {
        threads.emplace_back([copy = schema, &counts, i]() {
            counts[i] = copy.validate(json{{"id", 1}}).size();
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_THAT(counts, ::testing::Each(1));
    EXPECT_THAT(schema.validate(json{{"id", 1}}), SizeIs(1));
}
