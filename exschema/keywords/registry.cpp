/*
 * registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-9

Description: Fixed table mapping keyword names to their compilers

**************************************************/

#include "registry.hpp"

#include <array>

#include "exschema/keywords/families.hpp"

namespace exschema::keywords {

namespace {

using utils::InstanceType;
using utils::kAnyType;
using utils::kNumericTypes;
using utils::maskOf;

constexpr auto kString = maskOf(InstanceType::String);
constexpr auto kArray = maskOf(InstanceType::Array);
constexpr auto kObject = maskOf(InstanceType::Object);

constexpr std::array kCompilers{
    // general
    KeywordEntry{"type", kAnyType, compileType},
    KeywordEntry{"enum", kAnyType, compileEnum},
    KeywordEntry{"const", kAnyType, compileConst},
    // numbers
    KeywordEntry{"minimum", kNumericTypes, compileBound},
    KeywordEntry{"maximum", kNumericTypes, compileBound},
    KeywordEntry{"exclusiveMinimum", kNumericTypes, compileExclusiveBound},
    KeywordEntry{"exclusiveMaximum", kNumericTypes, compileExclusiveBound},
    KeywordEntry{"multipleOf", kNumericTypes, compileMultipleOf},
    // strings
    KeywordEntry{"minLength", kString, compileLength},
    KeywordEntry{"maxLength", kString, compileLength},
    KeywordEntry{"pattern", kString, compilePattern},
    KeywordEntry{"format", kString, compileFormat},
    // objects
    KeywordEntry{"properties", kObject, compileProperties},
    KeywordEntry{"patternProperties", kObject, compilePatternProperties},
    KeywordEntry{"additionalProperties", kObject, compileAdditionalProperties},
    KeywordEntry{"unevaluatedProperties", kObject,
                 compileUnevaluatedProperties},
    KeywordEntry{"required", kObject, compileRequired},
    KeywordEntry{"minProperties", kObject, compileLength},
    KeywordEntry{"maxProperties", kObject, compileLength},
    KeywordEntry{"dependencies", kObject, compileDependencies},
    KeywordEntry{"dependentRequired", kObject, compileDependencies},
    KeywordEntry{"dependentSchemas", kObject, compileDependencies},
    KeywordEntry{"propertyNames", kObject, compilePropertyNames},
    // arrays
    KeywordEntry{"items", kArray, compileItems},
    KeywordEntry{"additionalItems", kArray, compileAdditionalItems},
    KeywordEntry{"minItems", kArray, compileLength},
    KeywordEntry{"maxItems", kArray, compileLength},
    KeywordEntry{"uniqueItems", kArray, compileUniqueItems},
    KeywordEntry{"contains", kArray, compileContains},
    KeywordEntry{"minContains", kArray, compileNothing},
    KeywordEntry{"maxContains", kArray, compileNothing},
    // composition
    KeywordEntry{"allOf", kAnyType, compileBranches},
    KeywordEntry{"anyOf", kAnyType, compileBranches},
    KeywordEntry{"oneOf", kAnyType, compileBranches},
    KeywordEntry{"not", kAnyType, compileNot},
    KeywordEntry{"if", kAnyType, compileConditional},
    KeywordEntry{"then", kAnyType, compileNothing},
    KeywordEntry{"else", kAnyType, compileNothing},
};

}  // namespace

auto findCompiler(std::string_view name) noexcept -> const KeywordEntry* {
    for (const auto& entry : kCompilers) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

}  // namespace exschema::keywords
