/*
 * families.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-9

Description: Keyword compilers, grouped by the instance type they check

**************************************************/

#ifndef EXSCHEMA_KEYWORDS_FAMILIES_HPP
#define EXSCHEMA_KEYWORDS_FAMILIES_HPP

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "exschema/schema/document.hpp"
#include "exschema/validator/graph.hpp"

namespace exschema::keywords {

class CompileContext;

#define EXSCHEMA_DECLARE_KEYWORD(function)                               \
    auto function(CompileContext& context, const schema::SchemaNode& node, \
                  std::string_view keyword, const nlohmann::json& value)   \
        -> std::optional<validator::NodeId>

// general.cpp
EXSCHEMA_DECLARE_KEYWORD(compileType);
EXSCHEMA_DECLARE_KEYWORD(compileEnum);
EXSCHEMA_DECLARE_KEYWORD(compileConst);

// numeric.cpp
EXSCHEMA_DECLARE_KEYWORD(compileBound);
EXSCHEMA_DECLARE_KEYWORD(compileExclusiveBound);
EXSCHEMA_DECLARE_KEYWORD(compileMultipleOf);

// string.cpp, also serves the item and property counts
EXSCHEMA_DECLARE_KEYWORD(compileLength);
EXSCHEMA_DECLARE_KEYWORD(compilePattern);
EXSCHEMA_DECLARE_KEYWORD(compileFormat);

// object.cpp
EXSCHEMA_DECLARE_KEYWORD(compileProperties);
EXSCHEMA_DECLARE_KEYWORD(compilePatternProperties);
EXSCHEMA_DECLARE_KEYWORD(compileAdditionalProperties);
EXSCHEMA_DECLARE_KEYWORD(compileUnevaluatedProperties);
EXSCHEMA_DECLARE_KEYWORD(compileRequired);
EXSCHEMA_DECLARE_KEYWORD(compileDependencies);
EXSCHEMA_DECLARE_KEYWORD(compilePropertyNames);

// array.cpp
EXSCHEMA_DECLARE_KEYWORD(compileItems);
EXSCHEMA_DECLARE_KEYWORD(compileAdditionalItems);
EXSCHEMA_DECLARE_KEYWORD(compileUniqueItems);
EXSCHEMA_DECLARE_KEYWORD(compileContains);

// composition.cpp
EXSCHEMA_DECLARE_KEYWORD(compileBranches);
EXSCHEMA_DECLARE_KEYWORD(compileNot);
EXSCHEMA_DECLARE_KEYWORD(compileConditional);

// shared by the modifiers handled through a sibling keyword
EXSCHEMA_DECLARE_KEYWORD(compileNothing);

#undef EXSCHEMA_DECLARE_KEYWORD

}  // namespace exschema::keywords

#endif  // EXSCHEMA_KEYWORDS_FAMILIES_HPP
