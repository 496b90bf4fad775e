/*
 * registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-9

Description: Fixed table mapping keyword names to their compilers

**************************************************/

#ifndef EXSCHEMA_KEYWORDS_REGISTRY_HPP
#define EXSCHEMA_KEYWORDS_REGISTRY_HPP

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "exschema/macro.hpp"
#include "exschema/schema/document.hpp"
#include "exschema/utils/json_utils.hpp"
#include "exschema/validator/graph.hpp"

namespace exschema::keywords {

using json = nlohmann::json;

class CompileContext;

/**
 * @brief Compiles one keyword of a schema object.
 *
 * Returns std::nullopt for keywords that only modify a sibling (`then`,
 * `exclusiveMaximum: true`, ...) or that can never fail.
 */
using KeywordCompiler = std::optional<validator::NodeId> (*)(
    CompileContext& context, const schema::SchemaNode& node,
    std::string_view keyword, const json& value);

struct KeywordEntry {
    std::string_view name;
    utils::TypeMask applies_to;  // instance types the keyword constrains
    KeywordCompiler compile;
};

/**
 * @return the entry or nullptr for keywords without a compiler
 */
EXSCHEMA_NODISCARD auto findCompiler(std::string_view name) noexcept
    -> const KeywordEntry*;

}  // namespace exschema::keywords

#endif  // EXSCHEMA_KEYWORDS_REGISTRY_HPP
