/*
 * numeric.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-10

Description: Compilers of the numeric keywords

**************************************************/

#include "exschema/keywords/families.hpp"

#include "exschema/error/exception.hpp"
#include "exschema/keywords/context.hpp"
#include "exschema/utils/json_utils.hpp"

namespace exschema::keywords {

using validator::NodeTag;

// minimum/maximum may be modified by a draft-04 boolean exclusive flag;
// the numeric exclusive forms compile to nodes of their own.
auto compileBound(CompileContext& context, const schema::SchemaNode& node,
                  std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    const bool lower = keyword == "minimum";
    const auto* flag =
        node.keyword(lower ? "exclusiveMinimum" : "exclusiveMaximum");
    const bool exclusive =
        flag != nullptr && flag->is_boolean() && flag->get<bool>();

    if (!lower) {
        if (const auto* minimum = node.keyword("minimum");
            minimum != nullptr && utils::compareNumbers(value, *minimum) < 0) {
            THROW_MALFORMED_SCHEMA(context.location(node, keyword),
                                   "'maximum' (", value.dump(),
                                   ") is less than 'minimum' (",
                                   minimum->dump(), ")");
        }
    }
    return context.addNode(NodeTag::Bound, node, keyword,
                           validator::BoundParams{value, lower, exclusive});
}

auto compileExclusiveBound(CompileContext& context,
                           const schema::SchemaNode& node,
                           std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    const bool lower = keyword == "exclusiveMinimum";
    if (value.is_boolean()) {
        const auto* bound = lower ? "minimum" : "maximum";
        if (value.get<bool>() && !node.hasKeyword(bound)) {
            THROW_MALFORMED_SCHEMA(context.location(node, keyword), "'",
                                   keyword, "' requires '", bound, "'");
        }
        return std::nullopt;
    }
    return context.addNode(NodeTag::Bound, node, keyword,
                           validator::BoundParams{value, lower, true});
}

auto compileMultipleOf(CompileContext& context, const schema::SchemaNode& node,
                       std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    return context.addNode(NodeTag::MultipleOf, node, keyword,
                           validator::MultipleOfParams{value});
}

}  // namespace exschema::keywords
