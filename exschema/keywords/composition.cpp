/*
 * composition.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-11

Description: Compilers of allOf, anyOf, oneOf, not and if/then/else

**************************************************/

#include "exschema/keywords/families.hpp"

#include <spdlog/spdlog.h>

#include "exschema/keywords/context.hpp"

namespace exschema::keywords {

using schema::SchemaNode;
using validator::NodeTag;

auto compileBranches(CompileContext& context, const SchemaNode& node,
                     std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    const auto tag = keyword == "allOf"   ? NodeTag::AllOf
                     : keyword == "anyOf" ? NodeTag::AnyOf
                                          : NodeTag::OneOf;
    validator::BranchParams params;
    for (std::size_t i = 0; i < value.size(); ++i) {
        params.branches.push_back(context.compileChild(node, keyword, i));
    }
    return context.addNode(tag, node, keyword, std::move(params));
}

auto compileNot(CompileContext& context, const SchemaNode& node,
                std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    (void)value;
    return context.addNode(
        NodeTag::Not, node, keyword,
        validator::ChildParams{context.compileChild(node, keyword)});
}

// `then` and `else` only exist through their `if`.
auto compileConditional(CompileContext& context, const SchemaNode& node,
                        std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    (void)value;
    const bool hasThen = node.hasKeyword("then");
    const bool hasElse = node.hasKeyword("else");
    if (!hasThen && !hasElse) {
        spdlog::debug("'if' at '{}' has neither 'then' nor 'else'",
                      context.location(node, keyword));
        return std::nullopt;
    }
    validator::ConditionalParams params;
    params.condition = context.compileChild(node, keyword);
    if (hasThen) {
        params.then_branch = context.compileChild(node, "then");
    }
    if (hasElse) {
        params.else_branch = context.compileChild(node, "else");
    }
    return context.addNode(NodeTag::Conditional, node, keyword,
                           std::move(params));
}

}  // namespace exschema::keywords
