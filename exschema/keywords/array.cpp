/*
 * array.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-11

Description: Compilers of the array keywords

**************************************************/

#include "exschema/keywords/families.hpp"

#include <spdlog/spdlog.h>

#include "exschema/error/exception.hpp"
#include "exschema/keywords/context.hpp"
#include "exschema/utils/json_utils.hpp"

namespace exschema::keywords {

using schema::SchemaNode;
using validator::NodeTag;

auto compileItems(CompileContext& context, const SchemaNode& node,
                  std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    validator::ItemsParams params;
    if (value.is_array()) {
        if (value.empty()) {
            return std::nullopt;
        }
        for (std::size_t i = 0; i < value.size(); ++i) {
            params.tuple.push_back(context.compileChild(node, keyword, i));
        }
    } else {
        if (value.is_boolean() && value.get<bool>()) {
            return std::nullopt;
        }
        params.every = context.compileChild(node, keyword);
    }
    return context.addNode(NodeTag::Items, node, keyword, std::move(params));
}

// Only a tuple `items` leaves room for additional items.
auto compileAdditionalItems(CompileContext& context, const SchemaNode& node,
                            std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    const auto* items = node.keyword("items");
    if (items == nullptr || !items->is_array()) {
        spdlog::debug("'{}' at '{}' has no effect without a tuple 'items'",
                      keyword, context.location(node, keyword));
        return std::nullopt;
    }
    if (value.is_boolean() && value.get<bool>()) {
        return std::nullopt;
    }
    const auto child = value.is_boolean() ? validator::kNoNode
                                          : context.compileChild(node, keyword);
    return context.addNode(NodeTag::AdditionalItems, node, keyword,
                           validator::AdditionalItemsParams{items->size(),
                                                            child});
}

auto compileUniqueItems(CompileContext& context, const SchemaNode& node,
                        std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    if (!value.get<bool>()) {
        return std::nullopt;
    }
    return context.addNode(NodeTag::UniqueItems, node, keyword,
                           std::monostate{});
}

// minContains and maxContains are read here.
auto compileContains(CompileContext& context, const SchemaNode& node,
                     std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    (void)value;
    validator::ContainsParams params;
    if (const auto* minimum = node.keyword("minContains")) {
        params.min = utils::toCount(*minimum);
    }
    if (const auto* maximum = node.keyword("maxContains")) {
        params.max = utils::toCount(*maximum);
        if (*params.max < params.min) {
            THROW_MALFORMED_SCHEMA(context.location(node, "maxContains"),
                                   "'maxContains' (", *params.max,
                                   ") is less than 'minContains' (",
                                   params.min, ")");
        }
    }
    params.child = context.compileChild(node, keyword);
    return context.addNode(NodeTag::Contains, node, keyword,
                           std::move(params));
}

}  // namespace exschema::keywords
