/*
 * general.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-10

Description: Compilers of type, enum and const

**************************************************/

#include "exschema/keywords/families.hpp"

#include <algorithm>

#include "exschema/error/exception.hpp"
#include "exschema/keywords/context.hpp"
#include "exschema/utils/json_utils.hpp"

namespace exschema::keywords {

using validator::NodeTag;

auto compileType(CompileContext& context, const schema::SchemaNode& node,
                 std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    const auto where = context.location(node, keyword);
    const auto names = value.is_array() ? value : json::array({value});
    if (names.empty()) {
        THROW_MALFORMED_SCHEMA(where, "'type' must name at least one type");
    }

    validator::TypeParams params{0, {}};
    for (const auto& entry : names) {
        const auto& name = entry.get_ref<const std::string&>();
        auto mask = utils::parseTypeName(name);
        if (!mask) {
            THROW_MALFORMED_SCHEMA(where, "unknown type '", name, "'");
        }
        if (std::find(params.expected.begin(), params.expected.end(), name) !=
            params.expected.end()) {
            THROW_MALFORMED_SCHEMA(where, "type '", name,
                                   "' is listed more than once");
        }
        params.mask |= *mask;
        params.expected.push_back(name);
    }
    return context.addNode(NodeTag::Type, node, keyword, std::move(params));
}

auto compileEnum(CompileContext& context, const schema::SchemaNode& node,
                 std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    const auto where = context.location(node, keyword);
    if (value.empty()) {
        THROW_MALFORMED_SCHEMA(where, "'enum' must not be empty");
    }
    std::vector<json> values;
    for (const auto& item : value) {
        if (std::find(values.begin(), values.end(), item) != values.end()) {
            THROW_MALFORMED_SCHEMA(where, "'enum' lists ", item.dump(),
                                   " more than once");
        }
        values.push_back(item);
    }
    return context.addNode(NodeTag::Enum, node, keyword,
                           validator::EnumParams{std::move(values)});
}

auto compileConst(CompileContext& context, const schema::SchemaNode& node,
                  std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    return context.addNode(NodeTag::Const, node, keyword,
                           validator::ConstParams{value});
}

auto compileNothing(CompileContext& /*context*/,
                    const schema::SchemaNode& /*node*/,
                    std::string_view /*keyword*/, const json& /*value*/)
    -> std::optional<validator::NodeId> {
    return std::nullopt;
}

}  // namespace exschema::keywords
