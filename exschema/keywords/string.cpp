/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-10

Description: Compilers of the string keywords and of the size bounds

**************************************************/

#include "exschema/keywords/families.hpp"

#include <spdlog/spdlog.h>

#include "exschema/error/exception.hpp"
#include "exschema/keywords/context.hpp"
#include "exschema/utils/json_utils.hpp"

namespace exschema::keywords {

using validator::NodeTag;

// Serves minLength/maxLength, minItems/maxItems and
// minProperties/maxProperties; the instance type decides what is measured.
auto compileLength(CompileContext& context, const schema::SchemaNode& node,
                   std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    const bool lower = keyword.starts_with("min");
    const auto limit = utils::toCount(value);
    if (!lower) {
        const auto sibling = "min" + std::string(keyword.substr(3));
        if (const auto* minimum = node.keyword(sibling);
            minimum != nullptr && utils::toCount(*minimum) > limit) {
            THROW_MALFORMED_SCHEMA(context.location(node, keyword), "'",
                                   keyword, "' (", limit, ") is less than '",
                                   sibling, "' (", minimum->dump(), ")");
        }
    }
    return context.addNode(NodeTag::Length, node, keyword,
                           validator::LengthParams{limit, lower});
}

auto compilePattern(CompileContext& context, const schema::SchemaNode& node,
                    std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    const auto& source = value.get_ref<const std::string&>();
    auto regex = context.compileRegex(source, context.location(node, keyword));
    return context.addNode(NodeTag::Pattern, node, keyword,
                           validator::PatternParams{source, std::move(regex)});
}

auto compileFormat(CompileContext& context, const schema::SchemaNode& node,
                   std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    const auto& name = value.get_ref<const std::string&>();
    const auto* checker = context.formats().find(name);
    if (checker == nullptr) {
        if (context.options().strict) {
            THROW_MALFORMED_SCHEMA(context.location(node, keyword),
                                   "unknown format '", name, "'");
        }
        spdlog::warn("Unknown format '{}' at '{}' is ignored", name,
                     context.location(node, keyword));
        return std::nullopt;
    }
    return context.addNode(
        NodeTag::Format, node, keyword,
        validator::FormatParams{name, *checker,
                                context.options().enforce_format});
}

}  // namespace exschema::keywords
