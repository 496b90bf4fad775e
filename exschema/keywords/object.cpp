/*
 * object.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-11

Description: Compilers of the object keywords

**************************************************/

#include "exschema/keywords/families.hpp"

#include <algorithm>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "exschema/error/exception.hpp"
#include "exschema/keywords/context.hpp"
#include "exschema/schema/identifier.hpp"

namespace exschema::keywords {

using schema::NodeKind;
using schema::SchemaNode;
using validator::NodeTag;

namespace {

/**
 * @brief Properties a schema object evaluates without looking at values.
 */
struct Coverage {
    std::unordered_set<std::string> names;
    std::vector<std::regex> patterns;
    bool everything = false;
};

void addDeclared(CompileContext& context, const SchemaNode& node,
                 Coverage& coverage) {
    if (const auto* properties = node.keyword("properties")) {
        for (const auto& [name, schema] : properties->items()) {
            coverage.names.insert(name);
        }
    }
    if (const auto* patterns = node.keyword("patternProperties")) {
        const auto where = context.location(node, "patternProperties");
        for (const auto& [source, schema] : patterns->items()) {
            coverage.patterns.push_back(context.compileRegex(
                source, schema::appendPointer(where, source)));
        }
    }
}

// Walks the in-place applicators of a schema object, following references.
void collectApplied(CompileContext& context, const SchemaNode& node,
                    Coverage& coverage,
                    std::unordered_set<const SchemaNode*>& visited) {
    if (!visited.insert(&node).second) {
        return;
    }
    if (node.kind() == NodeKind::Reference) {
        auto& resolver = context.resolver();
        collectApplied(
            context,
            resolver.resolve(resolver.identify(node.reference(),
                                               node.scopeUri())),
            coverage, visited);
        return;
    }
    if (node.kind() != NodeKind::Object) {
        return;
    }
    if (node.hasKeyword("additionalProperties") ||
        (visited.size() > 1 && node.hasKeyword("unevaluatedProperties"))) {
        coverage.everything = true;
        return;
    }
    addDeclared(context, node, coverage);

    for (const auto* keyword : {"allOf", "anyOf", "oneOf"}) {
        if (const auto* branches = node.keyword(keyword)) {
            for (std::size_t i = 0; i < branches->size(); ++i) {
                if (const auto* branch = node.child(keyword, i)) {
                    collectApplied(context, *branch, coverage, visited);
                }
            }
        }
    }
    for (const auto* keyword : {"then", "else"}) {
        if (const auto* branch = node.child(keyword)) {
            collectApplied(context, *branch, coverage, visited);
        }
    }
}

auto compileLeftovers(CompileContext& context, const SchemaNode& node,
                      std::string_view keyword, const json& value,
                      Coverage coverage) -> std::optional<validator::NodeId> {
    if (value.is_boolean() && value.get<bool>()) {
        return std::nullopt;
    }
    auto child = value.is_boolean() ? validator::kNoNode
                                     : context.compileChild(node, keyword);
    return context.addNode(
        NodeTag::AdditionalProperties, node, keyword,
        validator::AdditionalPropertiesParams{std::move(coverage.names),
                                              std::move(coverage.patterns),
                                              child});
}

}  // namespace

auto compileProperties(CompileContext& context, const SchemaNode& node,
                       std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    if (value.empty()) {
        return std::nullopt;
    }
    validator::PropertiesParams params;
    for (const auto& [name, schema] : value.items()) {
        params.children.emplace_back(name,
                                     context.compileChild(node, keyword, name));
    }
    return context.addNode(NodeTag::Properties, node, keyword,
                           std::move(params));
}

auto compilePatternProperties(CompileContext& context, const SchemaNode& node,
                              std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    if (value.empty()) {
        return std::nullopt;
    }
    const auto where = context.location(node, keyword);
    validator::PatternPropertiesParams params;
    for (const auto& [source, schema] : value.items()) {
        params.children.push_back(
            {source,
             context.compileRegex(source, schema::appendPointer(where, source)),
             context.compileChild(node, keyword, source)});
    }
    return context.addNode(NodeTag::PatternProperties, node, keyword,
                           std::move(params));
}

auto compileAdditionalProperties(CompileContext& context,
                                 const SchemaNode& node,
                                 std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    Coverage coverage;
    addDeclared(context, node, coverage);
    return compileLeftovers(context, node, keyword, value,
                            std::move(coverage));
}

auto compileUnevaluatedProperties(CompileContext& context,
                                  const SchemaNode& node,
                                  std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    Coverage coverage;
    std::unordered_set<const SchemaNode*> visited;
    collectApplied(context, node, coverage, visited);
    if (coverage.everything) {
        spdlog::debug("'{}' at '{}' never applies: every property is "
                      "evaluated by additionalProperties",
                      keyword, context.location(node, keyword));
        return std::nullopt;
    }
    return compileLeftovers(context, node, keyword, value,
                            std::move(coverage));
}

auto compileRequired(CompileContext& context, const SchemaNode& node,
                     std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    if (value.empty()) {
        return std::nullopt;
    }
    validator::RequiredParams params;
    for (const auto& item : value) {
        const auto& name = item.get_ref<const std::string&>();
        if (std::find(params.properties.begin(), params.properties.end(),
                      name) != params.properties.end()) {
            THROW_MALFORMED_SCHEMA(context.location(node, keyword),
                                   "property '", name,
                                   "' is required more than once");
        }
        params.properties.push_back(name);
    }
    return context.addNode(NodeTag::Required, node, keyword,
                           std::move(params));
}

// dependencies (both forms), dependentRequired and dependentSchemas.
auto compileDependencies(CompileContext& context, const SchemaNode& node,
                         std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    validator::DependenciesParams params;
    for (const auto& [property, dependency] : value.items()) {
        validator::DependencyRule rule{property, {}, validator::kNoNode};
        if (dependency.is_array()) {
            if (dependency.empty()) {
                continue;
            }
            for (const auto& name : dependency) {
                rule.required.push_back(name.get<std::string>());
            }
        } else {
            rule.schema = context.compileChild(node, keyword, property);
        }
        params.rules.push_back(std::move(rule));
    }
    if (params.rules.empty()) {
        return std::nullopt;
    }
    return context.addNode(NodeTag::Dependencies, node, keyword,
                           std::move(params));
}

auto compilePropertyNames(CompileContext& context, const SchemaNode& node,
                          std::string_view keyword, const json& value)
    -> std::optional<validator::NodeId> {
    if (value.is_boolean() && value.get<bool>()) {
        return std::nullopt;
    }
    return context.addNode(
        NodeTag::PropertyNames, node, keyword,
        validator::ChildParams{context.compileChild(node, keyword)});
}

}  // namespace exschema::keywords
