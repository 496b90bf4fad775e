/*
 * context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-9

Description: State shared by the keyword compilers during one compilation

**************************************************/

#include "context.hpp"

#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

#include "exschema/error/exception.hpp"
#include "exschema/keywords/registry.hpp"
#include "exschema/schema/identifier.hpp"
#include "exschema/schema/vocabulary.hpp"

namespace exschema::keywords {

using schema::NodeKind;
using schema::SchemaNode;
using validator::NodeTag;

CompileContext::CompileContext(schema::ReferenceResolver& resolver,
                               const schema::CompileOptions& options,
                               const format::FormatRegistry& formats,
                               const ExtensionMap& extensions)
    : resolver_(resolver),
      options_(options),
      formats_(formats),
      extensions_(extensions),
      graph_(std::make_shared<validator::ValidatorGraph>()) {}

auto CompileContext::compileNode(const SchemaNode& node) -> NodeId {
    if (auto it = compiled_.find(&node); it != compiled_.end()) {
        return it->second;
    }
    switch (node.kind()) {
        case NodeKind::Reference:
            return compileReference(node);
        case NodeKind::Boolean: {
            const bool value = node.booleanValue();
            auto id = graph_->add({NodeTag::Boolean, value ? "true" : "false",
                                   node.identifier(),
                                   validator::BooleanParams{value}});
            compiled_.emplace(&node, id);
            return id;
        }
        case NodeKind::Object:
            break;
    }
    return compileObject(node);
}

auto CompileContext::compileChild(const SchemaNode& parent,
                                  std::string_view keyword) -> NodeId {
    return requireChild(parent.child(keyword), parent, keyword);
}

auto CompileContext::compileChild(const SchemaNode& parent,
                                  std::string_view keyword,
                                  std::string_view key) -> NodeId {
    return requireChild(parent.child(keyword, key), parent, keyword);
}

auto CompileContext::compileChild(const SchemaNode& parent,
                                  std::string_view keyword, std::size_t index)
    -> NodeId {
    return requireChild(parent.child(keyword, index), parent, keyword);
}

auto CompileContext::requireChild(const SchemaNode* child,
                                  const SchemaNode& parent,
                                  std::string_view keyword) -> NodeId {
    if (child == nullptr) {
        THROW_MALFORMED_SCHEMA(location(parent, keyword),
                               "subschema was not loaded");
    }
    return compileNode(*child);
}

auto CompileContext::addNode(NodeTag tag, const SchemaNode& owner,
                             std::string_view keyword,
                             validator::NodeParams params) -> NodeId {
    return graph_->add({tag, std::string(keyword), location(owner, keyword),
                        std::move(params)});
}

auto CompileContext::location(const SchemaNode& node,
                              std::string_view keyword) const -> std::string {
    return schema::makeIdentifier(
        node.document().uri(), schema::appendPointer(node.pointer(), keyword));
}

auto CompileContext::compileRegex(const std::string& source,
                                  const std::string& location) const
    -> std::regex {
    try {
        return std::regex(source, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        THROW_MALFORMED_SCHEMA(location, "invalid regular expression '",
                               source, "': ", e.what());
    }
}

auto CompileContext::compileObject(const SchemaNode& node) -> NodeId {
    // Registered before the keywords so that references back to this node
    // resolve to it.
    const auto self = graph_->add({NodeTag::Schema, "", node.identifier(),
                                   validator::SchemaParams{}});
    compiled_.emplace(&node, self);

    utils::TypeMask declared = utils::kAnyType;
    if (const auto* type = node.keyword("type")) {
        declared = 0;
        for (const auto& name :
             type->is_array() ? *type : json::array({*type})) {
            declared |= utils::parseTypeName(name.get<std::string>())
                            .value_or(utils::TypeMask{0});
        }
    }

    std::vector<std::pair<NodeId, utils::TypeMask>> children;
    for (const auto& [name, value] : node.value().items()) {
        if (const auto* entry = findCompiler(name)) {
            if ((declared & entry->applies_to) == 0) {
                spdlog::warn(
                    "Keyword '{}' at '{}' will never be used: the declared "
                    "type excludes every instance it applies to",
                    name, location(node, name));
                continue;
            }
            if (auto id = entry->compile(*this, node, name, value)) {
                children.emplace_back(*id, entry->applies_to);
            }
        } else if (auto ext = extensions_.find(name);
                   ext != extensions_.end()) {
            if ((declared & ext->second->appliesTo()) == 0) {
                spdlog::warn("Keyword '{}' at '{}' will never be used", name,
                             location(node, name));
                continue;
            }
            children.emplace_back(
                compileExtension(*ext->second, node, name, value),
                ext->second->appliesTo());
        } else if (const auto* info = schema::findKeyword(name);
                   info != nullptr && info->annotation) {
            continue;
        } else if (options_.strict) {
            THROW_UNSUPPORTED_KEYWORD(location(node, name),
                                      "unknown keyword '", name, "'");
        } else {
            spdlog::debug("Ignoring unknown keyword '{}' at '{}'", name,
                          location(node, name));
        }
    }

    auto& params = std::get<validator::SchemaParams>(graph_->at(self).params);
    for (const auto& [id, mask] : children) {
        for (std::size_t type = 0; type < utils::kInstanceTypeCount; ++type) {
            if ((mask & utils::maskOf(static_cast<utils::InstanceType>(
                            type))) != 0) {
                params.plans[type].push_back(id);
            }
        }
    }
    return self;
}

auto CompileContext::compileReference(const SchemaNode& node) -> NodeId {
    auto identifier = resolver_.identify(node.reference(), node.scopeUri());
    if (auto it = memo_.find(identifier); it != memo_.end()) {
        if (resolver_.isInFlight(identifier)) {
            spdlog::debug("Reference '{}' closes a cycle", identifier);
        }
        compiled_.emplace(&node, it->second);
        return it->second;
    }

    const auto placeholder =
        addNode(NodeTag::Reference, node, "$ref",
                validator::ReferenceParams{identifier, validator::kNoNode});
    memo_.emplace(identifier, placeholder);
    compiled_.emplace(&node, placeholder);
    references_.push_back(placeholder);

    auto guard = resolver_.enter(identifier);
    const auto& target = resolver_.resolve(identifier);
    const auto target_id = compileNode(target);
    graph_->link(placeholder, target_id);
    spdlog::debug("Linked reference '{}' to node #{}", identifier, target_id);
    return placeholder;
}

auto CompileContext::compileExtension(const KeywordExtension& extension,
                                      const SchemaNode& node,
                                      std::string_view keyword,
                                      const json& value) -> NodeId {
    const auto where = location(node, keyword);
    extension.validateSchemaValue(value, where);
    auto check = extension.compile(value, node.value());
    if (!check) {
        THROW_MALFORMED_SCHEMA(where, "keyword '", keyword,
                               "' produced no check");
    }
    return addNode(NodeTag::Custom, node, keyword,
                   validator::CustomParams{std::move(check)});
}

void CompileContext::checkReferenceChains() const {
    for (auto start : references_) {
        std::unordered_set<NodeId> seen{start};
        std::size_t hops = 0;
        auto current = start;
        while (true) {
            const auto& params = std::get<validator::ReferenceParams>(
                graph_->at(current).params);
            current = params.target;
            if (current == validator::kNoNode) {
                THROW_UNRESOLVED_REFERENCE(graph_->at(start).schema_path,
                                           "reference '", params.identifier,
                                           "' was never linked");
            }
            if (graph_->at(current).tag != NodeTag::Reference) {
                break;
            }
            if (!seen.insert(current).second) {
                THROW_RECURSION_LIMIT_EXCEEDED(
                    graph_->at(start).schema_path, "reference '",
                    params.identifier,
                    "' only leads back to itself through other references");
            }
            if (++hops > options_.max_reference_depth) {
                THROW_RECURSION_LIMIT_EXCEEDED(
                    graph_->at(start).schema_path,
                    "chain of references is longer than ",
                    options_.max_reference_depth);
            }
        }
    }
}

auto CompileContext::takeGraph() -> std::shared_ptr<validator::ValidatorGraph> {
    return std::move(graph_);
}

}  // namespace exschema::keywords
