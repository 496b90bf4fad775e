/*
 * graph.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-6

Description: Index-addressed graph of compiled keyword validators

**************************************************/

#include "graph.hpp"

#include <format>
#include <sstream>
#include <type_traits>

namespace exschema::validator {

namespace {

auto nodeRef(NodeId id) -> std::string {
    return id == kNoNode ? std::string("none") : std::format("#{}", id);
}

auto nodeList(const std::vector<NodeId>& ids) -> std::string {
    std::string text;
    for (auto id : ids) {
        if (!text.empty()) {
            text += ' ';
        }
        text += nodeRef(id);
    }
    return text;
}

// Single line describing the parameters of a node; schema plans are
// rendered separately.
auto describe(const NodeParams& params) -> std::string {
    return std::visit(
        [](const auto& p) -> std::string {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, BooleanParams>) {
                return p.value ? "true" : "false";
            } else if constexpr (std::is_same_v<T, ReferenceParams>) {
                return std::format("-> {} ({})", nodeRef(p.target),
                                   p.identifier);
            } else if constexpr (std::is_same_v<T, TypeParams>) {
                return json(p.expected).dump();
            } else if constexpr (std::is_same_v<T, EnumParams>) {
                return std::format("{} values", p.values.size());
            } else if constexpr (std::is_same_v<T, ConstParams>) {
                return utils::summarize(p.value);
            } else if constexpr (std::is_same_v<T, BoundParams>) {
                const auto* op = p.lower ? (p.exclusive ? ">" : ">=")
                                         : (p.exclusive ? "<" : "<=");
                return std::format("{} {}", op, p.limit.dump());
            } else if constexpr (std::is_same_v<T, MultipleOfParams>) {
                return p.divisor.dump();
            } else if constexpr (std::is_same_v<T, LengthParams>) {
                return std::format("{} {}", p.lower ? ">=" : "<=", p.limit);
            } else if constexpr (std::is_same_v<T, PatternParams>) {
                return json(p.source).dump();
            } else if constexpr (std::is_same_v<T, FormatParams>) {
                return std::format("{}{}", p.name,
                                   p.enforced ? "" : " (advisory)");
            } else if constexpr (std::is_same_v<T, RequiredParams>) {
                return json(p.properties).dump();
            } else if constexpr (std::is_same_v<T, PropertiesParams>) {
                std::string text;
                for (const auto& [name, child] : p.children) {
                    text += std::format("{}{}: {}", text.empty() ? "" : ", ",
                                        name, nodeRef(child));
                }
                return text;
            } else if constexpr (std::is_same_v<T, PatternPropertiesParams>) {
                std::string text;
                for (const auto& child : p.children) {
                    text += std::format("{}/{}/: {}", text.empty() ? "" : ", ",
                                        child.source, nodeRef(child.child));
                }
                return text;
            } else if constexpr (std::is_same_v<T,
                                                AdditionalPropertiesParams>) {
                return std::format("{} covered, {} patterns, {}",
                                   p.covered.size(), p.patterns.size(),
                                   p.child == kNoNode ? "forbidden"
                                                      : nodeRef(p.child));
            } else if constexpr (std::is_same_v<T, DependenciesParams>) {
                std::string text;
                for (const auto& rule : p.rules) {
                    text += std::format(
                        "{}{}: {}", text.empty() ? "" : ", ", rule.property,
                        rule.schema == kNoNode ? json(rule.required).dump()
                                               : nodeRef(rule.schema));
                }
                return text;
            } else if constexpr (std::is_same_v<T, ItemsParams>) {
                return p.every != kNoNode
                           ? std::format("every {}", nodeRef(p.every))
                           : std::format("tuple [{}]", nodeList(p.tuple));
            } else if constexpr (std::is_same_v<T, AdditionalItemsParams>) {
                return std::format("from {} {}", p.offset,
                                   p.child == kNoNode ? "forbidden"
                                                      : nodeRef(p.child));
            } else if constexpr (std::is_same_v<T, ContainsParams>) {
                return std::format(
                    "{} min {} max {}", nodeRef(p.child), p.min,
                    p.max ? std::to_string(*p.max) : std::string("none"));
            } else if constexpr (std::is_same_v<T, BranchParams>) {
                return nodeList(p.branches);
            } else if constexpr (std::is_same_v<T, ChildParams>) {
                return nodeRef(p.child);
            } else if constexpr (std::is_same_v<T, ConditionalParams>) {
                return std::format("if {} then {} else {}",
                                   nodeRef(p.condition),
                                   nodeRef(p.then_branch),
                                   nodeRef(p.else_branch));
            } else {
                return "";
            }
        },
        params);
}

}  // namespace

auto tagName(NodeTag tag) noexcept -> std::string_view {
    switch (tag) {
        case NodeTag::Schema:
            return "schema";
        case NodeTag::Boolean:
            return "boolean";
        case NodeTag::Reference:
            return "reference";
        case NodeTag::Type:
            return "type";
        case NodeTag::Enum:
            return "enum";
        case NodeTag::Const:
            return "const";
        case NodeTag::Bound:
            return "bound";
        case NodeTag::MultipleOf:
            return "multipleOf";
        case NodeTag::Length:
            return "length";
        case NodeTag::Pattern:
            return "pattern";
        case NodeTag::Format:
            return "format";
        case NodeTag::Required:
            return "required";
        case NodeTag::Properties:
            return "properties";
        case NodeTag::PatternProperties:
            return "patternProperties";
        case NodeTag::AdditionalProperties:
            return "additionalProperties";
        case NodeTag::Dependencies:
            return "dependencies";
        case NodeTag::PropertyNames:
            return "propertyNames";
        case NodeTag::Items:
            return "items";
        case NodeTag::AdditionalItems:
            return "additionalItems";
        case NodeTag::UniqueItems:
            return "uniqueItems";
        case NodeTag::Contains:
            return "contains";
        case NodeTag::AllOf:
            return "allOf";
        case NodeTag::AnyOf:
            return "anyOf";
        case NodeTag::OneOf:
            return "oneOf";
        case NodeTag::Not:
            return "not";
        case NodeTag::Conditional:
            return "conditional";
        case NodeTag::Custom:
            return "custom";
    }
    return "unknown";
}

auto ValidatorGraph::add(ValidatorNode node) -> NodeId {
    nodes_.push_back(std::move(node));
    return nodes_.size() - 1;
}

auto ValidatorGraph::at(NodeId id) const -> const ValidatorNode& {
    return nodes_.at(id);
}

auto ValidatorGraph::at(NodeId id) -> ValidatorNode& { return nodes_.at(id); }

void ValidatorGraph::link(NodeId reference, NodeId target) {
    std::get<ReferenceParams>(at(reference).params).target = target;
}

auto ValidatorGraph::toString() const -> std::string {
    std::ostringstream oss;
    oss << "ValidatorGraph: " << nodes_.size() << " nodes, root "
        << nodeRef(root_) << '\n';
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        const auto& node = nodes_[id];
        oss << nodeRef(id) << ' ' << tagName(node.tag);
        if (node.keyword != tagName(node.tag) && !node.keyword.empty()) {
            oss << " '" << node.keyword << "'";
        }
        if (auto details = describe(node.params); !details.empty()) {
            oss << ' ' << details;
        }
        oss << "  [" << node.schema_path << "]\n";

        if (const auto* schema = std::get_if<SchemaParams>(&node.params)) {
            for (std::size_t type = 0; type < utils::kInstanceTypeCount;
                 ++type) {
                const auto& plan = schema->plans[type];
                if (plan.empty()) {
                    continue;
                }
                oss << "    "
                    << utils::typeName(static_cast<utils::InstanceType>(type))
                    << ": " << nodeList(plan) << '\n';
            }
        }
    }
    return oss.str();
}

}  // namespace exschema::validator
