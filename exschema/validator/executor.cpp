/*
 * executor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Runs an instance through a validator graph

**************************************************/

#include "executor.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

#include "exschema/utils/json_utils.hpp"

namespace exschema::validator {

namespace {

constexpr std::string_view kRecursionKeyword = "recursionLimitExceeded";

auto branchReport(std::size_t index, const std::vector<ErrorRecord>& errors)
    -> json {
    return {{"index", index}, {"errors", toJson(errors)}};
}

auto measure(const json& instance) -> std::size_t {
    if (instance.is_string()) {
        return utils::utf8Length(instance.get_ref<const std::string&>());
    }
    return instance.size();
}

auto lengthMessage(const ValidatorNode& node, const LengthParams& params)
    -> std::string {
    if (node.keyword == "minLength") {
        return std::format("String is too short, minimum length: {}",
                           params.limit);
    }
    if (node.keyword == "maxLength") {
        return std::format("String is too long, maximum length: {}",
                           params.limit);
    }
    if (node.keyword == "minItems") {
        return std::format("Array has too few items, minimum: {}",
                           params.limit);
    }
    if (node.keyword == "maxItems") {
        return std::format("Array has too many items, maximum: {}",
                           params.limit);
    }
    if (node.keyword == "minProperties") {
        return std::format("Object has too few properties, minimum: {}",
                           params.limit);
    }
    return std::format("Object has too many properties, maximum: {}",
                       params.limit);
}

auto boundMessage(const BoundParams& params) -> std::string {
    if (params.lower) {
        return params.exclusive
                   ? std::format(
                         "Value must be greater than exclusive minimum: {}",
                         params.limit.dump())
                   : std::format("Value is less than minimum: {}",
                                 params.limit.dump());
    }
    return params.exclusive
               ? std::format("Value must be less than exclusive maximum: {}",
                             params.limit.dump())
               : std::format("Value is greater than maximum: {}",
                             params.limit.dump());
}

auto matchesAny(const std::string& key, const std::vector<std::regex>& patterns)
    -> bool {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&key](const std::regex& pattern) {
                           return std::regex_search(key, pattern);
                       });
}

}  // namespace

ValidationContext::PathScope::PathScope(ValidationContext& context,
                                        PathElement element)
    : context_(context) {
    context_.path_.push_back(std::move(element));
}

ValidationContext::PathScope::~PathScope() { context_.path_.pop_back(); }

ValidationContext::CaptureScope::CaptureScope(ValidationContext& context)
    : context_(context) {
    context_.aggregators_.emplace_back();
}

ValidationContext::CaptureScope::~CaptureScope() {
    context_.aggregators_.pop_back();
}

auto ValidationContext::CaptureScope::take() -> std::vector<ErrorRecord> {
    return context_.aggregators_.back().take();
}

ValidationContext::ValidationContext() { aggregators_.emplace_back(); }

void ValidationContext::report(ErrorRecord record) {
    aggregators_.back().append(std::move(record));
}

auto ValidationContext::enterReference(NodeId reference, const json* instance)
    -> bool {
    return guard_.emplace(reference, instance).second;
}

void ValidationContext::leaveReference(NodeId reference,
                                       const json* instance) {
    guard_.erase({reference, instance});
}

auto ValidationContext::take() -> std::vector<ErrorRecord> {
    return aggregators_.front().take();
}

Executor::Executor(const ValidatorGraph& graph, std::size_t max_depth)
    : graph_(graph), max_depth_(max_depth) {}

auto Executor::run(const json& instance) const -> std::vector<ErrorRecord> {
    ValidationContext context;
    if (graph_.root() != kNoNode) {
        (void)evaluate(graph_.root(), instance, context);
    }
    return context.take();
}

void Executor::fail(const ValidatorNode& node, const json& instance,
                    ValidationContext& context, std::string message,
                    json detail) const {
    context.report(ErrorRecord{context.path(), node.keyword, instance,
                               std::move(detail), node.schema_path,
                               std::move(message)});
}

auto Executor::evaluate(NodeId id, const json& instance,
                        ValidationContext& context) const -> bool {
    const auto& node = graph_.at(id);
    switch (node.tag) {
        case NodeTag::Schema:
            return checkSchema(node, instance, context);
        case NodeTag::Boolean:
            if (std::get<BooleanParams>(node.params).value) {
                return true;
            }
            fail(node, instance, context,
                 "False schema does not allow any value");
            return false;
        case NodeTag::Reference:
            return follow(id, node, instance, context);
        case NodeTag::Type:
        case NodeTag::Enum:
        case NodeTag::Const:
        case NodeTag::Bound:
        case NodeTag::MultipleOf:
        case NodeTag::Length:
        case NodeTag::Pattern:
        case NodeTag::Format:
        case NodeTag::Custom:
            return checkLeaf(node, instance, context);
        case NodeTag::Required:
        case NodeTag::Properties:
        case NodeTag::PatternProperties:
        case NodeTag::AdditionalProperties:
        case NodeTag::Dependencies:
        case NodeTag::PropertyNames:
            return checkObject(node, instance, context);
        case NodeTag::Items:
        case NodeTag::AdditionalItems:
        case NodeTag::UniqueItems:
        case NodeTag::Contains:
            return checkArray(node, instance, context);
        case NodeTag::AllOf:
        case NodeTag::AnyOf:
        case NodeTag::OneOf:
        case NodeTag::Not:
        case NodeTag::Conditional:
            return checkComposition(node, instance, context);
    }
    return true;
}

auto Executor::descend(NodeId id, PathElement element, const json& instance,
                       ValidationContext& context) const -> bool {
    ValidationContext::PathScope scope(context, std::move(element));
    if (context.depth() > max_depth_) {
        const auto& node = graph_.at(id);
        context.report(ErrorRecord{
            context.path(), std::string(kRecursionKeyword), instance,
            json{{"maxDepth", max_depth_}}, node.schema_path,
            std::format("Maximum recursion depth exceeded: {}", max_depth_)});
        return false;
    }
    return evaluate(id, instance, context);
}

auto Executor::follow(NodeId id, const ValidatorNode& node,
                      const json& instance, ValidationContext& context) const
    -> bool {
    const auto& params = std::get<ReferenceParams>(node.params);
    if (!context.enterReference(id, &instance)) {
        spdlog::trace("Reference '{}' re-entered at '{}'", params.identifier,
                      formatPath(context.path()));
        context.report(ErrorRecord{
            context.path(), std::string(kRecursionKeyword), instance,
            json{{"reference", params.identifier}}, node.schema_path,
            std::format("Reference '{}' re-entered without consuming input",
                        params.identifier)});
        return false;
    }
    const bool valid = evaluate(params.target, instance, context);
    context.leaveReference(id, &instance);
    return valid;
}

auto Executor::checkSchema(const ValidatorNode& node, const json& instance,
                           ValidationContext& context) const -> bool {
    const auto& params = std::get<SchemaParams>(node.params);
    const auto type = static_cast<std::size_t>(utils::classify(instance));
    bool valid = true;
    for (auto child : params.plans[type]) {
        valid = evaluate(child, instance, context) && valid;
    }
    return valid;
}

auto Executor::checkLeaf(const ValidatorNode& node, const json& instance,
                         ValidationContext& context) const -> bool {
    switch (node.tag) {
        case NodeTag::Type: {
            const auto& params = std::get<TypeParams>(node.params);
            if ((params.mask & utils::maskOf(utils::classify(instance))) != 0) {
                return true;
            }
            std::string expected;
            for (const auto& name : params.expected) {
                expected += expected.empty() ? name : " or " + name;
            }
            fail(node, instance, context,
                 std::format("Type mismatch, expected: {}, got: {}", expected,
                             utils::typeName(utils::classify(instance))),
                 json{{"expected", params.expected}});
            return false;
        }
        case NodeTag::Enum: {
            const auto& values = std::get<EnumParams>(node.params).values;
            if (std::find(values.begin(), values.end(), instance) !=
                values.end()) {
                return true;
            }
            fail(node, instance, context, "Value not found in enumeration");
            return false;
        }
        case NodeTag::Const:
            if (std::get<ConstParams>(node.params).value == instance) {
                return true;
            }
            fail(node, instance, context, "Value does not match const value");
            return false;
        case NodeTag::Bound: {
            const auto& params = std::get<BoundParams>(node.params);
            const int order = utils::compareNumbers(instance, params.limit);
            const bool valid =
                params.lower ? (params.exclusive ? order > 0 : order >= 0)
                             : (params.exclusive ? order < 0 : order <= 0);
            if (!valid) {
                fail(node, instance, context, boundMessage(params));
            }
            return valid;
        }
        case NodeTag::MultipleOf: {
            const auto& divisor =
                std::get<MultipleOfParams>(node.params).divisor;
            if (utils::isMultipleOf(instance, divisor)) {
                return true;
            }
            fail(node, instance, context,
                 std::format("Value is not a multiple of: {}", divisor.dump()));
            return false;
        }
        case NodeTag::Length: {
            const auto& params = std::get<LengthParams>(node.params);
            const auto size = measure(instance);
            const bool valid =
                params.lower ? size >= params.limit : size <= params.limit;
            if (!valid) {
                fail(node, instance, context, lengthMessage(node, params));
            }
            return valid;
        }
        case NodeTag::Pattern: {
            const auto& params = std::get<PatternParams>(node.params);
            if (std::regex_search(instance.get_ref<const std::string&>(),
                                  params.regex)) {
                return true;
            }
            fail(node, instance, context,
                 std::format("String does not match pattern: {}",
                             params.source));
            return false;
        }
        case NodeTag::Format: {
            const auto& params = std::get<FormatParams>(node.params);
            if (params.checker(instance.get_ref<const std::string&>())) {
                return true;
            }
            if (!params.enforced) {
                spdlog::trace("Advisory format '{}' not satisfied",
                              params.name);
                return true;
            }
            fail(node, instance, context,
                 std::format("String does not match format: {}", params.name));
            return false;
        }
        case NodeTag::Custom: {
            const auto& check = std::get<CustomParams>(node.params).check;
            json detail;
            if (check->check(instance, detail)) {
                return true;
            }
            fail(node, instance, context, check->describe(), std::move(detail));
            return false;
        }
        default:
            return true;
    }
}

auto Executor::checkObject(const ValidatorNode& node, const json& instance,
                           ValidationContext& context) const -> bool {
    bool valid = true;
    switch (node.tag) {
        case NodeTag::Required:
            for (const auto& name :
                 std::get<RequiredParams>(node.params).properties) {
                if (!instance.contains(name)) {
                    fail(node, instance, context,
                         "Missing required property: " + name,
                         json{{"property", name}});
                    valid = false;
                }
            }
            return valid;
        case NodeTag::Properties:
            for (const auto& [name, child] :
                 std::get<PropertiesParams>(node.params).children) {
                if (auto it = instance.find(name); it != instance.end()) {
                    valid = descend(child, name, *it, context) && valid;
                }
            }
            return valid;
        case NodeTag::PatternProperties: {
            const auto& params = std::get<PatternPropertiesParams>(node.params);
            for (const auto& [key, value] : instance.items()) {
                for (const auto& pattern : params.children) {
                    if (std::regex_search(key, pattern.regex)) {
                        valid = descend(pattern.child, key, value, context) &&
                                valid;
                    }
                }
            }
            return valid;
        }
        case NodeTag::AdditionalProperties: {
            const auto& params =
                std::get<AdditionalPropertiesParams>(node.params);
            for (const auto& [key, value] : instance.items()) {
                if (params.covered.contains(key) ||
                    matchesAny(key, params.patterns)) {
                    continue;
                }
                if (params.child != kNoNode) {
                    valid = descend(params.child, key, value, context) && valid;
                    continue;
                }
                ValidationContext::PathScope scope(context, key);
                fail(node, value, context,
                     "Additional property not allowed: " + key,
                     json{{"property", key}});
                valid = false;
            }
            return valid;
        }
        case NodeTag::Dependencies:
            for (const auto& rule :
                 std::get<DependenciesParams>(node.params).rules) {
                if (!instance.contains(rule.property)) {
                    continue;
                }
                if (rule.schema != kNoNode) {
                    valid = evaluate(rule.schema, instance, context) && valid;
                    continue;
                }
                for (const auto& name : rule.required) {
                    if (!instance.contains(name)) {
                        fail(node, instance, context,
                             std::format("Missing dependency: {} requires {}",
                                         rule.property, name),
                             json{{"property", rule.property},
                                  {"missing", name}});
                        valid = false;
                    }
                }
            }
            return valid;
        case NodeTag::PropertyNames: {
            const auto child = std::get<ChildParams>(node.params).child;
            for (const auto& [key, value] : instance.items()) {
                const json name = key;
                valid = descend(child, key, name, context) && valid;
            }
            return valid;
        }
        default:
            return true;
    }
}

auto Executor::checkArray(const ValidatorNode& node, const json& instance,
                          ValidationContext& context) const -> bool {
    bool valid = true;
    switch (node.tag) {
        case NodeTag::Items: {
            const auto& params = std::get<ItemsParams>(node.params);
            if (params.every != kNoNode) {
                for (std::size_t i = 0; i < instance.size(); ++i) {
                    valid = descend(params.every, i, instance[i], context) &&
                            valid;
                }
                return valid;
            }
            const auto count = std::min(instance.size(), params.tuple.size());
            for (std::size_t i = 0; i < count; ++i) {
                valid = descend(params.tuple[i], i, instance[i], context) &&
                        valid;
            }
            return valid;
        }
        case NodeTag::AdditionalItems: {
            const auto& params = std::get<AdditionalItemsParams>(node.params);
            for (std::size_t i = params.offset; i < instance.size(); ++i) {
                if (params.child != kNoNode) {
                    valid = descend(params.child, i, instance[i], context) &&
                            valid;
                    continue;
                }
                ValidationContext::PathScope scope(context, i);
                fail(node, instance[i], context,
                     std::format("Additional items not allowed, at most {} "
                                 "items expected",
                                 params.offset));
                valid = false;
            }
            return valid;
        }
        case NodeTag::UniqueItems:
            for (std::size_t i = 1; i < instance.size(); ++i) {
                for (std::size_t j = 0; j < i; ++j) {
                    if (instance[i] == instance[j]) {
                        ValidationContext::PathScope scope(context, i);
                        fail(node, instance[i], context,
                             "Array items must be unique",
                             json{{"duplicateOf", j}});
                        valid = false;
                        break;
                    }
                }
            }
            return valid;
        case NodeTag::Contains: {
            const auto& params = std::get<ContainsParams>(node.params);
            std::size_t matched = 0;
            for (std::size_t i = 0; i < instance.size(); ++i) {
                ValidationContext::CaptureScope capture(context);
                if (descend(params.child, i, instance[i], context)) {
                    ++matched;
                }
            }
            if (matched < params.min) {
                fail(node, instance, context,
                     std::format("Array doesn't contain required number of "
                                 "matching items (min: {}, found: {})",
                                 params.min, matched),
                     json{{"matched", matched}});
                return false;
            }
            if (params.max && matched > *params.max) {
                fail(node, instance, context,
                     std::format("Array contains too many matching items "
                                 "(max: {}, found: {})",
                                 *params.max, matched),
                     json{{"matched", matched}});
                return false;
            }
            return true;
        }
        default:
            return true;
    }
}

auto Executor::checkComposition(const ValidatorNode& node,
                                const json& instance,
                                ValidationContext& context) const -> bool {
    switch (node.tag) {
        case NodeTag::AllOf: {
            bool valid = true;
            for (auto branch : std::get<BranchParams>(node.params).branches) {
                valid = evaluate(branch, instance, context) && valid;
            }
            return valid;
        }
        case NodeTag::AnyOf: {
            const auto& branches = std::get<BranchParams>(node.params).branches;
            json reports = json::array();
            for (std::size_t i = 0; i < branches.size(); ++i) {
                ValidationContext::CaptureScope capture(context);
                if (evaluate(branches[i], instance, context)) {
                    return true;
                }
                reports.push_back(branchReport(i, capture.take()));
            }
            fail(node, instance, context,
                 "Value does not match any schema in anyOf",
                 json{{"branches", std::move(reports)}});
            return false;
        }
        case NodeTag::OneOf: {
            const auto& branches = std::get<BranchParams>(node.params).branches;
            json reports = json::array();
            std::vector<std::size_t> matched;
            for (std::size_t i = 0; i < branches.size(); ++i) {
                ValidationContext::CaptureScope capture(context);
                if (evaluate(branches[i], instance, context)) {
                    matched.push_back(i);
                } else {
                    reports.push_back(branchReport(i, capture.take()));
                }
            }
            if (matched.size() == 1) {
                return true;
            }
            if (matched.empty()) {
                fail(node, instance, context,
                     "Value does not match exactly one schema in oneOf "
                     "(matched 0)",
                     json{{"branches", std::move(reports)}});
            } else {
                fail(node, instance, context,
                     std::format("Value matches more than one schema in oneOf "
                                 "(matched {})",
                                 matched.size()),
                     json{{"matched", matched}});
            }
            return false;
        }
        case NodeTag::Not: {
            const auto child = std::get<ChildParams>(node.params).child;
            bool matched = false;
            {
                ValidationContext::CaptureScope capture(context);
                matched = evaluate(child, instance, context);
            }
            if (matched) {
                fail(node, instance, context,
                     "Value should not validate against schema in 'not'");
            }
            return !matched;
        }
        case NodeTag::Conditional: {
            const auto& params = std::get<ConditionalParams>(node.params);
            bool matched = false;
            {
                ValidationContext::CaptureScope capture(context);
                matched = evaluate(params.condition, instance, context);
            }
            const auto branch =
                matched ? params.then_branch : params.else_branch;
            return branch == kNoNode || evaluate(branch, instance, context);
        }
        default:
            return true;
    }
}

}  // namespace exschema::validator
