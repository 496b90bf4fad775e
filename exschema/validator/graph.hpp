/*
 * graph.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-6

Description: Index-addressed graph of compiled keyword validators

**************************************************/

#ifndef EXSCHEMA_VALIDATOR_GRAPH_HPP
#define EXSCHEMA_VALIDATOR_GRAPH_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "exschema/format/formats.hpp"
#include "exschema/keywords/extension.hpp"
#include "exschema/macro.hpp"
#include "exschema/utils/json_utils.hpp"

namespace exschema::validator {

using json = nlohmann::json;

using NodeId = std::size_t;
inline constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

enum class NodeTag : std::uint8_t {
    Schema,
    Boolean,
    Reference,
    Type,
    Enum,
    Const,
    Bound,
    MultipleOf,
    Length,
    Pattern,
    Format,
    Required,
    Properties,
    PatternProperties,
    AdditionalProperties,
    Dependencies,
    PropertyNames,
    Items,
    AdditionalItems,
    UniqueItems,
    Contains,
    AllOf,
    AnyOf,
    OneOf,
    Not,
    Conditional,
    Custom
};

EXSCHEMA_NODISCARD auto tagName(NodeTag tag) noexcept -> std::string_view;

/// Implicit conjunction of the keywords of one schema object.
struct SchemaParams {
    std::array<std::vector<NodeId>, utils::kInstanceTypeCount> plans;
};

struct BooleanParams {
    bool value = true;
};

struct ReferenceParams {
    std::string identifier;
    NodeId target = kNoNode;
};

struct TypeParams {
    utils::TypeMask mask = utils::kAnyType;
    std::vector<std::string> expected;
};

struct EnumParams {
    std::vector<json> values;
};

struct ConstParams {
    json value;
};

/// minimum, maximum and the numeric exclusive forms.
struct BoundParams {
    json limit;
    bool lower = true;
    bool exclusive = false;
};

struct MultipleOfParams {
    json divisor;
};

/// Size bound measured on strings (code points), arrays or objects.
struct LengthParams {
    std::size_t limit = 0;
    bool lower = true;
};

struct PatternParams {
    std::string source;
    std::regex regex;
};

struct FormatParams {
    std::string name;
    format::FormatChecker checker;
    bool enforced = false;
};

struct RequiredParams {
    std::vector<std::string> properties;
};

struct PropertiesParams {
    std::vector<std::pair<std::string, NodeId>> children;
};

struct PatternChild {
    std::string source;
    std::regex regex;
    NodeId child = kNoNode;
};

struct PatternPropertiesParams {
    std::vector<PatternChild> children;
};

/**
 * @brief additionalProperties and unevaluatedProperties.
 *
 * Properties named in `covered` or matching one of `patterns` are skipped;
 * the others must satisfy `child`, or are forbidden when child is kNoNode.
 */
struct AdditionalPropertiesParams {
    std::unordered_set<std::string> covered;
    std::vector<std::regex> patterns;
    NodeId child = kNoNode;
};

struct DependencyRule {
    std::string property;
    std::vector<std::string> required;
    NodeId schema = kNoNode;
};

struct DependenciesParams {
    std::vector<DependencyRule> rules;
};

struct ItemsParams {
    NodeId every = kNoNode;
    std::vector<NodeId> tuple;
};

struct AdditionalItemsParams {
    std::size_t offset = 0;
    NodeId child = kNoNode;
};

struct ContainsParams {
    NodeId child = kNoNode;
    std::size_t min = 1;
    std::optional<std::size_t> max;
};

struct BranchParams {
    std::vector<NodeId> branches;
};

/// not and propertyNames.
struct ChildParams {
    NodeId child = kNoNode;
};

struct ConditionalParams {
    NodeId condition = kNoNode;
    NodeId then_branch = kNoNode;
    NodeId else_branch = kNoNode;
};

struct CustomParams {
    std::shared_ptr<const keywords::CustomCheck> check;
};

using NodeParams =
    std::variant<std::monostate, SchemaParams, BooleanParams, ReferenceParams,
                 TypeParams, EnumParams, ConstParams, BoundParams,
                 MultipleOfParams, LengthParams, PatternParams, FormatParams,
                 RequiredParams, PropertiesParams, PatternPropertiesParams,
                 AdditionalPropertiesParams, DependenciesParams, ItemsParams,
                 AdditionalItemsParams, ContainsParams, BranchParams,
                 ChildParams, ConditionalParams, CustomParams>;

struct ValidatorNode {
    NodeTag tag;
    std::string keyword;
    std::string schema_path;
    NodeParams params;
};

/**
 * @brief Executable form of a compiled schema.
 *
 * Nodes refer to each other by index. Reference nodes may point back to
 * an ancestor, so the graph can contain cycles. Once compilation finishes
 * the graph is only read.
 */
class ValidatorGraph {
public:
    auto add(ValidatorNode node) -> NodeId;

    EXSCHEMA_NODISCARD auto at(NodeId id) const -> const ValidatorNode&;
    EXSCHEMA_NODISCARD auto at(NodeId id) -> ValidatorNode&;

    /**
     * @brief Points a reference placeholder at its compiled target.
     */
    void link(NodeId reference, NodeId target);

    EXSCHEMA_NODISCARD auto root() const noexcept -> NodeId { return root_; }
    void setRoot(NodeId root) noexcept { root_ = root; }

    EXSCHEMA_NODISCARD auto size() const noexcept -> std::size_t {
        return nodes_.size();
    }

    /**
     * @brief Human readable listing of every node, plan and link.
     */
    EXSCHEMA_NODISCARD auto toString() const -> std::string;

private:
    std::vector<ValidatorNode> nodes_;
    NodeId root_ = kNoNode;
};

}  // namespace exschema::validator

#endif  // EXSCHEMA_VALIDATOR_GRAPH_HPP
