/*
 * context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-9

Description: State shared by the keyword compilers during one compilation

**************************************************/

#ifndef EXSCHEMA_KEYWORDS_CONTEXT_HPP
#define EXSCHEMA_KEYWORDS_CONTEXT_HPP

#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "exschema/format/formats.hpp"
#include "exschema/keywords/extension.hpp"
#include "exschema/macro.hpp"
#include "exschema/schema/document.hpp"
#include "exschema/schema/options.hpp"
#include "exschema/schema/resolver.hpp"
#include "exschema/validator/graph.hpp"

namespace exschema::keywords {

using json = nlohmann::json;
using validator::NodeId;

using ExtensionMap =
    std::unordered_map<std::string, std::shared_ptr<const KeywordExtension>>;

/**
 * @brief Builds one ValidatorGraph from schema nodes.
 *
 * Every schema node and every `$ref` identifier is compiled at most once:
 * later occurrences share the graph node, which is how recursive schemas
 * turn into cycles instead of infinite expansion.
 */
class CompileContext {
public:
    CompileContext(schema::ReferenceResolver& resolver,
                   const schema::CompileOptions& options,
                   const format::FormatRegistry& formats,
                   const ExtensionMap& extensions);

    CompileContext(const CompileContext&) = delete;
    CompileContext& operator=(const CompileContext&) = delete;

    /**
     * @brief Compiles an object, boolean or reference schema.
     */
    auto compileNode(const schema::SchemaNode& node) -> NodeId;

    /**
     * @brief Compiles the subschema stored directly under a keyword.
     */
    auto compileChild(const schema::SchemaNode& parent,
                      std::string_view keyword) -> NodeId;
    auto compileChild(const schema::SchemaNode& parent,
                      std::string_view keyword, std::string_view key)
        -> NodeId;
    auto compileChild(const schema::SchemaNode& parent,
                      std::string_view keyword, std::size_t index) -> NodeId;

    /**
     * @brief Appends a keyword node located at `owner/keyword`.
     */
    auto addNode(validator::NodeTag tag, const schema::SchemaNode& owner,
                 std::string_view keyword, validator::NodeParams params)
        -> NodeId;

    /**
     * @brief Identifier of a keyword of a schema node, used in diagnostics.
     */
    EXSCHEMA_NODISCARD auto location(const schema::SchemaNode& node,
                                     std::string_view keyword) const
        -> std::string;

    /**
     * @brief Compiles an ECMAScript regex.
     * @throws error::MalformedSchema naming `location` if it is invalid
     */
    EXSCHEMA_NODISCARD auto compileRegex(const std::string& source,
                                         const std::string& location) const
        -> std::regex;

    /**
     * @brief Verifies every chain of `$ref` to `$ref` links ends at a real
     * schema within the configured depth.
     * @throws error::RecursionLimitExceeded otherwise
     */
    void checkReferenceChains() const;

    EXSCHEMA_NODISCARD auto resolver() noexcept -> schema::ReferenceResolver& {
        return resolver_;
    }

    EXSCHEMA_NODISCARD auto options() const noexcept
        -> const schema::CompileOptions& {
        return options_;
    }

    EXSCHEMA_NODISCARD auto formats() const noexcept
        -> const format::FormatRegistry& {
        return formats_;
    }

    EXSCHEMA_NODISCARD auto graph() noexcept -> validator::ValidatorGraph& {
        return *graph_;
    }

    /**
     * @brief Hands over the finished graph.
     */
    auto takeGraph() -> std::shared_ptr<validator::ValidatorGraph>;

private:
    auto compileObject(const schema::SchemaNode& node) -> NodeId;
    auto compileReference(const schema::SchemaNode& node) -> NodeId;
    auto compileExtension(const KeywordExtension& extension,
                          const schema::SchemaNode& node,
                          std::string_view keyword, const json& value)
        -> NodeId;
    auto requireChild(const schema::SchemaNode* child,
                      const schema::SchemaNode& parent,
                      std::string_view keyword) -> NodeId;

    schema::ReferenceResolver& resolver_;
    const schema::CompileOptions& options_;
    const format::FormatRegistry& formats_;
    const ExtensionMap& extensions_;
    std::shared_ptr<validator::ValidatorGraph> graph_;
    std::unordered_map<std::string, NodeId> memo_;
    std::unordered_map<const schema::SchemaNode*, NodeId> compiled_;
    std::vector<NodeId> references_;
};

}  // namespace exschema::keywords

#endif  // EXSCHEMA_KEYWORDS_CONTEXT_HPP
