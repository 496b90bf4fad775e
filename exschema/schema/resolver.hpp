/*
 * resolver.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-3

Description: Maps schema identifiers to loaded schema nodes

**************************************************/

#ifndef EXSCHEMA_SCHEMA_RESOLVER_HPP
#define EXSCHEMA_SCHEMA_RESOLVER_HPP

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "exschema/macro.hpp"
#include "exschema/schema/document.hpp"

namespace exschema::schema {

/**
 * @brief Registry of schema documents addressed by identifier.
 *
 * Every node of a registered document is reachable through
 * `document-uri#pointer`, through `scope-uri#pointer` when it sits below a
 * `$id`, and through `scope-uri#name` for plain-name ids. Fragments that
 * were not indexed at load time (for example a schema hidden under an
 * unknown keyword) are adopted on first resolution.
 */
class ReferenceResolver {
public:
    /**
     * @brief Marks an identifier as being compiled until destroyed.
     */
    class InFlightGuard {
    public:
        InFlightGuard(ReferenceResolver& resolver, std::string identifier);
        InFlightGuard(InFlightGuard&& other) noexcept;
        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;
        InFlightGuard& operator=(InFlightGuard&&) = delete;
        ~InFlightGuard();

    private:
        ReferenceResolver* resolver_;
        std::string identifier_;
    };

    ReferenceResolver() = default;
    ReferenceResolver(const ReferenceResolver&) = delete;
    ReferenceResolver& operator=(const ReferenceResolver&) = delete;

    /**
     * @brief Loads and indexes a document.
     * @throws error::MalformedSchema if the document is malformed or an
     * identical identifier was already registered
     */
    void registerDocument(std::string_view identifier, const json& document);

    /**
     * @brief Indexes an already loaded document, which may be shared with
     * other resolvers.
     */
    void registerDocument(std::shared_ptr<const SchemaDocument> document);

    EXSCHEMA_NODISCARD auto contains(std::string_view uri) const -> bool;

    /**
     * @brief Canonical identifier of a `$ref` written inside `scope_uri`.
     */
    EXSCHEMA_NODISCARD auto identify(std::string_view reference,
                                     std::string_view scope_uri) const
        -> std::string;

    /**
     * @brief Finds the node an identifier designates.
     * @throws error::UnresolvedReference when the document or the pointer
     * path does not exist
     * @throws error::MalformedSchema when the target is not a schema
     */
    auto resolve(const std::string& identifier) -> const SchemaNode&;

    EXSCHEMA_NODISCARD auto enter(std::string identifier) -> InFlightGuard;

    EXSCHEMA_NODISCARD auto isInFlight(const std::string& identifier) const
        -> bool;

    EXSCHEMA_NODISCARD auto documentCount() const noexcept -> std::size_t {
        return documents_.size();
    }

private:
    void index(const SchemaDocument& document);
    auto adopt(const std::string& identifier, const SchemaNode& scope,
               const std::string& fragment, const json& target)
        -> const SchemaNode&;

    std::vector<std::shared_ptr<const SchemaDocument>> documents_;
    std::unordered_map<std::string, const SchemaDocument*> by_uri_;
    std::unordered_map<std::string, const SchemaNode*> scopes_;
    std::unordered_map<std::string, const SchemaNode*> index_;
    std::unordered_map<const json*, const SchemaNode*> by_address_;
    std::unordered_set<std::string> in_flight_;
};

}  // namespace exschema::schema

#endif  // EXSCHEMA_SCHEMA_RESOLVER_HPP
