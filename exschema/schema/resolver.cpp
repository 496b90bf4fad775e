/*
 * resolver.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-3

Description: Maps schema identifiers to loaded schema nodes

**************************************************/

#include "resolver.hpp"

#include <cctype>
#include <utility>

#include <spdlog/spdlog.h>

#include "exschema/error/exception.hpp"
#include "exschema/schema/identifier.hpp"
#include "exschema/schema/vocabulary.hpp"

namespace exschema::schema {

namespace {

auto parseIndex(const std::string& token, std::size_t& index) -> bool {
    if (token.empty() || (token.size() > 1 && token.front() == '0')) {
        return false;
    }
    index = 0;
    for (char c : token) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
        index = index * 10 + static_cast<std::size_t>(c - '0');
    }
    return true;
}

}  // namespace

ReferenceResolver::InFlightGuard::InFlightGuard(ReferenceResolver& resolver,
                                                std::string identifier)
    : resolver_(&resolver), identifier_(std::move(identifier)) {
    resolver_->in_flight_.insert(identifier_);
}

ReferenceResolver::InFlightGuard::InFlightGuard(InFlightGuard&& other) noexcept
    : resolver_(std::exchange(other.resolver_, nullptr)),
      identifier_(std::move(other.identifier_)) {}

ReferenceResolver::InFlightGuard::~InFlightGuard() {
    if (resolver_ != nullptr) {
        resolver_->in_flight_.erase(identifier_);
    }
}

void ReferenceResolver::registerDocument(std::string_view identifier,
                                         const json& document) {
    auto uri = stripFragment(identifier);
    if (by_uri_.contains(uri)) {
        THROW_MALFORMED_SCHEMA(makeIdentifier(uri, ""),
                               "a document is already registered as '", uri,
                               "'");
    }
    registerDocument(SchemaDocument::load(document, std::move(uri)));
}

void ReferenceResolver::registerDocument(
    std::shared_ptr<const SchemaDocument> document) {
    const auto& uri = document->uri();
    if (!by_uri_.emplace(uri, document.get()).second) {
        THROW_MALFORMED_SCHEMA(makeIdentifier(uri, ""),
                               "a document is already registered as '", uri,
                               "'");
    }
    index(*document);
    spdlog::debug("Registered schema document '{}' with {} nodes", uri,
                  document->nodes().size());
    documents_.push_back(std::move(document));
}

auto ReferenceResolver::contains(std::string_view uri) const -> bool {
    const auto key = stripFragment(uri);
    return by_uri_.contains(key) || scopes_.contains(key);
}

auto ReferenceResolver::identify(std::string_view reference,
                                 std::string_view scope_uri) const
    -> std::string {
    auto parts = splitIdentifier(resolveUri(scope_uri, reference));
    return makeIdentifier(parts.uri, percentDecode(parts.fragment));
}

auto ReferenceResolver::resolve(const std::string& identifier)
    -> const SchemaNode& {
    if (auto it = index_.find(identifier); it != index_.end()) {
        return *it->second;
    }

    auto parts = splitIdentifier(identifier);
    const SchemaNode* scope = nullptr;
    if (auto it = scopes_.find(parts.uri); it != scopes_.end()) {
        scope = it->second;
    } else if (auto doc = by_uri_.find(parts.uri); doc != by_uri_.end()) {
        scope = &doc->second->root();
    } else {
        THROW_UNRESOLVED_REFERENCE(identifier,
                                   "no schema document is registered as '",
                                   parts.uri, "'");
    }

    auto tokens = splitPointer(parts.fragment);
    if (!tokens) {
        THROW_UNRESOLVED_REFERENCE(identifier, "no schema declares the id '#",
                                   parts.fragment, "'");
    }

    const json* target = &scope->value();
    for (const auto& token : *tokens) {
        std::size_t position = 0;
        if (target->is_object() && target->contains(token)) {
            target = &(*target)[token];
        } else if (target->is_array() && parseIndex(token, position) &&
                   position < target->size()) {
            target = &(*target)[position];
        } else {
            THROW_UNRESOLVED_REFERENCE(identifier, "the pointer '",
                                       parts.fragment, "' does not exist");
        }
    }

    if (auto known = by_address_.find(target); known != by_address_.end()) {
        index_.emplace(identifier, known->second);
        return *known->second;
    }
    if (!isSchemaValue(*target)) {
        THROW_MALFORMED_SCHEMA(identifier,
                               "the reference target must be an object or a "
                               "boolean, got ",
                               target->type_name());
    }
    return adopt(identifier, *scope, parts.fragment, *target);
}

auto ReferenceResolver::enter(std::string identifier) -> InFlightGuard {
    return InFlightGuard(*this, std::move(identifier));
}

auto ReferenceResolver::isInFlight(const std::string& identifier) const
    -> bool {
    return in_flight_.contains(identifier);
}

void ReferenceResolver::index(const SchemaDocument& document) {
    for (const auto& node : document.nodes()) {
        const auto* entry = node.get();
        index_.emplace(entry->identifier(), entry);
        index_.emplace(entry->scopedIdentifier(), entry);
        if (!entry->anchor().empty()) {
            index_.emplace(makeIdentifier(entry->scopeUri(), entry->anchor()),
                           entry);
        }
        if (entry->scopePointer().empty()) {
            scopes_.emplace(entry->scopeUri(), entry);
        }
        by_address_.emplace(&entry->value(), entry);
    }
}

auto ReferenceResolver::adopt(const std::string& identifier,
                              const SchemaNode& scope,
                              const std::string& fragment, const json& target)
    -> const SchemaNode& {
    spdlog::debug("Adopting unindexed schema fragment '{}'", identifier);
    std::shared_ptr<const SchemaDocument> adopted = SchemaDocument::load(
        target, scope.document().uri(), scope.pointer() + fragment,
        scope.scopeUri(), scope.scopePointer() + fragment);
    index(*adopted);
    const auto& root = adopted->root();
    index_.emplace(identifier, &root);
    documents_.push_back(std::move(adopted));
    return root;
}

}  // namespace exschema::schema
