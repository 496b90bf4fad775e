/*
 * compiler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Entry point turning schema documents into validator graphs

**************************************************/

#include "compiler.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "exschema/error/exception.hpp"
#include "exschema/keywords/registry.hpp"
#include "exschema/schema/identifier.hpp"
#include "exschema/schema/resolver.hpp"
#include "exschema/schema/vocabulary.hpp"

namespace exschema::schema {

SchemaCompiler::SchemaCompiler(CompileOptions options)
    : options_(std::move(options)) {}

void SchemaCompiler::registerDocument(std::string_view identifier,
                                      const json& document) {
    auto uri = stripFragment(identifier);
    if (std::any_of(
            documents_.begin(), documents_.end(),
            [&uri](const auto& known) { return known->uri() == uri; })) {
        THROW_MALFORMED_SCHEMA(makeIdentifier(uri, ""),
                               "a document is already registered as '", uri,
                               "'");
    }
    documents_.push_back(SchemaDocument::load(document, std::move(uri)));
    spdlog::debug("Registered schema document '{}'", documents_.back()->uri());
}

void SchemaCompiler::registerFormat(std::string name,
                                    format::FormatChecker checker) {
    spdlog::debug("Registered format '{}'", name);
    formats_.add(std::move(name), std::move(checker));
}

void SchemaCompiler::registerExtension(
    std::shared_ptr<const keywords::KeywordExtension> extension) {
    if (!extension) {
        THROW_INVALID_OPTIONS("cannot register a null keyword extension");
    }
    auto name = extension->name();
    if (keywords::findCompiler(name) != nullptr ||
        findKeyword(name) != nullptr) {
        THROW_INVALID_OPTIONS("keyword '", name,
                              "' is built in and cannot be extended");
    }
    spdlog::debug("Registered keyword extension '{}'", name);
    extensions_.insert_or_assign(std::move(name), std::move(extension));
}

auto SchemaCompiler::compile(const json& schema,
                             std::string_view identifier) const
    -> validator::CompiledSchema {
    auto uri = identifier.empty() ? stripFragment(options_.base_uri)
                                  : stripFragment(identifier);
    spdlog::debug("Compiling schema '{}'", uri);

    ReferenceResolver resolver;
    prepare(resolver);
    std::shared_ptr<const SchemaDocument> document =
        SchemaDocument::load(schema, uri);
    resolver.registerDocument(document);
    return build(resolver, document->root(), std::move(uri));
}

auto SchemaCompiler::compileRegistered(std::string_view identifier) const
    -> validator::CompiledSchema {
    ReferenceResolver resolver;
    prepare(resolver);
    auto canonical = resolver.identify(identifier, "");
    const auto& root = resolver.resolve(canonical);
    return build(resolver, root, std::move(canonical));
}

void SchemaCompiler::prepare(ReferenceResolver& resolver) const {
    for (const auto& document : documents_) {
        resolver.registerDocument(document);
    }
}

auto SchemaCompiler::build(ReferenceResolver& resolver, const SchemaNode& root,
                           std::string identifier) const
    -> validator::CompiledSchema {
    keywords::CompileContext context(resolver, options_, formats_,
                                     extensions_);
    const auto root_id = context.compileNode(root);
    context.graph().setRoot(root_id);
    context.checkReferenceChains();

    auto graph = context.takeGraph();
    spdlog::debug("Compiled schema '{}' into {} validator nodes from {} "
                  "documents",
                  identifier, graph->size(), resolver.documentCount());
    return validator::CompiledSchema(std::move(graph),
                                     options_.max_recursion_depth,
                                     std::move(identifier));
}

}  // namespace exschema::schema
