/*
 * compiler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Entry point turning schema documents into validator graphs

**************************************************/

#ifndef EXSCHEMA_SCHEMA_COMPILER_HPP
#define EXSCHEMA_SCHEMA_COMPILER_HPP

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "exschema/format/formats.hpp"
#include "exschema/keywords/context.hpp"
#include "exschema/keywords/extension.hpp"
#include "exschema/macro.hpp"
#include "exschema/schema/document.hpp"
#include "exschema/schema/options.hpp"
#include "exschema/validator/compiled_schema.hpp"

namespace exschema::schema {

/**
 * @brief Compiles schemas once so they can validate many instances.
 *
 * Documents referenced by `$ref` must be registered beforehand; nothing is
 * fetched. Each compile() call works on its own resolver, so compiling
 * never changes the compiler and the resulting schemas are independent.
 *
 * @code
 * exschema::schema::SchemaCompiler compiler;
 * compiler.registerDocument("urn:defs", defs);
 * auto schema = compiler.compile(R"({"$ref": "urn:defs#/point"})"_json);
 * for (const auto& error : schema.validate(instance)) {
 *     std::cout << error.message << '\n';
 * }
 * @endcode
 */
class SchemaCompiler {
public:
    explicit SchemaCompiler(CompileOptions options = {});

    /**
     * @brief Makes a document available to `$ref`.
     * @throws error::MalformedSchema if the document is malformed or the
     * identifier is taken
     */
    void registerDocument(std::string_view identifier, const json& document);

    /**
     * @brief Adds or replaces a `format` checker.
     */
    void registerFormat(std::string name, format::FormatChecker checker);

    /**
     * @brief Adds a keyword outside the built-in vocabulary.
     * @throws error::InvalidOptions for null extensions or names of
     * built-in keywords
     */
    void registerExtension(
        std::shared_ptr<const keywords::KeywordExtension> extension);

    /**
     * @brief Compiles a schema.
     * @param schema Root schema, an object or a boolean
     * @param identifier Identifier of the root document, defaults to
     * CompileOptions::base_uri
     * @throws error::SchemaException subclasses, compilation never
     * partially succeeds
     */
    EXSCHEMA_NODISCARD auto compile(const json& schema,
                                    std::string_view identifier = "") const
        -> validator::CompiledSchema;

    /**
     * @brief Compiles a registered document, or a fragment of one.
     */
    EXSCHEMA_NODISCARD auto compileRegistered(std::string_view identifier) const
        -> validator::CompiledSchema;

    EXSCHEMA_NODISCARD auto options() const noexcept
        -> const CompileOptions& {
        return options_;
    }

private:
    void prepare(ReferenceResolver& resolver) const;
    auto build(ReferenceResolver& resolver, const SchemaNode& root,
               std::string identifier) const -> validator::CompiledSchema;

    CompileOptions options_;
    format::FormatRegistry formats_;
    keywords::ExtensionMap extensions_;
    std::vector<std::shared_ptr<const SchemaDocument>> documents_;
};

}  // namespace exschema::schema

#endif  // EXSCHEMA_SCHEMA_COMPILER_HPP
