/*
 * vocabulary.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-2

Description: Table of the schema keywords known to the document model

**************************************************/

#ifndef EXSCHEMA_SCHEMA_VOCABULARY_HPP
#define EXSCHEMA_SCHEMA_VOCABULARY_HPP

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "exschema/macro.hpp"

namespace exschema::schema {

using json = nlohmann::json;

/**
 * @brief Shape a keyword value must have for the schema to be well formed.
 */
enum class KeywordShape {
    Any,
    Schema,               // object or boolean subschema
    SchemaMap,            // object whose values are subschemas
    SchemaArray,          // non-empty array of subschemas
    SchemaOrSchemaArray,  // `items`
    DependencyMap,        // values are subschemas or arrays of strings
    StringArrayMap,       // values are arrays of strings
    TypeSpec,             // type name or non-empty array of type names
    DialectUri,           // `$schema` naming a supported draft
    String,
    StringArray,
    NonNegativeInteger,
    Number,
    PositiveNumber,
    NumberOrBoolean,
    Boolean,
    Array
};

/**
 * @brief Drafts a schema may declare through `$schema`.
 */
enum class Dialect { Draft4, Draft6, Draft7, Draft2019_09, Draft2020_12 };

struct KeywordInfo {
    std::string_view name;
    KeywordShape shape;
    bool annotation;  // recognized but never compiled
};

/**
 * @brief Looks up a keyword of the vocabulary.
 * @return nullptr for keywords the vocabulary does not know
 */
EXSCHEMA_NODISCARD auto findKeyword(std::string_view name) noexcept
    -> const KeywordInfo*;

/**
 * @brief Maps a `$schema` URI to its draft.
 *
 * Both http and https forms are accepted, with or without the empty
 * fragment.
 * @return std::nullopt for URIs of unsupported dialects
 */
EXSCHEMA_NODISCARD auto parseDialect(std::string_view uri) noexcept
    -> std::optional<Dialect>;

/**
 * @brief True for shapes whose value holds subschemas.
 */
EXSCHEMA_NODISCARD auto holdsSubschemas(KeywordShape shape) noexcept -> bool;

/**
 * @brief Checks a keyword value against its shape.
 * @throws error::MalformedSchema naming `location` on mismatch
 */
void checkShape(const KeywordInfo& info, const json& value,
                const std::string& location);

/**
 * @brief True for an object or boolean, the two forms a schema can take.
 */
EXSCHEMA_NODISCARD inline auto isSchemaValue(const json& value) noexcept
    -> bool {
    return value.is_object() || value.is_boolean();
}

/**
 * @brief True for integral JSON numbers greater than or equal to zero.
 */
EXSCHEMA_NODISCARD auto isNonNegativeInteger(const json& value) noexcept
    -> bool;

}  // namespace exschema::schema

#endif  // EXSCHEMA_SCHEMA_VOCABULARY_HPP
