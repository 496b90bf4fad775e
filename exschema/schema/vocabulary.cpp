/*
 * vocabulary.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-2

Description: Table of the schema keywords known to the document model

**************************************************/

#include "vocabulary.hpp"

#include <array>
#include <cmath>

#include "exschema/error/exception.hpp"
#include "exschema/schema/identifier.hpp"
#include "exschema/utils/json_utils.hpp"

namespace exschema::schema {

namespace {

using enum KeywordShape;

constexpr std::array kKeywords{
    // Core and annotations
    KeywordInfo{"$ref", String, false},
    KeywordInfo{"$schema", DialectUri, true},
    KeywordInfo{"$id", String, true},
    KeywordInfo{"id", Any, true},
    KeywordInfo{"$comment", Any, true},
    KeywordInfo{"title", Any, true},
    KeywordInfo{"description", Any, true},
    KeywordInfo{"default", Any, true},
    KeywordInfo{"examples", Any, true},
    KeywordInfo{"readOnly", Any, true},
    KeywordInfo{"writeOnly", Any, true},
    KeywordInfo{"deprecated", Any, true},
    KeywordInfo{"contentEncoding", Any, true},
    KeywordInfo{"contentMediaType", Any, true},
    KeywordInfo{"definitions", SchemaMap, true},
    KeywordInfo{"$defs", SchemaMap, true},
    // General
    KeywordInfo{"type", TypeSpec, false},
    KeywordInfo{"enum", Array, false},
    KeywordInfo{"const", Any, false},
    // Numbers
    KeywordInfo{"minimum", Number, false},
    KeywordInfo{"maximum", Number, false},
    KeywordInfo{"exclusiveMinimum", NumberOrBoolean, false},
    KeywordInfo{"exclusiveMaximum", NumberOrBoolean, false},
    KeywordInfo{"multipleOf", PositiveNumber, false},
    // Strings
    KeywordInfo{"minLength", NonNegativeInteger, false},
    KeywordInfo{"maxLength", NonNegativeInteger, false},
    KeywordInfo{"pattern", String, false},
    KeywordInfo{"format", String, false},
    // Objects
    KeywordInfo{"properties", SchemaMap, false},
    KeywordInfo{"patternProperties", SchemaMap, false},
    KeywordInfo{"additionalProperties", Schema, false},
    KeywordInfo{"unevaluatedProperties", Schema, false},
    KeywordInfo{"required", StringArray, false},
    KeywordInfo{"minProperties", NonNegativeInteger, false},
    KeywordInfo{"maxProperties", NonNegativeInteger, false},
    KeywordInfo{"dependencies", DependencyMap, false},
    KeywordInfo{"dependentRequired", StringArrayMap, false},
    KeywordInfo{"dependentSchemas", SchemaMap, false},
    KeywordInfo{"propertyNames", Schema, false},
    // Arrays
    KeywordInfo{"items", SchemaOrSchemaArray, false},
    KeywordInfo{"additionalItems", Schema, false},
    KeywordInfo{"minItems", NonNegativeInteger, false},
    KeywordInfo{"maxItems", NonNegativeInteger, false},
    KeywordInfo{"uniqueItems", Boolean, false},
    KeywordInfo{"contains", Schema, false},
    KeywordInfo{"minContains", NonNegativeInteger, false},
    KeywordInfo{"maxContains", NonNegativeInteger, false},
    // Composition
    KeywordInfo{"allOf", SchemaArray, false},
    KeywordInfo{"anyOf", SchemaArray, false},
    KeywordInfo{"oneOf", SchemaArray, false},
    KeywordInfo{"not", Schema, false},
    KeywordInfo{"if", Schema, false},
    KeywordInfo{"then", Schema, false},
    KeywordInfo{"else", Schema, false},
};

auto isStringArray(const json& value) -> bool {
    if (!value.is_array()) {
        return false;
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            return false;
        }
    }
    return true;
}

struct DialectInfo {
    std::string_view path;
    Dialect dialect;
};

constexpr std::array kDialects{
    DialectInfo{"json-schema.org/draft-04/schema", Dialect::Draft4},
    DialectInfo{"json-schema.org/draft-06/schema", Dialect::Draft6},
    DialectInfo{"json-schema.org/draft-07/schema", Dialect::Draft7},
    DialectInfo{"json-schema.org/draft/2019-09/schema",
                Dialect::Draft2019_09},
    DialectInfo{"json-schema.org/draft/2020-12/schema",
                Dialect::Draft2020_12},
};

}  // namespace

auto parseDialect(std::string_view uri) noexcept -> std::optional<Dialect> {
    if (uri.ends_with('#')) {
        uri.remove_suffix(1);
    }
    if (uri.starts_with("https://")) {
        uri.remove_prefix(8);
    } else if (uri.starts_with("http://")) {
        uri.remove_prefix(7);
    } else {
        return std::nullopt;
    }
    for (const auto& info : kDialects) {
        if (info.path == uri) {
            return info.dialect;
        }
    }
    return std::nullopt;
}

auto findKeyword(std::string_view name) noexcept -> const KeywordInfo* {
    for (const auto& info : kKeywords) {
        if (info.name == name) {
            return &info;
        }
    }
    return nullptr;
}

auto holdsSubschemas(KeywordShape shape) noexcept -> bool {
    switch (shape) {
        case Schema:
        case SchemaMap:
        case SchemaArray:
        case SchemaOrSchemaArray:
        case DependencyMap:
            return true;
        default:
            return false;
    }
}

auto isNonNegativeInteger(const json& value) noexcept -> bool {
    if (value.is_number_unsigned()) {
        return true;
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>() >= 0;
    }
    if (value.is_number_float()) {
        const auto number = value.get<double>();
        return number >= 0.0 && std::trunc(number) == number;
    }
    return false;
}

void checkShape(const KeywordInfo& info, const json& value,
                const std::string& location) {
    switch (info.shape) {
        case Any:
            return;
        case Schema:
            if (!isSchemaValue(value)) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be a schema object or boolean");
            }
            return;
        case SchemaMap:
            if (!value.is_object()) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be an object");
            }
            return;
        case SchemaArray:
            if (!value.is_array() || value.empty()) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be a non-empty array");
            }
            return;
        case SchemaOrSchemaArray:
            if (!isSchemaValue(value) && !value.is_array()) {
                THROW_MALFORMED_SCHEMA(
                    location, "'", info.name,
                    "' must be a schema or an array of schemas");
            }
            return;
        case DependencyMap:
            if (!value.is_object()) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be an object");
            }
            for (const auto& [property, dependency] : value.items()) {
                if (!isSchemaValue(dependency) && !isStringArray(dependency)) {
                    THROW_MALFORMED_SCHEMA(
                        appendPointer(location, property), "dependency of '",
                        property, "' must be a schema or an array of strings");
                }
            }
            return;
        case StringArrayMap:
            if (!value.is_object()) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be an object");
            }
            for (const auto& [property, dependency] : value.items()) {
                if (!isStringArray(dependency)) {
                    THROW_MALFORMED_SCHEMA(appendPointer(location, property),
                                           "dependency of '", property,
                                           "' must be an array of strings");
                }
            }
            return;
        case TypeSpec:
            if (!value.is_string() && !isStringArray(value)) {
                THROW_MALFORMED_SCHEMA(
                    location,
                    "the value of 'type' must be either a string or an array "
                    "of strings");
            }
            if (value.is_array() && value.empty()) {
                THROW_MALFORMED_SCHEMA(location,
                                       "'type' must name at least one type");
            }
            for (const auto& name :
                 value.is_array() ? value : json::array({value})) {
                const auto& text = name.get_ref<const std::string&>();
                if (!utils::parseTypeName(text)) {
                    THROW_MALFORMED_SCHEMA(location, "unknown type '", text,
                                           "'");
                }
            }
            return;
        case DialectUri:
            if (!value.is_string()) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be a string");
            }
            if (!parseDialect(value.get_ref<const std::string&>())) {
                THROW_MALFORMED_SCHEMA(location, "invalid dialect '",
                                       value.get_ref<const std::string&>(),
                                       "'");
            }
            return;
        case String:
            if (!value.is_string()) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be a string");
            }
            return;
        case StringArray:
            if (!isStringArray(value)) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be an array of strings");
            }
            return;
        case NonNegativeInteger:
            if (!isNonNegativeInteger(value)) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be a non-negative integer");
            }
            return;
        case Number:
            if (!value.is_number()) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be a number");
            }
            return;
        case PositiveNumber:
            if (!value.is_number() || value.get<double>() <= 0.0) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be strictly greater than 0");
            }
            return;
        case NumberOrBoolean:
            if (!value.is_number() && !value.is_boolean()) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be a number or a boolean");
            }
            return;
        case Boolean:
            if (!value.is_boolean()) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be a boolean");
            }
            return;
        case Array:
            if (!value.is_array()) {
                THROW_MALFORMED_SCHEMA(location, "'", info.name,
                                       "' must be an array");
            }
            return;
    }
}

}  // namespace exschema::schema
