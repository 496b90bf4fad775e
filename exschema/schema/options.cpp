/*
 * options.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-3

Description: Options controlling schema compilation and validation

**************************************************/

#include "options.hpp"

#include "exschema/error/exception.hpp"
#include "exschema/schema/vocabulary.hpp"
#include "exschema/utils/json_utils.hpp"

namespace exschema::schema {

namespace {

auto readFlag(const json& value, const std::string& key) -> bool {
    if (!value.is_boolean()) {
        THROW_INVALID_OPTIONS("option '", key, "' must be a boolean, got ",
                              value.type_name());
    }
    return value.get<bool>();
}

auto readLimit(const json& value, const std::string& key) -> std::size_t {
    if (!isNonNegativeInteger(value)) {
        THROW_INVALID_OPTIONS("option '", key,
                              "' must be a non-negative integer, got ",
                              value.dump());
    }
    return utils::toCount(value);
}

}  // namespace

auto CompileOptions::fromJson(const json& config) -> CompileOptions {
    if (!config.is_object()) {
        THROW_INVALID_OPTIONS("options must be a JSON object, got ",
                              config.type_name());
    }

    CompileOptions options;
    for (const auto& [key, value] : config.items()) {
        if (key == "strict") {
            options.strict = readFlag(value, key);
        } else if (key == "enforceFormat") {
            options.enforce_format = readFlag(value, key);
        } else if (key == "maxReferenceDepth") {
            options.max_reference_depth = readLimit(value, key);
        } else if (key == "maxRecursionDepth") {
            options.max_recursion_depth = readLimit(value, key);
        } else if (key == "baseUri") {
            if (!value.is_string()) {
                THROW_INVALID_OPTIONS("option 'baseUri' must be a string");
            }
            options.base_uri = value.get<std::string>();
        } else {
            THROW_INVALID_OPTIONS("unknown option '", key, "'");
        }
    }
    return options;
}

auto CompileOptions::toJson() const -> json {
    return {{"strict", strict},
            {"enforceFormat", enforce_format},
            {"maxReferenceDepth", max_reference_depth},
            {"maxRecursionDepth", max_recursion_depth},
            {"baseUri", base_uri}};
}

}  // namespace exschema::schema
