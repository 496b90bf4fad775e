/*
 * options.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-3

Description: Options controlling schema compilation and validation

**************************************************/

#ifndef EXSCHEMA_SCHEMA_OPTIONS_HPP
#define EXSCHEMA_SCHEMA_OPTIONS_HPP

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "exschema/macro.hpp"

namespace exschema::schema {

using json = nlohmann::json;

struct CompileOptions {
    /// Reject keywords that are neither known nor registered extensions.
    bool strict = false;
    /// Report `format` violations instead of treating them as annotations.
    bool enforce_format = false;
    /// Longest chain of `$ref` to `$ref` links accepted at compile time.
    std::size_t max_reference_depth = 16;
    /// Deepest instance nesting the executor descends into.
    std::size_t max_recursion_depth = 512;
    /// Identifier of a schema compiled without one.
    std::string base_uri;

    /**
     * @brief Reads options from a configuration object such as
     * `{"strict": true, "maxRecursionDepth": 32}`. Missing keys keep their
     * defaults.
     * @throws error::InvalidOptions for unknown keys or mistyped values
     */
    static auto fromJson(const json& config) -> CompileOptions;

    EXSCHEMA_NODISCARD auto toJson() const -> json;
};

}  // namespace exschema::schema

#endif  // EXSCHEMA_SCHEMA_OPTIONS_HPP
