/*
 * compiled_schema.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Immutable handle on a compiled schema

**************************************************/

#ifndef EXSCHEMA_VALIDATOR_COMPILED_SCHEMA_HPP
#define EXSCHEMA_VALIDATOR_COMPILED_SCHEMA_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "exschema/macro.hpp"
#include "exschema/validator/errors.hpp"
#include "exschema/validator/graph.hpp"

namespace exschema::validator {

/**
 * @brief Result of SchemaCompiler::compile.
 *
 * Copies share the same graph. Validation is const and keeps its state on
 * the stack, so a CompiledSchema can be used from many threads at once.
 */
class CompiledSchema {
public:
    CompiledSchema(std::shared_ptr<const ValidatorGraph> graph,
                   std::size_t max_recursion_depth, std::string identifier);

    /**
     * @brief Collects every violation of the schema by `instance`.
     * @return the error records in discovery order, empty when valid
     */
    EXSCHEMA_NODISCARD auto validate(const json& instance) const
        -> std::vector<ErrorRecord>;

    EXSCHEMA_NODISCARD auto isValid(const json& instance) const -> bool;

    EXSCHEMA_NODISCARD auto identifier() const noexcept
        -> const std::string& {
        return identifier_;
    }

    EXSCHEMA_NODISCARD auto graph() const noexcept -> const ValidatorGraph& {
        return *graph_;
    }

    EXSCHEMA_NODISCARD auto toString() const -> std::string;

private:
    std::shared_ptr<const ValidatorGraph> graph_;
    std::size_t max_recursion_depth_;
    std::string identifier_;
};

/**
 * @brief Free-function form of CompiledSchema::validate.
 */
EXSCHEMA_NODISCARD auto validate(const CompiledSchema& schema,
                                 const json& instance)
    -> std::vector<ErrorRecord>;

}  // namespace exschema::validator

#endif  // EXSCHEMA_VALIDATOR_COMPILED_SCHEMA_HPP
