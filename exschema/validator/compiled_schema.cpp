/*
 * compiled_schema.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Immutable handle on a compiled schema

**************************************************/

#include "compiled_schema.hpp"

#include <utility>

#include "exschema/validator/executor.hpp"

namespace exschema::validator {

CompiledSchema::CompiledSchema(std::shared_ptr<const ValidatorGraph> graph,
                               std::size_t max_recursion_depth,
                               std::string identifier)
    : graph_(std::move(graph)),
      max_recursion_depth_(max_recursion_depth),
      identifier_(std::move(identifier)) {}

auto CompiledSchema::validate(const json& instance) const
    -> std::vector<ErrorRecord> {
    return Executor(*graph_, max_recursion_depth_).run(instance);
}

auto CompiledSchema::isValid(const json& instance) const -> bool {
    return validate(instance).empty();
}

auto CompiledSchema::toString() const -> std::string {
    return graph_->toString();
}

auto validate(const CompiledSchema& schema, const json& instance)
    -> std::vector<ErrorRecord> {
    return schema.validate(instance);
}

}  // namespace exschema::validator
