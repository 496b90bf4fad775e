/*
 * executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-8

Description: Runs an instance through a validator graph

**************************************************/

#ifndef EXSCHEMA_VALIDATOR_EXECUTOR_HPP
#define EXSCHEMA_VALIDATOR_EXECUTOR_HPP

#include <cstddef>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "exschema/macro.hpp"
#include "exschema/validator/errors.hpp"
#include "exschema/validator/graph.hpp"

namespace exschema::validator {

using json = nlohmann::json;

/**
 * @brief Mutable state of one validation call.
 */
class ValidationContext {
public:
    /**
     * @brief Keeps a key or index on the instance path while alive.
     */
    class PathScope {
    public:
        PathScope(ValidationContext& context, PathElement element);
        PathScope(const PathScope&) = delete;
        PathScope& operator=(const PathScope&) = delete;
        ~PathScope();

    private:
        ValidationContext& context_;
    };

    /**
     * @brief Redirects reported records into a scratch aggregator.
     *
     * Composition keywords evaluate their branches under a capture and
     * decide afterwards what to report.
     */
    class CaptureScope {
    public:
        explicit CaptureScope(ValidationContext& context);
        CaptureScope(const CaptureScope&) = delete;
        CaptureScope& operator=(const CaptureScope&) = delete;
        ~CaptureScope();

        auto take() -> std::vector<ErrorRecord>;

    private:
        ValidationContext& context_;
    };

    ValidationContext();

    void report(ErrorRecord record);

    EXSCHEMA_NODISCARD auto path() const noexcept -> const InstancePath& {
        return path_;
    }

    EXSCHEMA_NODISCARD auto depth() const noexcept -> std::size_t {
        return path_.size();
    }

    /**
     * @brief Records that a reference is being followed for an instance.
     * @return false if the same pair is already being followed
     */
    auto enterReference(NodeId reference, const json* instance) -> bool;
    void leaveReference(NodeId reference, const json* instance);

    /**
     * @brief Records of the outermost aggregator.
     */
    auto take() -> std::vector<ErrorRecord>;

private:
    InstancePath path_;
    std::set<std::pair<NodeId, const json*>> guard_;
    std::vector<ErrorAggregator> aggregators_;
};

/**
 * @brief Depth-first interpreter of a ValidatorGraph.
 *
 * The executor keeps no state between calls; every run() owns its own
 * ValidationContext, so one executor can serve several threads.
 */
class Executor {
public:
    Executor(const ValidatorGraph& graph, std::size_t max_depth);

    /**
     * @brief Validates an instance from the root of the graph.
     * @return every violation found, empty when the instance is valid
     */
    EXSCHEMA_NODISCARD auto run(const json& instance) const
        -> std::vector<ErrorRecord>;

private:
    auto evaluate(NodeId id, const json& instance,
                  ValidationContext& context) const -> bool;
    auto descend(NodeId id, PathElement element, const json& instance,
                 ValidationContext& context) const -> bool;
    auto follow(NodeId id, const ValidatorNode& node, const json& instance,
                ValidationContext& context) const -> bool;

    auto checkSchema(const ValidatorNode& node, const json& instance,
                     ValidationContext& context) const -> bool;
    auto checkLeaf(const ValidatorNode& node, const json& instance,
                   ValidationContext& context) const -> bool;
    auto checkObject(const ValidatorNode& node, const json& instance,
                     ValidationContext& context) const -> bool;
    auto checkArray(const ValidatorNode& node, const json& instance,
                    ValidationContext& context) const -> bool;
    auto checkComposition(const ValidatorNode& node, const json& instance,
                          ValidationContext& context) const -> bool;

    void fail(const ValidatorNode& node, const json& instance,
              ValidationContext& context, std::string message,
              json detail = nullptr) const;

    const ValidatorGraph& graph_;
    std::size_t max_depth_;
};

}  // namespace exschema::validator

#endif  // EXSCHEMA_VALIDATOR_EXECUTOR_HPP
