/*
 * errors.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-7

Description: Validation error records and their aggregation

**************************************************/

#ifndef EXSCHEMA_VALIDATOR_ERRORS_HPP
#define EXSCHEMA_VALIDATOR_ERRORS_HPP

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "exschema/macro.hpp"

namespace exschema::validator {

using json = nlohmann::json;

/// Object key or array index.
using PathElement = std::variant<std::string, std::size_t>;
using InstancePath = std::vector<PathElement>;

/**
 * @brief One violated constraint.
 */
struct ErrorRecord {
    InstancePath path;        // from the instance root
    std::string keyword;      // violated keyword
    json value;               // offending instance fragment
    json context;             // keyword specific detail, null when none
    std::string schema_path;  // identifier of the schema location
    std::string message;

    /**
     * @brief `{path, keyword, value, context?, schemaPath, message}`.
     */
    EXSCHEMA_NODISCARD auto toJson() const -> json;
};

/**
 * @brief Renders a path as a JSON pointer (`/items/0/name`).
 */
EXSCHEMA_NODISCARD auto formatPath(const InstancePath& path) -> std::string;

/**
 * @brief Renders a path as a JSON array of keys and indices.
 */
EXSCHEMA_NODISCARD auto pathToJson(const InstancePath& path) -> json;

EXSCHEMA_NODISCARD auto toJson(const std::vector<ErrorRecord>& records)
    -> json;

/**
 * @brief Groups records by instance path, in first-seen path order:
 * `[{"path": [...], "errors": [{"keyword": ..., "value": ...}]}]`.
 */
EXSCHEMA_NODISCARD auto groupByPath(const std::vector<ErrorRecord>& records)
    -> json;

/**
 * @brief Collects records in discovery order.
 *
 * Nothing is deduplicated or reordered: two violations of the same
 * keyword at the same location produce two records.
 */
class ErrorAggregator {
public:
    void append(ErrorRecord record) { records_.push_back(std::move(record)); }

    void append(std::vector<ErrorRecord>&& records) {
        for (auto& record : records) {
            records_.push_back(std::move(record));
        }
    }

    EXSCHEMA_NODISCARD auto size() const noexcept -> std::size_t {
        return records_.size();
    }

    EXSCHEMA_NODISCARD auto empty() const noexcept -> bool {
        return records_.empty();
    }

    EXSCHEMA_NODISCARD auto records() const noexcept
        -> const std::vector<ErrorRecord>& {
        return records_;
    }

    /**
     * @brief Hands the records over, leaving the aggregator empty.
     */
    auto take() -> std::vector<ErrorRecord> {
        auto records = std::move(records_);
        records_.clear();
        return records;
    }

private:
    std::vector<ErrorRecord> records_;
};

}  // namespace exschema::validator

#endif  // EXSCHEMA_VALIDATOR_ERRORS_HPP
