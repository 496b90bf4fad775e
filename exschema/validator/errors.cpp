/*
 * errors.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-7

Description: Validation error records and their aggregation

**************************************************/

#include "errors.hpp"

#include <unordered_map>

#include "exschema/schema/identifier.hpp"

namespace exschema::validator {

auto ErrorRecord::toJson() const -> json {
    json result = {{"path", pathToJson(path)},
                   {"keyword", keyword},
                   {"value", value}};
    if (!context.is_null()) {
        result["context"] = context;
    }
    result["schemaPath"] = schema_path;
    result["message"] = message;
    return result;
}

auto formatPath(const InstancePath& path) -> std::string {
    std::string pointer;
    for (const auto& element : path) {
        if (const auto* key = std::get_if<std::string>(&element)) {
            pointer = schema::appendPointer(pointer, *key);
        } else {
            pointer = schema::appendPointer(pointer,
                                            std::get<std::size_t>(element));
        }
    }
    return pointer;
}

auto pathToJson(const InstancePath& path) -> json {
    json result = json::array();
    for (const auto& element : path) {
        std::visit([&result](const auto& item) { result.push_back(item); },
                   element);
    }
    return result;
}

auto toJson(const std::vector<ErrorRecord>& records) -> json {
    json result = json::array();
    for (const auto& record : records) {
        result.push_back(record.toJson());
    }
    return result;
}

auto groupByPath(const std::vector<ErrorRecord>& records) -> json {
    json groups = json::array();
    std::unordered_map<std::string, std::size_t> positions;
    for (const auto& record : records) {
        auto path = pathToJson(record.path);
        auto [it, inserted] = positions.emplace(path.dump(), groups.size());
        if (inserted) {
            groups.push_back(
                {{"path", std::move(path)}, {"errors", json::array()}});
        }
        groups[it->second]["errors"].push_back(
            {{"keyword", record.keyword}, {"value", record.value}});
    }
    return groups;
}

}  // namespace exschema::validator
