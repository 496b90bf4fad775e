/*
 * extension.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-6

Description: Extension point for keywords outside the built-in vocabulary

**************************************************/

#ifndef EXSCHEMA_KEYWORDS_EXTENSION_HPP
#define EXSCHEMA_KEYWORDS_EXTENSION_HPP

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "exschema/macro.hpp"
#include "exschema/utils/json_utils.hpp"

namespace exschema::keywords {

using json = nlohmann::json;

/**
 * @brief Compiled form of one extension keyword occurrence.
 *
 * Instances are shared by every validation of a compiled schema, so check()
 * must not modify the object.
 */
class CustomCheck {
public:
    virtual ~CustomCheck() = default;

    /**
     * @brief Tests an instance.
     * @param instance Value being validated
     * @param detail Filled with context for the error record on failure
     * @return true when the instance satisfies the keyword
     */
    virtual auto check(const json& instance, json& detail) const -> bool = 0;

    /**
     * @brief Sentence used as the error message on failure.
     */
    EXSCHEMA_NODISCARD virtual auto describe() const -> std::string {
        return "Custom constraint not satisfied";
    }
};

/**
 * @brief A keyword contributed by the library user.
 *
 * Registered through SchemaCompiler::registerExtension. The keyword is then
 * recognized in strict mode and compiled into a leaf of the validator
 * graph.
 */
class KeywordExtension {
public:
    virtual ~KeywordExtension() = default;

    EXSCHEMA_NODISCARD virtual auto name() const -> std::string = 0;

    /**
     * @brief Instance types the keyword constrains; others pass untouched.
     */
    EXSCHEMA_NODISCARD virtual auto appliesTo() const -> utils::TypeMask {
        return utils::kAnyType;
    }

    /**
     * @brief Rejects ill-formed keyword values by throwing
     * error::MalformedSchema naming `location`.
     */
    virtual void validateSchemaValue(const json& value,
                                     const std::string& location) const {
        (void)value;
        (void)location;
    }

    /**
     * @brief Builds the check for one occurrence of the keyword.
     * @param value Keyword value
     * @param schema The enclosing schema object
     */
    EXSCHEMA_NODISCARD virtual auto compile(const json& value,
                                            const json& schema) const
        -> std::shared_ptr<const CustomCheck> = 0;
};

}  // namespace exschema::keywords

#endif  // EXSCHEMA_KEYWORDS_EXTENSION_HPP
