/*
 * formats.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-4

Description: Checkers for the string formats of the `format` keyword

**************************************************/

#ifndef EXSCHEMA_FORMAT_FORMATS_HPP
#define EXSCHEMA_FORMAT_FORMATS_HPP

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "exschema/macro.hpp"

namespace exschema::format {

/**
 * @brief Returns true when the string conforms to the format.
 *
 * Checkers are shared by every compiled schema and may be called from
 * several threads at once.
 */
using FormatChecker = std::function<bool(std::string_view)>;

EXSCHEMA_NODISCARD auto isDateTime(std::string_view text) -> bool;
EXSCHEMA_NODISCARD auto isDate(std::string_view text) -> bool;
EXSCHEMA_NODISCARD auto isTime(std::string_view text) -> bool;
EXSCHEMA_NODISCARD auto isEmail(std::string_view text) -> bool;
EXSCHEMA_NODISCARD auto isHostname(std::string_view text) -> bool;
EXSCHEMA_NODISCARD auto isIpv4(std::string_view text) -> bool;
EXSCHEMA_NODISCARD auto isIpv6(std::string_view text) -> bool;

/**
 * @brief Absolute URI with an authority part (`scheme://...`).
 */
EXSCHEMA_NODISCARD auto isUri(std::string_view text) -> bool;
EXSCHEMA_NODISCARD auto isUuid(std::string_view text) -> bool;

/**
 * @brief Text accepted by the ECMAScript regex grammar.
 */
EXSCHEMA_NODISCARD auto isRegex(std::string_view text) -> bool;

/**
 * @brief Named format checkers, preloaded with the built-in formats.
 */
class FormatRegistry {
public:
    FormatRegistry();

    /**
     * @brief Adds or replaces the checker of a format.
     */
    void add(std::string name, FormatChecker checker);

    /**
     * @return the checker or nullptr for unknown formats
     */
    EXSCHEMA_NODISCARD auto find(std::string_view name) const
        -> const FormatChecker*;

    EXSCHEMA_NODISCARD auto contains(std::string_view name) const -> bool {
        return find(name) != nullptr;
    }

    EXSCHEMA_NODISCARD auto names() const -> std::vector<std::string>;

private:
    std::unordered_map<std::string, FormatChecker> checkers_;
};

}  // namespace exschema::format

#endif  // EXSCHEMA_FORMAT_FORMATS_HPP
