/*
 * json_utils.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-2

Description: Instance typing, exact number comparison and text helpers

**************************************************/

#ifndef EXSCHEMA_UTILS_JSON_UTILS_HPP
#define EXSCHEMA_UTILS_JSON_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "exschema/macro.hpp"

namespace exschema::utils {

using json = nlohmann::json;

/**
 * @brief The seven instance types a schema can distinguish.
 *
 * `Integer` and `Number` follow the representation of the parsed value:
 * `3` is an Integer, `3.0` is a Number.
 */
enum class InstanceType : std::uint8_t {
    Null = 0,
    Boolean,
    Integer,
    Number,
    String,
    Array,
    Object
};

inline constexpr std::size_t kInstanceTypeCount = 7;

using TypeMask = std::uint8_t;

constexpr auto maskOf(InstanceType type) noexcept -> TypeMask {
    return static_cast<TypeMask>(1U << static_cast<unsigned>(type));
}

inline constexpr TypeMask kAnyType = 0x7F;
inline constexpr TypeMask kNumericTypes =
    maskOf(InstanceType::Integer) | maskOf(InstanceType::Number);

EXSCHEMA_NODISCARD auto classify(const json& instance) noexcept
    -> InstanceType;

EXSCHEMA_NODISCARD auto typeName(InstanceType type) noexcept
    -> std::string_view;

/**
 * @brief Maps a schema type name to the instance types it admits.
 * @return std::nullopt for names that are not JSON Schema types
 */
EXSCHEMA_NODISCARD auto parseTypeName(std::string_view name) noexcept
    -> std::optional<TypeMask>;

/**
 * @brief Three-way comparison of two JSON numbers without rounding.
 *
 * Signed, unsigned and floating representations are compared by value, so
 * `9007199254740993` is greater than `9007199254740992.0`.
 *
 * @return negative, zero or positive like strcmp
 */
EXSCHEMA_NODISCARD auto compareNumbers(const json& lhs,
                                       const json& rhs) noexcept -> int;

/**
 * @brief Checks `value` is an integral multiple of a positive `divisor`.
 */
EXSCHEMA_NODISCARD auto isMultipleOf(const json& value,
                                     const json& divisor) noexcept -> bool;

/**
 * @brief Reads a non-negative integral number as a count.
 *
 * Values beyond the range of std::size_t saturate to its maximum and
 * negative values read as zero.
 */
EXSCHEMA_NODISCARD auto toCount(const json& value) noexcept -> std::size_t;

/**
 * @brief Number of code points of a UTF-8 string.
 */
EXSCHEMA_NODISCARD auto utf8Length(std::string_view text) noexcept
    -> std::size_t;

/**
 * @brief Compact rendering of a value for log lines and error messages.
 */
EXSCHEMA_NODISCARD auto summarize(const json& value,
                                  std::size_t max_length = 64)
    -> std::string;

}  // namespace exschema::utils

#endif  // EXSCHEMA_UTILS_JSON_UTILS_HPP
