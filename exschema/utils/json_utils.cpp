/*
 * json_utils.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-2

Description: Instance typing, exact number comparison and text helpers

**************************************************/

#include "json_utils.hpp"

#include <cmath>
#include <limits>

namespace exschema::utils {

namespace {

// 2^63 and 2^64 are exactly representable as doubles.
constexpr double kTwoPow63 = 9223372036854775808.0;
constexpr double kTwoPow64 = 18446744073709551616.0;

template <typename T>
constexpr auto threeWay(T lhs, T rhs) noexcept -> int {
    return lhs < rhs ? -1 : (rhs < lhs ? 1 : 0);
}

auto compareSignedToDouble(std::int64_t value, double other) noexcept -> int {
    if (other >= kTwoPow63) {
        return -1;
    }
    if (other < -kTwoPow63) {
        return 1;
    }
    const double whole = std::trunc(other);
    const auto truncated = static_cast<std::int64_t>(whole);
    if (value != truncated) {
        return threeWay(value, truncated);
    }
    return threeWay(whole, other);
}

auto compareUnsignedToDouble(std::uint64_t value, double other) noexcept
    -> int {
    if (other < 0.0) {
        return 1;
    }
    if (other >= kTwoPow64) {
        return -1;
    }
    const double whole = std::trunc(other);
    const auto truncated = static_cast<std::uint64_t>(whole);
    if (value != truncated) {
        return threeWay(value, truncated);
    }
    return threeWay(whole, other);
}

auto compareIntegers(const json& lhs, const json& rhs) noexcept -> int {
    const bool lhs_unsigned = lhs.is_number_unsigned();
    const bool rhs_unsigned = rhs.is_number_unsigned();
    if (!lhs_unsigned && !rhs_unsigned) {
        return threeWay(lhs.get<std::int64_t>(), rhs.get<std::int64_t>());
    }
    if (lhs_unsigned && rhs_unsigned) {
        return threeWay(lhs.get<std::uint64_t>(), rhs.get<std::uint64_t>());
    }
    if (lhs_unsigned) {
        const auto other = rhs.get<std::int64_t>();
        if (other < 0) {
            return 1;
        }
        return threeWay(lhs.get<std::uint64_t>(),
                        static_cast<std::uint64_t>(other));
    }
    const auto value = lhs.get<std::int64_t>();
    if (value < 0) {
        return -1;
    }
    return threeWay(static_cast<std::uint64_t>(value),
                    rhs.get<std::uint64_t>());
}

auto compareIntegerToDouble(const json& integer, double other) noexcept
    -> int {
    if (integer.is_number_unsigned()) {
        return compareUnsignedToDouble(integer.get<std::uint64_t>(), other);
    }
    return compareSignedToDouble(integer.get<std::int64_t>(), other);
}

auto magnitude(const json& integer) noexcept -> std::uint64_t {
    if (integer.is_number_unsigned()) {
        return integer.get<std::uint64_t>();
    }
    const auto value = integer.get<std::int64_t>();
    return value < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(value)
                     : static_cast<std::uint64_t>(value);
}

}  // namespace

auto classify(const json& instance) noexcept -> InstanceType {
    switch (instance.type()) {
        case json::value_t::boolean:
            return InstanceType::Boolean;
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return InstanceType::Integer;
        case json::value_t::number_float:
            return InstanceType::Number;
        case json::value_t::string:
            return InstanceType::String;
        case json::value_t::array:
            return InstanceType::Array;
        case json::value_t::object:
            return InstanceType::Object;
        default:
            return InstanceType::Null;
    }
}

auto typeName(InstanceType type) noexcept -> std::string_view {
    switch (type) {
        case InstanceType::Null:
            return "null";
        case InstanceType::Boolean:
            return "boolean";
        case InstanceType::Integer:
            return "integer";
        case InstanceType::Number:
            return "number";
        case InstanceType::String:
            return "string";
        case InstanceType::Array:
            return "array";
        case InstanceType::Object:
            return "object";
    }
    return "unknown";
}

auto parseTypeName(std::string_view name) noexcept -> std::optional<TypeMask> {
    if (name == "null")
        return maskOf(InstanceType::Null);
    if (name == "boolean")
        return maskOf(InstanceType::Boolean);
    if (name == "integer")
        return maskOf(InstanceType::Integer);
    if (name == "number")
        return kNumericTypes;
    if (name == "string")
        return maskOf(InstanceType::String);
    if (name == "array")
        return maskOf(InstanceType::Array);
    if (name == "object")
        return maskOf(InstanceType::Object);
    return std::nullopt;
}

auto compareNumbers(const json& lhs, const json& rhs) noexcept -> int {
    const bool lhs_float = lhs.is_number_float();
    const bool rhs_float = rhs.is_number_float();
    if (!lhs_float && !rhs_float) {
        return compareIntegers(lhs, rhs);
    }
    if (lhs_float && rhs_float) {
        return threeWay(lhs.get<double>(), rhs.get<double>());
    }
    if (rhs_float) {
        return compareIntegerToDouble(lhs, rhs.get<double>());
    }
    return -compareIntegerToDouble(rhs, lhs.get<double>());
}

auto isMultipleOf(const json& value, const json& divisor) noexcept -> bool {
    if (!value.is_number_float() && !divisor.is_number_float()) {
        const auto step = magnitude(divisor);
        return step != 0 && magnitude(value) % step == 0;
    }
    const double quotient = value.get<double>() / divisor.get<double>();
    return std::isfinite(quotient) && std::trunc(quotient) == quotient;
}

auto toCount(const json& value) noexcept -> std::size_t {
    constexpr auto kMax = std::numeric_limits<std::size_t>::max();
    std::uint64_t count = 0;
    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (!(number > 0.0)) {
            return 0;
        }
        if (number >= kTwoPow64) {
            return kMax;
        }
        count = static_cast<std::uint64_t>(number);
    } else if (value.is_number_unsigned()) {
        count = value.get<std::uint64_t>();
    } else if (value.is_number_integer()) {
        const auto number = value.get<std::int64_t>();
        count = number < 0 ? 0 : static_cast<std::uint64_t>(number);
    }
    return count > kMax ? kMax : static_cast<std::size_t>(count);
}

auto utf8Length(std::string_view text) noexcept -> std::size_t {
    std::size_t count = 0;
    for (unsigned char byte : text) {
        if ((byte & 0xC0U) != 0x80U) {
            ++count;
        }
    }
    return count;
}

auto summarize(const json& value, std::size_t max_length) -> std::string {
    std::string text =
        value.dump(-1, ' ', false, json::error_handler_t::replace);
    if (text.size() > max_length) {
        text.resize(max_length);
        text += "...";
    }
    return text;
}

}  // namespace exschema::utils
