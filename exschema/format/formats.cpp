/*
 * formats.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-4

Description: Checkers for the string formats of the `format` keyword

**************************************************/

#include "formats.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace exschema::format {

namespace {

auto matches(std::string_view text, const std::regex& pattern) -> bool {
    return std::regex_match(text.begin(), text.end(), pattern);
}

auto contains(std::string_view text, const std::regex& pattern) -> bool {
    return std::regex_search(text.begin(), text.end(), pattern);
}

auto toNumber(std::string_view digits) -> int {
    int value = 0;
    for (char c : digits) {
        value = value * 10 + (c - '0');
    }
    return value;
}

auto isLeapYear(int year) -> bool {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

auto daysInMonth(int year, int month) -> int {
    constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

// Expects text already shaped as YYYY-MM-DD.
auto isCalendarDate(std::string_view text) -> bool {
    const int year = toNumber(text.substr(0, 4));
    const int month = toNumber(text.substr(5, 2));
    const int day = toNumber(text.substr(8, 2));
    return month >= 1 && month <= 12 && day >= 1 &&
           day <= daysInMonth(year, month);
}

auto split(std::string_view text, char separator)
    -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto end = text.find(separator, start);
        if (end == std::string_view::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, end - start));
        start = end + 1;
    }
}

auto isHexGroup(std::string_view group) -> bool {
    return !group.empty() && group.size() <= 4 &&
           std::all_of(group.begin(), group.end(), [](char c) {
               return std::isxdigit(static_cast<unsigned char>(c)) != 0;
           });
}

// Counts the 16-bit groups of one side of an IPv6 address; -1 on error.
auto countGroups(std::string_view side, bool allow_ipv4_tail) -> int {
    if (side.empty()) {
        return 0;
    }
    auto groups = split(side, ':');
    int count = 0;
    for (std::size_t i = 0; i < groups.size(); ++i) {
        const bool last = i + 1 == groups.size();
        if (last && allow_ipv4_tail &&
            groups[i].find('.') != std::string_view::npos) {
            if (!isIpv4(groups[i])) {
                return -1;
            }
            count += 2;
        } else if (isHexGroup(groups[i])) {
            ++count;
        } else {
            return -1;
        }
    }
    return count;
}

}  // namespace

auto isDateTime(std::string_view text) -> bool {
    static const std::regex kDateTime(
        R"(^\d{4}-[01]\d-[0-3]\d[tT]([0-2]\d):[0-5]\d:[0-5]\d(?:\.\d+)?)"
        R"((?:[+-][0-2]\d:[0-5]\d|[+-][0-2]\d[0-5]\d|z|Z)$)");
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_match(text.begin(), text.end(), match, kDateTime)) {
        return false;
    }
    return isCalendarDate(text.substr(0, 10)) && toNumber(match.str(1)) < 24;
}

auto isDate(std::string_view text) -> bool {
    static const std::regex kDate(R"(^\d{4}-\d\d-\d\d$)");
    return matches(text, kDate) && isCalendarDate(text);
}

auto isTime(std::string_view text) -> bool {
    static const std::regex kTime(
        R"(^([0-2]\d):[0-5]\d:[0-5]\d(?:\.\d+)?(?:[zZ]|[+-][0-2]\d:[0-5]\d)?$)");
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_match(text.begin(), text.end(), match, kTime)) {
        return false;
    }
    return toNumber(match.str(1)) < 24;
}

auto isEmail(std::string_view text) -> bool {
    static const std::regex kBadName(
        R"((^[^a-zA-Z0-9])|([^a-zA-Z0-9._+-])|([._\-+]{2,})|([^a-zA-Z0-9]$))");
    static const std::regex kBadDomain(
        R"((^[^a-zA-Z0-9])|([^a-zA-Z0-9.-])|([.-]{2,})|([a-zA-Z0-9-]{65,})|([^a-zA-Z0-9.]$))");
    const auto at = text.find('@');
    if (at == std::string_view::npos) {
        return false;
    }
    const auto name = text.substr(0, at);
    const auto domain = text.substr(at + 1);
    return !name.empty() && !domain.empty() && !contains(name, kBadName) &&
           !contains(domain, kBadDomain);
}

auto isHostname(std::string_view text) -> bool {
    static const std::regex kBadHostname(
        R"((^[^a-zA-Z0-9])|([^a-zA-Z0-9.-])|([.-]{2,})|([a-zA-Z0-9-]{64,})|([^a-zA-Z0-9.]$))");
    return !text.empty() && text.size() <= 255 &&
           !contains(text, kBadHostname);
}

auto isIpv4(std::string_view text) -> bool {
    auto parts = split(text, '.');
    if (parts.size() != 4) {
        return false;
    }
    return std::all_of(parts.begin(), parts.end(), [](std::string_view part) {
        if (part.empty() || part.size() > 3 ||
            (part.front() == '0' && part.size() > 1)) {
            return false;
        }
        if (!std::all_of(part.begin(), part.end(), [](char c) {
                return std::isdigit(static_cast<unsigned char>(c)) != 0;
            })) {
            return false;
        }
        return toNumber(part) < 256;
    });
}

auto isIpv6(std::string_view text) -> bool {
    const auto gap = text.find("::");
    if (gap == std::string_view::npos) {
        return countGroups(text, true) == 8;
    }
    if (text.find("::", gap + 1) != std::string_view::npos) {
        return false;
    }
    const int head = countGroups(text.substr(0, gap), false);
    const int tail = countGroups(text.substr(gap + 2), true);
    return head >= 0 && tail >= 0 && head + tail <= 7;
}

auto isUri(std::string_view text) -> bool {
    static const std::regex kScheme(R"(^[a-zA-Z][a-zA-Z0-9.+-]*$)");
    const auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    if (std::any_of(text.begin(), text.end(), [](char c) {
            const auto byte = static_cast<unsigned char>(c);
            return byte <= 0x20 || byte == 0x7F;
        })) {
        return false;
    }
    const auto hierPart = text.substr(colon + 1);
    return matches(text.substr(0, colon), kScheme) && hierPart.size() > 2 &&
           hierPart.substr(0, 2) == "//";
}

auto isUuid(std::string_view text) -> bool {
    static const std::regex kUuid(
        R"(^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$)");
    return matches(text, kUuid);
}

auto isRegex(std::string_view text) -> bool {
    try {
        std::regex pattern(text.begin(), text.end(), std::regex::ECMAScript);
        return true;
    } catch (const std::regex_error&) {
        return false;
    }
}

FormatRegistry::FormatRegistry() {
    add("date-time", isDateTime);
    add("date", isDate);
    add("time", isTime);
    add("email", isEmail);
    add("hostname", isHostname);
    add("ipv4", isIpv4);
    add("ipv6", isIpv6);
    add("uri", isUri);
    add("uuid", isUuid);
    add("regex", isRegex);
}

void FormatRegistry::add(std::string name, FormatChecker checker) {
    checkers_.insert_or_assign(std::move(name), std::move(checker));
}

auto FormatRegistry::find(std::string_view name) const
    -> const FormatChecker* {
    auto it = checkers_.find(std::string(name));
    return it == checkers_.end() ? nullptr : &it->second;
}

auto FormatRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(checkers_.size());
    for (const auto& [name, checker] : checkers_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace exschema::format
