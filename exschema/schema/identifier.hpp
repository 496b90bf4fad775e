/*
 * identifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-2

Description: Schema identifiers, URI resolution and JSON pointers

**************************************************/

#ifndef EXSCHEMA_SCHEMA_IDENTIFIER_HPP
#define EXSCHEMA_SCHEMA_IDENTIFIER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "exschema/macro.hpp"

namespace exschema::schema {

/**
 * @brief An identifier split at its first '#'.
 */
struct IdentifierParts {
    std::string uri;
    std::string fragment;
};

/**
 * @brief Builds the canonical `uri#fragment` form.
 */
EXSCHEMA_NODISCARD auto makeIdentifier(std::string_view uri,
                                       std::string_view fragment)
    -> std::string;

EXSCHEMA_NODISCARD auto splitIdentifier(std::string_view identifier)
    -> IdentifierParts;

EXSCHEMA_NODISCARD auto stripFragment(std::string_view uri) -> std::string;

/**
 * @brief Resolves a URI reference against a base URI (RFC 3986 section 5.2,
 * without query handling).
 */
EXSCHEMA_NODISCARD auto resolveUri(std::string_view base,
                                   std::string_view reference) -> std::string;

/**
 * @brief Decodes `%XX` escapes; malformed escapes are kept verbatim.
 */
EXSCHEMA_NODISCARD auto percentDecode(std::string_view text) -> std::string;

EXSCHEMA_NODISCARD auto escapePointerToken(std::string_view token)
    -> std::string;

EXSCHEMA_NODISCARD auto unescapePointerToken(std::string_view token)
    -> std::string;

EXSCHEMA_NODISCARD auto appendPointer(std::string_view pointer,
                                      std::string_view token) -> std::string;

EXSCHEMA_NODISCARD auto appendPointer(std::string_view pointer,
                                      std::size_t index) -> std::string;

/**
 * @brief Splits a JSON pointer into unescaped reference tokens.
 * @return std::nullopt when the text is not a JSON pointer
 */
EXSCHEMA_NODISCARD auto splitPointer(std::string_view pointer)
    -> std::optional<std::vector<std::string>>;

}  // namespace exschema::schema

#endif  // EXSCHEMA_SCHEMA_IDENTIFIER_HPP
