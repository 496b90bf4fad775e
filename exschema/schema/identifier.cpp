/*
 * identifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-2

Description: Schema identifiers, URI resolution and JSON pointers

**************************************************/

#include "identifier.hpp"

#include <cctype>

namespace exschema::schema {

namespace {

auto schemeLength(std::string_view uri) -> std::size_t {
    if (uri.empty() || std::isalpha(static_cast<unsigned char>(uri[0])) == 0) {
        return 0;
    }
    for (std::size_t i = 1; i < uri.size(); ++i) {
        const auto c = static_cast<unsigned char>(uri[i]);
        if (c == ':') {
            return i;
        }
        if (std::isalnum(c) == 0 && c != '+' && c != '-' && c != '.') {
            return 0;
        }
    }
    return 0;
}

auto hexValue(char c) -> int {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Removes "." and ".." segments from an absolute or relative path.
auto removeDotSegments(std::string_view path) -> std::string {
    std::vector<std::string_view> segments;
    const bool absolute = !path.empty() && path.front() == '/';
    std::size_t start = absolute ? 1 : 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        auto segment = path.substr(start, end - start);
        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            if (end == path.size()) {
                segments.emplace_back();
            }
        } else if (segment == ".") {
            if (end == path.size()) {
                segments.emplace_back();
            }
        } else {
            segments.push_back(segment);
        }
        start = end + 1;
    }

    std::string result = absolute ? "/" : "";
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += segments[i];
    }
    return result;
}

}  // namespace

auto makeIdentifier(std::string_view uri, std::string_view fragment)
    -> std::string {
    std::string identifier(uri);
    identifier += '#';
    identifier += fragment;
    return identifier;
}

auto splitIdentifier(std::string_view identifier) -> IdentifierParts {
    const auto hash = identifier.find('#');
    if (hash == std::string_view::npos) {
        return {std::string(identifier), ""};
    }
    return {std::string(identifier.substr(0, hash)),
            std::string(identifier.substr(hash + 1))};
}

auto stripFragment(std::string_view uri) -> std::string {
    return std::string(uri.substr(0, uri.find('#')));
}

auto resolveUri(std::string_view base, std::string_view reference)
    -> std::string {
    const std::string base_uri = stripFragment(base);
    if (reference.empty()) {
        return base_uri;
    }
    if (schemeLength(reference) > 0) {
        return std::string(reference);
    }
    if (reference.front() == '#') {
        return base_uri + std::string(reference);
    }

    const auto scheme = schemeLength(base_uri);
    const std::string_view base_view(base_uri);
    if (reference.starts_with("//")) {
        return std::string(base_view.substr(0, scheme + (scheme ? 1 : 0))) +
               std::string(reference);
    }

    // Split the base into "scheme://authority" and the path that follows.
    std::size_t path_start = scheme > 0 ? scheme + 1 : 0;
    if (base_view.substr(path_start).starts_with("//")) {
        const auto slash = base_view.find('/', path_start + 2);
        path_start = slash == std::string_view::npos ? base_view.size() : slash;
    }
    const auto prefix = base_view.substr(0, path_start);
    const auto base_path = base_view.substr(path_start);

    // Split the reference's own fragment off before touching its path.
    const auto hash = reference.find('#');
    const auto ref_path = reference.substr(0, hash);
    const auto ref_fragment = hash == std::string_view::npos
                                  ? std::string_view{}
                                  : reference.substr(hash);

    std::string merged;
    if (ref_path.front() == '/') {
        merged = removeDotSegments(ref_path);
    } else {
        const auto last_slash = base_path.rfind('/');
        if (last_slash == std::string_view::npos) {
            if (scheme > 0 && prefix.size() == scheme + 1) {
                // Opaque bases such as "urn:x" have no hierarchy to merge.
                return std::string(reference);
            }
            merged = removeDotSegments(
                (prefix.empty() ? std::string() : std::string("/")) +
                std::string(ref_path));
        } else {
            merged = removeDotSegments(
                std::string(base_path.substr(0, last_slash + 1)) +
                std::string(ref_path));
        }
    }
    return std::string(prefix) + merged + std::string(ref_fragment);
}

auto percentDecode(std::string_view text) -> std::string {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int high = hexValue(text[i + 1]);
            const int low = hexValue(text[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded += static_cast<char>(high * 16 + low);
                i += 2;
                continue;
            }
        }
        decoded += text[i];
    }
    return decoded;
}

auto escapePointerToken(std::string_view token) -> std::string {
    std::string escaped;
    escaped.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            escaped += "~0";
        } else if (c == '/') {
            escaped += "~1";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

auto unescapePointerToken(std::string_view token) -> std::string {
    std::string unescaped;
    unescaped.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] == '~' && i + 1 < token.size()) {
            if (token[i + 1] == '0') {
                unescaped += '~';
                ++i;
                continue;
            }
            if (token[i + 1] == '1') {
                unescaped += '/';
                ++i;
                continue;
            }
        }
        unescaped += token[i];
    }
    return unescaped;
}

auto appendPointer(std::string_view pointer, std::string_view token)
    -> std::string {
    std::string result(pointer);
    result += '/';
    result += escapePointerToken(token);
    return result;
}

auto appendPointer(std::string_view pointer, std::size_t index)
    -> std::string {
    std::string result(pointer);
    result += '/';
    result += std::to_string(index);
    return result;
}

auto splitPointer(std::string_view pointer)
    -> std::optional<std::vector<std::string>> {
    std::vector<std::string> tokens;
    if (pointer.empty()) {
        return tokens;
    }
    if (pointer.front() != '/') {
        return std::nullopt;
    }
    std::size_t start = 1;
    while (true) {
        const auto end = pointer.find('/', start);
        if (end == std::string_view::npos) {
            tokens.push_back(unescapePointerToken(pointer.substr(start)));
            break;
        }
        tokens.push_back(
            unescapePointerToken(pointer.substr(start, end - start)));
        start = end + 1;
    }
    return tokens;
}

}  // namespace exschema::schema
