/*
 * document.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-2

Description: Addressable in-memory model of a schema document

**************************************************/

#ifndef EXSCHEMA_SCHEMA_DOCUMENT_HPP
#define EXSCHEMA_SCHEMA_DOCUMENT_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "exschema/macro.hpp"

namespace exschema::schema {

using json = nlohmann::json;

class SchemaDocument;

/**
 * @brief The three forms a loaded schema fragment can take.
 */
enum class NodeKind {
    Object,     // bag of keywords
    Boolean,    // `true` or `false` schema
    Reference   // object carrying `$ref`; sibling keywords are ignored
};

/**
 * @brief One schema fragment of a loaded document.
 *
 * Nodes are created by SchemaDocument::load and never change afterwards.
 * Besides its position inside the document, a node knows the resolution
 * scope established by the nearest enclosing `$id` (or draft-04 `id`).
 */
class SchemaNode {
public:
    SchemaNode(const SchemaNode&) = delete;
    SchemaNode& operator=(const SchemaNode&) = delete;

    EXSCHEMA_NODISCARD auto kind() const noexcept -> NodeKind { return kind_; }

    EXSCHEMA_NODISCARD auto booleanValue() const noexcept -> bool {
        return kind_ == NodeKind::Boolean && value_->get<bool>();
    }

    /**
     * @brief Raw `$ref` text of a reference node, empty otherwise.
     */
    EXSCHEMA_NODISCARD auto reference() const noexcept -> const std::string& {
        return reference_;
    }

    EXSCHEMA_NODISCARD auto value() const noexcept -> const json& {
        return *value_;
    }

    EXSCHEMA_NODISCARD auto document() const noexcept
        -> const SchemaDocument& {
        return *document_;
    }

    /**
     * @brief JSON pointer of this node inside its document.
     */
    EXSCHEMA_NODISCARD auto pointer() const noexcept -> const std::string& {
        return pointer_;
    }

    EXSCHEMA_NODISCARD auto scopeUri() const noexcept -> const std::string& {
        return scope_uri_;
    }

    EXSCHEMA_NODISCARD auto scopePointer() const noexcept
        -> const std::string& {
        return scope_pointer_;
    }

    /**
     * @brief Plain-name fragment declared with `"$id": "#name"`, if any.
     */
    EXSCHEMA_NODISCARD auto anchor() const noexcept -> const std::string& {
        return anchor_;
    }

    /**
     * @brief `document-uri#pointer`, the location used in diagnostics.
     */
    EXSCHEMA_NODISCARD auto identifier() const -> std::string;

    /**
     * @brief `scope-uri#pointer-inside-scope`.
     */
    EXSCHEMA_NODISCARD auto scopedIdentifier() const -> std::string;

    EXSCHEMA_NODISCARD auto hasKeyword(std::string_view name) const -> bool;

    /**
     * @return the keyword value or nullptr when absent
     */
    EXSCHEMA_NODISCARD auto keyword(std::string_view name) const
        -> const json*;

    /**
     * @brief Subschema stored directly under a keyword (`not`, `items`, ...).
     */
    EXSCHEMA_NODISCARD auto child(std::string_view keyword) const
        -> const SchemaNode*;

    /**
     * @brief Subschema stored under a keyword's member (`properties/name`).
     */
    EXSCHEMA_NODISCARD auto child(std::string_view keyword,
                                  std::string_view key) const
        -> const SchemaNode*;

    /**
     * @brief Subschema stored under a keyword's element (`allOf/0`).
     */
    EXSCHEMA_NODISCARD auto child(std::string_view keyword,
                                  std::size_t index) const
        -> const SchemaNode*;

private:
    friend class SchemaDocument;

    SchemaNode() = default;

    NodeKind kind_{NodeKind::Object};
    const json* value_{nullptr};
    const SchemaDocument* document_{nullptr};
    std::string reference_;
    std::string pointer_;
    std::string scope_uri_;
    std::string scope_pointer_;
    std::string anchor_;
};

/**
 * @brief Owns a schema tree and every SchemaNode found in it.
 *
 * Loading checks the shape of every recognized keyword but resolves no
 * reference, so documents can be loaded in any order.
 */
class SchemaDocument {
public:
    /**
     * @brief Loads an already parsed schema tree.
     * @param document Root value, must be an object or a boolean
     * @param uri Identifier of the document
     * @param base_pointer Pointer of `document` inside the document named by
     * `uri` (non-empty for fragments adopted by the resolver)
     * @param scope_uri Resolution scope of the root, defaults to `uri`
     * @throws error::MalformedSchema on shape errors
     */
    static auto load(const json& document, std::string uri,
                     std::string base_pointer = "",
                     std::string scope_uri = "", std::string scope_pointer = "")
        -> std::unique_ptr<SchemaDocument>;

    SchemaDocument(const SchemaDocument&) = delete;
    SchemaDocument& operator=(const SchemaDocument&) = delete;

    EXSCHEMA_NODISCARD auto uri() const noexcept -> const std::string& {
        return uri_;
    }

    EXSCHEMA_NODISCARD auto raw() const noexcept -> const json& {
        return raw_;
    }

    EXSCHEMA_NODISCARD auto root() const noexcept -> const SchemaNode& {
        return *nodes_.front();
    }

    /**
     * @brief Node at a document pointer, nullptr when none was loaded there.
     */
    EXSCHEMA_NODISCARD auto find(std::string_view pointer) const
        -> const SchemaNode*;

    EXSCHEMA_NODISCARD auto nodes() const noexcept
        -> const std::vector<std::unique_ptr<SchemaNode>>& {
        return nodes_;
    }

private:
    SchemaDocument(json raw, std::string uri);

    void loadNode(const json& value, const std::string& pointer,
                  const std::string& scope_uri,
                  const std::string& scope_pointer);
    void loadChildren(const json& object, const std::string& pointer,
                      const std::string& scope_uri,
                      const std::string& scope_pointer);

    json raw_;
    std::string uri_;
    std::vector<std::unique_ptr<SchemaNode>> nodes_;
    std::unordered_map<std::string, const SchemaNode*> by_pointer_;
};

}  // namespace exschema::schema

#endif  // EXSCHEMA_SCHEMA_DOCUMENT_HPP
