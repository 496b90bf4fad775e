/*
 * document.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-2

Description: Addressable in-memory model of a schema document

**************************************************/

#include "document.hpp"

#include <utility>

#include "exschema/error/exception.hpp"
#include "exschema/schema/identifier.hpp"
#include "exschema/schema/vocabulary.hpp"

namespace exschema::schema {

namespace {

// `$id`, or the draft-04 `id` when it is a string.
auto declaredId(const json& object) -> const json* {
    if (auto it = object.find("$id"); it != object.end() && it->is_string()) {
        return &*it;
    }
    if (auto it = object.find("id"); it != object.end() && it->is_string()) {
        return &*it;
    }
    return nullptr;
}

}  // namespace

auto SchemaNode::identifier() const -> std::string {
    return makeIdentifier(document_->uri(), pointer_);
}

auto SchemaNode::scopedIdentifier() const -> std::string {
    return makeIdentifier(scope_uri_, scope_pointer_);
}

auto SchemaNode::hasKeyword(std::string_view name) const -> bool {
    return keyword(name) != nullptr;
}

auto SchemaNode::keyword(std::string_view name) const -> const json* {
    if (!value_->is_object()) {
        return nullptr;
    }
    auto it = value_->find(name);
    return it == value_->end() ? nullptr : &*it;
}

auto SchemaNode::child(std::string_view keyword) const -> const SchemaNode* {
    return document_->find(appendPointer(pointer_, keyword));
}

auto SchemaNode::child(std::string_view keyword, std::string_view key) const
    -> const SchemaNode* {
    return document_->find(
        appendPointer(appendPointer(pointer_, keyword), key));
}

auto SchemaNode::child(std::string_view keyword, std::size_t index) const
    -> const SchemaNode* {
    return document_->find(
        appendPointer(appendPointer(pointer_, keyword), index));
}

SchemaDocument::SchemaDocument(json raw, std::string uri)
    : raw_(std::move(raw)), uri_(std::move(uri)) {}

auto SchemaDocument::load(const json& document, std::string uri,
                          std::string base_pointer, std::string scope_uri,
                          std::string scope_pointer)
    -> std::unique_ptr<SchemaDocument> {
    if (!isSchemaValue(document)) {
        THROW_MALFORMED_SCHEMA(makeIdentifier(uri, base_pointer),
                               "a schema must be an object or a boolean, got ",
                               document.type_name());
    }
    if (scope_uri.empty()) {
        scope_uri = uri;
        scope_pointer = base_pointer;
    }
    std::unique_ptr<SchemaDocument> loaded(
        new SchemaDocument(document, std::move(uri)));
    loaded->loadNode(loaded->raw_, base_pointer, scope_uri, scope_pointer);
    return loaded;
}

auto SchemaDocument::find(std::string_view pointer) const
    -> const SchemaNode* {
    auto it = by_pointer_.find(std::string(pointer));
    return it == by_pointer_.end() ? nullptr : it->second;
}

void SchemaDocument::loadNode(const json& value, const std::string& pointer,
                              const std::string& scope_uri,
                              const std::string& scope_pointer) {
    std::unique_ptr<SchemaNode> node(new SchemaNode());
    node->value_ = &value;
    node->document_ = this;
    node->pointer_ = pointer;
    node->scope_uri_ = scope_uri;
    node->scope_pointer_ = scope_pointer;

    if (value.is_boolean()) {
        node->kind_ = NodeKind::Boolean;
    } else if (auto ref = value.find("$ref"); ref != value.end()) {
        if (!ref->is_string()) {
            THROW_MALFORMED_SCHEMA(
                makeIdentifier(uri_, appendPointer(pointer, "$ref")),
                "'$ref' must be a string");
        }
        node->kind_ = NodeKind::Reference;
        node->reference_ = ref->get<std::string>();
    } else if (const auto* id = declaredId(value); id != nullptr) {
        // A declared id opens a new resolution scope; a plain-name
        // fragment additionally names this node.
        const auto& text = id->get_ref<const std::string&>();
        auto parts = splitIdentifier(resolveUri(scope_uri, text));
        if (text.empty() || text.front() != '#') {
            node->scope_uri_ = parts.uri;
            node->scope_pointer_.clear();
        }
        if (!parts.fragment.empty() && parts.fragment.front() != '/') {
            node->anchor_ = percentDecode(parts.fragment);
        }
    }

    const auto* loaded = node.get();
    by_pointer_.emplace(pointer, loaded);
    nodes_.push_back(std::move(node));

    if (value.is_object()) {
        loadChildren(value, pointer, loaded->scope_uri_,
                     loaded->scope_pointer_);
    }
}

void SchemaDocument::loadChildren(const json& object,
                                  const std::string& pointer,
                                  const std::string& scope_uri,
                                  const std::string& scope_pointer) {
    for (const auto& [name, value] : object.items()) {
        const auto* info = findKeyword(name);
        if (info == nullptr) {
            continue;
        }
        const auto keywordPointer = appendPointer(pointer, name);
        const auto keywordScope = appendPointer(scope_pointer, name);
        checkShape(*info, value, makeIdentifier(uri_, keywordPointer));
        if (!holdsSubschemas(info->shape)) {
            continue;
        }

        auto loadMember = [&](const json& member, const std::string& token,
                              bool required) {
            if (!isSchemaValue(member)) {
                if (required) {
                    THROW_MALFORMED_SCHEMA(
                        makeIdentifier(uri_,
                                       appendPointer(keywordPointer, token)),
                        "'", name, "' entries must be schemas, got ",
                        member.type_name());
                }
                return;
            }
            loadNode(member, appendPointer(keywordPointer, token), scope_uri,
                     appendPointer(keywordScope, token));
        };

        switch (info->shape) {
            case KeywordShape::Schema:
                loadNode(value, keywordPointer, scope_uri, keywordScope);
                break;
            case KeywordShape::SchemaOrSchemaArray:
                if (!value.is_array()) {
                    loadNode(value, keywordPointer, scope_uri, keywordScope);
                    break;
                }
                [[fallthrough]];
            case KeywordShape::SchemaArray:
                for (std::size_t i = 0; i < value.size(); ++i) {
                    loadMember(value[i], std::to_string(i), true);
                }
                break;
            case KeywordShape::SchemaMap:
                for (const auto& [key, member] : value.items()) {
                    loadMember(member, key, true);
                }
                break;
            case KeywordShape::DependencyMap:
                // array entries are property lists, not schemas
                for (const auto& [key, member] : value.items()) {
                    loadMember(member, key, false);
                }
                break;
            default:
                break;
        }
    }
}

}  // namespace exschema::schema
