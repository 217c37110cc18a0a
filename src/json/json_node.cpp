//! # JSON5 Node Implementation
//!
//! This module implements the out-of-line parts of `JsonNode`: container
//! construction, lookup, deep copy and equality. Serialization methods are in
//! `json_stringify.cpp`.
//!
//! ## Equality Semantics
//!
//! | Kind | Comparison Rule |
//! |------|-----------------|
//! | `Null` | All nulls are equal |
//! | `Bool` | Standard boolean comparison |
//! | `Integer` | Exact `int64_t` comparison |
//! | `Float` | IEEE comparison, except that `NaN` equals `NaN` |
//! | `String` | Byte-by-byte comparison |
//! | `Array` | Element-by-element in order |
//! | `Object` | Member-by-member in order, keys and values |
//!
//! Nodes of different kinds are never equal: `1` and `1.0` differ.

#include "json5ast/json/json_node.hpp"

#include <cmath>

namespace json5ast::json {

auto node_kind_name(NodeKind kind) -> std::string_view {
    switch (kind) {
    case NodeKind::Null:
        return "Null";
    case NodeKind::Bool:
        return "Bool";
    case NodeKind::Integer:
        return "Integer";
    case NodeKind::Float:
        return "Float";
    case NodeKind::String:
        return "String";
    case NodeKind::Array:
        return "Array";
    case NodeKind::Object:
        return "Object";
    }
    return "Unknown";
}

JsonNode::JsonNode(JsonArray value, SourceSpan span)
    : data_(make_box<JsonArray>(std::move(value))), span_(span) {}

JsonNode::JsonNode(JsonObject value, SourceSpan span)
    : data_(make_box<JsonObject>(std::move(value))), span_(span) {}

auto JsonNode::get(const std::string& key) const -> const JsonNode* {
    if (const auto* obj = std::get_if<Box<JsonObject>>(&data_)) {
        return (*obj)->get(key);
    }
    return nullptr;
}

auto JsonNode::size() const -> size_t {
    if (const auto* arr = std::get_if<Box<JsonArray>>(&data_)) {
        return (*arr)->size();
    }
    if (const auto* obj = std::get_if<Box<JsonObject>>(&data_)) {
        return (*obj)->size();
    }
    return 0;
}

auto JsonNode::clone() const -> JsonNode {
    switch (kind()) {
    case NodeKind::Null:
        return JsonNode(nullptr, span_);
    case NodeKind::Bool:
        return JsonNode(as_bool(), span_);
    case NodeKind::Integer:
        return JsonNode(as_integer(), span_);
    case NodeKind::Float:
        return JsonNode(as_float(), span_);
    case NodeKind::String:
        return JsonNode(as_string(), span_);
    case NodeKind::Array: {
        JsonArray copy;
        copy.reserve(size());
        for (const auto& element : as_array()) {
            copy.push_back(element.clone());
        }
        return JsonNode(std::move(copy), span_);
    }
    case NodeKind::Object: {
        JsonObject copy;
        for (const auto& [key, member] : as_object()) {
            copy.insert(key, member.clone());
        }
        return JsonNode(std::move(copy), span_);
    }
    }
    return JsonNode(nullptr, span_);
}

auto JsonNode::operator==(const JsonNode& other) const -> bool {
    // Different kinds are not equal
    if (data_.index() != other.data_.index()) {
        return false;
    }

    switch (kind()) {
    case NodeKind::Null:
        return true;
    case NodeKind::Bool:
        return as_bool() == other.as_bool();
    case NodeKind::Integer:
        return as_integer() == other.as_integer();
    case NodeKind::Float: {
        double a = as_float();
        double b = other.as_float();
        if (std::isnan(a) || std::isnan(b)) {
            return std::isnan(a) && std::isnan(b);
        }
        return a == b;
    }
    case NodeKind::String:
        return as_string() == other.as_string();
    case NodeKind::Array: {
        const auto& arr1 = as_array();
        const auto& arr2 = other.as_array();
        if (arr1.size() != arr2.size()) {
            return false;
        }
        for (size_t i = 0; i < arr1.size(); ++i) {
            if (arr1[i] != arr2[i]) {
                return false;
            }
        }
        return true;
    }
    case NodeKind::Object:
        return as_object() == other.as_object();
    }
    return false;
}

} // namespace json5ast::json
