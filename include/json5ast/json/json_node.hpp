//! # JSON5 Node Model
//!
//! This module provides `JsonNode`, the value tree produced by the JSON5
//! parser. Every node carries its decoded value and the `SourceSpan` it
//! occupied in the parsed text, so callers can report semantic errors
//! ("port must be positive") at the original source location.
//!
//! ## Node Kinds
//!
//! | JSON5 Input | Kind | C++ Storage | Accessor |
//! |-------------|------|-------------|----------|
//! | `null` | `Null` | `std::monostate` | - |
//! | `true` / `false` | `Bool` | `bool` | `as_bool()` |
//! | `42`, `0x1F` | `Integer` | `int64_t` | `as_integer()` |
//! | `1.0`, `1e2`, `Infinity` | `Float` | `double` | `as_float()` |
//! | `"text"`, `'text'` | `String` | `std::string` | `as_string()` |
//! | `[...]` | `Array` | `Box<JsonArray>` | `as_array()`, `operator[]` |
//! | `{...}` | `Object` | `Box<JsonObject>` | `as_object()`, `get()` |
//!
//! `Integer` vs `Float` is decided by the literal's form, never its value:
//! `1.0` is a `Float`. Decimal and hex integers that overflow `int64_t`
//! become `Float`.
//!
//! ## Ownership
//!
//! Nodes are move-only; `clone()` makes an explicit deep copy. Arrays and
//! objects are boxed so `JsonNode` has a fixed size.
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse("{port: -1}");
//! const JsonNode& root = unwrap(result);
//! if (const JsonNode* port = root.get("port"); port && port->as_integer() < 0) {
//!     std::cerr << render_diagnostic(text, port->span(), "port must be positive");
//! }
//! ```

#pragma once

#include "json5ast/common.hpp"
#include "json5ast/json/ordered_map.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace json5ast::json {

// ============================================================================
// Forward Declarations and Type Aliases
// ============================================================================

class JsonNode;
struct StringifyOptions;

/// A JSON5 array: child nodes in source order.
using JsonArray = std::vector<JsonNode>;

/// A JSON5 object: members in source order with unique keys.
using JsonObject = OrderedMap<JsonNode>;

/// The kind of value a `JsonNode` holds.
enum class NodeKind : uint8_t {
    Null,
    Bool,
    Integer,
    Float,
    String,
    Array,
    Object
};

/// Returns the display name of a node kind (e.g., `"Integer"`).
[[nodiscard]] auto node_kind_name(NodeKind kind) -> std::string_view;

// ============================================================================
// JsonNode
// ============================================================================

/// A parsed JSON5 value with its source span.
///
/// Accessors for a specific kind throw `std::bad_variant_access` when the
/// node holds a different kind; check `kind()` or an `is_*()` query first.
///
/// # Equality
///
/// `operator==` compares values and ignores spans. An `Integer` never equals
/// a `Float`, two `NaN` floats are equal, and object members are compared in
/// order.
class JsonNode {
public:
    /// The null type (empty state).
    using Null = std::monostate;

    /// The variant type holding all possible node values.
    using ValueVariant = std::variant<Null,             // null
                                      bool,             // boolean
                                      int64_t,          // integer
                                      double,           // float
                                      std::string,      // string
                                      Box<JsonArray>,   // array (boxed)
                                      Box<JsonObject>>; // object (boxed)

    // ========================================================================
    // Constructors
    // ========================================================================

    /// Default constructor creates a `null` node with an empty span.
    JsonNode() : data_(Null{}) {}

    /// Constructs a `null` node.
    explicit JsonNode(std::nullptr_t, SourceSpan span = {}) : data_(Null{}), span_(span) {}

    /// Constructs a boolean node.
    explicit JsonNode(bool value, SourceSpan span = {}) : data_(value), span_(span) {}

    /// Constructs an integer node from `int`.
    explicit JsonNode(int value, SourceSpan span = {})
        : data_(static_cast<int64_t>(value)), span_(span) {}

    /// Constructs an integer node.
    explicit JsonNode(int64_t value, SourceSpan span = {}) : data_(value), span_(span) {}

    /// Constructs a float node.
    explicit JsonNode(double value, SourceSpan span = {}) : data_(value), span_(span) {}

    /// Constructs a string node from a C string.
    explicit JsonNode(const char* value, SourceSpan span = {})
        : data_(std::string(value)), span_(span) {}

    /// Constructs a string node.
    explicit JsonNode(std::string value, SourceSpan span = {})
        : data_(std::move(value)), span_(span) {}

    /// Constructs an array node.
    ///
    /// # Arguments
    ///
    /// * `value` - The elements (moved)
    /// * `span` - Source region from `[` to `]`
    explicit JsonNode(JsonArray value, SourceSpan span = {});

    /// Constructs an object node.
    ///
    /// # Arguments
    ///
    /// * `value` - The members (moved)
    /// * `span` - Source region from `{` to `}`
    explicit JsonNode(JsonObject value, SourceSpan span = {});

    JsonNode(JsonNode&&) noexcept = default;
    auto operator=(JsonNode&&) noexcept -> JsonNode& = default;
    JsonNode(const JsonNode&) = delete;
    auto operator=(const JsonNode&) -> JsonNode& = delete;
    ~JsonNode() = default;

    // ========================================================================
    // Type Queries
    // ========================================================================

    /// Returns the kind of value this node holds.
    [[nodiscard]] auto kind() const -> NodeKind {
        return static_cast<NodeKind>(data_.index());
    }

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data_);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data_);
    }

    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<int64_t>(data_);
    }

    [[nodiscard]] auto is_float() const -> bool {
        return std::holds_alternative<double>(data_);
    }

    /// Returns `true` if this node is an `Integer` or a `Float`.
    [[nodiscard]] auto is_number() const -> bool {
        return is_integer() || is_float();
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data_);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data_);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data_);
    }

    // ========================================================================
    // Type Accessors
    // ========================================================================

    /// Gets the boolean value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a boolean.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data_);
    }

    /// Gets the integer value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an `Integer`.
    [[nodiscard]] auto as_integer() const -> int64_t {
        return std::get<int64_t>(data_);
    }

    /// Gets the float value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a `Float`.
    [[nodiscard]] auto as_float() const -> double {
        return std::get<double>(data_);
    }

    /// Gets an `Integer` or `Float` value as `double`.
    ///
    /// Integers beyond 2^53 may lose precision.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a number.
    [[nodiscard]] auto as_number() const -> double {
        if (const auto* value = std::get_if<int64_t>(&data_)) {
            return static_cast<double>(*value);
        }
        return std::get<double>(data_);
    }

    /// Gets the string value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a string.
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data_);
    }

    /// Gets the array elements.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an array.
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data_);
    }

    /// Gets the object members.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an object.
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data_);
    }

    // ========================================================================
    // Container Access
    // ========================================================================

    /// Gets a member of an object by key.
    ///
    /// # Returns
    ///
    /// Pointer to the member, or `nullptr` if this is not an object or the
    /// key does not exist.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonNode*;

    /// Returns `true` if this is an object containing `key`.
    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    /// Gets an array element by index.
    ///
    /// # Panics
    ///
    /// Throws if this is not an array or index is out of bounds.
    [[nodiscard]] auto operator[](size_t index) const -> const JsonNode& {
        return as_array().at(index);
    }

    /// Gets the number of elements or members.
    ///
    /// Returns `0` for scalar nodes.
    [[nodiscard]] auto size() const -> size_t;

    // ========================================================================
    // Source Information
    // ========================================================================

    /// Returns the source region this node was parsed from.
    ///
    /// Nodes built in code have an empty span at offset 0.
    [[nodiscard]] auto span() const -> const SourceSpan& {
        return span_;
    }

    // ========================================================================
    // Copying and Comparison
    // ========================================================================

    /// Returns a deep copy of this node, spans included.
    [[nodiscard]] auto clone() const -> JsonNode;

    /// Compares two nodes by value, ignoring spans.
    [[nodiscard]] auto operator==(const JsonNode& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonNode& other) const -> bool {
        return !(*this == other);
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Renders this node as compact JSON5.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Renders this node as JSON5 indented with `indent` spaces per level.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

private:
    ValueVariant data_;
    SourceSpan span_;
};

} // namespace json5ast::json
