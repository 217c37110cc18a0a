//! # JSON5 Parser
//!
//! This module provides the recursive descent parser that builds a
//! `JsonNode` tree from JSON5 text. Every node carries the span of the text
//! it was parsed from.
//!
//! ## Grammar
//!
//! ```text
//! value  := object | array | string | number | 'true' | 'false' | 'null'
//! object := '{' (member (',' member)* ','? )? '}'
//! member := (identifier | string) ':' value
//! array  := '[' (value (',' value)* ','? )? ']'
//! ```
//!
//! Keys may be quoted strings or bare identifier names, including reserved
//! words such as `null` or `Infinity`; both spellings produce the same key.
//!
//! ## Errors
//!
//! Parsing is all-or-nothing. The first error ends the parse and is returned
//! with its span:
//!
//! | Kind | Span |
//! |------|------|
//! | Lexical errors | The malformed token |
//! | `UnexpectedToken` | The unexpected token |
//! | `UnterminatedStructure` | The innermost unclosed `{` or `[` |
//! | `DuplicateKey` | The repeated key |
//! | `TrailingContent` | The first token after the value |
//! | `DepthLimitExceeded` | The `{` or `[` that went too deep |
//!
//! ## Example
//!
//! ```cpp
//! #include "json5ast/json/json_parser.hpp"
//! using namespace json5ast::json;
//!
//! auto result = parse("{name: 'Alice', tags: ['a', 'b',],}");
//! if (is_ok(result)) {
//!     const JsonNode& root = unwrap(result);
//!     std::cout << root.get("name")->as_string() << std::endl;
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "json5ast/common.hpp"
#include "json5ast/json/json_error.hpp"
#include "json5ast/json/json_lexer.hpp"
#include "json5ast/json/json_node.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace json5ast::json {

// ============================================================================
// Options
// ============================================================================

/// How the parser treats a key repeated within one object.
enum class DuplicateKeyPolicy : uint8_t {
    Error,   ///< Fail with `DuplicateKey`
    LastWins ///< Replace the earlier value, keeping the key's first position
};

/// Parser configuration.
struct ParseOptions {
    /// Maximum nesting of arrays and objects.
    size_t max_depth = 1000;

    /// Handling of repeated object keys.
    DuplicateKeyPolicy duplicate_keys = DuplicateKeyPolicy::Error;
};

// ============================================================================
// Parser
// ============================================================================

/// Recursive descent JSON5 parser.
///
/// A parser instance parses its input once.
///
/// # Example
///
/// ```cpp
/// JsonParser parser("[1, 2, 3,]");
/// auto result = parser.parse();
/// if (is_ok(result)) {
///     auto& arr = unwrap(result);
///     // Use array...
/// }
/// ```
class JsonParser {
public:
    /// Creates a parser for the given input.
    ///
    /// The input is borrowed and must outlive the parser.
    explicit JsonParser(std::string_view input, ParseOptions options = {});

    /// Parses the input as exactly one JSON5 value.
    ///
    /// # Returns
    ///
    /// `Ok(JsonNode)` on success, `Err(ParseError)` on failure.
    [[nodiscard]] auto parse() -> Result<JsonNode, ParseError>;

private:
    /// An `{` or `[` whose closing bracket has not been seen yet.
    struct OpenStructure {
        JsonTokenKind kind;
        SourceSpan span;
    };

    JsonLexer lexer_;
    ParseOptions options_;
    JsonToken current_;
    std::vector<OpenStructure> open_;

    /// Advances to the next token.
    void advance();

    /// Checks if the current token is of the expected kind.
    [[nodiscard]] auto check(JsonTokenKind kind) const -> bool;

    /// Advances if the current token matches, returns true if matched.
    auto match(JsonTokenKind kind) -> bool;

    /// Builds the error for a current token that is not in `expected`.
    ///
    /// Lexer errors are passed through, and end of input inside an open
    /// structure becomes `UnterminatedStructure`.
    [[nodiscard]] auto unexpected(std::vector<std::string> expected) const -> ParseError;

    /// Parses a value (any JSON5 type).
    auto parse_value() -> Result<JsonNode, ParseError>;

    /// Parses an object.
    auto parse_object() -> Result<JsonNode, ParseError>;

    /// Parses an array.
    auto parse_array() -> Result<JsonNode, ParseError>;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Parses JSON5 text into a node tree.
///
/// This is the main entry point for parsing.
///
/// # Arguments
///
/// * `input` - The JSON5 text to parse
/// * `options` - Depth limit and duplicate key policy
///
/// # Returns
///
/// `Ok(JsonNode)` on success, `Err(ParseError)` on failure.
[[nodiscard]] auto parse(std::string_view input, const ParseOptions& options = {})
    -> Result<JsonNode, ParseError>;

} // namespace json5ast::json
