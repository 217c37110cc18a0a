//! # JSON5 Error Types
//!
//! This module provides the error type returned by the JSON5 lexer and parser.
//! Every error carries the span of the offending source text.
//!
//! ## Error Taxonomy
//!
//! | Category | Kinds |
//! |----------|-------|
//! | Lex | `UnterminatedString`, `InvalidEscape`, `InvalidNumber`, `UnexpectedCharacter` |
//! | Syntax | `UnexpectedToken`, `UnterminatedStructure`, `TrailingContent`, `DuplicateKey`, `DepthLimitExceeded` |
//!
//! Semantic errors ("port must be positive") are never produced here; callers
//! build them from node spans and may render them with `render_diagnostic()`.
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse("{\"a\": 1");
//! if (is_err(result)) {
//!     const auto& error = unwrap_err(result);
//!     std::cerr << error.to_string() << std::endl;
//!     // Output: "line 1, column 1: unclosed '{'"
//! }
//! ```

#pragma once

#include "json5ast/common.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace json5ast::json {

/// The specific failure reported by a `ParseError`.
enum class ErrorKind : uint8_t {
    // Lexical errors
    UnterminatedString,  ///< String reaches a raw newline or end of input
    InvalidEscape,       ///< Malformed escape sequence in a string or identifier
    InvalidNumber,       ///< Malformed numeric literal
    UnexpectedCharacter, ///< Character that cannot start any token

    // Syntax errors
    UnexpectedToken,       ///< Token not allowed at this position
    UnterminatedStructure, ///< End of input inside an object or array
    TrailingContent,       ///< Content after the top-level value
    DuplicateKey,          ///< Key repeated within one object
    DepthLimitExceeded     ///< Nesting deeper than `ParseOptions::max_depth`
};

/// Broad classification of an `ErrorKind`.
enum class ErrorCategory : uint8_t {
    Lex,   ///< Malformed token
    Syntax ///< Malformed grammar
};

/// Returns the display name of an error kind (e.g., `"UnexpectedToken"`).
[[nodiscard]] auto error_kind_name(ErrorKind kind) -> std::string_view;

/// Returns the category an error kind belongs to.
[[nodiscard]] auto error_category(ErrorKind kind) -> ErrorCategory;

/// An error encountered while lexing or parsing JSON5 text.
///
/// # Fields
///
/// - `kind`: What went wrong
/// - `message`: Human-readable description
/// - `span`: Source region of the offending token (or opening bracket for
///   `UnterminatedStructure`)
/// - `expected`: For `UnexpectedToken`, descriptions of the acceptable tokens
/// - `found`: For `UnexpectedToken`, description of the token actually seen
struct ParseError {
    ErrorKind kind = ErrorKind::UnexpectedToken;
    std::string message;
    SourceSpan span;
    std::vector<std::string> expected;
    std::string found;

    /// Creates an error of the given kind at `span`.
    static auto make(ErrorKind kind, std::string msg, const SourceSpan& span) -> ParseError {
        return ParseError{kind, std::move(msg), span, {}, {}};
    }

    /// Creates an `UnexpectedToken` error listing what the parser would have accepted.
    static auto unexpected(std::vector<std::string> expected, std::string found,
                           const SourceSpan& span) -> ParseError;

    /// Returns whether this is a lexical or a syntax error.
    [[nodiscard]] auto category() const -> ErrorCategory {
        return error_category(kind);
    }

    /// 1-based line of the error start.
    [[nodiscard]] auto line() const -> size_t {
        return span.start.line;
    }

    /// 1-based column of the error start.
    [[nodiscard]] auto column() const -> size_t {
        return span.start.column;
    }

    /// Formats the error as a human-readable string.
    ///
    /// - With line and column: `"line X, column Y: message"`
    /// - Without location: `"message"`
    [[nodiscard]] auto to_string() const -> std::string;

    /// Renders the error with the offending source line and a caret underline.
    ///
    /// `source` must be the text that was parsed.
    [[nodiscard]] auto render(std::string_view source) const -> std::string;
};

} // namespace json5ast::json
