//! # JSON5 Lexer
//!
//! Zero-copy tokenizer for JSON5 text. The lexer borrows the input as a
//! `std::string_view` and produces tokens one at a time, each tagged with its
//! source span.
//!
//! ## Lexical Extensions over JSON
//!
//! - `//` line comments and `/* */` block comments
//! - Single-quoted strings, `\x`, `\v`, `\0` escapes and line continuations
//! - Bare identifiers (used as object keys)
//! - Hexadecimal integers, leading `+`, leading or trailing `.`
//! - `Infinity` and `NaN`
//! - The Unicode white space set (`U+00A0`, `U+FEFF`, `U+2028`, ...)
//!
//! Input must be well-formed UTF-8. An invalid byte anywhere, including
//! inside strings and comments, is an `UnexpectedCharacter` error.
//!
//! ## Error Model
//!
//! The first lexical error is terminal: `next_token()` returns an `Error`
//! token, `error()` holds the `ParseError`, and every later call returns the
//! same `Error` token. No partial token is ever produced.
//!
//! ## Example
//!
//! ```cpp
//! JsonLexer lexer("{key: 'value'}");
//! while (true) {
//!     JsonToken tok = lexer.next_token();
//!     if (tok.kind == JsonTokenKind::Eof || tok.kind == JsonTokenKind::Error) break;
//!     // Process token...
//! }
//! ```

#pragma once

#include "json5ast/common.hpp"
#include "json5ast/json/json_error.hpp"
#include "json5ast/json/json_token.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace json5ast::json {

/// Zero-copy JSON5 lexer.
///
/// The sequence is forward-only; `reset()` restarts it from the beginning of
/// the same input.
class JsonLexer {
public:
    /// Creates a lexer for the given input.
    ///
    /// The input is borrowed and must outlive the lexer and its tokens.
    explicit JsonLexer(std::string_view input);

    /// Returns the next token from the input.
    ///
    /// Call this repeatedly until `Eof` or `Error` is returned.
    auto next_token() -> JsonToken;

    /// Rewinds to the start of the input and clears any error.
    void reset();

    /// Returns `true` once a lexical error has occurred.
    [[nodiscard]] auto has_error() const -> bool {
        return error_.has_value();
    }

    /// Returns the lexical error.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_optional_access` if `has_error()` is false.
    [[nodiscard]] auto error() const -> const ParseError& {
        return error_.value();
    }

    /// Returns the current position in the input.
    [[nodiscard]] auto location() const -> SourceLocation {
        return SourceLocation{.line = line_, .column = column_, .offset = pos_};
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    size_t token_start_ = 0;
    SourceLocation token_loc_;

    std::optional<ParseError> error_;
    JsonToken error_token_;

    /// Returns the current byte without advancing, or `'\0'` at end of input.
    [[nodiscard]] auto peek() const -> char;

    /// Returns the byte `n` positions ahead without advancing.
    [[nodiscard]] auto peek_at(size_t n) const -> char;

    /// Decodes the code point at the current position without advancing.
    [[nodiscard]] auto peek_codepoint() const -> char32_t;

    [[nodiscard]] auto is_at_end() const -> bool {
        return pos_ >= input_.size();
    }

    /// Consumes one code point, updating line and column tracking.
    auto advance() -> char32_t;

    /// Consumes one code point and appends its raw bytes to `out`.
    void advance_into(std::string& out);

    /// Skips white space and comments.
    ///
    /// Returns `false` after recording an error: an unterminated block comment
    /// or invalid UTF-8 inside a comment.
    auto skip_trivia() -> bool;

    /// Marks the current position as the start of a token.
    void begin_token();

    /// Creates a token spanning from the token start to the current position.
    auto make_token(JsonTokenKind kind) -> JsonToken;

    /// Records a lexical error over `[start, current)` and returns the error token.
    auto fail(ErrorKind kind, std::string msg, const SourceLocation& start) -> JsonToken;

    /// Returns `true` if the bytes at the current position are not valid UTF-8.
    [[nodiscard]] auto at_invalid_utf8() const -> bool;

    /// Consumes the offending byte and records an `UnexpectedCharacter` error.
    auto fail_invalid_utf8() -> JsonToken;

    /// Scans a string literal delimited by `quote`.
    auto scan_string(char quote) -> JsonToken;

    /// Scans one escape sequence starting at a backslash and appends its value.
    ///
    /// Returns `false` after recording an error.
    auto scan_escape(std::string& out) -> bool;

    /// Scans a `\uXXXX` escape (the backslash and `u` already consumed),
    /// combining UTF-16 surrogate pairs.
    auto scan_unicode_escape(const SourceLocation& escape_start, char32_t& out) -> bool;

    /// Reads `count` hex digits at `pos_ + at` without consuming them.
    [[nodiscard]] auto hex_value_at(size_t at, size_t count, char32_t& out) const -> bool;

    /// Scans a numeric literal, including signed `Infinity` and `NaN`.
    auto scan_number() -> JsonToken;

    /// Scans an identifier and classifies keywords.
    auto scan_word() -> JsonToken;

    /// Returns `true` if the current code point may continue an identifier.
    [[nodiscard]] auto at_identifier_continue() const -> bool;
};

/// Tokenizes the whole input.
///
/// # Returns
///
/// All tokens including the final `Eof`, or the first lexical error.
[[nodiscard]] auto tokenize(std::string_view input) -> Result<std::vector<JsonToken>, ParseError>;

} // namespace json5ast::json
