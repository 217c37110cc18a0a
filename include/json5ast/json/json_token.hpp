//! # JSON5 Tokens
//!
//! Token types produced by `JsonLexer` and consumed by `JsonParser`.
//!
//! ## Token Types
//!
//! | Token | Description | Example |
//! |-------|-------------|---------|
//! | `LBrace` | Left brace | `{` |
//! | `RBrace` | Right brace | `}` |
//! | `LBracket` | Left bracket | `[` |
//! | `RBracket` | Right bracket | `]` |
//! | `Colon` | Colon | `:` |
//! | `Comma` | Comma | `,` |
//! | `String` | Quoted string | `"hello"`, `'hello'` |
//! | `Number` | Numeric literal | `42`, `-.5`, `0x1F`, `+Infinity`, `NaN` |
//! | `Identifier` | Bare name (object keys) | `port`, `$id`, `abc` |
//! | `True` | Boolean true | `true` |
//! | `False` | Boolean false | `false` |
//! | `Null` | Null value | `null` |

#pragma once

#include "json5ast/common.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace json5ast::json {

/// Token types for the JSON5 lexer.
enum class JsonTokenKind : uint8_t {
    // Punctuators
    LBrace,   ///< `{` - Start of object
    RBrace,   ///< `}` - End of object
    LBracket, ///< `[` - Start of array
    RBracket, ///< `]` - End of array
    Colon,    ///< `:` - Key-value separator
    Comma,    ///< `,` - Element separator

    // Value tokens
    String,     ///< `"..."` or `'...'` - String literal
    Number,     ///< Any numeric literal, including `Infinity` and `NaN`
    Identifier, ///< Bare identifier, usable as an object key
    True,       ///< `true` - Boolean true
    False,      ///< `false` - Boolean false
    Null,       ///< `null` - Null value

    // Special tokens
    Eof,  ///< End of input
    Error ///< Lexer error (see `JsonLexer::error()`)
};

/// The lexical form of a numeric literal.
///
/// The parser decides `Integer` vs `Float` from the form, never from the value.
enum class NumberForm : uint8_t {
    Decimal,  ///< `42`, `-1.5`, `.5`, `1e10`
    Hex,      ///< `0x1F`, `-0XFF`
    Infinity, ///< `Infinity`, `+Infinity`, `-Infinity`
    NaN       ///< `NaN`, `+NaN`, `-NaN`
};

/// Returns a short description of a token kind for error messages (e.g., `"'{'"`).
[[nodiscard]] auto token_kind_to_string(JsonTokenKind kind) -> std::string_view;

/// A token produced by the JSON5 lexer.
///
/// For `String` and `Identifier` tokens, `string_value` contains the decoded
/// text. For `Number` tokens, `number_form` and `has_fraction_or_exponent`
/// describe the literal; the value itself is decoded by `decode_number()`.
struct JsonToken {
    /// The type of this token.
    JsonTokenKind kind = JsonTokenKind::Eof;

    /// The original text of this token (view into source).
    std::string_view lexeme;

    /// Source region of this token.
    SourceSpan span;

    /// For `String`/`Identifier` tokens: the unescaped content.
    std::string string_value;

    /// For `Number` tokens: the literal's lexical form.
    NumberForm number_form = NumberForm::Decimal;

    /// For decimal `Number` tokens: `true` if a `.` or exponent was present.
    bool has_fraction_or_exponent = false;

    /// Returns `true` if this token can name an object member.
    ///
    /// JSON5 keys are any identifier name, so the reserved words `true`,
    /// `false`, `null`, `Infinity` and `NaN` also qualify when written bare.
    [[nodiscard]] auto is_identifier_name() const -> bool {
        switch (kind) {
        case JsonTokenKind::Identifier:
        case JsonTokenKind::True:
        case JsonTokenKind::False:
        case JsonTokenKind::Null:
            return true;
        case JsonTokenKind::Number:
            return lexeme == "Infinity" || lexeme == "NaN";
        default:
            return false;
        }
    }
};

} // namespace json5ast::json
