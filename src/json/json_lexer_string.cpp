//! # JSON5 Lexer - Strings and Identifiers
//!
//! This file implements string literal and identifier lexing.
//!
//! ## Escape Sequences
//!
//! | Escape | Character |
//! |--------|-----------|
//! | `\n` `\t` `\r` `\b` `\f` `\v` | Control characters |
//! | `\"` `\'` `\\` `\/` | The character itself |
//! | `\0` | NUL (must not be followed by a digit) |
//! | `\xHH` | Code point `U+00HH` |
//! | `\uXXXX` | UTF-16 code unit; surrogate pairs are combined |
//! | `\` + line terminator | Line continuation, produces nothing |
//! | `\` + other character | The character itself |
//!
//! `\1` through `\9` are rejected. A lone surrogate decodes to U+FFFD.
//!
//! ## Identifiers
//!
//! Identifiers may contain `\uXXXX` escapes; no other escape is allowed. The
//! keywords `true`, `false`, `null`, `Infinity` and `NaN` are only recognized
//! when written without escapes.

#include "json/json_chars.hpp"
#include "json5ast/json/json_lexer.hpp"

namespace json5ast::json {

namespace {

constexpr auto is_high_surrogate(char32_t unit) -> bool {
    return unit >= 0xD800 && unit <= 0xDBFF;
}

constexpr auto is_low_surrogate(char32_t unit) -> bool {
    return unit >= 0xDC00 && unit <= 0xDFFF;
}

} // namespace

auto JsonLexer::scan_string(char quote) -> JsonToken {
    // Skip opening quote
    advance();

    std::string value;
    while (true) {
        if (is_at_end()) {
            return fail(ErrorKind::UnterminatedString, "unterminated string", token_loc_);
        }

        char c = peek();
        if (c == quote) {
            advance();
            break;
        }
        if (c == '\n' || c == '\r') {
            return fail(ErrorKind::UnterminatedString,
                        "unterminated string: line break inside string literal", token_loc_);
        }
        if (c == '\\') {
            if (!scan_escape(value)) {
                return error_token_;
            }
            continue;
        }
        if (at_invalid_utf8()) {
            return fail_invalid_utf8();
        }
        advance_into(value);
    }

    JsonToken tok = make_token(JsonTokenKind::String);
    tok.string_value = std::move(value);
    return tok;
}

auto JsonLexer::scan_escape(std::string& out) -> bool {
    SourceLocation escape_start = location();
    advance(); // Skip backslash

    if (is_at_end()) {
        fail(ErrorKind::UnterminatedString, "unterminated string", token_loc_);
        return false;
    }

    char c = peek();
    switch (c) {
    case 'n':
        advance();
        out += '\n';
        return true;
    case 't':
        advance();
        out += '\t';
        return true;
    case 'r':
        advance();
        out += '\r';
        return true;
    case 'b':
        advance();
        out += '\b';
        return true;
    case 'f':
        advance();
        out += '\f';
        return true;
    case 'v':
        advance();
        out += '\v';
        return true;
    case '0':
        advance();
        if (chars::is_digit(peek())) {
            advance();
            fail(ErrorKind::InvalidEscape, "'\\0' must not be followed by a digit", escape_start);
            return false;
        }
        out += '\0';
        return true;
    case 'x': {
        char32_t value = 0;
        if (!hex_value_at(1, 2, value)) {
            advance();
            fail(ErrorKind::InvalidEscape, "'\\x' must be followed by two hex digits",
                 escape_start);
            return false;
        }
        advance();
        advance();
        advance();
        chars::encode_utf8(out, value);
        return true;
    }
    case 'u': {
        advance();
        char32_t cp = 0;
        if (!scan_unicode_escape(escape_start, cp)) {
            return false;
        }
        chars::encode_utf8(out, cp);
        return true;
    }
    case '\r':
        // Line continuation; CR LF is a single terminator
        advance();
        if (peek() == '\n') {
            advance();
        }
        return true;
    case '\n':
        advance();
        return true;
    default:
        break;
    }

    if (chars::is_digit(c)) {
        advance();
        fail(ErrorKind::InvalidEscape, std::string("invalid escape sequence '\\") + c + "'",
             escape_start);
        return false;
    }

    char32_t cp = peek_codepoint();
    if (cp == chars::INVALID) {
        fail_invalid_utf8();
        return false;
    }
    if (cp == 0x2028 || cp == 0x2029) {
        advance();
        return true;
    }

    // Identity escape: `\"`, `\'`, `\\`, `\/` and any other character
    advance_into(out);
    return true;
}

auto JsonLexer::hex_value_at(size_t at, size_t count, char32_t& out) const -> bool {
    if (pos_ + at + count > input_.size()) {
        return false;
    }

    char32_t value = 0;
    for (size_t i = 0; i < count; ++i) {
        int digit = chars::hex_digit_value(input_[pos_ + at + i]);
        if (digit < 0) {
            return false;
        }
        value = (value << 4) | static_cast<char32_t>(digit);
    }
    out = value;
    return true;
}

auto JsonLexer::scan_unicode_escape(const SourceLocation& escape_start, char32_t& out) -> bool {
    char32_t unit = 0;
    if (!hex_value_at(0, 4, unit)) {
        fail(ErrorKind::InvalidEscape, "'\\u' must be followed by four hex digits", escape_start);
        return false;
    }
    for (int i = 0; i < 4; ++i) {
        advance();
    }

    if (is_high_surrogate(unit)) {
        char32_t low = 0;
        if (peek() == '\\' && peek_at(1) == 'u' && hex_value_at(2, 4, low) &&
            is_low_surrogate(low)) {
            for (int i = 0; i < 6; ++i) {
                advance();
            }
            out = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
            return true;
        }
        out = chars::REPLACEMENT;
        return true;
    }

    out = is_low_surrogate(unit) ? chars::REPLACEMENT : unit;
    return true;
}

auto JsonLexer::at_identifier_continue() const -> bool {
    if (is_at_end()) {
        return false;
    }
    char c = peek();
    if (static_cast<unsigned char>(c) < 0x80) {
        return chars::is_ascii_ident_continue(c);
    }
    char32_t cp = peek_codepoint();
    return cp != chars::INVALID && !chars::is_whitespace(cp);
}

auto JsonLexer::scan_word() -> JsonToken {
    std::string name;
    bool escaped = false;

    while (!is_at_end()) {
        if (peek() == '\\') {
            SourceLocation escape_start = location();
            if (peek_at(1) != 'u') {
                advance();
                if (!is_at_end()) {
                    advance();
                }
                return fail(ErrorKind::InvalidEscape,
                            "only '\\u' escapes are allowed in identifiers", escape_start);
            }
            advance();
            advance();

            char32_t cp = 0;
            if (!scan_unicode_escape(escape_start, cp)) {
                return error_token_;
            }

            bool valid = !chars::is_whitespace(cp);
            if (cp < 0x80) {
                auto c = static_cast<char>(cp);
                valid = name.empty() ? chars::is_ascii_ident_start(c)
                                     : chars::is_ascii_ident_continue(c);
            }
            if (!valid) {
                return fail(ErrorKind::InvalidEscape,
                            "escaped character is not valid in an identifier", escape_start);
            }

            chars::encode_utf8(name, cp);
            escaped = true;
            continue;
        }

        if (!at_identifier_continue()) {
            break;
        }
        advance_into(name);
    }

    if (!escaped) {
        if (name == "true") {
            return make_token(JsonTokenKind::True);
        }
        if (name == "false") {
            return make_token(JsonTokenKind::False);
        }
        if (name == "null") {
            return make_token(JsonTokenKind::Null);
        }
        if (name == "Infinity" || name == "NaN") {
            JsonToken tok = make_token(JsonTokenKind::Number);
            tok.number_form = name == "NaN" ? NumberForm::NaN : NumberForm::Infinity;
            return tok;
        }
    }

    JsonToken tok = make_token(JsonTokenKind::Identifier);
    tok.string_value = std::move(name);
    return tok;
}

} // namespace json5ast::json
