//! # JSON5 Lexer - Numbers
//!
//! This file implements numeric literal lexing.
//!
//! ## Number Formats
//!
//! | Format | Example | Form |
//! |--------|---------|------|
//! | Integer | `42`, `-7`, `+1` | `Decimal` |
//! | Fraction | `1.5`, `.5`, `5.` | `Decimal` |
//! | Exponent | `1e10`, `2.5E-3` | `Decimal` |
//! | Hexadecimal | `0x1F`, `-0XFF` | `Hex` |
//! | Infinity | `Infinity`, `-Infinity` | `Infinity` |
//! | NaN | `NaN`, `+NaN` | `NaN` |
//!
//! The lexer only validates the literal; `decode_number()` converts it.
//!
//! ## Rejected Forms
//!
//! - Leading zeros: `01`, `-007`
//! - Missing digits: `+`, `.`, `1e`, `0x`
//! - A literal immediately followed by an identifier character, digit or `.`:
//!   `1a`, `0x1G`, `1.2.3`

#include "json/json_chars.hpp"
#include "json5ast/json/json_lexer.hpp"

namespace json5ast::json {

auto JsonLexer::scan_number() -> JsonToken {
    NumberForm form = NumberForm::Decimal;
    bool has_fraction_or_exponent = false;

    auto consume_digits = [this]() {
        bool any = false;
        while (chars::is_digit(peek())) {
            advance();
            any = true;
        }
        return any;
    };

    if (peek() == '+' || peek() == '-') {
        advance();
    }

    if (peek() == 'I' || peek() == 'N') {
        // Signed Infinity or NaN; the unsigned forms are lexed as words
        size_t word_start = pos_;
        while (chars::is_ascii_ident_continue(peek())) {
            advance();
        }
        std::string_view word = input_.substr(word_start, pos_ - word_start);
        if (word == "Infinity") {
            form = NumberForm::Infinity;
        } else if (word == "NaN") {
            form = NumberForm::NaN;
        } else {
            std::string text(input_.substr(token_start_, pos_ - token_start_));
            return fail(ErrorKind::InvalidNumber, "invalid number '" + text + "'", token_loc_);
        }
    } else if (peek() == '0' && (peek_at(1) == 'x' || peek_at(1) == 'X')) {
        advance();
        advance();
        if (!chars::is_hex_digit(peek())) {
            return fail(ErrorKind::InvalidNumber, "expected hex digits after '0x'", token_loc_);
        }
        while (chars::is_hex_digit(peek())) {
            advance();
        }
        form = NumberForm::Hex;
    } else {
        bool int_digits = false;
        if (peek() == '0') {
            advance();
            int_digits = true;
            if (chars::is_digit(peek())) {
                consume_digits();
                return fail(ErrorKind::InvalidNumber, "leading zeros are not allowed", token_loc_);
            }
        } else {
            int_digits = consume_digits();
        }

        bool frac_digits = false;
        if (peek() == '.') {
            advance();
            has_fraction_or_exponent = true;
            frac_digits = consume_digits();
        }

        if (!int_digits && !frac_digits) {
            return fail(ErrorKind::InvalidNumber, "expected digits in number", token_loc_);
        }

        if (peek() == 'e' || peek() == 'E') {
            advance();
            has_fraction_or_exponent = true;
            if (peek() == '+' || peek() == '-') {
                advance();
            }
            if (!consume_digits()) {
                return fail(ErrorKind::InvalidNumber, "expected digits in exponent", token_loc_);
            }
        }
    }

    // The literal must end here: `1a`, `0x1G`, `1.2.3` and `NaNx` are all invalid
    if (peek() == '.' || peek() == '\\' || at_identifier_continue()) {
        while (peek() == '.' || at_identifier_continue()) {
            advance();
        }
        std::string text(input_.substr(token_start_, pos_ - token_start_));
        return fail(ErrorKind::InvalidNumber, "invalid number '" + text + "'", token_loc_);
    }

    JsonToken tok = make_token(JsonTokenKind::Number);
    tok.number_form = form;
    tok.has_fraction_or_exponent = has_fraction_or_exponent;
    return tok;
}

} // namespace json5ast::json
