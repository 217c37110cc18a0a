//! # JSON5 Lexer Core
//!
//! This file implements core lexer functionality:
//!
//! - **Character access**: `peek()`, `advance()` with line/column tracking
//! - **Trivia**: white space, `//` and `/* */` comments
//! - **Token creation**: `make_token()`, `fail()`
//! - **Dispatch**: `next_token()` selects the scanner for the next token
//!
//! String, identifier and number scanners live in `json_lexer_string.cpp` and
//! `json_lexer_number.cpp`.

#include "json/json_chars.hpp"
#include "json5ast/json/json_lexer.hpp"
#include "json5ast/log/log.hpp"

namespace json5ast::json {

namespace {

/// Formats a byte for an error message, escaping non-printable ones.
auto describe_byte(char c) -> std::string {
    if (c >= 0x20 && c < 0x7F) {
        return std::string(1, c);
    }
    constexpr const char* HEX = "0123456789ABCDEF";
    auto b = static_cast<unsigned char>(c);
    return std::string("\\x") + HEX[b >> 4] + HEX[b & 0xF];
}

} // namespace

auto token_kind_to_string(JsonTokenKind kind) -> std::string_view {
    switch (kind) {
    case JsonTokenKind::LBrace:
        return "'{'";
    case JsonTokenKind::RBrace:
        return "'}'";
    case JsonTokenKind::LBracket:
        return "'['";
    case JsonTokenKind::RBracket:
        return "']'";
    case JsonTokenKind::Colon:
        return "':'";
    case JsonTokenKind::Comma:
        return "','";
    case JsonTokenKind::String:
        return "string";
    case JsonTokenKind::Number:
        return "number";
    case JsonTokenKind::Identifier:
        return "identifier";
    case JsonTokenKind::True:
        return "'true'";
    case JsonTokenKind::False:
        return "'false'";
    case JsonTokenKind::Null:
        return "'null'";
    case JsonTokenKind::Eof:
        return "end of input";
    case JsonTokenKind::Error:
        return "invalid token";
    }
    return "unknown token";
}

JsonLexer::JsonLexer(std::string_view input) : input_(input) {}

void JsonLexer::reset() {
    pos_ = 0;
    line_ = 1;
    column_ = 1;
    token_start_ = 0;
    token_loc_ = {};
    error_.reset();
    error_token_ = {};
}

auto JsonLexer::peek() const -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    return input_[pos_];
}

auto JsonLexer::peek_at(size_t n) const -> char {
    if (pos_ + n >= input_.size()) {
        return '\0';
    }
    return input_[pos_ + n];
}

auto JsonLexer::peek_codepoint() const -> char32_t {
    if (is_at_end()) {
        return 0;
    }
    size_t length = 0;
    return chars::decode_utf8(input_, pos_, length);
}

auto JsonLexer::advance() -> char32_t {
    if (is_at_end()) {
        return 0;
    }
    size_t length = 0;
    char32_t cp = chars::decode_utf8(input_, pos_, length);
    pos_ += length;

    // CR LF is one terminator: the LF starts the new line
    bool new_line = cp == '\n' || cp == 0x2028 || cp == 0x2029 || (cp == '\r' && peek() != '\n');
    if (new_line) {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return cp;
}

void JsonLexer::advance_into(std::string& out) {
    size_t before = pos_;
    advance();
    out.append(input_.substr(before, pos_ - before));
}

auto JsonLexer::skip_trivia() -> bool {
    while (!is_at_end()) {
        char c = peek();

        if (c == '/' && peek_at(1) == '/') {
            while (!is_at_end() && !chars::is_line_terminator(peek_codepoint())) {
                if (at_invalid_utf8()) {
                    fail_invalid_utf8();
                    return false;
                }
                advance();
            }
            continue;
        }

        if (c == '/' && peek_at(1) == '*') {
            begin_token();
            advance();
            advance();
            while (!(peek() == '*' && peek_at(1) == '/')) {
                if (is_at_end()) {
                    fail(ErrorKind::UnexpectedCharacter, "unterminated block comment", token_loc_);
                    return false;
                }
                if (at_invalid_utf8()) {
                    fail_invalid_utf8();
                    return false;
                }
                advance();
            }
            advance();
            advance();
            continue;
        }

        if (!chars::is_whitespace(peek_codepoint())) {
            return true;
        }
        advance();
    }
    return true;
}

void JsonLexer::begin_token() {
    token_start_ = pos_;
    token_loc_ = location();
}

auto JsonLexer::make_token(JsonTokenKind kind) -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.lexeme = input_.substr(token_start_, pos_ - token_start_);
    tok.span = SourceSpan{token_loc_, location()};
    return tok;
}

auto JsonLexer::at_invalid_utf8() const -> bool {
    return !is_at_end() && static_cast<unsigned char>(peek()) >= 0x80 &&
           peek_codepoint() == chars::INVALID;
}

auto JsonLexer::fail_invalid_utf8() -> JsonToken {
    SourceLocation start = location();
    char c = peek();
    advance();
    return fail(ErrorKind::UnexpectedCharacter, "invalid UTF-8 byte '" + describe_byte(c) + "'",
                start);
}

auto JsonLexer::fail(ErrorKind kind, std::string msg, const SourceLocation& start) -> JsonToken {
    SourceSpan span{start, location()};
    JSON5AST_LOG_DEBUG("lexer", "line " << span.start.line << ", column " << span.start.column
                                        << ": " << msg);

    error_ = ParseError::make(kind, std::move(msg), span);

    error_token_ = JsonToken{};
    error_token_.kind = JsonTokenKind::Error;
    error_token_.lexeme = input_.substr(start.offset, pos_ - start.offset);
    error_token_.span = span;
    return error_token_;
}

auto JsonLexer::next_token() -> JsonToken {
    if (error_) {
        return error_token_;
    }
    if (!skip_trivia()) {
        return error_token_;
    }

    begin_token();
    if (is_at_end()) {
        return make_token(JsonTokenKind::Eof);
    }

    char c = peek();
    switch (c) {
    case '{':
        advance();
        return make_token(JsonTokenKind::LBrace);
    case '}':
        advance();
        return make_token(JsonTokenKind::RBrace);
    case '[':
        advance();
        return make_token(JsonTokenKind::LBracket);
    case ']':
        advance();
        return make_token(JsonTokenKind::RBracket);
    case ':':
        advance();
        return make_token(JsonTokenKind::Colon);
    case ',':
        advance();
        return make_token(JsonTokenKind::Comma);
    case '"':
    case '\'':
        return scan_string(c);
    case '+':
    case '-':
    case '.':
    case '0':
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '6':
    case '7':
    case '8':
    case '9':
        return scan_number();
    default:
        break;
    }

    if (at_invalid_utf8()) {
        return fail_invalid_utf8();
    }

    // Trivia is already skipped, so any remaining non-ASCII code point is
    // treated as part of an identifier.
    if (chars::is_ascii_ident_start(c) || c == '\\' || static_cast<unsigned char>(c) >= 0x80) {
        return scan_word();
    }

    advance();
    return fail(ErrorKind::UnexpectedCharacter, "unexpected character '" + describe_byte(c) + "'",
                token_loc_);
}

auto tokenize(std::string_view input) -> Result<std::vector<JsonToken>, ParseError> {
    JsonLexer lexer(input);
    std::vector<JsonToken> tokens;

    while (true) {
        JsonToken tok = lexer.next_token();
        if (tok.kind == JsonTokenKind::Error) {
            return lexer.error();
        }
        bool done = tok.kind == JsonTokenKind::Eof;
        tokens.push_back(std::move(tok));
        if (done) {
            break;
        }
    }

    JSON5AST_LOG_TRACE("lexer", "tokenized " << input.size() << " bytes into " << tokens.size()
                                             << " tokens");
    return tokens;
}

} // namespace json5ast::json
