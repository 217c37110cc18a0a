//! # JSON5 Character Classes
//!
//! Character classification and UTF-8 helpers shared by the lexer, the
//! number decoder and the stringifier.
//!
//! `hex_digit_value()` is the single definition of a hex digit: the lexer
//! accepts a character as a hex digit exactly when this returns a value, and
//! the number decoder converts with the same function, so conversion of an
//! accepted literal cannot fail.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace json5ast::json::chars {

/// Unicode replacement character, the value of a lone surrogate escape.
constexpr char32_t REPLACEMENT = 0xFFFD;

/// Returns the value of a hex digit, or -1 if `c` is not one.
constexpr auto hex_digit_value(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

constexpr auto is_hex_digit(char c) -> bool {
    return hex_digit_value(c) >= 0;
}

constexpr auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

constexpr auto is_ascii_ident_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
}

constexpr auto is_ascii_ident_continue(char c) -> bool {
    return is_ascii_ident_start(c) || is_digit(c);
}

/// JSON5 line terminators: LF, CR, U+2028, U+2029.
constexpr auto is_line_terminator(char32_t cp) -> bool {
    return cp == '\n' || cp == '\r' || cp == 0x2028 || cp == 0x2029;
}

/// JSON5 white space, including line terminators and the Unicode `Zs` category.
constexpr auto is_whitespace(char32_t cp) -> bool {
    switch (cp) {
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
    case ' ':
    case 0x00A0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
    case 0xFEFF:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

/// Returned by `decode_utf8()` for bytes that do not start a valid sequence.
constexpr char32_t INVALID = 0xFFFFFFFF;

/// Decodes the UTF-8 sequence starting at `pos`.
///
/// Stores the number of bytes consumed in `length` (always at least 1).
/// Truncated sequences, overlong forms, encoded surrogates and values above
/// U+10FFFF decode to `INVALID` and consume one byte.
inline auto decode_utf8(std::string_view text, size_t pos, size_t& length) -> char32_t {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(text[i]); };

    length = 1;
    unsigned char lead = byte(pos);
    if (lead < 0x80) {
        return lead;
    }

    size_t count = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((lead & 0xE0) == 0xC0) {
        count = 2;
        cp = lead & 0x1F;
        min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        count = 3;
        cp = lead & 0x0F;
        min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        count = 4;
        cp = lead & 0x07;
        min = 0x10000;
    } else {
        return INVALID;
    }

    if (pos + count > text.size()) {
        return INVALID;
    }
    for (size_t i = 1; i < count; ++i) {
        if ((byte(pos + i) & 0xC0) != 0x80) {
            return INVALID;
        }
        cp = (cp << 6) | (byte(pos + i) & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return INVALID;
    }
    length = count;
    return cp;
}

/// Appends the UTF-8 encoding of `cp` to `out`.
inline void encode_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/// Returns `true` if `name` is a non-empty plain ASCII identifier.
///
/// Such names can be written as unquoted object keys.
inline auto is_plain_identifier(std::string_view name) -> bool {
    if (name.empty() || !is_ascii_ident_start(name.front())) {
        return false;
    }
    for (char c : name.substr(1)) {
        if (!is_ascii_ident_continue(c)) {
            return false;
        }
    }
    return true;
}

} // namespace json5ast::json::chars
