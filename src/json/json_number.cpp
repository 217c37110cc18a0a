//! # JSON5 Number Decoding
//!
//! Implements `decode_number()`. Hex digits are converted with the same
//! `hex_digit_value()` table the lexer validated them with.

#include "json5ast/json/json_number.hpp"

#include "json/json_chars.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>

namespace json5ast::json {

namespace {

constexpr uint64_t INT64_MAX_MAGNITUDE = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

/// Decodes the digits after `0x`, falling back to `Float` past `int64_t` range.
auto decode_hex(std::string_view digits, bool negative, const SourceSpan& span) -> JsonNode {
    uint64_t magnitude = 0;
    double approx = 0.0;
    bool overflow = false;

    for (char c : digits) {
        auto digit = static_cast<uint64_t>(chars::hex_digit_value(c));
        approx = approx * 16.0 + static_cast<double>(digit);
        if (magnitude > (std::numeric_limits<uint64_t>::max() >> 4)) {
            overflow = true;
        } else {
            magnitude = (magnitude << 4) | digit;
        }
    }

    if (!overflow) {
        if (!negative && magnitude <= INT64_MAX_MAGNITUDE) {
            return JsonNode(static_cast<int64_t>(magnitude), span);
        }
        if (negative && magnitude <= INT64_MAX_MAGNITUDE + 1) {
            // -(2^63) is representable although 2^63 is not
            if (magnitude == INT64_MAX_MAGNITUDE + 1) {
                return JsonNode(std::numeric_limits<int64_t>::min(), span);
            }
            return JsonNode(-static_cast<int64_t>(magnitude), span);
        }
    }
    return JsonNode(negative ? -approx : approx, span);
}

} // namespace

auto decode_number(const JsonToken& token) -> JsonNode {
    std::string_view text = token.lexeme;
    bool negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    switch (token.number_form) {
    case NumberForm::Infinity: {
        double inf = std::numeric_limits<double>::infinity();
        return JsonNode(negative ? -inf : inf, token.span);
    }
    case NumberForm::NaN:
        return JsonNode(std::numeric_limits<double>::quiet_NaN(), token.span);
    case NumberForm::Hex:
        return decode_hex(text.substr(2), negative, token.span);
    case NumberForm::Decimal:
        break;
    }

    // from_chars and strtod accept '-' but not '+'
    std::string_view digits = token.lexeme;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }

    if (!token.has_fraction_or_exponent) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec == std::errc{} && ptr == digits.data() + digits.size()) {
            return JsonNode(value, token.span);
        }
        // Out of int64_t range: fall through to Float
    }

    std::string buffer(digits);
    double value = std::strtod(buffer.c_str(), nullptr);
    return JsonNode(value, token.span);
}

} // namespace json5ast::json
