//! # JSON5 Number Decoding
//!
//! Converts a validated `Number` token into an `Integer` or `Float` node.
//!
//! ## Conversion Rules
//!
//! | Literal | Result |
//! |---------|--------|
//! | Decimal without `.` or exponent, in `int64_t` range | `Integer` |
//! | Decimal with `.` or exponent | `Float` |
//! | Decimal integer out of `int64_t` range | `Float` |
//! | Hex in `int64_t` range (after sign) | `Integer` |
//! | Hex out of range | `Float` |
//! | `Infinity`, `NaN` (any sign) | `Float` |
//!
//! Decoding never fails: the lexer only produces literals these rules cover.

#pragma once

#include "json5ast/json/json_node.hpp"
#include "json5ast/json/json_token.hpp"

namespace json5ast::json {

/// Decodes a `Number` token into a node carrying the token's span.
[[nodiscard]] auto decode_number(const JsonToken& token) -> JsonNode;

} // namespace json5ast::json
