//! # JSON5 Stringifier
//!
//! Renders a `JsonNode` tree as JSON5 or strict JSON text. The output always
//! re-parses to a value-equal tree; comments and the original formatting are
//! not preserved.
//!
//! ## Options
//!
//! | Option | Default | Effect |
//! |--------|---------|--------|
//! | `indent` | none | Compact output when unset, otherwise one copy per level |
//! | `quote_style` | `Double` | Quote character for strings and keys |
//! | `trailing_commas` | `false` | Comma after the last member in indented output |
//! | `unquoted_keys` | `false` | Bare keys when the key is a plain identifier |
//! | `dialect` | `Json5` | `Json` restricts output to RFC 8259 |
//!
//! ## Numbers
//!
//! Integers print without a decimal point. Floats use the shortest
//! representation that round-trips and always contain `.` or an exponent, so
//! `1.0` stays a `Float`. `Infinity`, `-Infinity` and `NaN` are written
//! literally in JSON5 and as `null` in JSON.
//!
//! ## Example
//!
//! ```cpp
//! StringifyOptions options;
//! options.indent = "  ";
//! options.unquoted_keys = true;
//! std::string text = stringify(root, options);
//! // {
//! //   name: "Alice",
//! //   age: 30
//! // }
//! ```

#pragma once

#include "json5ast/json/json_node.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace json5ast::json {

/// Quote character used for strings and quoted keys.
enum class QuoteStyle : uint8_t {
    Double, ///< `"text"`
    Single  ///< `'text'`
};

/// Output language.
enum class Dialect : uint8_t {
    Json5, ///< JSON5 with all options honored
    Json   ///< Strict JSON: double quotes, quoted keys, no trailing commas
};

/// Stringifier configuration.
struct StringifyOptions {
    /// Indentation unit; unset means compact single-line output.
    ///
    /// Only white space is written: JSON5 white space for `Dialect::Json5`,
    /// and space, tab, CR and LF for `Dialect::Json`. Other characters are
    /// dropped so the output always parses.
    std::optional<std::string> indent;

    QuoteStyle quote_style = QuoteStyle::Double;

    /// Emit a comma after the last element in indented output.
    bool trailing_commas = false;

    /// Write keys that are plain ASCII identifiers without quotes.
    bool unquoted_keys = false;

    Dialect dialect = Dialect::Json5;
};

/// Renders `node` as text.
///
/// Never fails.
[[nodiscard]] auto stringify(const JsonNode& node, const StringifyOptions& options = {})
    -> std::string;

/// Writes `node` as text to `os`.
///
/// # Returns
///
/// The stream, for chaining.
auto write_to(std::ostream& os, const JsonNode& node, const StringifyOptions& options = {})
    -> std::ostream&;

} // namespace json5ast::json
