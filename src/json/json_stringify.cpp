//! # JSON5 Stringifier Implementation
//!
//! Converts a `JsonNode` tree to text in compact or indented form.
//!
//! ## String Escaping
//!
//! | Character | Escape Sequence |
//! |-----------|-----------------|
//! | Active quote | `\"` or `\'` |
//! | `\` | `\\` |
//! | Backspace | `\b` |
//! | Form feed | `\f` |
//! | Line feed | `\n` |
//! | Carriage return | `\r` |
//! | Tab | `\t` |
//! | Other control (0x00-0x1F) | `\u00XX` |
//! | U+2028, U+2029 | `\u2028`, `\u2029` |
//!
//! Everything else, including non-ASCII text, is written as UTF-8.

#include "json5ast/json/json_stringify.hpp"

#include "json/json_chars.hpp"
#include "json5ast/log/log.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <ostream>

namespace json5ast::json {

namespace {

/// Keeps the characters of `indent` that are white space in `dialect`.
auto whitespace_only(std::string_view indent, Dialect dialect) -> std::string {
    std::string kept;
    size_t pos = 0;
    while (pos < indent.size()) {
        size_t length = 0;
        char32_t cp = chars::decode_utf8(indent, pos, length);
        bool keep = dialect == Dialect::Json
                        ? cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r'
                        : chars::is_whitespace(cp);
        if (keep) {
            kept.append(indent.substr(pos, length));
        }
        pos += length;
    }
    return kept;
}

/// Recursive writer holding the effective options for one call.
class Stringifier {
public:
    explicit Stringifier(const StringifyOptions& options) : options_(options) {
        if (options_.dialect == Dialect::Json) {
            options_.quote_style = QuoteStyle::Double;
            options_.trailing_commas = false;
            options_.unquoted_keys = false;
        }
        quote_ = options_.quote_style == QuoteStyle::Single ? '\'' : '"';
        if (options_.indent) {
            options_.indent = whitespace_only(*options_.indent, options_.dialect);
        }
    }

    void write(const JsonNode& node, size_t depth) {
        switch (node.kind()) {
        case NodeKind::Null:
            out_ += "null";
            return;
        case NodeKind::Bool:
            out_ += node.as_bool() ? "true" : "false";
            return;
        case NodeKind::Integer:
            out_ += std::to_string(node.as_integer());
            return;
        case NodeKind::Float:
            write_float(node.as_float());
            return;
        case NodeKind::String:
            write_string(node.as_string());
            return;
        case NodeKind::Array:
            write_array(node.as_array(), depth);
            return;
        case NodeKind::Object:
            write_object(node.as_object(), depth);
            return;
        }
    }

    [[nodiscard]] auto take() -> std::string {
        return std::move(out_);
    }

private:
    StringifyOptions options_;
    char quote_ = '"';
    std::string out_;

    [[nodiscard]] auto pretty() const -> bool {
        return options_.indent.has_value();
    }

    void newline(size_t depth) {
        out_ += '\n';
        for (size_t i = 0; i < depth; ++i) {
            out_ += *options_.indent;
        }
    }

    void write_float(double value) {
        if (std::isnan(value) || std::isinf(value)) {
            if (options_.dialect == Dialect::Json) {
                out_ += "null";
            } else if (std::isnan(value)) {
                out_ += "NaN";
            } else {
                out_ += value < 0 ? "-Infinity" : "Infinity";
            }
            return;
        }

        // Shortest representation that round-trips
        char buffer[32];
        auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
        std::string_view text(buffer, ec == std::errc{} ? static_cast<size_t>(ptr - buffer) : 0);
        out_ += text;

        // Ensure there's a decimal point or exponent for floats
        if (text.find_first_of(".eE") == std::string_view::npos) {
            out_ += ".0";
        }
    }

    void write_string(std::string_view s) {
        out_ += quote_;
        size_t pos = 0;
        while (pos < s.size()) {
            char c = s[pos];
            if (c == quote_) {
                out_ += '\\';
                out_ += c;
                ++pos;
                continue;
            }

            switch (c) {
            case '\\':
                out_ += "\\\\";
                break;
            case '\b':
                out_ += "\\b";
                break;
            case '\f':
                out_ += "\\f";
                break;
            case '\n':
                out_ += "\\n";
                break;
            case '\r':
                out_ += "\\r";
                break;
            case '\t':
                out_ += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control character - escape as \u00XX
                    constexpr const char* HEX = "0123456789abcdef";
                    auto b = static_cast<unsigned char>(c);
                    out_ += "\\u00";
                    out_ += HEX[b >> 4];
                    out_ += HEX[b & 0xF];
                } else if (static_cast<unsigned char>(c) >= 0x80) {
                    size_t length = 0;
                    char32_t cp = chars::decode_utf8(s, pos, length);
                    if (cp == 0x2028 || cp == 0x2029) {
                        out_ += cp == 0x2028 ? "\\u2028" : "\\u2029";
                    } else {
                        out_.append(s.substr(pos, length));
                    }
                    pos += length;
                    continue;
                } else {
                    out_ += c;
                }
                break;
            }
            ++pos;
        }
        out_ += quote_;
    }

    void write_key(const std::string& key) {
        if (options_.unquoted_keys && chars::is_plain_identifier(key)) {
            out_ += key;
        } else {
            write_string(key);
        }
        out_ += pretty() ? ": " : ":";
    }

    void write_array(const JsonArray& arr, size_t depth) {
        if (arr.empty()) {
            out_ += "[]";
            return;
        }

        out_ += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out_ += ',';
            }
            if (pretty()) {
                newline(depth + 1);
            }
            write(arr[i], depth + 1);
        }
        close(']', depth);
    }

    void write_object(const JsonObject& obj, size_t depth) {
        if (obj.empty()) {
            out_ += "{}";
            return;
        }

        out_ += '{';
        bool first = true;
        for (const auto& [key, member] : obj) {
            if (!first) {
                out_ += ',';
            }
            first = false;
            if (pretty()) {
                newline(depth + 1);
            }
            write_key(key);
            write(member, depth + 1);
        }
        close('}', depth);
    }

    /// Closes a non-empty container, adding the trailing comma if enabled.
    void close(char bracket, size_t depth) {
        if (pretty()) {
            if (options_.trailing_commas) {
                out_ += ',';
            }
            newline(depth);
        }
        out_ += bracket;
    }
};

} // namespace

auto stringify(const JsonNode& node, const StringifyOptions& options) -> std::string {
    Stringifier stringifier(options);
    stringifier.write(node, 0);
    std::string text = stringifier.take();
    JSON5AST_LOG_TRACE("stringify", "rendered " << node_kind_name(node.kind()) << " as "
                                                << text.size() << " bytes");
    return text;
}

auto write_to(std::ostream& os, const JsonNode& node, const StringifyOptions& options)
    -> std::ostream& {
    return os << stringify(node, options);
}

// ============================================================================
// JsonNode Serialization Methods
// ============================================================================

auto JsonNode::to_string() const -> std::string {
    return stringify(*this);
}

auto JsonNode::to_string_pretty(int indent) const -> std::string {
    StringifyOptions options;
    options.indent = std::string(static_cast<size_t>(std::max(indent, 0)), ' ');
    return stringify(*this, options);
}

} // namespace json5ast::json
