//! # JSON5 Parser Implementation
//!
//! Recursive descent over the lexer's token stream with one token of
//! lookahead. The parser keeps a stack of unclosed brackets so that end of
//! input inside a structure is reported at the innermost opening bracket, and
//! so that nesting depth is bounded by `ParseOptions::max_depth`.

#include "json5ast/json/json_parser.hpp"

#include "json5ast/json/json_number.hpp"
#include "json5ast/log/log.hpp"

namespace json5ast::json {

namespace {

/// Describes a token for the `found` part of an error message.
auto describe_token(const JsonToken& token) -> std::string {
    switch (token.kind) {
    case JsonTokenKind::String:
    case JsonTokenKind::Number:
    case JsonTokenKind::Identifier:
        return std::string(token_kind_to_string(token.kind)) + " " + std::string(token.lexeme);
    default:
        return std::string(token_kind_to_string(token.kind));
    }
}

/// Returns the key text of a member name token.
///
/// Bare names written with `\u` escapes are decoded; reserved words such as
/// `null` or `Infinity` are used verbatim.
auto key_text(const JsonToken& token) -> std::string {
    if (token.kind == JsonTokenKind::String || token.kind == JsonTokenKind::Identifier) {
        return token.string_value;
    }
    return std::string(token.lexeme);
}

} // namespace

// ============================================================================
// JsonParser Implementation
// ============================================================================

JsonParser::JsonParser(std::string_view input, ParseOptions options)
    : lexer_(input), options_(options) {
    advance();
}

void JsonParser::advance() {
    current_ = lexer_.next_token();
}

auto JsonParser::check(JsonTokenKind kind) const -> bool {
    return current_.kind == kind;
}

auto JsonParser::match(JsonTokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto JsonParser::unexpected(std::vector<std::string> expected) const -> ParseError {
    if (check(JsonTokenKind::Error)) {
        return lexer_.error();
    }

    if (check(JsonTokenKind::Eof) && !open_.empty()) {
        const OpenStructure& innermost = open_.back();
        std::string msg = innermost.kind == JsonTokenKind::LBrace ? "unclosed '{'" : "unclosed '['";
        return ParseError::make(ErrorKind::UnterminatedStructure, std::move(msg), innermost.span);
    }

    return ParseError::unexpected(std::move(expected), describe_token(current_), current_.span);
}

auto JsonParser::parse() -> Result<JsonNode, ParseError> {
    auto result = parse_value();

    if (is_ok(result) && !check(JsonTokenKind::Eof)) {
        if (check(JsonTokenKind::Error)) {
            result = lexer_.error();
        } else {
            result = ParseError::make(ErrorKind::TrailingContent,
                                      "unexpected " + describe_token(current_) +
                                          " after the top-level value",
                                      current_.span);
        }
    }

    if (is_err(result)) {
        JSON5AST_LOG_DEBUG("parser", "parse failed: " << unwrap_err(result).to_string());
    } else {
        JSON5AST_LOG_TRACE("parser", "parsed " << node_kind_name(unwrap(result).kind())
                                               << " spanning " << unwrap(result).span().length()
                                               << " bytes");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonNode, ParseError> {
    switch (current_.kind) {
    case JsonTokenKind::Null: {
        SourceSpan span = current_.span;
        advance();
        return JsonNode(nullptr, span);
    }

    case JsonTokenKind::True:
    case JsonTokenKind::False: {
        bool value = check(JsonTokenKind::True);
        SourceSpan span = current_.span;
        advance();
        return JsonNode(value, span);
    }

    case JsonTokenKind::Number: {
        Result<JsonNode, ParseError> number = decode_number(current_);
        advance();
        return number;
    }

    case JsonTokenKind::String: {
        std::string value = std::move(current_.string_value);
        SourceSpan span = current_.span;
        advance();
        return JsonNode(std::move(value), span);
    }

    case JsonTokenKind::LBrace:
    case JsonTokenKind::LBracket:
        if (open_.size() >= options_.max_depth) {
            return ParseError::make(ErrorKind::DepthLimitExceeded,
                                    "maximum nesting depth of " +
                                        std::to_string(options_.max_depth) + " exceeded",
                                    current_.span);
        }
        return check(JsonTokenKind::LBrace) ? parse_object() : parse_array();

    default:
        return unexpected({"value"});
    }
}

auto JsonParser::parse_object() -> Result<JsonNode, ParseError> {
    open_.push_back({JsonTokenKind::LBrace, current_.span});
    advance(); // Skip '{'

    JsonObject obj;

    while (!check(JsonTokenKind::RBrace)) {
        // Member name: string or bare identifier name
        if (!check(JsonTokenKind::String) && !current_.is_identifier_name()) {
            return unexpected({"string", "identifier", "'}'"});
        }
        std::string key = key_text(current_);
        SourceSpan key_span = current_.span;
        advance();

        bool last_wins = options_.duplicate_keys == DuplicateKeyPolicy::LastWins;
        if (!last_wins && obj.contains(key)) {
            return ParseError::make(ErrorKind::DuplicateKey, "duplicate key '" + key + "'",
                                    key_span);
        }

        if (!match(JsonTokenKind::Colon)) {
            return unexpected({"':'"});
        }

        auto value_result = parse_value();
        if (is_err(value_result)) {
            return value_result;
        }

        if (last_wins) {
            obj.insert_or_assign(std::move(key), std::move(unwrap(value_result)));
        } else {
            obj.insert(std::move(key), std::move(unwrap(value_result)));
        }

        // A comma may also trail the last member
        if (match(JsonTokenKind::Comma)) {
            continue;
        }
        if (!check(JsonTokenKind::RBrace)) {
            return unexpected({"','", "'}'"});
        }
    }

    SourceSpan span = SourceSpan::merge(open_.back().span, current_.span);
    open_.pop_back();
    advance(); // Skip '}'
    return JsonNode(std::move(obj), span);
}

auto JsonParser::parse_array() -> Result<JsonNode, ParseError> {
    open_.push_back({JsonTokenKind::LBracket, current_.span});
    advance(); // Skip '['

    JsonArray arr;

    while (!check(JsonTokenKind::RBracket)) {
        auto value_result = parse_value();
        if (is_err(value_result)) {
            return value_result;
        }
        arr.push_back(std::move(unwrap(value_result)));

        // A comma may also trail the last element
        if (match(JsonTokenKind::Comma)) {
            continue;
        }
        if (!check(JsonTokenKind::RBracket)) {
            return unexpected({"','", "']'"});
        }
    }

    SourceSpan span = SourceSpan::merge(open_.back().span, current_.span);
    open_.pop_back();
    advance(); // Skip ']'
    return JsonNode(std::move(arr), span);
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto parse(std::string_view input, const ParseOptions& options) -> Result<JsonNode, ParseError> {
    JsonParser parser(input, options);
    return parser.parse();
}

} // namespace json5ast::json
