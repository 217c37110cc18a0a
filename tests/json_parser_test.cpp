//! # JSON5 Parser Tests
//!
//! Value parsing, JSON5 syntax extensions, spans, duplicate key policies,
//! the depth limit and error reporting.

#include "json5ast/json/json_parser.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <string>

using namespace json5ast;
using namespace json5ast::json;

namespace {

/// Parses `text`, failing the test on error.
auto parse_ok(std::string_view text, const ParseOptions& options = {}) -> JsonNode {
    auto result = parse(text, options);
    EXPECT_TRUE(is_ok(result)) << "failed to parse: " << text << "\n"
                               << (is_err(result) ? unwrap_err(result).to_string() : "");
    if (is_err(result)) {
        return JsonNode();
    }
    return std::move(unwrap(result));
}

/// Parses `text`, failing the test if it succeeds.
auto parse_err(std::string_view text, const ParseOptions& options = {}) -> ParseError {
    auto result = parse(text, options);
    EXPECT_TRUE(is_err(result)) << "expected failure for: " << text;
    if (is_ok(result)) {
        return {};
    }
    return unwrap_err(result);
}

/// Checks that every composite node's span contains its children's spans.
void expect_spans_nested(const JsonNode& node) {
    if (node.is_array()) {
        for (const auto& element : node.as_array()) {
            EXPECT_TRUE(node.span().contains(element.span()));
            expect_spans_nested(element);
        }
    } else if (node.is_object()) {
        for (const auto& [key, member] : node.as_object()) {
            EXPECT_TRUE(node.span().contains(member.span())) << "member " << key;
            expect_spans_nested(member);
        }
    }
}

auto nested_arrays(size_t depth) -> std::string {
    return std::string(depth, '[') + "0" + std::string(depth, ']');
}

} // namespace

// ============================================================================
// Scalar Values
// ============================================================================

TEST(JsonParserTest, Null) {
    EXPECT_TRUE(parse_ok("null").is_null());
}

TEST(JsonParserTest, Booleans) {
    EXPECT_EQ(parse_ok("true"), JsonNode(true));
    EXPECT_EQ(parse_ok("false"), JsonNode(false));
}

TEST(JsonParserTest, IntegerVersusFloat) {
    EXPECT_EQ(parse_ok("1"), JsonNode(1));
    EXPECT_EQ(parse_ok("1.0"), JsonNode(1.0));
    EXPECT_EQ(parse_ok("1e2"), JsonNode(100.0));
    EXPECT_EQ(parse_ok("0x1F"), JsonNode(31));
    EXPECT_EQ(parse_ok("-0"), JsonNode(0));
    EXPECT_TRUE(parse_ok("1.0").is_float());
    EXPECT_TRUE(parse_ok("1").is_integer());
}

TEST(JsonParserTest, Json5Numbers) {
    EXPECT_EQ(parse_ok("+1"), JsonNode(1));
    EXPECT_EQ(parse_ok(".5"), JsonNode(0.5));
    EXPECT_EQ(parse_ok("5."), JsonNode(5.0));
    EXPECT_EQ(parse_ok("-0xFF"), JsonNode(-255));
}

TEST(JsonParserTest, InfinityAndNaN) {
    JsonNode inf = parse_ok("Infinity");
    ASSERT_TRUE(inf.is_float());
    EXPECT_TRUE(std::isinf(inf.as_float()));

    JsonNode neg = parse_ok("-Infinity");
    ASSERT_TRUE(neg.is_float());
    EXPECT_LT(neg.as_float(), 0);

    EXPECT_TRUE(parse_ok("+Infinity").is_float());
    EXPECT_TRUE(std::isnan(parse_ok("NaN").as_float()));
    EXPECT_EQ(parse_ok("NaN"), parse_ok("NaN"));
}

TEST(JsonParserTest, Strings) {
    EXPECT_EQ(parse_ok("\"hello\""), JsonNode("hello"));
    EXPECT_EQ(parse_ok("'hello'"), JsonNode("hello"));
    EXPECT_EQ(parse_ok("'line\\nbreak'"), JsonNode("line\nbreak"));
}

TEST(JsonParserTest, WhitespaceAndCommentsAroundValue) {
    EXPECT_EQ(parse_ok("  // leading\n  42 /* trailing */  \n"), JsonNode(42));
    EXPECT_EQ(parse_ok("\xEF\xBB\xBF{}"), JsonNode(JsonObject{}));
}

// ============================================================================
// Arrays and Objects
// ============================================================================

TEST(JsonParserTest, EmptyContainers) {
    JsonNode arr = parse_ok("[]");
    ASSERT_TRUE(arr.is_array());
    EXPECT_EQ(arr.size(), 0u);

    JsonNode obj = parse_ok("{ }");
    ASSERT_TRUE(obj.is_object());
    EXPECT_EQ(obj.size(), 0u);
    EXPECT_EQ(obj.span().length(), 3u);
}

TEST(JsonParserTest, ArrayElements) {
    JsonNode arr = parse_ok("[1, 'two', [3], {four: 4}, null]");
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_EQ(arr[0], JsonNode(1));
    EXPECT_EQ(arr[1], JsonNode("two"));
    EXPECT_TRUE(arr[2].is_array());
    EXPECT_EQ(arr[3].get("four")->as_integer(), 4);
    EXPECT_TRUE(arr[4].is_null());
}

TEST(JsonParserTest, TrailingCommas) {
    EXPECT_EQ(parse_ok("[1,2,]"), parse_ok("[1,2]"));
    EXPECT_EQ(parse_ok("{a: 1, b: 2,}"), parse_ok("{a: 1, b: 2}"));
}

TEST(JsonParserTest, UnquotedKeysEqualQuotedKeys) {
    EXPECT_EQ(parse_ok("{a:1}"), parse_ok("{\"a\":1}"));
    EXPECT_EQ(parse_ok("{'a':1}"), parse_ok("{\"a\":1}"));
    EXPECT_EQ(parse_ok("{$id: 1, _x: 2}"), parse_ok("{\"$id\": 1, \"_x\": 2}"));
}

TEST(JsonParserTest, EscapedIdentifierKey) {
    EXPECT_EQ(parse_ok("{\\u0061: 1}"), parse_ok("{a: 1}"));
}

TEST(JsonParserTest, ReservedWordsAsKeys) {
    JsonNode obj = parse_ok("{null: 1, true: 2, false: 3, Infinity: 4, NaN: 5}");
    auto keys = obj.as_object().keys();
    ASSERT_EQ(keys.size(), 5u);
    EXPECT_EQ(keys[0], "null");
    EXPECT_EQ(keys[1], "true");
    EXPECT_EQ(keys[2], "false");
    EXPECT_EQ(keys[3], "Infinity");
    EXPECT_EQ(keys[4], "NaN");
    EXPECT_EQ(obj.get("Infinity")->as_integer(), 4);
}

TEST(JsonParserTest, MemberOrderPreserved) {
    JsonNode obj = parse_ok("{\"a\":1,\"b\":2}");
    auto keys = obj.as_object().keys();
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "a");
    EXPECT_EQ(keys[1], "b");

    JsonNode reversed = parse_ok("{z: 1, y: 2, x: 3}");
    std::vector<std::string> seen;
    for (const auto& [key, member] : reversed.as_object()) {
        seen.push_back(key);
    }
    EXPECT_EQ(seen, (std::vector<std::string>{"z", "y", "x"}));
}

TEST(JsonParserTest, NestedStructure) {
    JsonNode root = parse_ok(R"(
        // Server configuration
        {
            server: {
                host: 'localhost',
                port: 8080,
                tls: false,
            },
            paths: ['/a', '/b',],
        }
    )");
    const JsonNode* server = root.get("server");
    ASSERT_NE(server, nullptr);
    EXPECT_EQ(server->get("host")->as_string(), "localhost");
    EXPECT_EQ(server->get("port")->as_integer(), 8080);
    EXPECT_FALSE(server->get("tls")->as_bool());
    EXPECT_EQ(root.get("paths")->size(), 2u);
}

// ============================================================================
// Spans
// ============================================================================

TEST(JsonParserTest, ScalarSpan) {
    JsonNode root = parse_ok("{\"port\": -1}");
    const JsonNode* port = root.get("port");
    ASSERT_NE(port, nullptr);
    EXPECT_EQ(port->span().start.offset, 9u);
    EXPECT_EQ(port->span().end.offset, 11u);
    EXPECT_EQ(port->span().start.line, 1u);
    EXPECT_EQ(port->span().start.column, 10u);
}

TEST(JsonParserTest, CompositeSpanCoversBrackets) {
    std::string text = "  {\"port\": -1}  ";
    JsonNode root = parse_ok(text);
    EXPECT_EQ(root.span().start.offset, 2u);
    EXPECT_EQ(root.span().end.offset, 14u);
    EXPECT_EQ(text.substr(root.span().start.offset, root.span().length()), "{\"port\": -1}");
}

TEST(JsonParserTest, MultilineSpans) {
    JsonNode root = parse_ok("{\n  a: [1, 2],\n  b: 'x'\n}");
    const JsonNode* a = root.get("a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->span().start.line, 2u);
    EXPECT_EQ(a->span().start.column, 6u);
    EXPECT_EQ(a->span().end.column, 12u);

    const JsonNode* b = root.get("b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->span().start.line, 3u);
    EXPECT_EQ(b->span().start.column, 6u);

    EXPECT_EQ(root.span().start.line, 1u);
    EXPECT_EQ(root.span().end.line, 4u);
}

TEST(JsonParserTest, SpansNest) {
    JsonNode root = parse_ok(R"({a: [1, {b: [true, null, 'x']}], c: {d: {e: 2.5}}, f: []})");
    expect_spans_nested(root);
}

// ============================================================================
// Duplicate Keys
// ============================================================================

TEST(JsonParserTest, DuplicateKeyIsErrorByDefault) {
    auto err = parse_err("{\"a\":1,\"a\":2}");
    EXPECT_EQ(err.kind, ErrorKind::DuplicateKey);
    EXPECT_EQ(err.message, "duplicate key 'a'");
    EXPECT_EQ(err.span.start.offset, 7u);
    EXPECT_EQ(err.span.length(), 3u);
}

TEST(JsonParserTest, DuplicateKeyAcrossSpellings) {
    auto err = parse_err("{a: 1, 'a': 2}");
    EXPECT_EQ(err.kind, ErrorKind::DuplicateKey);
    EXPECT_EQ(err.span.start.offset, 7u);
}

TEST(JsonParserTest, DuplicateKeyReportedBeforeLaterErrors) {
    auto err = parse_err("{\"a\":1,\"a\":[1,2");
    EXPECT_EQ(err.kind, ErrorKind::DuplicateKey);
    EXPECT_EQ(err.span.start.offset, 7u);
    EXPECT_EQ(err.span.start.column, 8u);

    err = parse_err("{a: 1, a: @}");
    EXPECT_EQ(err.kind, ErrorKind::DuplicateKey);

    ParseOptions options;
    options.duplicate_keys = DuplicateKeyPolicy::LastWins;
    EXPECT_EQ(parse_err("{\"a\":1,\"a\":[1,2", options).kind,
              ErrorKind::UnterminatedStructure);
}

TEST(JsonParserTest, InvalidUtf8IsUnexpectedCharacter) {
    auto err = parse_err("{\"k\": \"a\xFF\"}");
    EXPECT_EQ(err.kind, ErrorKind::UnexpectedCharacter);
    EXPECT_EQ(err.span.start.offset, 8u);
    EXPECT_EQ(err.span.length(), 1u);
}

TEST(JsonParserTest, DuplicateKeyLastWins) {
    ParseOptions options;
    options.duplicate_keys = DuplicateKeyPolicy::LastWins;

    JsonNode obj = parse_ok("{\"a\":1,\"a\":2}", options);
    EXPECT_EQ(obj, parse_ok("{\"a\":2}"));
}

TEST(JsonParserTest, LastWinsKeepsFirstPosition) {
    ParseOptions options;
    options.duplicate_keys = DuplicateKeyPolicy::LastWins;

    JsonNode obj = parse_ok("{a: 1, b: 2, a: 3}", options);
    auto keys = obj.as_object().keys();
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "a");
    EXPECT_EQ(keys[1], "b");
    EXPECT_EQ(obj.get("a")->as_integer(), 3);
}

TEST(JsonParserTest, SameKeyInDifferentObjects) {
    JsonNode root = parse_ok("{a: {x: 1}, b: {x: 2}}");
    EXPECT_EQ(root.get("b")->get("x")->as_integer(), 2);
}

// ============================================================================
// Depth Limit
// ============================================================================

TEST(JsonParserTest, DefaultDepthLimit) {
    EXPECT_TRUE(is_ok(parse(nested_arrays(1000))));

    auto err = parse_err(nested_arrays(1001));
    EXPECT_EQ(err.kind, ErrorKind::DepthLimitExceeded);
    EXPECT_EQ(err.span.start.offset, 1000u);
}

TEST(JsonParserTest, CustomDepthLimit) {
    ParseOptions options;
    options.max_depth = 3;

    EXPECT_TRUE(is_ok(parse("[{a: [1]}]", options)));

    auto err = parse_err("[{a: [[1]]}]", options);
    EXPECT_EQ(err.kind, ErrorKind::DepthLimitExceeded);
    EXPECT_EQ(err.message, "maximum nesting depth of 3 exceeded");
    EXPECT_EQ(err.span.start.offset, 6u);
    EXPECT_EQ(err.category(), ErrorCategory::Syntax);
}

TEST(JsonParserTest, ZeroDepthAllowsOnlyScalars) {
    ParseOptions options;
    options.max_depth = 0;
    EXPECT_TRUE(is_ok(parse("42", options)));
    EXPECT_EQ(parse_err("[]", options).kind, ErrorKind::DepthLimitExceeded);
}

// ============================================================================
// Errors
// ============================================================================

TEST(JsonParserTest, EmptyInput) {
    auto err = parse_err("");
    EXPECT_EQ(err.kind, ErrorKind::UnexpectedToken);
    EXPECT_EQ(err.expected, (std::vector<std::string>{"value"}));
    EXPECT_EQ(err.found, "end of input");
    EXPECT_EQ(err.message, "expected value, found end of input");

    EXPECT_EQ(parse_err("  // only a comment\n").kind, ErrorKind::UnexpectedToken);
}

TEST(JsonParserTest, UnterminatedObject) {
    auto err = parse_err("{\"a\":1");
    EXPECT_EQ(err.kind, ErrorKind::UnterminatedStructure);
    EXPECT_EQ(err.message, "unclosed '{'");
    EXPECT_EQ(err.span.start.offset, 0u);
    EXPECT_EQ(err.span.length(), 1u);
    EXPECT_EQ(err.to_string(), "line 1, column 1: unclosed '{'");
}

TEST(JsonParserTest, UnterminatedAtInnermostOpener) {
    EXPECT_EQ(parse_err("[").span.start.offset, 0u);
    EXPECT_EQ(parse_err("[1, [2").span.start.offset, 4u);
    EXPECT_EQ(parse_err("[1, [2").message, "unclosed '['");
    // The inner array is closed, so the outer one is reported
    EXPECT_EQ(parse_err("[[1]").span.start.offset, 0u);
    EXPECT_EQ(parse_err("{a: {b:").span.start.offset, 4u);
    EXPECT_EQ(parse_err("{\"a\"").kind, ErrorKind::UnterminatedStructure);
    EXPECT_EQ(parse_err("[1,").kind, ErrorKind::UnterminatedStructure);
}

TEST(JsonParserTest, MissingSeparator) {
    auto err = parse_err("[1 2]");
    EXPECT_EQ(err.kind, ErrorKind::UnexpectedToken);
    EXPECT_EQ(err.expected, (std::vector<std::string>{"','", "']'"}));
    EXPECT_EQ(err.found, "number 2");
    EXPECT_EQ(err.message, "expected ',' or ']', found number 2");
    EXPECT_EQ(err.span.start.offset, 3u);
}

TEST(JsonParserTest, MissingColon) {
    auto err = parse_err("{a 1}");
    EXPECT_EQ(err.kind, ErrorKind::UnexpectedToken);
    EXPECT_EQ(err.message, "expected ':', found number 1");
}

TEST(JsonParserTest, InvalidKey) {
    auto err = parse_err("{1: 2}");
    EXPECT_EQ(err.kind, ErrorKind::UnexpectedToken);
    EXPECT_EQ(err.message, "expected string, identifier or '}', found number 1");
    EXPECT_EQ(parse_err("{-Infinity: 1}").kind, ErrorKind::UnexpectedToken);
}

TEST(JsonParserTest, MisplacedCommas) {
    EXPECT_EQ(parse_err("[,]").found, "','");
    EXPECT_EQ(parse_err("[1,,2]").span.start.offset, 3u);
    EXPECT_EQ(parse_err("{,}").kind, ErrorKind::UnexpectedToken);
}

TEST(JsonParserTest, MismatchedBracket) {
    auto err = parse_err("{a: [1, 2}");
    EXPECT_EQ(err.kind, ErrorKind::UnexpectedToken);
    EXPECT_EQ(err.found, "'}'");
}

TEST(JsonParserTest, IdentifierIsNotAValue) {
    auto err = parse_err("[foo]");
    EXPECT_EQ(err.kind, ErrorKind::UnexpectedToken);
    EXPECT_EQ(err.found, "identifier foo");
}

TEST(JsonParserTest, TrailingContent) {
    auto err = parse_err("1 2");
    EXPECT_EQ(err.kind, ErrorKind::TrailingContent);
    EXPECT_EQ(err.span.start.offset, 2u);
    EXPECT_EQ(err.message, "unexpected number 2 after the top-level value");

    EXPECT_EQ(parse_err("{} {}").kind, ErrorKind::TrailingContent);
    EXPECT_EQ(parse_err("[1]]").kind, ErrorKind::TrailingContent);
}

TEST(JsonParserTest, LexerErrorsPropagate) {
    auto err = parse_err("[1, \"abc");
    EXPECT_EQ(err.kind, ErrorKind::UnterminatedString);
    EXPECT_EQ(err.span.start.offset, 4u);
    EXPECT_EQ(err.category(), ErrorCategory::Lex);

    EXPECT_EQ(parse_err("{a: 01}").kind, ErrorKind::InvalidNumber);
    EXPECT_EQ(parse_err("['\\1']").kind, ErrorKind::InvalidEscape);
    EXPECT_EQ(parse_err("[1] @").kind, ErrorKind::UnexpectedCharacter);
    EXPECT_EQ(parse_err("{a: 1 /* open").kind, ErrorKind::UnexpectedCharacter);
}

TEST(JsonParserTest, ErrorLocation) {
    auto err = parse_err("{\n  a: 1,\n  b: ]\n}");
    EXPECT_EQ(err.line(), 3u);
    EXPECT_EQ(err.column(), 6u);
    EXPECT_EQ(err.to_string(), "line 3, column 6: expected value, found ']'");
}

TEST(JsonParserTest, ParserInstance) {
    JsonParser parser("{list: [1, 2, 3,]}");
    auto result = parser.parse();
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).get("list")->size(), 3u);
}
