//! # JSON5 Stringifier Tests
//!
//! Compact and indented output, quoting, key styles, float formatting,
//! string escapes and the strict JSON dialect.

#include "json5ast/json/json_parser.hpp"
#include "json5ast/json/json_stringify.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include <string>

using namespace json5ast;
using namespace json5ast::json;

namespace {

auto parse_ok(std::string_view text) -> JsonNode {
    auto result = parse(text);
    EXPECT_TRUE(is_ok(result)) << "failed to parse: " << text;
    if (is_err(result)) {
        return JsonNode();
    }
    return std::move(unwrap(result));
}

auto pretty(const std::string& indent) -> StringifyOptions {
    StringifyOptions options;
    options.indent = indent;
    return options;
}

} // namespace

// ============================================================================
// Scalars
// ============================================================================

TEST(JsonStringifyTest, Scalars) {
    EXPECT_EQ(stringify(JsonNode()), "null");
    EXPECT_EQ(stringify(JsonNode(true)), "true");
    EXPECT_EQ(stringify(JsonNode(false)), "false");
    EXPECT_EQ(stringify(JsonNode(42)), "42");
    EXPECT_EQ(stringify(JsonNode(-7)), "-7");
    EXPECT_EQ(stringify(JsonNode(std::numeric_limits<int64_t>::min())),
              "-9223372036854775808");
    EXPECT_EQ(stringify(JsonNode("hi")), "\"hi\"");
}

TEST(JsonStringifyTest, FloatsKeepFractionOrExponent) {
    EXPECT_EQ(stringify(JsonNode(1.0)), "1.0");
    EXPECT_EQ(stringify(JsonNode(100.0)), "100.0");
    EXPECT_EQ(stringify(JsonNode(-0.0)), "-0.0");
    EXPECT_EQ(stringify(JsonNode(0.5)), "0.5");
    EXPECT_EQ(stringify(JsonNode(3.14)), "3.14");
    EXPECT_EQ(stringify(JsonNode(1e100)), "1e+100");
}

TEST(JsonStringifyTest, NonFiniteFloats) {
    double inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(stringify(JsonNode(inf)), "Infinity");
    EXPECT_EQ(stringify(JsonNode(-inf)), "-Infinity");
    EXPECT_EQ(stringify(JsonNode(std::numeric_limits<double>::quiet_NaN())), "NaN");
}

// ============================================================================
// String Escapes
// ============================================================================

TEST(JsonStringifyTest, NamedEscapes) {
    EXPECT_EQ(stringify(JsonNode("a\"b\\c")), R"("a\"b\\c")");
    EXPECT_EQ(stringify(JsonNode("\b\f\n\r\t")), R"("\b\f\n\r\t")");
}

TEST(JsonStringifyTest, ControlCharactersUseUnicodeEscapes) {
    EXPECT_EQ(stringify(JsonNode(std::string("\x01\x1f", 2))), "\"\\u0001\\u001f\"");
    EXPECT_EQ(stringify(JsonNode(std::string("a\0b", 3))), "\"a\\u0000b\"");
}

TEST(JsonStringifyTest, LineSeparatorsAreEscaped) {
    EXPECT_EQ(stringify(JsonNode("a\xE2\x80\xA8" "b\xE2\x80\xA9")), "\"a\\u2028b\\u2029\"");
}

TEST(JsonStringifyTest, NonAsciiWrittenAsUtf8) {
    EXPECT_EQ(stringify(JsonNode("caf\xC3\xA9 \xF0\x9F\x98\x80")),
              "\"caf\xC3\xA9 \xF0\x9F\x98\x80\"");
}

TEST(JsonStringifyTest, SingleQuotes) {
    StringifyOptions options;
    options.quote_style = QuoteStyle::Single;
    EXPECT_EQ(stringify(JsonNode("it's"), options), R"('it\'s')");
    EXPECT_EQ(stringify(JsonNode("say \"hi\""), options), R"('say "hi"')");
}

// ============================================================================
// Containers
// ============================================================================

TEST(JsonStringifyTest, CompactOutput) {
    JsonNode root = parse_ok("{a: 1, b: [true, null, 'x'], c: {}}");
    EXPECT_EQ(stringify(root), R"({"a":1,"b":[true,null,"x"],"c":{}})");
}

TEST(JsonStringifyTest, EmptyContainers) {
    EXPECT_EQ(stringify(JsonNode(JsonArray{})), "[]");
    EXPECT_EQ(stringify(JsonNode(JsonObject{})), "{}");
    EXPECT_EQ(stringify(JsonNode(JsonArray{}), pretty("  ")), "[]");
}

TEST(JsonStringifyTest, IndentedOutput) {
    JsonNode root = parse_ok("{a: 1, b: [true, null], c: []}");
    std::string expected = "{\n"
                           "  \"a\": 1,\n"
                           "  \"b\": [\n"
                           "    true,\n"
                           "    null\n"
                           "  ],\n"
                           "  \"c\": []\n"
                           "}";
    EXPECT_EQ(stringify(root, pretty("  ")), expected);
}

TEST(JsonStringifyTest, TabIndent) {
    JsonNode root = parse_ok("[1, [2]]");
    EXPECT_EQ(stringify(root, pretty("\t")), "[\n\t1,\n\t[\n\t\t2\n\t]\n]");
}

TEST(JsonStringifyTest, IndentKeepsOnlyWhitespace) {
    JsonNode root = parse_ok("[1]");
    EXPECT_EQ(stringify(root, pretty("x")), "[\n1\n]");
    EXPECT_EQ(stringify(root, pretty("-> ")), "[\n 1\n]");
    EXPECT_EQ(stringify(root, pretty("\xC2\xA0|")), "[\n\xC2\xA0" "1\n]");

    for (const char* indent : {"x", "//", "/*", "\xFF ", "\xC2\xA0"}) {
        std::string text = stringify(root, pretty(indent));
        auto reparsed = parse(text);
        ASSERT_TRUE(is_ok(reparsed)) << text;
        EXPECT_EQ(unwrap(reparsed), root);
    }
}

TEST(JsonStringifyTest, JsonDialectIndentIsAsciiWhitespace) {
    StringifyOptions options = pretty("\xC2\xA0\t");
    options.dialect = Dialect::Json;
    EXPECT_EQ(stringify(parse_ok("[1]"), options), "[\n\t1\n]");
}

TEST(JsonStringifyTest, TrailingCommasInIndentedOutput) {
    JsonNode root = parse_ok("{a: [1, 2]}");
    StringifyOptions options = pretty("  ");
    options.trailing_commas = true;
    std::string expected = "{\n"
                           "  \"a\": [\n"
                           "    1,\n"
                           "    2,\n"
                           "  ],\n"
                           "}";
    EXPECT_EQ(stringify(root, options), expected);
}

TEST(JsonStringifyTest, TrailingCommasIgnoredWhenCompact) {
    StringifyOptions options;
    options.trailing_commas = true;
    EXPECT_EQ(stringify(parse_ok("[1, 2]"), options), "[1,2]");
}

TEST(JsonStringifyTest, UnquotedKeys) {
    StringifyOptions options;
    options.unquoted_keys = true;
    JsonNode root = parse_ok(R"({name: 1, $id: 2, "b-c": 3, "1x": 4, "": 5, "caf\u00e9": 6})");
    EXPECT_EQ(stringify(root, options),
              "{name:1,$id:2,\"b-c\":3,\"1x\":4,\"\":5,\"caf\xC3\xA9\":6}");
}

TEST(JsonStringifyTest, SingleQuotedKeys) {
    StringifyOptions options;
    options.quote_style = QuoteStyle::Single;
    EXPECT_EQ(stringify(parse_ok("{a: 'b'}"), options), "{'a':'b'}");
}

// ============================================================================
// Strict JSON Dialect
// ============================================================================

TEST(JsonStringifyTest, JsonDialectOverridesJson5Options) {
    StringifyOptions options = pretty("  ");
    options.dialect = Dialect::Json;
    options.quote_style = QuoteStyle::Single;
    options.trailing_commas = true;
    options.unquoted_keys = true;

    JsonNode root = parse_ok("{a: ['x']}");
    std::string expected = "{\n"
                           "  \"a\": [\n"
                           "    \"x\"\n"
                           "  ]\n"
                           "}";
    EXPECT_EQ(stringify(root, options), expected);
}

TEST(JsonStringifyTest, JsonDialectWritesNonFiniteAsNull) {
    StringifyOptions options;
    options.dialect = Dialect::Json;
    JsonNode root = parse_ok("[NaN, Infinity, -Infinity, 1.5]");
    EXPECT_EQ(stringify(root, options), "[null,null,null,1.5]");
}

// ============================================================================
// Stream and Convenience Methods
// ============================================================================

TEST(JsonStringifyTest, WriteToStream) {
    std::ostringstream out;
    write_to(out, parse_ok("{a: [1]}")) << "\n";
    EXPECT_EQ(out.str(), "{\"a\":[1]}\n");
}

TEST(JsonStringifyTest, NodeToString) {
    JsonNode root = parse_ok("{a: [1, 2.5]}");
    EXPECT_EQ(root.to_string(), R"({"a":[1,2.5]})");
    EXPECT_EQ(root.to_string_pretty(4), "{\n    \"a\": [\n        1,\n        2.5\n    ]\n}");
    EXPECT_EQ(root.to_string_pretty(0), "{\n\"a\": [\n1,\n2.5\n]\n}");
}
