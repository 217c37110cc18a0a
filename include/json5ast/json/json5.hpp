//! # json5ast JSON5 Library
//!
//! Umbrella header for the JSON5 parser. Including it brings in the whole
//! public API:
//!
//! | Header | Contents |
//! |--------|----------|
//! | `json_error.hpp` | `ParseError`, `ErrorKind`, `ErrorCategory` |
//! | `line_index.hpp` | `LineIndex` offset-to-line/column lookup |
//! | `json_token.hpp` | `JsonToken`, `JsonTokenKind`, `NumberForm` |
//! | `json_lexer.hpp` | `JsonLexer`, `tokenize()` |
//! | `ordered_map.hpp` | `OrderedMap` insertion-ordered container |
//! | `json_node.hpp` | `JsonNode`, `NodeKind`, `JsonArray`, `JsonObject` |
//! | `json_number.hpp` | `decode_number()` |
//! | `json_parser.hpp` | `parse()`, `JsonParser`, `ParseOptions` |
//! | `json_stringify.hpp` | `stringify()`, `write_to()`, `StringifyOptions` |
//! | `diagnostic.hpp` | `render_diagnostic()`, `DiagnosticRenderer` |
//!
//! ## Example
//!
//! ```cpp
//! #include "json5ast/json/json5.hpp"
//! using namespace json5ast;
//!
//! std::string text = "{server: {port: -1}}";
//! auto result = json::parse(text);
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).render(text);
//!     return 1;
//! }
//! const json::JsonNode& root = unwrap(result);
//! const json::JsonNode* port = root.get("server")->get("port");
//! if (port->as_integer() <= 0) {
//!     std::cerr << json::render_diagnostic(text, port->span(), "port must be positive");
//! }
//! ```

#pragma once

#include "json5ast/common.hpp"
#include "json5ast/json/diagnostic.hpp"
#include "json5ast/json/json_error.hpp"
#include "json5ast/json/json_lexer.hpp"
#include "json5ast/json/json_node.hpp"
#include "json5ast/json/json_number.hpp"
#include "json5ast/json/json_parser.hpp"
#include "json5ast/json/json_stringify.hpp"
#include "json5ast/json/json_token.hpp"
#include "json5ast/json/line_index.hpp"
#include "json5ast/json/ordered_map.hpp"
