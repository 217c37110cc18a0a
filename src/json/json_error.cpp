//! # JSON5 Error Implementation
//!
//! Error kind names, categories, and the formatting methods of `ParseError`.

#include "json5ast/json/json_error.hpp"

#include "json5ast/json/diagnostic.hpp"

namespace json5ast::json {

namespace {

/// Joins alternatives as `"a"`, `"a or b"`, `"a, b or c"`.
auto join_alternatives(const std::vector<std::string>& items) -> std::string {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            result += i + 1 == items.size() ? " or " : ", ";
        }
        result += items[i];
    }
    return result;
}

} // namespace

auto error_kind_name(ErrorKind kind) -> std::string_view {
    switch (kind) {
    case ErrorKind::UnterminatedString:
        return "UnterminatedString";
    case ErrorKind::InvalidEscape:
        return "InvalidEscape";
    case ErrorKind::InvalidNumber:
        return "InvalidNumber";
    case ErrorKind::UnexpectedCharacter:
        return "UnexpectedCharacter";
    case ErrorKind::UnexpectedToken:
        return "UnexpectedToken";
    case ErrorKind::UnterminatedStructure:
        return "UnterminatedStructure";
    case ErrorKind::TrailingContent:
        return "TrailingContent";
    case ErrorKind::DuplicateKey:
        return "DuplicateKey";
    case ErrorKind::DepthLimitExceeded:
        return "DepthLimitExceeded";
    }
    return "Unknown";
}

auto error_category(ErrorKind kind) -> ErrorCategory {
    switch (kind) {
    case ErrorKind::UnterminatedString:
    case ErrorKind::InvalidEscape:
    case ErrorKind::InvalidNumber:
    case ErrorKind::UnexpectedCharacter:
        return ErrorCategory::Lex;
    default:
        return ErrorCategory::Syntax;
    }
}

auto ParseError::unexpected(std::vector<std::string> expected, std::string found,
                            const SourceSpan& span) -> ParseError {
    std::string msg = "expected " + join_alternatives(expected) + ", found " + found;
    return ParseError{ErrorKind::UnexpectedToken, std::move(msg), span, std::move(expected),
                      std::move(found)};
}

auto ParseError::to_string() const -> std::string {
    if (span.start.line > 0) {
        return "line " + std::to_string(span.start.line) + ", column " +
               std::to_string(span.start.column) + ": " + message;
    }
    return message;
}

auto ParseError::render(std::string_view source) const -> std::string {
    std::string label;
    if (!expected.empty()) {
        label = "expected " + join_alternatives(expected);
    }
    return render_diagnostic(source, span, message, label);
}

} // namespace json5ast::json
