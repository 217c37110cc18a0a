//! # Diagnostic Rendering
//!
//! Output layout, for a span starting on line 3:
//!
//! ```text
//! error: message
//!   --> 3:11
//!      |
//!    3 |   "port": -1,
//!      |           ^^ label
//! ```
//!
//! The gutter is at least four characters wide. A span that continues past
//! the end of its first line is underlined to the end of that line; an empty
//! span gets a single caret.

#include "json5ast/json/diagnostic.hpp"

#include "json/json_chars.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace json5ast::json {

namespace {

namespace Colors {
constexpr const char* Reset = "\033[0m";
constexpr const char* Bold = "\033[1m";
constexpr const char* BrightRed = "\033[91m";
constexpr const char* BrightYellow = "\033[93m";
constexpr const char* BrightCyan = "\033[96m";
constexpr const char* BrightBlue = "\033[94m";
} // namespace Colors

auto severity_color(Severity severity) -> const char* {
    switch (severity) {
    case Severity::Error:
        return Colors::BrightRed;
    case Severity::Warning:
        return Colors::BrightYellow;
    case Severity::Note:
        return Colors::BrightCyan;
    }
    return Colors::Reset;
}

} // namespace

auto severity_name(Severity severity) -> std::string_view {
    switch (severity) {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Note:
        return "note";
    }
    return "unknown";
}

DiagnosticRenderer::DiagnosticRenderer(std::string_view source, bool use_colors)
    : index_(source), use_colors_(use_colors) {}

auto DiagnosticRenderer::color(const char* code) const -> const char* {
    return use_colors_ ? code : "";
}

void DiagnosticRenderer::emit(std::ostream& out, const Diagnostic& diag) const {
    emit_header(out, diag);
    emit_snippet(out, diag);
}

auto DiagnosticRenderer::render(const Diagnostic& diag) const -> std::string {
    std::ostringstream out;
    emit(out, diag);
    return out.str();
}

void DiagnosticRenderer::emit_header(std::ostream& out, const Diagnostic& diag) const {
    // Format: error: message
    out << color(Colors::Bold) << color(severity_color(diag.severity))
        << severity_name(diag.severity) << color(Colors::Reset) << color(Colors::Bold) << ": "
        << diag.message << color(Colors::Reset) << "\n";
}

void DiagnosticRenderer::emit_snippet(std::ostream& out, const Diagnostic& diag) const {
    SourceLocation start = index_.location(diag.span.start.offset);
    SourceLocation end = index_.location(std::max(diag.span.end.offset, diag.span.start.offset));

    // Location line: --> line:column
    out << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << start.line << ":"
        << start.column << "\n";

    int line_width = static_cast<int>(std::to_string(start.line).length());
    line_width = std::max(line_width, 4);

    std::string_view source_line = index_.line(start.line);

    // Empty line with pipe
    out << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
        << "\n";

    // Source line with line number
    out << color(Colors::BrightBlue) << std::setw(line_width) << start.line << " | "
        << color(Colors::Reset) << source_line << "\n";

    // Underline: padding mirrors tabs so the carets line up
    std::string padding;
    std::string carets;
    size_t column = 1;
    size_t pos = 0;
    size_t end_column = end.line == start.line ? end.column : static_cast<size_t>(-1);
    while (pos < source_line.size()) {
        size_t length = 0;
        char32_t cp = chars::decode_utf8(source_line, pos, length);
        if (column < start.column) {
            padding += cp == '\t' ? '\t' : ' ';
        } else if (column < end_column) {
            carets += '^';
        } else {
            break;
        }
        pos += length;
        ++column;
    }
    if (carets.empty()) {
        carets = "^";
    }

    out << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
        << color(Colors::Reset) << padding << color(severity_color(diag.severity)) << carets;
    if (!diag.label.empty()) {
        out << " " << diag.label;
    }
    out << color(Colors::Reset) << "\n";
}

auto render_diagnostic(std::string_view source, const SourceSpan& span, std::string_view message,
                       std::string_view label) -> std::string {
    Diagnostic diag;
    diag.severity = Severity::Error;
    diag.message = std::string(message);
    diag.span = span;
    diag.label = std::string(label);
    return DiagnosticRenderer(source).render(diag);
}

} // namespace json5ast::json
