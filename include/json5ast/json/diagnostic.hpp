//! # Diagnostics
//!
//! Renders a message and a source span as a rustc-style report, with the
//! offending source line and a caret underline:
//!
//! ```text
//! error: port must be positive
//!   --> 3:11
//!      |
//!    3 |   "port": -1,
//!      |           ^^ negative value
//! ```
//!
//! Parse errors use this through `ParseError::render()`. Callers use it for
//! semantic errors found while walking a `JsonNode` tree, passing the span of
//! the node at fault.
//!
//! Line and column are recomputed from the span's byte offsets, so spans built
//! by hand only need correct offsets.

#pragma once

#include "json5ast/common.hpp"
#include "json5ast/json/line_index.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace json5ast::json {

/// Severity level of a diagnostic.
enum class Severity : uint8_t {
    Error,
    Warning,
    Note
};

/// Returns the lowercase name of a severity (e.g., `"error"`).
[[nodiscard]] auto severity_name(Severity severity) -> std::string_view;

/// A message attached to a region of source text.
struct Diagnostic {
    Severity severity = Severity::Error;
    std::string message;
    SourceSpan span;
    std::string label; ///< Text printed after the underline, may be empty
};

/// Formats diagnostics against one source text.
///
/// The source is borrowed and must outlive the renderer.
class DiagnosticRenderer {
public:
    /// Creates a renderer for `source`.
    ///
    /// # Arguments
    ///
    /// * `source` - The text the spans refer to
    /// * `use_colors` - Emit ANSI color codes
    explicit DiagnosticRenderer(std::string_view source, bool use_colors = false);

    /// Writes a diagnostic to `out`.
    void emit(std::ostream& out, const Diagnostic& diag) const;

    /// Returns a diagnostic as a string.
    [[nodiscard]] auto render(const Diagnostic& diag) const -> std::string;

private:
    LineIndex index_;
    bool use_colors_;

    /// Returns `code` when colors are enabled, otherwise an empty string.
    [[nodiscard]] auto color(const char* code) const -> const char*;

    void emit_header(std::ostream& out, const Diagnostic& diag) const;
    void emit_snippet(std::ostream& out, const Diagnostic& diag) const;
};

/// Renders an error diagnostic for `span` in `source`.
///
/// # Example
///
/// ```cpp
/// const JsonNode* port = root.get("port");
/// if (port->as_integer() < 0) {
///     std::cerr << render_diagnostic(text, port->span(), "port must be positive",
///                                    "negative value");
/// }
/// ```
[[nodiscard]] auto render_diagnostic(std::string_view source, const SourceSpan& span,
                                     std::string_view message, std::string_view label = {})
    -> std::string;

} // namespace json5ast::json
