//! # Line Index
//!
//! Maps byte offsets in a borrowed text buffer to line/column positions.
//!
//! Lines are terminated by LF, CR, CRLF (counted once), U+2028 and U+2029,
//! matching the JSON5 definition of a line terminator. Columns count code
//! points, so a multi-byte UTF-8 character advances the column by one.
//!
//! ## Example
//!
//! ```cpp
//! LineIndex index("{\n  a: 1\n}");
//! SourceLocation loc = index.location(4); // line 2, column 3
//! std::string_view text = index.line(2);  // "  a: 1"
//! ```

#pragma once

#include "json5ast/common.hpp"

#include <string_view>
#include <vector>

namespace json5ast::json {

/// Offset-to-position lookup over a text buffer.
///
/// The index stores only line start offsets; the text itself is borrowed and
/// must outlive the index.
class LineIndex {
public:
    /// Builds the index for `text`.
    explicit LineIndex(std::string_view text);

    /// Converts a byte offset to a line/column location.
    ///
    /// Uses binary search on the line starts. Offsets past the end are clamped
    /// to the end of the text.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Builds a span covering `[start, end)`.
    [[nodiscard]] auto span(size_t start, size_t end) const -> SourceSpan {
        return {location(start), location(end)};
    }

    /// Returns the content of a line (1-based) without its terminator.
    ///
    /// Returns an empty view if the line number is out of range.
    [[nodiscard]] auto line(size_t line_num) const -> std::string_view;

    /// Returns the number of lines in the text.
    [[nodiscard]] auto line_count() const -> size_t {
        return line_starts_.size();
    }

    /// Returns the indexed text.
    [[nodiscard]] auto text() const -> std::string_view {
        return text_;
    }

private:
    std::string_view text_;
    std::vector<size_t> line_starts_;
};

} // namespace json5ast::json
