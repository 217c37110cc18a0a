//! # Line Index Implementation
//!
//! Builds the line-start table once and answers offset lookups by binary
//! search. Line breaks are LF, CR, CR LF, U+2028 and U+2029.

#include "json5ast/json/line_index.hpp"

#include "json/json_chars.hpp"

#include <algorithm>
#include <iterator>

namespace json5ast::json {

namespace {

/// Returns `true` if the bytes at `pos` encode U+2028 or U+2029.
auto is_unicode_line_separator(std::string_view text, size_t pos) -> bool {
    return pos + 2 < text.size() && static_cast<unsigned char>(text[pos]) == 0xE2 &&
           static_cast<unsigned char>(text[pos + 1]) == 0x80 &&
           (static_cast<unsigned char>(text[pos + 2]) == 0xA8 ||
            static_cast<unsigned char>(text[pos + 2]) == 0xA9);
}

} // namespace

LineIndex::LineIndex(std::string_view text) : text_(text) {
    line_starts_.push_back(0); // First line starts at offset 0

    size_t i = 0;
    while (i < text_.size()) {
        char c = text_[i];
        if (c == '\n') {
            line_starts_.push_back(i + 1);
            ++i;
        } else if (c == '\r') {
            // CRLF counts as a single terminator
            if (i + 1 < text_.size() && text_[i + 1] == '\n') {
                ++i;
            }
            line_starts_.push_back(i + 1);
            ++i;
        } else if (is_unicode_line_separator(text_, i)) {
            line_starts_.push_back(i + 3);
            i += 3;
        } else {
            ++i;
        }
    }
}

auto LineIndex::location(size_t offset) const -> SourceLocation {
    offset = std::min(offset, text_.size());

    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    if (it != line_starts_.begin()) {
        --it;
    }

    auto line_number = static_cast<size_t>(std::distance(line_starts_.begin(), it)) + 1;
    // Columns count code points the same way the lexer advances
    size_t column = 1;
    size_t i = *it;
    while (i < offset) {
        size_t length = 0;
        chars::decode_utf8(text_, i, length);
        i += length;
        ++column;
    }

    return SourceLocation{.line = line_number, .column = column, .offset = offset};
}

auto LineIndex::line(size_t line_num) const -> std::string_view {
    if (line_num == 0 || line_num > line_starts_.size()) {
        return {};
    }

    size_t start = line_starts_[line_num - 1];
    size_t end = line_num < line_starts_.size() ? line_starts_[line_num] : text_.size();
    std::string_view content = text_.substr(start, end - start);

    if (content.ends_with("\r\n")) {
        content.remove_suffix(2);
    } else if (content.ends_with('\n') || content.ends_with('\r')) {
        content.remove_suffix(1);
    } else if (content.size() >= 3 && is_unicode_line_separator(content, content.size() - 3)) {
        content.remove_suffix(3);
    }
    return content;
}

} // namespace json5ast::json
