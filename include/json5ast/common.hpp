//! # Common Definitions
//!
//! This module provides the types shared by every json5ast component:
//! source locations, the `Result` error-handling type and smart pointer
//! aliases.
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Parsing errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Use `Box<T>` for unique ownership
//! - **Located Values**: Everything produced from source text carries a `SourceSpan`

#ifndef JSON5AST_COMMON_HPP
#define JSON5AST_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace json5ast {

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise position in source text.
///
/// # Fields
///
/// - `line`: 1-based line number
/// - `column`: 1-based column, counted in code points
/// - `offset`: 0-based byte offset from the start of the text
struct SourceLocation {
    /// Line number (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number (1-based, 0 if unknown).
    size_t column = 0;

    /// Byte offset from start of text (0-based).
    size_t offset = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A half-open region `[start, end)` of source text.
///
/// `end` is the position just past the last byte of the region, so an empty
/// span has `start.offset == end.offset`.
struct SourceSpan {
    /// First position covered by the span.
    SourceLocation start;

    /// Position one past the last byte covered by the span.
    SourceLocation end;

    /// Number of bytes covered.
    [[nodiscard]] auto length() const -> size_t {
        return end.offset - start.offset;
    }

    /// Returns `true` if `other` lies entirely within this span.
    [[nodiscard]] auto contains(const SourceSpan& other) const -> bool {
        return other.start.offset >= start.offset && other.end.offset <= end.offset;
    }

    /// Merges two spans into one that covers both.
    ///
    /// The result spans from the start of `a` to the end of `b`.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }

    [[nodiscard]] auto operator==(const SourceSpan& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = json::parse("{port: 8080}");
/// if (is_ok(result)) {
///     const auto& root = unwrap(result);
/// } else {
///     std::cerr << unwrap_err(result).to_string() << "\n";
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
///
/// Composite JSON nodes box their children so `JsonNode` has a fixed size.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace json5ast

#endif // JSON5AST_COMMON_HPP
