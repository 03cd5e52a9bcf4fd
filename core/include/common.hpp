//! # Common Definitions
//!
//! Common types and helpers shared by every polydoc component.
//!
//! ## Overview
//!
//! - **Version Information**: Generator version constants
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointer Aliases**: `Box<T>` for unique ownership, `Rc<T>` for shared
//!
//! ## Design Philosophy
//!
//! - **No Exceptions across modules**: fallible operations return `Result<T, E>`
//! - **Immutable stage outputs**: every pipeline stage returns a fresh value
//! - **Explicit Ownership**: `Box<T>` owns, `Rc<const T>` shares read-only data

#ifndef POLYDOC_COMMON_HPP
#define POLYDOC_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace polydoc {

// ============================================================================
// Version Information
// ============================================================================

/// The generator version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<Module, PipelineError> merged = merger.merge(modules, context);
/// if (is_err(merged)) {
///     logger.error(unwrap_err(merged).to_string());
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
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

/// Success marker for operations that produce no value.
struct Unit {
    [[nodiscard]] auto operator==(const Unit&) const -> bool = default;
};

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace polydoc

#endif // POLYDOC_COMMON_HPP
