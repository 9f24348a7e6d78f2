//! # Common Definitions
//!
//! Types and helpers shared by every devkit component.
//!
//! ## Overview
//!
//! - **Version Information**: devkit version constants
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Conventions
//!
//! - **No Exceptions**: Fallible operations return `Result<T, E>`. Exceptions
//!   raised by third-party libraries are caught at the call site and
//!   converted.
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared.

#ifndef DEVKIT_COMMON_HPP
#define DEVKIT_COMMON_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <variant>

namespace devkit {

namespace fs = std::filesystem;

// ============================================================================
// Version Information
// ============================================================================

/// The devkit version string.
constexpr const char* VERSION = "0.4.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 4;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `T` and `E` must be distinct types.
///
/// # Example
///
/// ```cpp
/// Result<Manifest, ConfigError> load(const fs::path& path);
///
/// auto result = load(path);
/// if (is_ok(result)) {
///     auto& manifest = unwrap(result);
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
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

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

} // namespace devkit

#endif // DEVKIT_COMMON_HPP
