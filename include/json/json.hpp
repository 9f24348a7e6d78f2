//! # JSON Reader
//!
//! A small JSON value type and recursive-descent parser used to read
//! `package.json` manifests.
//!
//! ## Example
//!
//! ```cpp
//! auto result = json::parse_json(R"({"name": "web", "scripts": {"build": "vite"}})");
//! if (is_ok(result)) {
//!     const auto& root = unwrap(result);
//!     root.get("name")->as_string(); // "web"
//! }
//! ```

#ifndef DEVKIT_JSON_HPP
#define DEVKIT_JSON_HPP

#include "common.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace devkit::json {

/// An error encountered while parsing JSON, with 1-based location.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;

    static auto make(std::string msg, size_t line, size_t column) -> JsonError {
        return JsonError{std::move(msg), line, column};
    }

    /// "line X, column Y: message", or just the message when no location is known.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        return message;
    }
};

class JsonValue;

using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

/// A JSON value.
///
/// | JSON   | C++          | Check         | Access          |
/// |--------|--------------|---------------|-----------------|
/// | null   | `Null`       | `is_null()`   |                 |
/// | bool   | `bool`       | `is_bool()`   | `as_bool()`     |
/// | number | `double`     | `is_number()` | `as_number()`   |
/// | string | `std::string`| `is_string()` | `as_string()`   |
/// | array  | `JsonArray`  | `is_array()`  | `as_array()`    |
/// | object | `JsonObject` | `is_object()` | `as_object()`   |
class JsonValue {
public:
    struct Null {};

    JsonValue() : data_(Null{}) {}
    explicit JsonValue(bool value) : data_(value) {}
    explicit JsonValue(double value) : data_(value) {}
    explicit JsonValue(std::string value) : data_(std::move(value)) {}
    explicit JsonValue(JsonArray value) : data_(std::move(value)) {}
    explicit JsonValue(JsonObject value) : data_(std::move(value)) {}

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data_);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data_);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<double>(data_);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data_);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<JsonArray>(data_);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<JsonObject>(data_);
    }

    /// Throws `std::bad_variant_access` on a type mismatch; check first.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data_);
    }
    [[nodiscard]] auto as_number() const -> double {
        return std::get<double>(data_);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data_);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return std::get<JsonArray>(data_);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return std::get<JsonObject>(data_);
    }

    /// Member lookup. Returns nullptr if this is not an object or the key is absent.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    /// String member lookup, empty if absent or not a string.
    [[nodiscard]] auto get_string(const std::string& key) const -> std::string;

private:
    std::variant<Null, bool, double, std::string, JsonArray, JsonObject> data_;
};

/// Recursive-descent JSON parser.
///
/// Nesting is limited to `MAX_DEPTH` levels.
class JsonParser {
public:
    static constexpr size_t MAX_DEPTH = 512;

    explicit JsonParser(std::string_view input) : input_(input) {}

    /// Parses the complete input; trailing non-whitespace is an error.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;

    auto peek() const -> char {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }
    auto advance() -> char;
    void skip_whitespace();
    auto error(const std::string& msg) const -> JsonError {
        return JsonError::make(msg, line_, column_);
    }

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_keyword() -> Result<JsonValue, JsonError>;
};

/// Parses a JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace devkit::json

#endif // DEVKIT_JSON_HPP
