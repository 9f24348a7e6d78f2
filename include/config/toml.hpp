//! # TOML Subset Reader
//!
//! Reads the subset of TOML used by `.dev/config.toml` and `dev.toml`.
//!
//! ## Supported Syntax
//!
//! | Construct        | Example                              |
//! |------------------|--------------------------------------|
//! | Section          | `[workspaces]`                       |
//! | Dotted section   | `[cmd.build]`, `[cmd."db:migrate"]`  |
//! | Bare/quoted keys | `build = ...`, `"db:seed" = ...`     |
//! | Strings          | `"basic \"escaped\""`, `'literal'`   |
//! | Integers         | `port = 5432`                        |
//! | Booleans         | `enabled = true`                     |
//! | String arrays    | `deps = ["web", "api:build"]`        |
//! | Inline tables    | `test = { default = "cargo test" }`  |
//! | Comments         | `# ...`                              |
//!
//! Arrays may span lines. An inline table is stored as a child section whose
//! path is the parent section path plus the key.

#ifndef DEVKIT_CONFIG_TOML_HPP
#define DEVKIT_CONFIG_TOML_HPP

#include "common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace devkit::config {

/// A scalar or string-array TOML value.
using TomlValue = std::variant<std::string, int64_t, bool, std::vector<std::string>>;

/// An error from the TOML reader. `line` is 1-based.
struct TomlError {
    std::string message;
    int line = 0;
};

/// One `[section]` and the key/value pairs written under it.
struct TomlSection {
    std::vector<std::string> path; ///< Empty for the root table
    std::map<std::string, TomlValue> entries;
    std::vector<std::string> key_order; ///< Keys in declaration order
    int line = 0;                       ///< Line of the header (0 for root)

    const TomlValue* find(const std::string& key) const {
        auto it = entries.find(key);
        return it == entries.end() ? nullptr : &it->second;
    }

    /// String value for `key`, or nullopt if absent or not a string.
    std::optional<std::string> get_string(const std::string& key) const;

    /// String array for `key`, or nullopt if absent or not an array.
    std::optional<std::vector<std::string>> get_string_array(const std::string& key) const;

    std::optional<int64_t> get_integer(const std::string& key) const;
};

/// A parsed TOML document: the root table followed by sections in file order.
class TomlDocument {
public:
    TomlDocument();

    /// The root table (keys before the first header).
    const TomlSection& root() const {
        return sections_.front();
    }

    /// Section with exactly this path, or nullptr.
    const TomlSection* find(const std::vector<std::string>& path) const;

    /// Direct children of `prefix` (sections whose path is prefix + one component),
    /// in file order.
    std::vector<const TomlSection*> children(const std::vector<std::string>& prefix) const;

    const std::vector<TomlSection>& sections() const {
        return sections_;
    }

private:
    friend class TomlParser;

    std::vector<TomlSection> sections_;

    /// Returns the section for `path`, creating it if absent.
    TomlSection& section(const std::vector<std::string>& path, int line);
};

/// Reader for the TOML subset above.
class TomlParser {
public:
    explicit TomlParser(std::string content);

    Result<TomlDocument, TomlError> parse();

private:
    std::string content_;
    size_t pos_ = 0;
    int line_ = 1;
    std::optional<TomlError> error_;

    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    void skip_inline_whitespace();
    void skip_comment();
    /// Skips whitespace, newlines and comments (used inside arrays).
    void skip_trivia();
    bool expect_line_end();

    std::optional<std::string> parse_key_component();
    std::optional<std::vector<std::string>> parse_key_path(char terminator);
    std::optional<std::string> parse_string();
    std::optional<TomlValue> parse_value();
    std::optional<std::vector<std::string>> parse_string_array();
    bool parse_inline_table(TomlDocument& doc, const std::vector<std::string>& path);
    bool parse_assignment(TomlDocument& doc, const std::vector<std::string>& section_path);

    void set_error(const std::string& message);
};

/// Parses TOML text.
Result<TomlDocument, TomlError> parse_toml(const std::string& content);

} // namespace devkit::config

#endif // DEVKIT_CONFIG_TOML_HPP
