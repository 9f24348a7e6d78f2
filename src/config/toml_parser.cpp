//! # TOML Subset Reader
//!
//! Character-level reader producing a `TomlDocument`. Errors carry the line
//! number where reading stopped; the first error wins.

#include "config/toml.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <set>

namespace devkit::config {

// ============================================================================
// TomlSection / TomlDocument
// ============================================================================

std::optional<std::string> TomlSection::get_string(const std::string& key) const {
    const auto* value = find(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(value)) {
        return *s;
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>>
TomlSection::get_string_array(const std::string& key) const {
    const auto* value = find(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* arr = std::get_if<std::vector<std::string>>(value)) {
        return *arr;
    }
    return std::nullopt;
}

std::optional<int64_t> TomlSection::get_integer(const std::string& key) const {
    const auto* value = find(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* i = std::get_if<int64_t>(value)) {
        return *i;
    }
    return std::nullopt;
}

TomlDocument::TomlDocument() {
    sections_.emplace_back();
}

const TomlSection* TomlDocument::find(const std::vector<std::string>& path) const {
    for (const auto& section : sections_) {
        if (section.path == path) {
            return &section;
        }
    }
    return nullptr;
}

std::vector<const TomlSection*>
TomlDocument::children(const std::vector<std::string>& prefix) const {
    std::vector<const TomlSection*> result;
    for (const auto& section : sections_) {
        if (section.path.size() != prefix.size() + 1) {
            continue;
        }
        if (std::equal(prefix.begin(), prefix.end(), section.path.begin())) {
            result.push_back(&section);
        }
    }
    return result;
}

TomlSection& TomlDocument::section(const std::vector<std::string>& path, int line) {
    for (auto& section : sections_) {
        if (section.path == path) {
            return section;
        }
    }
    TomlSection created;
    created.path = path;
    created.line = line;
    sections_.push_back(std::move(created));
    return sections_.back();
}

// ============================================================================
// TomlParser
// ============================================================================

TomlParser::TomlParser(std::string content) : content_(std::move(content)) {}

char TomlParser::advance() {
    if (is_eof()) {
        return '\0';
    }
    char c = content_[pos_++];
    if (c == '\n') {
        ++line_;
    }
    return c;
}

void TomlParser::set_error(const std::string& message) {
    if (!error_) {
        error_ = TomlError{message, line_};
    }
}

void TomlParser::skip_inline_whitespace() {
    while (peek() == ' ' || peek() == '\t') {
        advance();
    }
}

void TomlParser::skip_comment() {
    if (peek() != '#') {
        return;
    }
    while (!is_eof() && peek() != '\n') {
        advance();
    }
}

void TomlParser::skip_trivia() {
    while (!is_eof()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else if (c == '#') {
            skip_comment();
        } else {
            break;
        }
    }
}

bool TomlParser::expect_line_end() {
    skip_inline_whitespace();
    skip_comment();
    if (peek() == '\r') {
        advance();
    }
    if (is_eof()) {
        return true;
    }
    if (peek() == '\n') {
        advance();
        return true;
    }
    set_error(std::string("expected end of line, found '") + peek() + "'");
    return false;
}

std::optional<std::string> TomlParser::parse_key_component() {
    if (peek() == '"' || peek() == '\'') {
        return parse_string();
    }
    std::string key;
    while (!is_eof()) {
        char c = peek();
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
            key += advance();
        } else {
            break;
        }
    }
    if (key.empty()) {
        set_error("expected key");
        return std::nullopt;
    }
    return key;
}

std::optional<std::vector<std::string>> TomlParser::parse_key_path(char terminator) {
    std::vector<std::string> path;
    while (true) {
        skip_inline_whitespace();
        auto component = parse_key_component();
        if (!component) {
            return std::nullopt;
        }
        path.push_back(std::move(*component));
        skip_inline_whitespace();
        if (peek() == '.') {
            advance();
            continue;
        }
        if (peek() == terminator) {
            return path;
        }
        set_error(std::string("expected '") + terminator + "' after key");
        return std::nullopt;
    }
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::optional<std::string> TomlParser::parse_string() {
    char quote = advance();
    if (peek() == quote && pos_ + 1 < content_.size() && content_[pos_ + 1] == quote) {
        set_error("multi-line strings are not supported");
        return std::nullopt;
    }

    std::string value;
    while (true) {
        if (is_eof() || peek() == '\n') {
            set_error("unterminated string");
            return std::nullopt;
        }
        char c = advance();
        if (c == quote) {
            return value;
        }
        if (quote == '\'' || c != '\\') {
            value += c;
            continue;
        }

        char esc = advance();
        switch (esc) {
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case 'n':
            value += '\n';
            break;
        case 't':
            value += '\t';
            break;
        case 'r':
            value += '\r';
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'u':
        case 'U': {
            size_t digits = esc == 'u' ? 4 : 8;
            if (pos_ + digits > content_.size()) {
                set_error("truncated unicode escape");
                return std::nullopt;
            }
            uint32_t cp = 0;
            for (size_t i = 0; i < digits; ++i) {
                char h = advance();
                if (!std::isxdigit(static_cast<unsigned char>(h))) {
                    set_error("invalid unicode escape");
                    return std::nullopt;
                }
                cp = cp * 16 + static_cast<uint32_t>(std::isdigit(static_cast<unsigned char>(h))
                                                         ? h - '0'
                                                         : std::tolower(h) - 'a' + 10);
            }
            append_utf8(value, cp);
            break;
        }
        default:
            set_error(std::string("invalid escape '\\") + esc + "'");
            return std::nullopt;
        }
    }
}

std::optional<std::vector<std::string>> TomlParser::parse_string_array() {
    advance(); // '['
    std::vector<std::string> items;
    while (true) {
        skip_trivia();
        if (peek() == ']') {
            advance();
            return items;
        }
        if (peek() != '"' && peek() != '\'') {
            set_error("only arrays of strings are supported");
            return std::nullopt;
        }
        auto item = parse_string();
        if (!item) {
            return std::nullopt;
        }
        items.push_back(std::move(*item));
        skip_trivia();
        if (peek() == ',') {
            advance();
            continue;
        }
        if (peek() == ']') {
            advance();
            return items;
        }
        set_error("expected ',' or ']' in array");
        return std::nullopt;
    }
}

std::optional<TomlValue> TomlParser::parse_value() {
    char c = peek();
    if (c == '"' || c == '\'') {
        auto s = parse_string();
        if (!s) {
            return std::nullopt;
        }
        return TomlValue(std::move(*s));
    }
    if (c == '[') {
        auto arr = parse_string_array();
        if (!arr) {
            return std::nullopt;
        }
        return TomlValue(std::move(*arr));
    }
    if (content_.compare(pos_, 4, "true") == 0) {
        pos_ += 4;
        return TomlValue(true);
    }
    if (content_.compare(pos_, 5, "false") == 0) {
        pos_ += 5;
        return TomlValue(false);
    }
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        bool negative = c == '-';
        if (c == '+' || c == '-') {
            advance();
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            set_error("expected digit");
            return std::nullopt;
        }
        // Magnitude limit is one larger for negative values (INT64_MIN).
        const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) +
                               (negative ? 1 : 0);
        uint64_t magnitude = 0;
        while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_') {
            char d = advance();
            if (d == '_') {
                continue;
            }
            auto digit = static_cast<uint64_t>(d - '0');
            if (magnitude > (limit - digit) / 10) {
                set_error("integer out of range");
                return std::nullopt;
            }
            magnitude = magnitude * 10 + digit;
        }
        if (peek() == '.' || peek() == 'e' || peek() == 'E') {
            set_error("floating point values are not supported");
            return std::nullopt;
        }
        if (negative) {
            // -(m - 1) - 1 stays representable for m == 2^63
            return TomlValue(magnitude == 0 ? int64_t{0}
                                            : -static_cast<int64_t>(magnitude - 1) - 1);
        }
        return TomlValue(static_cast<int64_t>(magnitude));
    }
    set_error("invalid value");
    return std::nullopt;
}

bool TomlParser::parse_inline_table(TomlDocument& doc, const std::vector<std::string>& path) {
    advance(); // '{'
    if (doc.find(path) != nullptr) {
        set_error("duplicate table");
        return false;
    }
    doc.section(path, line_);

    skip_inline_whitespace();
    if (peek() == '}') {
        advance();
        return true;
    }

    while (true) {
        auto keys = parse_key_path('=');
        if (!keys) {
            return false;
        }
        advance(); // '='
        skip_inline_whitespace();

        std::vector<std::string> target = path;
        target.insert(target.end(), keys->begin(), keys->end() - 1);
        const std::string& key = keys->back();

        if (peek() == '{') {
            std::vector<std::string> child = target;
            child.push_back(key);
            if (!parse_inline_table(doc, child)) {
                return false;
            }
        } else {
            auto value = parse_value();
            if (!value) {
                return false;
            }
            auto& section = doc.section(target, line_);
            if (section.entries.count(key) != 0) {
                set_error("duplicate key '" + key + "'");
                return false;
            }
            section.entries.emplace(key, std::move(*value));
            section.key_order.push_back(key);
        }

        skip_inline_whitespace();
        if (peek() == ',') {
            advance();
            continue;
        }
        if (peek() == '}') {
            advance();
            return true;
        }
        set_error("expected ',' or '}' in inline table");
        return false;
    }
}

bool TomlParser::parse_assignment(TomlDocument& doc, const std::vector<std::string>& section_path) {
    auto keys = parse_key_path('=');
    if (!keys) {
        return false;
    }
    advance(); // '='
    skip_inline_whitespace();

    std::vector<std::string> target = section_path;
    target.insert(target.end(), keys->begin(), keys->end() - 1);
    const std::string& key = keys->back();

    if (peek() == '{') {
        std::vector<std::string> child = target;
        child.push_back(key);
        return parse_inline_table(doc, child) && expect_line_end();
    }

    int line = line_;
    auto value = parse_value();
    if (!value) {
        return false;
    }
    auto& section = doc.section(target, line);
    if (section.entries.count(key) != 0) {
        set_error("duplicate key '" + key + "'");
        return false;
    }
    section.entries.emplace(key, std::move(*value));
    section.key_order.push_back(key);
    return expect_line_end();
}

Result<TomlDocument, TomlError> TomlParser::parse() {
    TomlDocument doc;
    std::vector<std::string> current;
    std::set<std::vector<std::string>> declared;

    while (true) {
        skip_trivia();
        if (is_eof()) {
            break;
        }

        if (peek() == '[') {
            advance();
            if (peek() == '[') {
                set_error("arrays of tables are not supported");
                break;
            }
            auto path = parse_key_path(']');
            if (!path) {
                break;
            }
            advance(); // ']'
            if (!declared.insert(*path).second) {
                set_error("duplicate section");
                break;
            }
            doc.section(*path, line_);
            current = std::move(*path);
            if (!expect_line_end()) {
                break;
            }
            continue;
        }

        if (!parse_assignment(doc, current)) {
            break;
        }
    }

    if (error_) {
        return *error_;
    }
    return doc;
}

Result<TomlDocument, TomlError> parse_toml(const std::string& content) {
    TomlParser parser(content);
    return parser.parse();
}

} // namespace devkit::config
