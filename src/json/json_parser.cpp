//! # JSON Parser Implementation
//!
//! Recursive-descent parser that builds a `JsonValue` tree directly from the
//! input characters, tracking line and column for error reporting.
//!
//! Supported:
//! - Objects, arrays, strings, numbers, `true`, `false`, `null`
//! - String escapes including `\uXXXX` (with surrogate pairs, emitted as UTF-8)

#include "json/json.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace devkit::json {

// ============================================================================
// JsonValue
// ============================================================================

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = as_object();
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

auto JsonValue::get_string(const std::string& key) const -> std::string {
    const auto* value = get(key);
    if (value && value->is_string()) {
        return value->as_string();
    }
    return "";
}

// ============================================================================
// JsonParser
// ============================================================================

auto JsonParser::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonParser::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else {
            break;
        }
    }
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    auto value = parse_value();
    if (is_err(value)) {
        return value;
    }
    skip_whitespace();
    if (pos_ < input_.size()) {
        return error("unexpected trailing content");
    }
    return value;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    switch (peek()) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return JsonValue(std::move(unwrap(str)));
    }
    case 't':
    case 'f':
    case 'n':
        return parse_keyword();
    case '\0':
        return error("unexpected end of input");
    default:
        break;
    }
    char c = peek();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return parse_number();
    }
    return error(std::string("unexpected character '") + c + "'");
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return error("maximum nesting depth exceeded");
    }
    advance(); // '{'

    JsonObject object;
    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(object));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return error("expected string key");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (peek() != ':') {
            return error("expected ':' after object key");
        }
        advance();
        skip_whitespace();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        object.insert_or_assign(std::move(unwrap(key)), std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == '}') {
            break;
        }
        if (c != ',') {
            return error("expected ',' or '}' in object");
        }
    }

    --depth_;
    return JsonValue(std::move(object));
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return error("maximum nesting depth exceeded");
    }
    advance(); // '['

    JsonArray array;
    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(array));
    }

    while (true) {
        skip_whitespace();
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        array.push_back(std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == ']') {
            break;
        }
        if (c != ',') {
            return error("expected ',' or ']' in array");
        }
    }

    --depth_;
    return JsonValue(std::move(array));
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

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    advance(); // opening quote

    auto read_hex4 = [this](uint32_t& out) -> bool {
        if (pos_ + 4 > input_.size()) {
            return false;
        }
        auto digits = input_.substr(pos_, 4);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + 4, out, 16);
        if (ec != std::errc() || ptr != digits.data() + 4) {
            return false;
        }
        for (int i = 0; i < 4; ++i) {
            advance();
        }
        return true;
    };

    std::string out;
    while (true) {
        if (pos_ >= input_.size()) {
            return error("unterminated string");
        }
        char c = advance();
        if (c == '"') {
            break;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return error("control character in string");
        }
        if (c != '\\') {
            out += c;
            continue;
        }

        char esc = advance();
        switch (esc) {
        case '"':
            out += '"';
            break;
        case '\\':
            out += '\\';
            break;
        case '/':
            out += '/';
            break;
        case 'b':
            out += '\b';
            break;
        case 'f':
            out += '\f';
            break;
        case 'n':
            out += '\n';
            break;
        case 'r':
            out += '\r';
            break;
        case 't':
            out += '\t';
            break;
        case 'u': {
            uint32_t cp = 0;
            if (!read_hex4(cp)) {
                return error("invalid \\u escape");
            }
            if (cp >= 0xDC00 && cp <= 0xDFFF) {
                return error("unpaired surrogate");
            }
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                if (peek() != '\\' || pos_ + 1 >= input_.size() || input_[pos_ + 1] != 'u') {
                    return error("unpaired surrogate");
                }
                advance();
                advance();
                uint32_t low = 0;
                if (!read_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
                    return error("invalid surrogate pair");
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(out, cp);
            break;
        }
        default:
            return error(std::string("invalid escape '\\") + esc + "'");
        }
    }
    return out;
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    if (peek() == '-') {
        advance();
    }
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
        return error("expected digit");
    }
    if (advance() == '0' && std::isdigit(static_cast<unsigned char>(peek()))) {
        return error("leading zeros are not allowed");
    }
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
        advance();
    }
    if (peek() == '.') {
        advance();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return error("expected digit after '.'");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return error("expected digit in exponent");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    std::string text(input_.substr(start, pos_ - start));
    return JsonValue(std::strtod(text.c_str(), nullptr));
}

auto JsonParser::parse_keyword() -> Result<JsonValue, JsonError> {
    auto rest = input_.substr(pos_);
    auto consume = [this](size_t n) {
        for (size_t i = 0; i < n; ++i) {
            advance();
        }
    };
    if (rest.starts_with("true")) {
        consume(4);
        return JsonValue(true);
    }
    if (rest.starts_with("false")) {
        consume(5);
        return JsonValue(false);
    }
    if (rest.starts_with("null")) {
        consume(4);
        return JsonValue();
    }
    return error("invalid literal");
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace devkit::json
