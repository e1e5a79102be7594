#include "json/json.hpp"

#include <charconv>
#include <cstdlib>

namespace weave::json {

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
    if (!value || !value->is_string()) {
        return {};
    }
    return value->as_string();
}

// ============================================================================
// JsonParser
// ============================================================================

auto JsonParser::peek() const -> char {
    return pos_ < input_.size() ? input_[pos_] : '\0';
}

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
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    skip_whitespace();
    if (pos_ < input_.size()) {
        return make_error("Unexpected trailing characters");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    skip_whitespace();
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
    case '-':
    case '0':
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '6':
    case '7':
    case '8':
    case '9':
        return parse_number();
    case 't':
    case 'f':
    case 'n':
        return parse_keyword();
    case '\0':
        return make_error("Unexpected end of input");
    default:
        return make_error(std::string("Unexpected character '") + peek() + "'");
    }
}

/// Parses a JSON object (`{...}`). Trailing commas are not allowed.
auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("Nesting too deep");
    }
    advance(); // Skip '{'

    JsonObject obj;
    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return make_error("Expected string key in object");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (advance() != ':') {
            return make_error("Expected ':' after object key");
        }

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj[std::move(unwrap(key))] = std::move(unwrap(value));

        skip_whitespace();
        char c = advance();
        if (c == '}') {
            --depth_;
            return JsonValue(std::move(obj));
        }
        if (c != ',') {
            return make_error("Expected ',' or '}' in object");
        }
        skip_whitespace();
        if (peek() == '}') {
            return make_error("Trailing comma in object");
        }
    }
}

/// Parses a JSON array (`[...]`). Trailing commas are not allowed.
auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("Nesting too deep");
    }
    advance(); // Skip '['

    JsonArray arr;
    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == ']') {
            --depth_;
            return JsonValue(std::move(arr));
        }
        if (c != ',') {
            return make_error("Expected ',' or ']' in array");
        }
        skip_whitespace();
        if (peek() == ']') {
            return make_error("Trailing comma in array");
        }
    }
}

static void append_utf8(std::string& out, unsigned int codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    advance(); // Skip opening quote

    std::string value;
    while (pos_ < input_.size()) {
        char c = advance();
        if (c == '"') {
            return value;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return make_error("Unescaped control character in string");
        }
        if (c != '\\') {
            value += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
        case '\\':
        case '/':
            value += escaped;
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            if (pos_ + 4 > input_.size()) {
                return make_error("Incomplete unicode escape sequence");
            }
            std::string_view hex = input_.substr(pos_, 4);
            unsigned int codepoint = 0;
            auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, codepoint, 16);
            if (ec != std::errc{} || ptr != hex.data() + 4) {
                return make_error("Invalid unicode escape sequence");
            }
            for (int i = 0; i < 4; ++i) {
                advance();
            }
            append_utf8(value, codepoint);
            break;
        }
        default:
            return make_error("Invalid escape sequence");
        }
    }
    return make_error("Unterminated string");
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    if (peek() == '-') {
        advance();
    }
    if (peek() < '0' || peek() > '9') {
        return make_error("Invalid number");
    }
    while ((peek() >= '0' && peek() <= '9') || peek() == '.' || peek() == 'e' || peek() == 'E' ||
           peek() == '+' || peek() == '-') {
        advance();
    }

    std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return make_error("Invalid number '" + text + "'");
    }
    return JsonValue(value);
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
    return make_error("Invalid keyword");
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace weave::json
