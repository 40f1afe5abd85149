// StreamHub - Real-time event fan-out server
// JSON Value Implementation

#include "streamhub/core/json_value.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace streamhub {
namespace core {

namespace {

constexpr size_t MAX_NESTING_DEPTH = 256;

void appendNumber(std::string& out, double v) {
    if (!std::isfinite(v)) {
        out += "null";
        return;
    }

    if (std::trunc(v) == v && std::fabs(v) < 1e15) {
        out += std::to_string(static_cast<long long>(v));
        return;
    }

    // Shortest of %.15g..%.17g that reads back to the same double.
    char buf[32];
    for (int precision = 15; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
        if (std::strtod(buf, nullptr) == v) {
            break;
        }
    }
    out += buf;
}

void appendUtf8(std::string& out, uint32_t codepoint) {
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

// =============================================================================
// Recursive-descent parser
// =============================================================================

class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    Result<JsonValue, JsonParseError> parse() {
        auto result = parseValue(0);
        if (result.isError()) {
            return result;
        }
        skipWhitespace();
        if (pos_ < input_.size()) {
            return fail("Unexpected characters after JSON value");
        }
        return result;
    }

private:
    using ParseResult = Result<JsonValue, JsonParseError>;

    const std::string& input_;
    size_t pos_;

    ParseResult fail(const std::string& message) const {
        return ParseResult::error(JsonParseError(message, pos_));
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    char consume() {
        return pos_ < input_.size() ? input_[pos_++] : '\0';
    }

    bool match(char c) {
        if (pos_ < input_.size() && input_[pos_] == c) {
            pos_++;
            return true;
        }
        return false;
    }

    ParseResult parseValue(size_t depth) {
        if (depth > MAX_NESTING_DEPTH) {
            return fail("Maximum nesting depth exceeded");
        }

        skipWhitespace();
        char c = peek();

        if (c == '"') return parseString();
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        if (pos_ >= input_.size()) {
            return fail("Unexpected end of input");
        }
        return fail("Unexpected character: " + std::string(1, c));
    }

    bool readHex4(uint32_t& out) {
        if (pos_ + 4 > input_.size()) {
            return false;
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char h = input_[pos_++];
            value <<= 4;
            if (h >= '0' && h <= '9') value |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') value |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') value |= static_cast<uint32_t>(h - 'A' + 10);
            else return false;
        }
        out = value;
        return true;
    }

    ParseResult parseString() {
        if (!match('"')) {
            return fail("Expected '\"'");
        }

        std::string result;
        while (pos_ < input_.size() && peek() != '"') {
            char c = consume();
            if (c != '\\') {
                result += c;
                continue;
            }

            char escaped = consume();
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    uint32_t codepoint = 0;
                    if (!readHex4(codepoint)) {
                        return fail("Invalid \\u escape");
                    }
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF &&
                        input_.compare(pos_, 2, "\\u") == 0) {
                        pos_ += 2;
                        uint32_t low = 0;
                        if (!readHex4(low) || low < 0xDC00 || low > 0xDFFF) {
                            return fail("Invalid surrogate pair");
                        }
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(result, codepoint);
                    break;
                }
                default:
                    return fail("Invalid escape character");
            }
        }

        if (!match('"')) {
            return fail("Unterminated string");
        }
        return ParseResult::success(JsonValue(std::move(result)));
    }

    ParseResult parseNumber() {
        size_t start = pos_;
        if (peek() == '-') consume();

        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return fail("Invalid number");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();

        if (peek() == '.') {
            consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        std::string numStr = input_.substr(start, pos_ - start);
        char* end = nullptr;
        double value = std::strtod(numStr.c_str(), &end);
        if (end == nullptr || *end != '\0') {
            return fail("Invalid number: " + numStr);
        }
        return ParseResult::success(JsonValue(value));
    }

    ParseResult parseBool() {
        if (input_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return ParseResult::success(JsonValue(true));
        }
        if (input_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return ParseResult::success(JsonValue(false));
        }
        return fail("Expected 'true' or 'false'");
    }

    ParseResult parseNull() {
        if (input_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return ParseResult::success(JsonValue());
        }
        return fail("Expected 'null'");
    }

    ParseResult parseArray(size_t depth) {
        match('[');
        JsonValue value = JsonValue::array();

        skipWhitespace();
        if (match(']')) {
            return ParseResult::success(std::move(value));
        }

        while (true) {
            auto element = parseValue(depth + 1);
            if (element.isError()) {
                return element;
            }
            value.push(std::move(element).value());

            skipWhitespace();
            if (match(']')) break;
            if (!match(',')) {
                return fail("Expected ',' or ']' in array");
            }
        }

        return ParseResult::success(std::move(value));
    }

    ParseResult parseObject(size_t depth) {
        match('{');
        JsonValue value = JsonValue::object();

        skipWhitespace();
        if (match('}')) {
            return ParseResult::success(std::move(value));
        }

        while (true) {
            skipWhitespace();
            if (peek() != '"') {
                return fail("Expected string key in object");
            }
            auto key = parseString();
            if (key.isError()) {
                return key;
            }

            skipWhitespace();
            if (!match(':')) {
                return fail("Expected ':' after key");
            }

            auto member = parseValue(depth + 1);
            if (member.isError()) {
                return member;
            }
            value.set(key.value().stringRef(), std::move(member).value());

            skipWhitespace();
            if (match('}')) break;
            if (!match(',')) {
                return fail("Expected ',' or '}' in object");
            }
        }

        return ParseResult::success(std::move(value));
    }
};

} // anonymous namespace

// =============================================================================
// JsonValue Implementation
// =============================================================================

JsonValue JsonValue::array(std::initializer_list<JsonValue> items) {
    JsonValue value;
    value.type_ = JsonType::Array;
    value.array_.assign(items.begin(), items.end());
    return value;
}

JsonValue JsonValue::object() {
    JsonValue value;
    value.type_ = JsonType::Object;
    return value;
}

bool JsonValue::getBool(bool fallback) const {
    return isBool() ? bool_ : fallback;
}

int64_t JsonValue::getInt(int64_t fallback) const {
    return isNumber() ? static_cast<int64_t>(number_) : fallback;
}

double JsonValue::getDouble(double fallback) const {
    return isNumber() ? number_ : fallback;
}

std::string JsonValue::getString(const std::string& fallback) const {
    return isString() ? string_ : fallback;
}

const std::string& JsonValue::stringRef() const {
    static const std::string empty;
    return isString() ? string_ : empty;
}

size_t JsonValue::size() const {
    if (isArray()) return array_.size();
    if (isObject()) return object_.size();
    return 0;
}

bool JsonValue::contains(const std::string& key) const {
    if (!isObject()) {
        return false;
    }
    for (const auto& member : object_) {
        if (member.first == key) {
            return true;
        }
    }
    return false;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue nullValue;
    if (!isObject()) {
        return nullValue;
    }
    for (const auto& member : object_) {
        if (member.first == key) {
            return member.second;
        }
    }
    return nullValue;
}

JsonValue& JsonValue::set(std::string key, JsonValue value) {
    if (isNull()) {
        type_ = JsonType::Object;
    }
    for (auto& member : object_) {
        if (member.first == key) {
            member.second = std::move(value);
            return *this;
        }
    }
    object_.emplace_back(std::move(key), std::move(value));
    return *this;
}

JsonValue& JsonValue::push(JsonValue value) {
    if (isNull()) {
        type_ = JsonType::Array;
    }
    array_.push_back(std::move(value));
    return *this;
}

std::string JsonValue::serialize() const {
    std::string out;
    serializeTo(out);
    return out;
}

void JsonValue::serializeTo(std::string& out) const {
    switch (type_) {
        case JsonType::Null:
            out += "null";
            break;
        case JsonType::Boolean:
            out += bool_ ? "true" : "false";
            break;
        case JsonType::Number:
            appendNumber(out, number_);
            break;
        case JsonType::String:
            out += '"';
            out += escapeJsonString(string_);
            out += '"';
            break;
        case JsonType::Array: {
            out += '[';
            bool first = true;
            for (const auto& item : array_) {
                if (!first) out += ',';
                first = false;
                item.serializeTo(out);
            }
            out += ']';
            break;
        }
        case JsonType::Object: {
            out += '{';
            bool first = true;
            for (const auto& member : object_) {
                if (!first) out += ',';
                first = false;
                out += '"';
                out += escapeJsonString(member.first);
                out += "\":";
                member.second.serializeTo(out);
            }
            out += '}';
            break;
        }
    }
}

bool JsonValue::operator==(const JsonValue& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case JsonType::Null: return true;
        case JsonType::Boolean: return bool_ == other.bool_;
        case JsonType::Number: return number_ == other.number_;
        case JsonType::String: return string_ == other.string_;
        case JsonType::Array: return array_ == other.array_;
        case JsonType::Object: return object_ == other.object_;
    }
    return false;
}

// =============================================================================
// Free Functions
// =============================================================================

Result<JsonValue, JsonParseError> parseJson(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

std::string escapeJsonString(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

} // namespace core
} // namespace streamhub
