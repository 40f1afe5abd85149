// StreamHub - Real-time event fan-out server
// JSON Value - payload and configuration document model
//
// Responsibilities:
// - Represent the opaque payload carried by every outbound message
// - Serialize compactly with object keys in insertion order, matching the
//   byte layout consumers of the event stream already parse
// - Parse JSON text for configuration documents

#ifndef STREAMHUB_CORE_JSON_VALUE_HPP
#define STREAMHUB_CORE_JSON_VALUE_HPP

#include "streamhub/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace streamhub {
namespace core {

/**
 * @brief Kind of value held by a JsonValue.
 */
enum class JsonType {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

/**
 * @brief Parse failure with the byte offset where it was detected.
 */
struct JsonParseError {
    std::string message;
    size_t offset = 0;

    JsonParseError() = default;
    JsonParseError(std::string msg, size_t off)
        : message(std::move(msg)), offset(off) {}
};

/**
 * @brief A JSON document node.
 *
 * Objects keep their members in insertion order; setting an existing key
 * replaces the value in place. Values are plain data and freely copyable.
 *
 * @code
 * JsonValue data = JsonValue::object();
 * data.set("connectionId", "conn_1");
 * data.set("channels", JsonValue::array({"system", "alerts"}));
 * data.serialize();  // {"connectionId":"conn_1","channels":["system","alerts"]}
 * @endcode
 */
class JsonValue {
public:
    using Array = std::vector<JsonValue>;
    using Member = std::pair<std::string, JsonValue>;
    using Object = std::vector<Member>;

    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool b) : type_(JsonType::Boolean), bool_(b) {}
    JsonValue(int v) : type_(JsonType::Number), number_(v) {}
    JsonValue(unsigned v) : type_(JsonType::Number), number_(v) {}
    JsonValue(long v) : type_(JsonType::Number), number_(static_cast<double>(v)) {}
    JsonValue(unsigned long v) : type_(JsonType::Number), number_(static_cast<double>(v)) {}
    JsonValue(long long v) : type_(JsonType::Number), number_(static_cast<double>(v)) {}
    JsonValue(unsigned long long v) : type_(JsonType::Number), number_(static_cast<double>(v)) {}
    JsonValue(double v) : type_(JsonType::Number), number_(v) {}
    JsonValue(const char* s) : type_(JsonType::String), string_(s) {}
    JsonValue(std::string s) : type_(JsonType::String), string_(std::move(s)) {}

    static JsonValue array(std::initializer_list<JsonValue> items = {});
    static JsonValue object();

    // -------------------------------------------------------------------------
    // Type queries
    // -------------------------------------------------------------------------

    JsonType type() const { return type_; }
    bool isNull() const { return type_ == JsonType::Null; }
    bool isBool() const { return type_ == JsonType::Boolean; }
    bool isNumber() const { return type_ == JsonType::Number; }
    bool isString() const { return type_ == JsonType::String; }
    bool isArray() const { return type_ == JsonType::Array; }
    bool isObject() const { return type_ == JsonType::Object; }

    // -------------------------------------------------------------------------
    // Typed accessors with fallbacks
    // -------------------------------------------------------------------------

    bool getBool(bool fallback = false) const;
    int64_t getInt(int64_t fallback = 0) const;
    double getDouble(double fallback = 0.0) const;
    std::string getString(const std::string& fallback = "") const;

    /**
     * @brief String content without a copy. Empty for non-strings.
     */
    const std::string& stringRef() const;

    const Array& items() const { return array_; }
    const Object& members() const { return object_; }
    size_t size() const;

    // -------------------------------------------------------------------------
    // Object access
    // -------------------------------------------------------------------------

    bool contains(const std::string& key) const;

    /**
     * @brief Member lookup. Returns a shared null value when absent or when
     * this is not an object.
     */
    const JsonValue& operator[](const std::string& key) const;

    /**
     * @brief Insert or replace a member. Converts a null value to an object.
     * @return Reference to this value for chaining
     */
    JsonValue& set(std::string key, JsonValue value);

    /**
     * @brief Append an element. Converts a null value to an array.
     */
    JsonValue& push(JsonValue value);

    // -------------------------------------------------------------------------
    // Serialization
    // -------------------------------------------------------------------------

    /**
     * @brief Compact serialization without insignificant whitespace.
     *
     * Integral numbers print without a fraction; non-finite numbers print
     * as null.
     */
    std::string serialize() const;

    bool operator==(const JsonValue& other) const;
    bool operator!=(const JsonValue& other) const { return !(*this == other); }

private:
    void serializeTo(std::string& out) const;

    JsonType type_ = JsonType::Null;
    bool bool_ = false;
    double number_ = 0.0;
    std::string string_;
    Array array_;
    Object object_;
};

/**
 * @brief Parse a complete JSON text.
 *
 * Rejects trailing content. Supports \\uXXXX escapes including surrogate
 * pairs (encoded as UTF-8).
 */
Result<JsonValue, JsonParseError> parseJson(const std::string& text);

/**
 * @brief Escape a string for embedding between JSON double quotes.
 */
std::string escapeJsonString(const std::string& str);

} // namespace core
} // namespace streamhub

#endif // STREAMHUB_CORE_JSON_VALUE_HPP
