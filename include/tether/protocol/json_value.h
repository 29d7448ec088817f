#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace tether::protocol {

enum class JsonType {
    Undefined,
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
};

const char* json_type_name(JsonType type);

// A JSON document node, extended with Undefined so that a remote
// `undefined` has a local representation distinct from `null`.
// Object members keep insertion order and unique keys.
class JsonValue {
public:
    using Array = std::vector<JsonValue>;
    using Member = std::pair<std::string, JsonValue>;
    using Object = std::vector<Member>;

    JsonValue() = default;
    JsonValue(std::nullptr_t) : type_(JsonType::Null) {}
    JsonValue(bool value) : type_(JsonType::Bool), bool_(value) {}

    template <typename T,
              std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
    JsonValue(T value) : type_(JsonType::Number), number_(static_cast<double>(value)) {}

    JsonValue(const char* value) : type_(JsonType::String), string_(value) {}
    // Other pointers would otherwise decay to Bool.
    JsonValue(const void*) = delete;
    JsonValue(std::string value) : type_(JsonType::String), string_(std::move(value)) {}
    JsonValue(std::string_view value) : type_(JsonType::String), string_(value) {}
    JsonValue(Array value) : type_(JsonType::Array), array_(std::move(value)) {}

    static JsonValue null() { return JsonValue(nullptr); }
    static JsonValue array() { return JsonValue(Array{}); }
    static JsonValue object();

    JsonType type() const { return type_; }
    bool is_undefined() const { return type_ == JsonType::Undefined; }
    bool is_null() const { return type_ == JsonType::Null; }
    bool is_bool() const { return type_ == JsonType::Bool; }
    bool is_number() const { return type_ == JsonType::Number; }
    bool is_string() const { return type_ == JsonType::String; }
    bool is_array() const { return type_ == JsonType::Array; }
    bool is_object() const { return type_ == JsonType::Object; }

    // Typed accessors throw std::logic_error on a type mismatch.
    bool as_bool() const;
    double as_number() const;
    const std::string& as_string() const;
    const Array& as_array() const;
    Array& as_array();
    const Object& as_object() const;
    Object& as_object();

    const JsonValue* find(std::string_view key) const;
    bool contains(std::string_view key) const { return find(key) != nullptr; }
    // Undefined when the key is absent or this is not an object.
    JsonValue get(std::string_view key) const;

    // Turns an Undefined value into an empty object first.
    JsonValue& operator[](const std::string& key);
    JsonValue& set(const std::string& key, JsonValue value);

    // Turns an Undefined value into an empty array first.
    void push_back(JsonValue value);

    std::size_t size() const;

    friend bool operator==(const JsonValue& lhs, const JsonValue& rhs);
    friend bool operator!=(const JsonValue& lhs, const JsonValue& rhs) { return !(lhs == rhs); }

private:
    JsonType type_ = JsonType::Undefined;
    bool bool_ = false;
    double number_ = 0.0;
    std::string string_;
    Array array_;
    Object object_;
};

// Compact JSON text. Values JSON cannot express (undefined, NaN, the
// infinities and negative zero) are written as their JavaScript spelling.
std::string to_json(const JsonValue& value);

} // namespace tether::protocol
