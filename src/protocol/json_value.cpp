#include <tether/protocol/json_value.h>

#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace tether::protocol {

const char* json_type_name(JsonType type) {
    switch (type) {
        case JsonType::Undefined: return "undefined";
        case JsonType::Null:      return "null";
        case JsonType::Bool:      return "boolean";
        case JsonType::Number:    return "number";
        case JsonType::String:    return "string";
        case JsonType::Array:     return "array";
        case JsonType::Object:    return "object";
    }
    return "unknown";
}

namespace {

[[noreturn]] void throw_type_mismatch(JsonType expected, JsonType actual) {
    throw std::logic_error(std::string("JsonValue: expected ") + json_type_name(expected) +
                           " but holds " + json_type_name(actual));
}

void append_number(std::string& out, double value) {
    if (std::isnan(value)) {
        out += "NaN";
        return;
    }
    if (std::isinf(value)) {
        out += value > 0 ? "Infinity" : "-Infinity";
        return;
    }
    if (value == 0.0 && std::signbit(value)) {
        out += "-0";
        return;
    }

    char buf[32];
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        std::snprintf(buf, sizeof(buf), "%.0f", value);
    } else {
        std::snprintf(buf, sizeof(buf), "%.17g", value);
    }
    out += buf;
}

void append_string(std::string& out, const std::string& value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void append_value(std::string& out, const JsonValue& value) {
    switch (value.type()) {
        case JsonType::Undefined:
            out += "undefined";
            break;
        case JsonType::Null:
            out += "null";
            break;
        case JsonType::Bool:
            out += value.as_bool() ? "true" : "false";
            break;
        case JsonType::Number:
            append_number(out, value.as_number());
            break;
        case JsonType::String:
            append_string(out, value.as_string());
            break;
        case JsonType::Array: {
            out += '[';
            bool first = true;
            for (const auto& item : value.as_array()) {
                if (!first) out += ',';
                first = false;
                append_value(out, item);
            }
            out += ']';
            break;
        }
        case JsonType::Object: {
            out += '{';
            bool first = true;
            for (const auto& [key, member] : value.as_object()) {
                if (!first) out += ',';
                first = false;
                append_string(out, key);
                out += ':';
                append_value(out, member);
            }
            out += '}';
            break;
        }
    }
}

} // anonymous namespace

JsonValue JsonValue::object() {
    JsonValue value;
    value.type_ = JsonType::Object;
    return value;
}

bool JsonValue::as_bool() const {
    if (type_ != JsonType::Bool) throw_type_mismatch(JsonType::Bool, type_);
    return bool_;
}

double JsonValue::as_number() const {
    if (type_ != JsonType::Number) throw_type_mismatch(JsonType::Number, type_);
    return number_;
}

const std::string& JsonValue::as_string() const {
    if (type_ != JsonType::String) throw_type_mismatch(JsonType::String, type_);
    return string_;
}

const JsonValue::Array& JsonValue::as_array() const {
    if (type_ != JsonType::Array) throw_type_mismatch(JsonType::Array, type_);
    return array_;
}

JsonValue::Array& JsonValue::as_array() {
    if (type_ != JsonType::Array) throw_type_mismatch(JsonType::Array, type_);
    return array_;
}

const JsonValue::Object& JsonValue::as_object() const {
    if (type_ != JsonType::Object) throw_type_mismatch(JsonType::Object, type_);
    return object_;
}

JsonValue::Object& JsonValue::as_object() {
    if (type_ != JsonType::Object) throw_type_mismatch(JsonType::Object, type_);
    return object_;
}

const JsonValue* JsonValue::find(std::string_view key) const {
    if (type_ != JsonType::Object) return nullptr;
    for (const auto& member : object_) {
        if (member.first == key) return &member.second;
    }
    return nullptr;
}

JsonValue JsonValue::get(std::string_view key) const {
    const JsonValue* found = find(key);
    return found ? *found : JsonValue();
}

JsonValue& JsonValue::operator[](const std::string& key) {
    if (type_ == JsonType::Undefined) type_ = JsonType::Object;
    if (type_ != JsonType::Object) throw_type_mismatch(JsonType::Object, type_);
    for (auto& member : object_) {
        if (member.first == key) return member.second;
    }
    object_.emplace_back(key, JsonValue());
    return object_.back().second;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    JsonValue& slot = (*this)[key];
    slot = std::move(value);
    return *this;
}

void JsonValue::push_back(JsonValue value) {
    if (type_ == JsonType::Undefined) type_ = JsonType::Array;
    if (type_ != JsonType::Array) throw_type_mismatch(JsonType::Array, type_);
    array_.push_back(std::move(value));
}

std::size_t JsonValue::size() const {
    switch (type_) {
        case JsonType::Array:  return array_.size();
        case JsonType::Object: return object_.size();
        case JsonType::String: return string_.size();
        default:               return 0;
    }
}

bool operator==(const JsonValue& lhs, const JsonValue& rhs) {
    if (lhs.type_ != rhs.type_) return false;
    switch (lhs.type_) {
        case JsonType::Undefined:
        case JsonType::Null:
            return true;
        case JsonType::Bool:
            return lhs.bool_ == rhs.bool_;
        case JsonType::Number:
            return lhs.number_ == rhs.number_;
        case JsonType::String:
            return lhs.string_ == rhs.string_;
        case JsonType::Array:
            return lhs.array_ == rhs.array_;
        case JsonType::Object:
            return lhs.object_ == rhs.object_;
    }
    return false;
}

std::string to_json(const JsonValue& value) {
    std::string out;
    append_value(out, value);
    return out;
}

} // namespace tether::protocol
