#include <tether/protocol/remote_object.h>

#include <cmath>
#include <limits>

namespace tether::protocol {

namespace {

const std::string kEmpty;

std::optional<std::string> optional_string(const JsonValue& json, std::string_view key) {
    const JsonValue* found = json.find(key);
    if (found && found->is_string()) return found->as_string();
    return std::nullopt;
}

} // anonymous namespace

bool RemoteObject::has_object_id() const {
    const auto* ref = std::get_if<ReferencePayload>(&payload);
    return ref != nullptr && !ref->object_id.empty();
}

const std::string& RemoteObject::object_id() const {
    const auto* ref = std::get_if<ReferencePayload>(&payload);
    return ref ? ref->object_id : kEmpty;
}

const std::string* RemoteObject::unserializable_value() const {
    const auto* sentinel = std::get_if<UnserializablePayload>(&payload);
    return sentinel ? &sentinel->sentinel : nullptr;
}

const JsonValue* RemoteObject::value() const {
    const auto* v = std::get_if<ValuePayload>(&payload);
    return v ? &v->value : nullptr;
}

RemoteObject RemoteObject::from_json(const JsonValue& json) {
    if (!json.is_object()) {
        throw DecodeError("remote object descriptor must be an object, got " +
                          std::string(json_type_name(json.type())));
    }

    RemoteObject remote;
    auto type = optional_string(json, "type");
    if (!type) {
        throw DecodeError("remote object descriptor has no type");
    }
    remote.type = *type;
    remote.subtype = optional_string(json, "subtype");
    remote.class_name = optional_string(json, "className");
    remote.description = optional_string(json, "description");

    if (auto object_id = optional_string(json, "objectId"); object_id && !object_id->empty()) {
        remote.payload = ReferencePayload{*object_id};
    } else if (auto sentinel = optional_string(json, "unserializableValue");
               sentinel && !sentinel->empty()) {
        remote.payload = UnserializablePayload{*sentinel};
    } else {
        remote.payload = ValuePayload{json.get("value")};
    }
    return remote;
}

JsonValue RemoteObject::to_json() const {
    JsonValue json = JsonValue::object();
    json["type"] = type;
    if (subtype) json["subtype"] = *subtype;
    if (class_name) json["className"] = *class_name;
    if (description) json["description"] = *description;

    std::visit([&json](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ReferencePayload>) {
            json["objectId"] = p.object_id;
        } else if constexpr (std::is_same_v<T, UnserializablePayload>) {
            json["unserializableValue"] = p.sentinel;
        } else {
            if (!p.value.is_undefined()) json["value"] = p.value;
        }
    }, payload);
    return json;
}

RemoteObject RemoteObject::from_value(JsonValue value) {
    RemoteObject remote;
    switch (value.type()) {
        case JsonType::Undefined: remote.type = "undefined"; break;
        case JsonType::Bool:      remote.type = "boolean"; break;
        case JsonType::Number:    remote.type = "number"; break;
        case JsonType::String:    remote.type = "string"; break;
        case JsonType::Null:
            remote.type = "object";
            remote.subtype = "null";
            break;
        case JsonType::Array:
            remote.type = "object";
            remote.subtype = "array";
            break;
        case JsonType::Object:
            remote.type = "object";
            break;
    }
    remote.payload = ValuePayload{std::move(value)};
    return remote;
}

RemoteObject RemoteObject::from_reference(std::string type, std::string object_id,
                                          std::optional<std::string> subtype) {
    RemoteObject remote;
    remote.type = std::move(type);
    remote.subtype = std::move(subtype);
    remote.payload = ReferencePayload{std::move(object_id)};
    return remote;
}

double sentinel_to_number(const std::string& sentinel) {
    if (sentinel == "Infinity") return std::numeric_limits<double>::infinity();
    if (sentinel == "-Infinity") return -std::numeric_limits<double>::infinity();
    if (sentinel == "NaN") return std::numeric_limits<double>::quiet_NaN();
    if (sentinel == "-0") return -0.0;
    throw DecodeError("Unsupported unserializable value: " + sentinel);
}

JsonValue value_from_remote_object(const RemoteObject& remote) {
    if (remote.has_object_id()) {
        throw std::logic_error("Cannot extract value when objectId is given");
    }
    if (const std::string* sentinel = remote.unserializable_value()) {
        return JsonValue(sentinel_to_number(*sentinel));
    }
    if (const JsonValue* value = remote.value()) {
        return *value;
    }
    return JsonValue();
}

std::string exception_message(const JsonValue& exception_details) {
    const JsonValue* exception = exception_details.find("exception");
    if (exception) {
        const JsonValue* description = exception->find("description");
        if (description && description->is_string() && !description->as_string().empty()) {
            return description->as_string();
        }
        const JsonValue* value = exception->find("value");
        if (value && value->is_string()) {
            return value->as_string();
        }
    }

    std::string message;
    const JsonValue* text = exception_details.find("text");
    if (text && text->is_string()) message = text->as_string();

    const JsonValue* stack_trace = exception_details.find("stackTrace");
    if (stack_trace) {
        const JsonValue* frames = stack_trace->find("callFrames");
        if (frames && frames->is_array()) {
            for (const auto& frame : frames->as_array()) {
                std::string location = frame.get("url").is_string() ? frame.get("url").as_string() : "";
                auto position = [&frame](const char* key) {
                    const JsonValue* n = frame.find(key);
                    return n && n->is_number() ? static_cast<long long>(n->as_number()) : 0LL;
                };
                location += ":" + std::to_string(position("lineNumber")) +
                            ":" + std::to_string(position("columnNumber"));
                std::string function_name = frame.get("functionName").is_string()
                    ? frame.get("functionName").as_string() : "";
                message += "\n    at " + (function_name.empty() ? std::string("<anonymous>") : function_name) +
                           " (" + location + ")";
            }
        }
    }
    if (message.empty()) message = "Uncaught";
    return message;
}

JsonValue make_value_argument(JsonValue value) {
    JsonValue arg = JsonValue::object();
    arg["value"] = std::move(value);
    return arg;
}

JsonValue make_unserializable_argument(const std::string& sentinel) {
    JsonValue arg = JsonValue::object();
    arg["unserializableValue"] = sentinel;
    return arg;
}

JsonValue make_object_argument(const std::string& object_id) {
    JsonValue arg = JsonValue::object();
    arg["objectId"] = object_id;
    return arg;
}

} // namespace tether::protocol
