#pragma once

#include <tether/protocol/json_value.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace tether::protocol {

// Malformed data received from the wire.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The remote value is directly JSON-representable.
struct ValuePayload {
    JsonValue value;
};

// A numeric sentinel JSON cannot carry: "Infinity", "-Infinity", "NaN", "-0".
struct UnserializablePayload {
    std::string sentinel;
};

// A live remote object that must be addressed by id and later released.
struct ReferencePayload {
    std::string object_id;
};

using RemotePayload = std::variant<ValuePayload, UnserializablePayload, ReferencePayload>;

// Wire-level description of a remote JavaScript value.
struct RemoteObject {
    std::string type = "undefined";
    std::optional<std::string> subtype;
    std::optional<std::string> class_name;
    std::optional<std::string> description;
    RemotePayload payload;

    bool has_object_id() const;
    // Empty when the payload is not a reference.
    const std::string& object_id() const;
    const std::string* unserializable_value() const;
    const JsonValue* value() const;

    static RemoteObject from_json(const JsonValue& json);
    JsonValue to_json() const;

    static RemoteObject from_value(JsonValue value);
    static RemoteObject from_reference(std::string type, std::string object_id,
                                       std::optional<std::string> subtype = std::nullopt);
};

// Materializes a descriptor that carries no object id. Sentinels map back to
// their doubles; a missing value yields Undefined.
JsonValue value_from_remote_object(const RemoteObject& remote);

// Maps a JavaScript numeric sentinel back to its double.
double sentinel_to_number(const std::string& sentinel);

// Human-readable message for an exceptionDetails payload.
std::string exception_message(const JsonValue& exception_details);

// Wire argument forms accepted by Runtime.callFunctionOn.
JsonValue make_value_argument(JsonValue value);
JsonValue make_unserializable_argument(const std::string& sentinel);
JsonValue make_object_argument(const std::string& object_id);

} // namespace tether::protocol
