#include <tether/rpc/message.h>
#include <tether/protocol/remote_object.h>
#include <tether/protocol/serializer.h>

#include <utility>

namespace tether::rpc {

Message Message::request(uint32_t id, std::string method, protocol::JsonValue params) {
    Message msg;
    msg.kind = MessageKind::Request;
    msg.id = id;
    msg.method = std::move(method);
    msg.body = std::move(params);
    return msg;
}

Message Message::response(uint32_t id, protocol::JsonValue result) {
    Message msg;
    msg.kind = MessageKind::Response;
    msg.id = id;
    msg.body = std::move(result);
    return msg;
}

Message Message::error(uint32_t id, int32_t code, const std::string& message) {
    Message msg;
    msg.kind = MessageKind::Error;
    msg.id = id;
    msg.body = protocol::JsonValue::object();
    msg.body["code"] = code;
    msg.body["message"] = message;
    return msg;
}

std::vector<uint8_t> encode_message(const Message& msg) {
    protocol::Serializer s;
    s.write_u8(static_cast<uint8_t>(msg.kind));
    s.write_u32(msg.id);
    s.write_string(msg.method);
    s.write_value(msg.body);
    return s.take_data();
}

Message decode_message(const std::vector<uint8_t>& bytes) {
    protocol::Deserializer d(bytes);

    Message msg;
    uint8_t kind = d.read_u8();
    if (kind < static_cast<uint8_t>(MessageKind::Request) ||
        kind > static_cast<uint8_t>(MessageKind::Error)) {
        throw protocol::DecodeError("unknown message kind " + std::to_string(kind));
    }
    msg.kind = static_cast<MessageKind>(kind);
    msg.id = d.read_u32();
    msg.method = d.read_string();
    msg.body = d.read_value();

    if (d.has_remaining()) {
        throw protocol::DecodeError("trailing bytes after message body");
    }
    return msg;
}

} // namespace tether::rpc
