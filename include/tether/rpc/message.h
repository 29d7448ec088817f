#pragma once
#include <tether/protocol/json_value.h>
#include <cstdint>
#include <string>
#include <vector>

namespace tether::rpc {

enum class MessageKind : uint8_t {
    Request = 1,
    Response = 2,
    Error = 3,
};

// Requests carry method + params in body; responses carry the result; errors
// carry {code, message}. Responses and errors echo the request id.
struct Message {
    MessageKind kind = MessageKind::Request;
    uint32_t id = 0;
    std::string method;
    protocol::JsonValue body;

    static Message request(uint32_t id, std::string method, protocol::JsonValue params);
    static Message response(uint32_t id, protocol::JsonValue result);
    static Message error(uint32_t id, int32_t code, const std::string& message);
};

// Wire format: kind(1) + id(4) + method(string) + body(value).
std::vector<uint8_t> encode_message(const Message& msg);
// Throws protocol::DecodeError on malformed input.
Message decode_message(const std::vector<uint8_t>& bytes);

} // namespace tether::rpc
