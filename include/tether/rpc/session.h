#pragma once
#include <tether/protocol/json_value.h>
#include <string>

namespace tether::rpc {

// Issues one protocol method and waits for its answer.
//
// send() returns the result object of a successful response. An error
// response raises core::ProtocolError; a request that could not be delivered
// or answered raises core::TransportError. Implementations are not required
// to be thread-safe.
class Session {
public:
    virtual ~Session() = default;

    virtual protocol::JsonValue send(const std::string& method,
                                     const protocol::JsonValue& params) = 0;
};

} // namespace tether::rpc
