#pragma once
#include <tether/rpc/message_pipe.h>
#include <tether/rpc/session.h>
#include <cstdint>

namespace tether::core {
class DiagnosticEmitter;
}

namespace tether::rpc {

// Client side of a MessagePipe: numbers each request and blocks until the
// response carrying the same id arrives.
class PipeSession : public Session {
public:
    explicit PipeSession(MessagePipe pipe, core::DiagnosticEmitter* emitter = nullptr);

    protocol::JsonValue send(const std::string& method,
                             const protocol::JsonValue& params) override;

    void close();
    bool is_open() const { return pipe_.is_open(); }

    uint32_t last_request_id() const { return next_id_ - 1; }

private:
    MessagePipe pipe_;
    core::DiagnosticEmitter* emitter_;
    uint32_t next_id_ = 1;
};

} // namespace tether::rpc
