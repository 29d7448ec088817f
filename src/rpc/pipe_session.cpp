#include <tether/rpc/pipe_session.h>
#include <tether/core/diagnostics.h>
#include <tether/core/errors.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace tether::rpc {

namespace {

// Saturates codes outside the int32 range; non-numeric codes become 0.
int32_t error_code(const protocol::JsonValue& code) {
    if (!code.is_number() || std::isnan(code.as_number())) {
        return 0;
    }
    const double value = code.as_number();
    if (value <= static_cast<double>(std::numeric_limits<int32_t>::min())) {
        return std::numeric_limits<int32_t>::min();
    }
    if (value >= static_cast<double>(std::numeric_limits<int32_t>::max())) {
        return std::numeric_limits<int32_t>::max();
    }
    return static_cast<int32_t>(value);
}

} // namespace

PipeSession::PipeSession(MessagePipe pipe, core::DiagnosticEmitter* emitter)
    : pipe_(std::move(pipe)), emitter_(emitter) {}

protocol::JsonValue PipeSession::send(const std::string& method,
                                      const protocol::JsonValue& params) {
    const uint32_t id = next_id_++;
    if (!pipe_.send(Message::request(id, method, params))) {
        throw core::TransportError("Connection closed while sending " + method);
    }

    while (true) {
        auto reply = pipe_.receive();
        if (!reply) {
            throw core::TransportError("Connection closed while waiting for " + method);
        }

        if (reply->id != id || reply->kind == MessageKind::Request) {
            if (emitter_) {
                emitter_->emit(core::Severity::Warning, "rpc", "receive",
                               "dropping unexpected message with id " +
                                   std::to_string(reply->id) + " while waiting for " +
                                   std::to_string(id));
            }
            continue;
        }

        if (reply->kind == MessageKind::Error) {
            const protocol::JsonValue message = reply->body.get("message");
            throw core::ProtocolError(
                error_code(reply->body.get("code")),
                message.is_string() ? message.as_string() : "Protocol error (" + method + ")");
        }
        return std::move(reply->body);
    }
}

void PipeSession::close() {
    pipe_.close();
}

} // namespace tether::rpc
