#pragma once
#include <tether/protocol/json_value.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace tether::core {
class DiagnosticEmitter;
}

namespace tether::rpc {
class MessagePipe;
}

namespace tether::runtime {

// In-process remote runtime backed by QuickJS. Answers the Runtime.* methods
// the handle layer issues, with one isolated QuickJS context per execution
// context id and a registry of the live objects it has handed out by id.
class RuntimeAgent {
public:
    explicit RuntimeAgent(core::DiagnosticEmitter* emitter = nullptr);
    ~RuntimeAgent();

    RuntimeAgent(const RuntimeAgent&) = delete;
    RuntimeAgent& operator=(const RuntimeAgent&) = delete;

    // Ids start at 1 and are never reused.
    int64_t create_context();
    // Releases every object handed out from the context.
    bool destroy_context(int64_t context_id);
    bool has_context(int64_t context_id) const;

    // Runs a script in the context's global scope, for setting up fixtures.
    // Throws core::ProtocolError if the script throws.
    void run_script(int64_t context_id, const std::string& source);

    std::size_t live_object_count() const;
    bool has_object(const std::string& object_id) const;

    // Executes one protocol method. Throws core::ProtocolError for malformed
    // params, unknown ids and unknown methods.
    protocol::JsonValue dispatch(const std::string& method, const protocol::JsonValue& params);

    // Answers requests arriving on `pipe` until the peer closes it.
    void serve(rpc::MessagePipe& pipe);

private:
    struct State;
    std::unique_ptr<State> state_;
    core::DiagnosticEmitter* emitter_;

    protocol::JsonValue call_function_on(const protocol::JsonValue& params);
    protocol::JsonValue get_properties(const protocol::JsonValue& params);
    protocol::JsonValue query_objects(const protocol::JsonValue& params);
    protocol::JsonValue release_object(const protocol::JsonValue& params);
};

} // namespace tether::runtime
