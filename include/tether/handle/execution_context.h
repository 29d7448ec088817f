#pragma once
#include <tether/handle/js_handle.h>
#include <tether/protocol/json_value.h>
#include <tether/protocol/remote_object.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace tether::core {
class DiagnosticEmitter;
}

namespace tether::rpc {
class Session;
}

namespace tether::handle {

class ExecutionContext;

// Wraps a descriptor returned by the remote runtime into a handle bound to
// the given context.
using HandleFactory =
    std::function<std::unique_ptr<JSHandle>(ExecutionContext&, protocol::RemoteObject)>;

// ElementHandle for subtype "node", JSHandle otherwise.
HandleFactory default_handle_factory();

// One argument of evaluate()/evaluate_handle(): a plain value, or a handle
// that is passed to the remote function by reference.
class Argument {
public:
    Argument(protocol::JsonValue value) : value_(std::move(value)) {}
    Argument(std::nullptr_t) : value_(nullptr) {}
    Argument(bool value) : value_(value) {}
    Argument(const char* value) : value_(value) {}
    Argument(std::string value) : value_(std::move(value)) {}

    template <typename T,
              std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Argument(T value) : value_(value) {}

    Argument(const JSHandle& handle) : handle_(&handle) {}
    // A null handle pointer passes null.
    Argument(const JSHandle* handle) : value_(nullptr), handle_(handle) {}
    Argument(const void*) = delete;

    bool is_handle() const { return handle_ != nullptr; }
    const JSHandle* handle() const { return handle_; }
    const protocol::JsonValue& value() const { return value_; }

private:
    protocol::JsonValue value_;
    const JSHandle* handle_ = nullptr;
};

// One isolated evaluation scope in the remote runtime.
//
// The context borrows the session; the session must outlive it. Every handle
// it hands out observes its liveness token, which dies with the context.
class ExecutionContext {
public:
    ExecutionContext(rpc::Session& session, int64_t context_id, HandleFactory factory,
                     core::DiagnosticEmitter* emitter = nullptr);

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    // evaluate_handle() + json_value(); the intermediate handle is disposed
    // on both the success and the failure path.
    protocol::JsonValue evaluate(const std::string& page_function,
                                 const std::vector<Argument>& args = {});

    // Calls `page_function` with `args` inside this context, awaiting a
    // returned promise, and wraps the result as a handle. Throws
    // HandleError(EvaluationFailed) when the remote code throws.
    std::unique_ptr<JSHandle> evaluate_handle(const std::string& page_function,
                                              const std::vector<Argument>& args = {});

    // Array handle of live objects whose prototype is `prototype`.
    std::unique_ptr<JSHandle> query_object(const JSHandle& prototype);

    // Wire form of one argument. Throws HandleError for a handle that is
    // disposed or belongs to another context.
    protocol::JsonValue convert_argument(const Argument& arg) const;

    std::unique_ptr<JSHandle> create_handle(protocol::RemoteObject remote_object);

    rpc::Session& session() const { return session_; }
    int64_t context_id() const { return context_id_; }
    core::DiagnosticEmitter* emitter() const { return emitter_; }
    std::weak_ptr<ExecutionContext*> liveness_token() const { return liveness_; }

    void log_debug(const std::string& stage, const std::string& message) const;
    void log_warning(const std::string& stage, const std::string& message) const;

private:
    rpc::Session& session_;
    const int64_t context_id_;
    HandleFactory factory_;
    core::DiagnosticEmitter* emitter_;
    std::shared_ptr<ExecutionContext*> liveness_;
};

} // namespace tether::handle
