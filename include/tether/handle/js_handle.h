#pragma once
#include <tether/protocol/json_value.h>
#include <tether/protocol/remote_object.h>
#include <map>
#include <memory>
#include <string>

namespace tether::rpc {
class Session;
}

namespace tether::handle {

class ElementHandle;
class ExecutionContext;

// The closed set of handle variants a factory may produce.
enum class HandleKind {
    Generic,
    Element,
};

// Local proxy for one value living in a remote execution context.
//
// A handle is Live until dispose() is called, after which every operation
// that would touch the remote runtime throws HandleError(DisposedHandleUse).
// dispose(), to_string() and as_element() stay safe on a disposed handle.
//
// The handle does not own its ExecutionContext. It watches the context's
// liveness token, so a handle outliving its context is orphaned rather than
// dangling: dispose() still releases through the session, and the other
// remote operations throw HandleError(ContextDestroyed).
class JSHandle {
public:
    JSHandle(ExecutionContext& context, protocol::RemoteObject remote_object);
    virtual ~JSHandle() = default;

    JSHandle(const JSHandle&) = delete;
    JSHandle& operator=(const JSHandle&) = delete;

    // Throws HandleError(ContextDestroyed) once the context is gone.
    ExecutionContext& execution_context() const;
    // Null once the context is gone.
    ExecutionContext* context_if_alive() const;
    rpc::Session& session() const { return *session_; }
    const protocol::RemoteObject& remote_object() const { return remote_object_; }
    HandleKind kind() const { return kind_; }
    bool is_disposed() const { return disposed_; }

    // Handle to `target[name]`, fetched through a single-key carrier object.
    std::unique_ptr<JSHandle> get_property(const std::string& name);

    // Own enumerable properties keyed by name. Empty for primitives.
    std::map<std::string, std::unique_ptr<JSHandle>> get_properties();

    // Pulls the value back by value. Issues no request for primitives.
    protocol::JsonValue json_value();

    // Null unless this handle is the element variant.
    ElementHandle* as_element();

    // Idempotent; releases the remote reference at most once.
    void dispose();

    std::string to_string() const;

protected:
    JSHandle(ExecutionContext& context, protocol::RemoteObject remote_object, HandleKind kind);

private:
    std::weak_ptr<ExecutionContext*> context_;
    rpc::Session* session_;
    protocol::RemoteObject remote_object_;
    HandleKind kind_ = HandleKind::Generic;
    bool disposed_ = false;

    void ensure_live() const;
};

} // namespace tether::handle
