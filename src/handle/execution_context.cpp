#include <tether/handle/execution_context.h>
#include <tether/handle/element_handle.h>
#include <tether/core/config.h>
#include <tether/core/diagnostics.h>
#include <tether/core/errors.h>
#include <tether/rpc/session.h>

#include <cmath>
#include <utility>

namespace tether::handle {

using protocol::JsonValue;
using protocol::RemoteObject;

HandleFactory default_handle_factory() {
    return [](ExecutionContext& context, RemoteObject remote) -> std::unique_ptr<JSHandle> {
        if (remote.subtype && *remote.subtype == "node") {
            return std::make_unique<ElementHandle>(context, std::move(remote));
        }
        return std::make_unique<JSHandle>(context, std::move(remote));
    };
}

ExecutionContext::ExecutionContext(rpc::Session& session, int64_t context_id,
                                   HandleFactory factory, core::DiagnosticEmitter* emitter)
    : session_(session),
      context_id_(context_id),
      factory_(factory ? std::move(factory) : default_handle_factory()),
      emitter_(emitter),
      liveness_(std::make_shared<ExecutionContext*>(this)) {}

JsonValue ExecutionContext::evaluate(const std::string& page_function,
                                     const std::vector<Argument>& args) {
    auto handle = evaluate_handle(page_function, args);

    JsonValue result;
    try {
        result = handle->json_value();
    } catch (const std::exception&) {
        try {
            handle->dispose();
        } catch (const core::TransportError& release_error) {
            log_warning("evaluate", std::string("release after failure: ") + release_error.what());
        }
        throw;
    }
    handle->dispose();
    return result;
}

std::unique_ptr<JSHandle> ExecutionContext::evaluate_handle(const std::string& page_function,
                                                            const std::vector<Argument>& args) {
    // Encode every argument before sending anything.
    JsonValue arguments = JsonValue::array();
    for (const auto& arg : args) {
        arguments.push_back(convert_argument(arg));
    }

    JsonValue params = JsonValue::object();
    params["functionDeclaration"] = page_function;
    params["executionContextId"] = context_id_;
    params["arguments"] = std::move(arguments);
    params["returnByValue"] = false;
    params["awaitPromise"] = true;

    log_debug("evaluate", "callFunctionOn with " + std::to_string(args.size()) + " argument(s)");
    JsonValue response = session_.send(core::config::kCallFunctionOn, params);

    if (const JsonValue* details = response.find("exceptionDetails");
        details && details->is_object()) {
        std::string message = "Evaluation failed: " + protocol::exception_message(*details);
        if (emitter_) {
            emitter_->emit(core::Severity::Error, "context", "evaluate", message, context_id_);
        }
        throw core::HandleError(core::ErrorKind::EvaluationFailed, message);
    }

    return create_handle(RemoteObject::from_json(response.get("result")));
}

std::unique_ptr<JSHandle> ExecutionContext::query_object(const JSHandle& prototype) {
    if (prototype.is_disposed()) {
        throw core::HandleError(core::ErrorKind::DisposedHandleUse,
                                "Prototype JSHandle is disposed!");
    }
    if (!prototype.remote_object().has_object_id()) {
        throw core::HandleError(core::ErrorKind::PrototypeNotObject,
                                "Prototype JSHandle must not be referencing primitive value");
    }

    JsonValue params = JsonValue::object();
    params["prototypeObjectId"] = prototype.remote_object().object_id();

    log_debug("query", "queryObjects for " + prototype.remote_object().object_id());
    JsonValue response = session_.send(core::config::kQueryObjects, params);
    return create_handle(RemoteObject::from_json(response.get("objects")));
}

JsonValue ExecutionContext::convert_argument(const Argument& arg) const {
    if (!arg.is_handle()) {
        const JsonValue& value = arg.value();
        if (value.is_number() && std::isinf(value.as_number())) {
            return protocol::make_unserializable_argument(value.as_number() > 0 ? "Infinity"
                                                                                : "-Infinity");
        }
        return protocol::make_value_argument(value);
    }

    const JSHandle& handle = *arg.handle();
    if (handle.context_if_alive() != this) {
        throw core::HandleError(core::ErrorKind::CrossContextHandle,
                                "JSHandles can be evaluated only in the context they were created!");
    }
    if (handle.is_disposed()) {
        throw core::HandleError(core::ErrorKind::DisposedHandleUse, "JSHandle is disposed!");
    }

    const RemoteObject& remote = handle.remote_object();
    if (const std::string* sentinel = remote.unserializable_value()) {
        return protocol::make_unserializable_argument(*sentinel);
    }
    if (!remote.has_object_id()) {
        const JsonValue* value = remote.value();
        return protocol::make_value_argument(value ? *value : JsonValue());
    }
    return protocol::make_object_argument(remote.object_id());
}

std::unique_ptr<JSHandle> ExecutionContext::create_handle(RemoteObject remote_object) {
    return factory_(*this, std::move(remote_object));
}

void ExecutionContext::log_debug(const std::string& stage, const std::string& message) const {
    if (emitter_) {
        emitter_->emit(core::Severity::Debug, "context", stage, message, context_id_);
    }
}

void ExecutionContext::log_warning(const std::string& stage, const std::string& message) const {
    if (emitter_) {
        emitter_->emit(core::Severity::Warning, "context", stage, message, context_id_);
    }
}

} // namespace tether::handle
