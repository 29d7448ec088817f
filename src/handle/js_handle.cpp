#include <tether/handle/js_handle.h>
#include <tether/handle/element_handle.h>
#include <tether/handle/execution_context.h>
#include <tether/core/config.h>
#include <tether/core/errors.h>
#include <tether/rpc/session.h>

#include <utility>

namespace tether::handle {

using protocol::JsonValue;
using protocol::RemoteObject;

JSHandle::JSHandle(ExecutionContext& context, RemoteObject remote_object)
    : JSHandle(context, std::move(remote_object), HandleKind::Generic) {}

JSHandle::JSHandle(ExecutionContext& context, RemoteObject remote_object, HandleKind kind)
    : context_(context.liveness_token()),
      session_(&context.session()),
      remote_object_(std::move(remote_object)),
      kind_(kind) {}

void JSHandle::ensure_live() const {
    if (disposed_) {
        throw core::HandleError(core::ErrorKind::DisposedHandleUse, "JSHandle is disposed!");
    }
}

ExecutionContext* JSHandle::context_if_alive() const {
    if (auto alive = context_.lock()) {
        return *alive;
    }
    return nullptr;
}

ExecutionContext& JSHandle::execution_context() const {
    ExecutionContext* context = context_if_alive();
    if (!context) {
        throw core::HandleError(core::ErrorKind::ContextDestroyed,
                                "Execution context was destroyed, most likely because of a navigation.");
    }
    return *context;
}

std::unique_ptr<JSHandle> JSHandle::get_property(const std::string& name) {
    ensure_live();

    auto carrier = execution_context().evaluate_handle(core::config::kPropertyCarrierFunction,
                                                       {*this, name});
    std::map<std::string, std::unique_ptr<JSHandle>> properties;
    try {
        properties = carrier->get_properties();
    } catch (const std::exception&) {
        carrier->dispose();
        throw;
    }
    carrier->dispose();

    auto it = properties.find(name);
    if (it == properties.end()) {
        throw core::HandleError(core::ErrorKind::PropertyMissing,
                                "Property '" + name + "' missing from carrier object");
    }
    return std::move(it->second);
}

std::map<std::string, std::unique_ptr<JSHandle>> JSHandle::get_properties() {
    ensure_live();

    std::map<std::string, std::unique_ptr<JSHandle>> result;
    if (!remote_object_.has_object_id()) {
        return result;
    }
    ExecutionContext& context = execution_context();

    JsonValue params = JsonValue::object();
    params["objectId"] = remote_object_.object_id();
    params["ownProperties"] = true;
    JsonValue response = session_->send(core::config::kGetProperties, params);

    const JsonValue* list = response.find("result");
    if (!list || !list->is_array()) {
        return result;
    }

    for (const auto& property : list->as_array()) {
        const JsonValue* enumerable = property.find("enumerable");
        if (!enumerable || !enumerable->is_bool() || !enumerable->as_bool()) {
            continue;
        }
        const JsonValue* name = property.find("name");
        if (!name || !name->is_string()) {
            continue;
        }

        // Accessor properties come without a value descriptor.
        const JsonValue* value = property.find("value");
        RemoteObject remote = value && value->is_object() ? RemoteObject::from_json(*value)
                                                           : RemoteObject{};
        result[name->as_string()] = context.create_handle(std::move(remote));
    }
    return result;
}

JsonValue JSHandle::json_value() {
    ensure_live();

    if (!remote_object_.has_object_id()) {
        return protocol::value_from_remote_object(remote_object_);
    }
    execution_context();  // throws once the context is gone

    JsonValue params = JsonValue::object();
    params["functionDeclaration"] = core::config::kIdentityFunction;
    params["objectId"] = remote_object_.object_id();
    params["returnByValue"] = true;
    params["awaitPromise"] = true;
    JsonValue response = session_->send(core::config::kCallFunctionOn, params);

    if (const JsonValue* details = response.find("exceptionDetails");
        details && details->is_object()) {
        throw core::HandleError(core::ErrorKind::EvaluationFailed,
                                "Evaluation failed: " + protocol::exception_message(*details));
    }
    return protocol::value_from_remote_object(RemoteObject::from_json(response.get("result")));
}

ElementHandle* JSHandle::as_element() {
    if (kind_ != HandleKind::Element) {
        return nullptr;
    }
    return static_cast<ElementHandle*>(this);
}

void JSHandle::dispose() {
    if (disposed_) {
        return;
    }
    disposed_ = true;

    if (!remote_object_.has_object_id()) {
        return;
    }

    JsonValue params = JsonValue::object();
    params["objectId"] = remote_object_.object_id();
    try {
        session_->send(core::config::kReleaseObject, params);
        if (ExecutionContext* context = context_if_alive()) {
            context->log_debug("dispose", "released " + remote_object_.object_id());
        }
    } catch (const core::ProtocolError& e) {
        // The runtime no longer knows the object; nothing is left to release.
        if (ExecutionContext* context = context_if_alive()) {
            context->log_warning("dispose", "release of " + remote_object_.object_id() +
                                                " failed: " + e.what());
        }
    }
}

std::string JSHandle::to_string() const {
    if (remote_object_.has_object_id()) {
        return "JSHandle@" + remote_object_.subtype.value_or(remote_object_.type);
    }

    if (const std::string* sentinel = remote_object_.unserializable_value()) {
        return "JSHandle:" + *sentinel;
    }
    const JsonValue* value = remote_object_.value();
    if (value && value->is_string()) {
        return "JSHandle:" + value->as_string();
    }
    return "JSHandle:" + protocol::to_json(value ? *value : JsonValue());
}

} // namespace tether::handle
