#include <tether/core/errors.h>

namespace tether::core {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EvaluationFailed:   return "EvaluationFailed";
        case ErrorKind::CrossContextHandle: return "CrossContextHandle";
        case ErrorKind::DisposedHandleUse:  return "DisposedHandleUse";
        case ErrorKind::PrototypeNotObject: return "PrototypeNotObject";
        case ErrorKind::PropertyMissing:    return "PropertyMissing";
        case ErrorKind::ContextDestroyed:   return "ContextDestroyed";
    }
    return "Unknown";
}

HandleError::HandleError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

ProtocolError::ProtocolError(std::int32_t code, const std::string& message)
    : TransportError(message), code_(code) {}

}  // namespace tether::core
