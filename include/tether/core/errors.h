#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tether::core {

enum class ErrorKind {
    EvaluationFailed,
    CrossContextHandle,
    DisposedHandleUse,
    PrototypeNotObject,
    PropertyMissing,
    ContextDestroyed,
};

const char* error_kind_name(ErrorKind kind);

// Raised by the handle layer for conditions it detects itself.
class HandleError : public std::runtime_error {
public:
    HandleError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// The session could not deliver a request or the connection went away.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The remote side answered with an error object instead of a result.
class ProtocolError : public TransportError {
public:
    ProtocolError(std::int32_t code, const std::string& message);

    std::int32_t code() const { return code_; }

private:
    std::int32_t code_;
};

}  // namespace tether::core
