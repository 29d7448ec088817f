#ifndef TETHER_CORE_CONFIG_H
#define TETHER_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace tether::core::config {

// Protocol methods issued by the handle layer.
inline constexpr const char kCallFunctionOn[] = "Runtime.callFunctionOn";
inline constexpr const char kGetProperties[] = "Runtime.getProperties";
inline constexpr const char kQueryObjects[] = "Runtime.queryObjects";
inline constexpr const char kReleaseObject[] = "Runtime.releaseObject";

// Evaluated with `this` bound to the target to pull it back by value.
inline constexpr const char kIdentityFunction[] = "function() { return this; }";

// Builds a null-prototype object holding exactly one property of `object`.
inline constexpr const char kPropertyCarrierFunction[] =
    "(object, propertyName) => {\n"
    "    const result = {__proto__: null};\n"
    "    result[propertyName] = object[propertyName];\n"
    "    return result;\n"
    "}";

// Diagnostic events a DiagnosticEmitter keeps before evicting the oldest.
inline constexpr std::size_t kMaxRetainedDiagnostics = 256;

inline constexpr std::size_t kMaxFrameSize = 64u * 1024u * 1024u;

inline constexpr std::int32_t kServerErrorCode = -32000;
inline constexpr std::int32_t kMethodNotFoundCode = -32601;

inline constexpr const char kProgramName[] = "tether-eval";
inline constexpr const char kVersionString[] = "tether-eval 0.1.0";

}  // namespace tether::core::config

#endif  // TETHER_CORE_CONFIG_H
