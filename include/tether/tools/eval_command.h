#pragma once
#include <tether/handle/execution_context.h>
#include <iosfwd>
#include <string>
#include <vector>

namespace tether::core {
class DiagnosticEmitter;
}

namespace tether::tools {

// true|false|null, Infinity|-Infinity, a number, or else the text itself.
handle::Argument parse_argument(const std::string& text);

// Evaluates `function` with `args` in a fresh QuickJS context. The result
// goes to `out`, failures to `err`. Returns the process exit status.
//
// With `print_handle` the result is printed as a handle followed by one
// line per own enumerable property.
int run_eval(const std::string& function, const std::vector<handle::Argument>& args,
             bool print_handle, core::DiagnosticEmitter& emitter, std::ostream& out,
             std::ostream& err);

} // namespace tether::tools
