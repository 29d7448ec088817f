#include <tether/tools/eval_command.h>
#include <tether/core/config.h>
#include <tether/core/diagnostics.h>
#include <tether/core/errors.h>
#include <tether/handle/js_handle.h>
#include <tether/protocol/remote_object.h>
#include <tether/runtime/local_session.h>
#include <tether/runtime/runtime_agent.h>

#include <charconv>
#include <cstdlib>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <system_error>

namespace tether::tools {

using core::config::kProgramName;

namespace {

bool parse_number(const std::string& text, double& value) {
    if (text.empty()) {
        return false;
    }

    const char* begin = text.data();
    const char* end = begin + text.size();
    long long integer = 0;
    const std::from_chars_result result = std::from_chars(begin, end, integer);
    if (result.ec == std::errc() && result.ptr == end) {
        value = static_cast<double>(integer);
        return true;
    }

    char* parsed_end = nullptr;
    const double parsed = std::strtod(begin, &parsed_end);
    if (parsed_end != end) {
        return false;
    }
    value = parsed;
    return true;
}

int evaluate_and_print(const std::string& function, const std::vector<handle::Argument>& args,
                       bool print_handle, core::DiagnosticEmitter& emitter, std::ostream& out) {
    runtime::RuntimeAgent agent(&emitter);
    runtime::LocalSession session(agent);
    const int64_t context_id = agent.create_context();
    handle::ExecutionContext context(session, context_id, nullptr, &emitter);

    if (!print_handle) {
        out << protocol::to_json(context.evaluate(function, args)) << "\n";
        return 0;
    }

    auto result = context.evaluate_handle(function, args);
    out << result->to_string() << "\n";
    auto properties = result->get_properties();
    for (auto& [name, property] : properties) {
        out << "  " << name << ": " << property->to_string() << "\n";
        property->dispose();
    }
    result->dispose();
    return 0;
}

} // namespace

handle::Argument parse_argument(const std::string& text) {
    if (text == "true") return handle::Argument(true);
    if (text == "false") return handle::Argument(false);
    if (text == "null") return handle::Argument(nullptr);
    if (text == "Infinity") return handle::Argument(std::numeric_limits<double>::infinity());
    if (text == "-Infinity") return handle::Argument(-std::numeric_limits<double>::infinity());

    double number = 0;
    if (parse_number(text, number)) {
        return handle::Argument(number);
    }
    return handle::Argument(text);
}

int run_eval(const std::string& function, const std::vector<handle::Argument>& args,
             bool print_handle, core::DiagnosticEmitter& emitter, std::ostream& out,
             std::ostream& err) {
    try {
        return evaluate_and_print(function, args, print_handle, emitter, out);
    } catch (const core::HandleError& e) {
        err << kProgramName << ": " << e.what() << "\n";
    } catch (const core::TransportError& e) {
        err << kProgramName << ": " << e.what() << "\n";
    } catch (const protocol::DecodeError& e) {
        // Must precede the runtime_error handler.
        err << kProgramName << ": result cannot be represented: " << e.what() << "\n";
    } catch (const std::runtime_error& e) {
        err << kProgramName << ": runtime setup failed: " << e.what() << "\n";
    }
    return 1;
}

} // namespace tether::tools
