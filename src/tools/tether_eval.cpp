#include <tether/tools/eval_command.h>
#include <tether/core/config.h>
#include <tether/core/diagnostics.h>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using tether::core::config::kProgramName;
using tether::core::config::kVersionString;

void print_usage(std::ostream& stream) {
    stream << "usage: " << kProgramName
           << " [--verbose] [--handle] <function> [arg...]\n"
           << "  each arg is parsed as true|false|null, Infinity|-Infinity, a number,\n"
           << "  or else passed as a string\n";
}

bool is_help_flag(std::string_view text) {
    return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
    return text == "-V" || text == "--version";
}

}  // namespace

int main(int argc, char** argv) {
    bool verbose = false;
    bool print_handle = false;
    int index = 1;

    for (; index < argc; ++index) {
        const std::string_view flag(argv[index]);
        if (is_help_flag(flag)) {
            print_usage(std::cout);
            return 0;
        }
        if (is_version_flag(flag)) {
            std::cout << kVersionString << "\n";
            return 0;
        }
        if (flag == "--verbose") {
            verbose = true;
        } else if (flag == "--handle") {
            print_handle = true;
        } else if (flag.size() > 1 && flag[0] == '-' && flag[1] == '-') {
            std::cerr << kProgramName << ": unknown option " << flag << "\n";
            print_usage(std::cerr);
            return 2;
        } else {
            break;
        }
    }

    if (index >= argc) {
        print_usage(std::cerr);
        return 2;
    }

    const std::string function = argv[index++];
    std::vector<tether::handle::Argument> args;
    for (; index < argc; ++index) {
        args.push_back(tether::tools::parse_argument(argv[index]));
    }

    // Events only go to the observer; nothing reads them back.
    tether::core::DiagnosticEmitter emitter(0);
    if (verbose) {
        emitter.set_min_severity(tether::core::Severity::Debug);
        emitter.add_observer(tether::core::stderr_observer());
    }

    return tether::tools::run_eval(function, args, print_handle, emitter, std::cout, std::cerr);
}
